#include "chhttp/util/version.hpp"

namespace chhttp {

std::string getVersion() {
#ifdef CHHTTP_VERSION
	return CHHTTP_VERSION;
#else
	return "";
#endif
}

} // namespace chhttp
