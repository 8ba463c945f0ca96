#include "chhttp/auth/basic_auth.hpp"
#include "chhttp/util/encoding.hpp"

namespace chhttp {

std::string BasicAuth::GetAuthorizationHeader() {
	return "Basic " + Base64Encode(user + ":" + password);
}

} // namespace chhttp
