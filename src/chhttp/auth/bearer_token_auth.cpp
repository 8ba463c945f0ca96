#include "chhttp/auth/bearer_token_auth.hpp"

namespace chhttp {

std::string BearerTokenAuth::GetAuthorizationHeader() {
	return "Bearer " + token;
}

} // namespace chhttp
