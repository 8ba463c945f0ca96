#pragma once

#include <string>

#include "chhttp/auth/auth_provider.hpp"

namespace chhttp {

class BearerTokenAuth : public IAuthProvider {
public:
	explicit BearerTokenAuth(const std::string &token) : token(token) {
	}

	std::string GetAuthorizationHeader() override;

private:
	std::string token;
};

} // namespace chhttp
