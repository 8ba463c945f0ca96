#pragma once

#include <string>

#include "chhttp/auth/auth_provider.hpp"

namespace chhttp {

class BasicAuth : public IAuthProvider {
public:
	BasicAuth(const std::string &user, const std::string &password) : user(user), password(password) {
	}

	std::string GetAuthorizationHeader() override;

private:
	std::string user;
	std::string password;
};

} // namespace chhttp
