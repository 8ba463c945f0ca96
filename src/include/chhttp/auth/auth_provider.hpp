#pragma once

#include <string>

namespace chhttp {

class IAuthProvider {
public:
	virtual ~IAuthProvider() = default;
	virtual std::string GetAuthorizationHeader() = 0;
};

} // namespace chhttp
