#include "chhttp/auth/auth_factory.hpp"

#include "chhttp/exception.hpp"
#include "chhttp/auth/basic_auth.hpp"
#include "chhttp/auth/bearer_token_auth.hpp"

namespace chhttp {

std::shared_ptr<IAuthProvider> CreateAuthFromOptions(const OptionMap &options) {
	auto token = GetStringOption(options, OPTION_TOKEN);
	if (!token.empty()) {
		return std::make_shared<BearerTokenAuth>(token);
	}
	auto user = GetStringOption(options, OPTION_USER);
	if (user.empty()) {
		if (options.count(OPTION_PASSWORD)) {
			throw ValidationException("'password' option given without 'user'");
		}
		return nullptr;
	}
	return std::make_shared<BasicAuth>(user, GetStringOption(options, OPTION_PASSWORD));
}

} // namespace chhttp
