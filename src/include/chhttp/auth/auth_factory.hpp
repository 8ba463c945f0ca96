#pragma once

#include <memory>

#include "chhttp/auth/auth_provider.hpp"
#include "chhttp/util/options.hpp"

namespace chhttp {

// Returns nullptr when the options carry no credentials.
std::shared_ptr<IAuthProvider> CreateAuthFromOptions(const OptionMap &options);

} // namespace chhttp
