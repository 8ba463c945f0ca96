#pragma once

#include <memory>

#include "chhttp/transport/http_client.hpp"
#include "chhttp/util/options.hpp"

namespace chhttp {

std::shared_ptr<IHttpClient> CreateHttpClient(const OptionMap &options);

} // namespace chhttp
