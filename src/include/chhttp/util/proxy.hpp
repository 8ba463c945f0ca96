#pragma once

#include <string>

#include "chhttp/transport/http_type.hpp"
#include "chhttp/util/options.hpp"

namespace chhttp {

void ParseHttpProxyHost(const std::string &proxy_value, std::string &hostname_out, uint16_t &port_out);

HttpProxyConfig GetHttpProxyConfig(const OptionMap &options);

} // namespace chhttp
