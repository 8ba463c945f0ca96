#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

#include "chhttp/exception.hpp"
#include "chhttp/util/proxy.hpp"

namespace chhttp {

static bool StartsWith(const std::string &str, const std::string &prefix) {
	return str.compare(0, prefix.size(), prefix) == 0;
}

void ParseHttpProxyHost(const std::string &proxy_value, std::string &hostname_out, uint16_t &port_out) {
	uint16_t default_port = 80;
	auto sanitized_proxy_value = proxy_value;
	if (StartsWith(proxy_value, "http://")) {
		sanitized_proxy_value = proxy_value.substr(7);
	} else if (StartsWith(proxy_value, "https://")) {
		default_port = 443;
		sanitized_proxy_value = proxy_value.substr(8);
	}

	// Remove all trailing slashes to avoid issues with host path
	while (!sanitized_proxy_value.empty() && sanitized_proxy_value.back() == '/') {
		sanitized_proxy_value.pop_back();
	}

	auto colon = sanitized_proxy_value.find(':');
	if (colon == std::string::npos) {
		hostname_out = sanitized_proxy_value;
		port_out = default_port;
		return;
	}
	if (sanitized_proxy_value.find(':', colon + 1) != std::string::npos) {
		throw ValidationException("Failed to parse http_proxy '" + proxy_value + "' into a host and port");
	}

	auto port_text = sanitized_proxy_value.substr(colon + 1);
	try {
		size_t consumed = 0;
		auto val = std::stoul(port_text, &consumed);
		if (consumed != port_text.size() || val > std::numeric_limits<uint16_t>::max()) {
			throw ValidationException("Failed to parse port from http_proxy '" + proxy_value + "'");
		}
		port_out = static_cast<uint16_t>(val);
	} catch (const std::invalid_argument &) {
		throw ValidationException("Failed to parse port from http_proxy '" + proxy_value + "'");
	} catch (const std::out_of_range &) {
		throw ValidationException("Failed to parse port from http_proxy '" + proxy_value + "'");
	}
	hostname_out = sanitized_proxy_value.substr(0, colon);
}

HttpProxyConfig GetHttpProxyConfig(const OptionMap &options) {
	HttpProxyConfig proxy_config;
	auto proxy_value = GetStringOption(options, OPTION_HTTP_PROXY);
	if (!proxy_value.empty()) {
		ParseHttpProxyHost(proxy_value, proxy_config.host, proxy_config.port);
		proxy_config.username = GetStringOption(options, OPTION_HTTP_PROXY_USERNAME);
		proxy_config.password = GetStringOption(options, OPTION_HTTP_PROXY_PASSWORD);
	}
	return proxy_config;
}

} // namespace chhttp
