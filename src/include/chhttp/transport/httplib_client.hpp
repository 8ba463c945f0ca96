#pragma once

#include <utility>

#include "chhttp/transport/http_client.hpp"
#include "chhttp/transport/http_type.hpp"

namespace chhttp {

class HttpLibClient : public IHttpClient {
public:
	explicit HttpLibClient(HttpProxyConfig proxy_config = HttpProxyConfig(), HttpTimeouts timeouts = HttpTimeouts())
	    : proxy_config(std::move(proxy_config)), timeouts(timeouts) {
	}

	HttpResponse Execute(const HttpRequest &request) override;

	static void ParseUrl(const std::string &url, std::string &baseUrl, std::string &path);

private:
	HttpProxyConfig proxy_config;
	HttpTimeouts timeouts;
};
} // namespace chhttp
