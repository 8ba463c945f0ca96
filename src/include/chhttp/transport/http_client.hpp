#pragma once

#include "chhttp/transport/http_type.hpp"

namespace chhttp {

class IHttpClient {
public:
	virtual ~IHttpClient() = default;
	virtual HttpResponse Execute(const HttpRequest &request) = 0;

	HttpRequest BuildRequest(const HttpMethod method, const std::string &url, const HttpHeaders &headers);
	HttpRequest BuildRequest(const HttpMethod method, const std::string &url, const HttpHeaders &headers,
	                         const std::string &body);

	HttpResponse Get(const std::string &url, const HttpHeaders &headers);
	HttpResponse Post(const std::string &url, const HttpHeaders &headers, const std::string &body);
};
} // namespace chhttp
