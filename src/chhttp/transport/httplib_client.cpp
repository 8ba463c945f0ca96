#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>

#include "chhttp/exception.hpp"
#include "chhttp/transport/httplib_client.hpp"
#include "chhttp/transport/http_type.hpp"

namespace chhttp {

constexpr const char *DEFAULT_CONTENT_TYPE = "text/plain; charset=UTF-8";

void HttpLibClient::ParseUrl(const std::string &url, std::string &baseUrl, std::string &path) {
	const std::string schemaSep = "://";
	size_t schemeEnd = url.find(schemaSep);
	if (schemeEnd == std::string::npos) {
		throw TransportException("Invalid URL: " + url);
	}

	size_t pathStart = url.find_first_of("/?", schemeEnd + schemaSep.size());
	if (pathStart == std::string::npos) {
		baseUrl = url;
		path = "/";
	} else {
		baseUrl = url.substr(0, pathStart);
		path = url.substr(pathStart);
		if (path[0] == '?') {
			path = "/" + path;
		}
	}
}

HttpResponse HttpLibClient::Execute(const HttpRequest &request) {
	std::string baseUrl;
	std::string path;
	ParseUrl(request.url, baseUrl, path);

	httplib::Client client(baseUrl);
	if (!client.is_valid()) {
		throw TransportException("Invalid URL: " + request.url);
	}
	// The query string arrives already percent-encoded.
	client.set_url_encode(false);

	if (!proxy_config.host.empty()) {
		client.set_proxy(proxy_config.host, proxy_config.port);
		if (!proxy_config.username.empty()) {
			client.set_proxy_basic_auth(proxy_config.username, proxy_config.password);
		}
	}
	if (timeouts.connectSeconds > 0) {
		client.set_connection_timeout(timeouts.connectSeconds, 0);
	}
	if (timeouts.readSeconds > 0) {
		client.set_read_timeout(timeouts.readSeconds, 0);
	}

	std::string contentType = DEFAULT_CONTENT_TYPE;
	httplib::Headers headers;
	for (const auto &h : request.headers) {
		if (EqualsIgnoreCase(h.first, "Content-Type")) {
			contentType = h.second;
		} else {
			headers.insert(h);
		}
	}

	httplib::Result result;

	switch (request.method) {
	case HttpMethod::GET:
		result = client.Get(path, headers);
		break;
	case HttpMethod::POST:
		result = client.Post(path, headers, request.body, contentType);
		break;
	}

	if (!result) {
		throw TransportException("HTTP request failed: " + httplib::to_string(result.error()));
	}

	HttpResponse response;
	response.statusCode = result->status;
	response.body = result->body;
	for (const auto &h : result->headers) {
		AddHeader(response.headers, h.first, h.second);
	}
	return response;
}

} // namespace chhttp
