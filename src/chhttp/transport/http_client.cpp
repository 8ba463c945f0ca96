#include "chhttp/transport/http_client.hpp"
#include "chhttp/transport/http_type.hpp"

namespace chhttp {

HttpRequest IHttpClient::BuildRequest(const HttpMethod method, const std::string &url, const HttpHeaders &headers) {
	return HttpRequest {method, url, headers, ""};
}

HttpRequest IHttpClient::BuildRequest(const HttpMethod method, const std::string &url, const HttpHeaders &headers,
                                      const std::string &body) {
	return HttpRequest {method, url, headers, body};
}

HttpResponse IHttpClient::Get(const std::string &url, const HttpHeaders &headers) {
	return Execute(BuildRequest(HttpMethod::GET, url, headers));
}

HttpResponse IHttpClient::Post(const std::string &url, const HttpHeaders &headers, const std::string &body) {
	return Execute(BuildRequest(HttpMethod::POST, url, headers, body));
}

} // namespace chhttp
