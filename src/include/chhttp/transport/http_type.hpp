#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace chhttp {

enum class HttpMethod { GET, POST };

struct CaseInsensitiveLess {
	bool operator()(const std::string &a, const std::string &b) const;
};

// Header names compare case-insensitively; repeated headers keep their arrival order.
using HttpHeaders = std::multimap<std::string, std::string, CaseInsensitiveLess>;

struct HttpRequest {
	HttpMethod method;
	std::string url;
	HttpHeaders headers;
	std::string body;
};

struct HttpResponse {
	int statusCode;
	HttpHeaders headers;
	std::string body;
};

struct HttpProxyConfig {
	std::string host;
	uint16_t port = 0;
	std::string username;
	std::string password;
};

struct HttpTimeouts {
	int connectSeconds = 0;
	int readSeconds = 0;
};

const char *HttpMethodToString(HttpMethod method);

bool EqualsIgnoreCase(const std::string &a, const std::string &b);

// Returns the first value of the header, or an empty string.
std::string GetHeader(const HttpHeaders &headers, const std::string &name);

std::vector<std::string> GetHeaderValues(const HttpHeaders &headers, const std::string &name);

bool HasHeader(const HttpHeaders &headers, const std::string &name);

// Replaces every existing value of the header.
void PutHeader(HttpHeaders &headers, const std::string &name, const std::string &value);

void AddHeader(HttpHeaders &headers, const std::string &name, const std::string &value);

} // namespace chhttp
