#include <algorithm>
#include <cctype>

#include "chhttp/transport/http_type.hpp"

namespace chhttp {

bool CaseInsensitiveLess::operator()(const std::string &a, const std::string &b) const {
	return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](char l, char r) {
		return std::tolower(static_cast<unsigned char>(l)) < std::tolower(static_cast<unsigned char>(r));
	});
}

bool EqualsIgnoreCase(const std::string &a, const std::string &b) {
	return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char l, char r) {
		       return std::tolower(static_cast<unsigned char>(l)) == std::tolower(static_cast<unsigned char>(r));
	       });
}

const char *HttpMethodToString(HttpMethod method) {
	switch (method) {
	case HttpMethod::GET:
		return "GET";
	case HttpMethod::POST:
		return "POST";
	}
	return "POST";
}

std::string GetHeader(const HttpHeaders &headers, const std::string &name) {
	auto it = headers.lower_bound(name);
	if (it == headers.end() || !EqualsIgnoreCase(it->first, name)) {
		return "";
	}
	return it->second;
}

std::vector<std::string> GetHeaderValues(const HttpHeaders &headers, const std::string &name) {
	std::vector<std::string> values;
	auto range = headers.equal_range(name);
	for (auto it = range.first; it != range.second; ++it) {
		values.push_back(it->second);
	}
	return values;
}

bool HasHeader(const HttpHeaders &headers, const std::string &name) {
	return headers.find(name) != headers.end();
}

void PutHeader(HttpHeaders &headers, const std::string &name, const std::string &value) {
	headers.erase(name);
	headers.emplace(name, value);
}

void AddHeader(HttpHeaders &headers, const std::string &name, const std::string &value) {
	headers.emplace(name, value);
}

} // namespace chhttp
