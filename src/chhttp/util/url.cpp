#include <cctype>
#include <iomanip>
#include <sstream>

#include "chhttp/util/url.hpp"

namespace chhttp {

static bool IsUnreserved(unsigned char c) {
	return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

std::string UrlEncode(const std::string &str, UrlEncoding encoding) {
	std::ostringstream escaped;
	escaped.fill('0');
	escaped << std::hex << std::uppercase;

	for (char ch : str) {
		auto c = static_cast<unsigned char>(ch);
		if (IsUnreserved(c)) {
			escaped << ch;
		} else if (c == ' ' && encoding == UrlEncoding::WWW_FORM) {
			escaped << '+';
		} else {
			escaped << '%' << std::setw(2) << static_cast<int>(c);
		}
	}
	return escaped.str();
}

std::string EncodeQuery(const QueryPairs &pairs, UrlEncoding encoding) {
	std::string encoded;
	for (const auto &pair : pairs) {
		if (!encoded.empty()) {
			encoded += '&';
		}
		encoded += UrlEncode(pair.first, encoding) + "=" + UrlEncode(pair.second, encoding);
	}
	return encoded;
}

void AppendQuery(std::string &query, const std::string &encoded) {
	if (encoded.empty()) {
		return;
	}
	if (query.empty()) {
		query = encoded;
	} else {
		query += "&" + encoded;
	}
}

std::string JoinUrl(const std::string &url, const std::string &query) {
	if (query.empty()) {
		return url;
	}
	auto queryStart = url.find('?');
	if (queryStart == std::string::npos) {
		return url + "?" + query;
	}
	if (queryStart == url.size() - 1 || url.back() == '&') {
		return url + query;
	}
	return url + "&" + query;
}

} // namespace chhttp
