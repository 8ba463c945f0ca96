#pragma once

#include <string>
#include <utility>
#include <vector>

namespace chhttp {

using QueryPairs = std::vector<std::pair<std::string, std::string>>;

enum class UrlEncoding {
	// Unreserved characters kept, everything else %XX (space is %20).
	RFC3986,
	// application/x-www-form-urlencoded: as RFC3986 but space is '+'.
	WWW_FORM
};

std::string UrlEncode(const std::string &str, UrlEncoding encoding = UrlEncoding::RFC3986);

// Renders "k1=v1&k2=v2" with both keys and values encoded.
std::string EncodeQuery(const QueryPairs &pairs, UrlEncoding encoding = UrlEncoding::RFC3986);

// Joins an already encoded fragment onto an existing query string with '&'.
void AppendQuery(std::string &query, const std::string &encoded);

// Appends a query string to a URL, respecting any query the URL already carries.
std::string JoinUrl(const std::string &url, const std::string &query);

} // namespace chhttp
