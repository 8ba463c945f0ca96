#pragma once

#include <string>
#include <vector>

namespace chhttp {

constexpr const char *FORMATS_PAGE = "https://clickhouse.com/docs/en/interfaces/formats";

// Requests a decoded table instead of raw bytes. Never sent on the wire.
constexpr const char *FORMAT_DATAFRAME = "dataframe";
// Accepted in place of FORMAT_DATAFRAME.
constexpr const char *FORMAT_EXPLORER = "explorer";
// What the server is asked for when FORMAT_DATAFRAME is requested.
constexpr const char *FORMAT_PARQUET = "Parquet";
constexpr const char *DEFAULT_FORMAT = "tsv";

// Request header naming the output format; ClickHouse echoes the format it used in the response.
constexpr const char *FORMAT_HEADER = "x-clickhouse-format";
// Private request metadata holding FormatDecision::format once the format is resolved.
constexpr const char *FORMAT_PRIVATE_KEY = "clickhouse_format";

struct FormatDecision {
	// Canonical token, or FORMAT_DATAFRAME.
	std::string format;
	// Value of the x-clickhouse-format request header.
	std::string header;

	bool IsDataFrame() const {
		return format == FORMAT_DATAFRAME;
	}
};

const std::vector<std::string> &SupportedFormats();

bool IsSupportedFormat(const std::string &format);

// Alias -> canonical name, or an empty string when token is not an alias.
std::string NormalizeFormatAlias(const std::string &token);

/**
 * Resolves a user supplied format token.
 *
 * Canonical names pass through, tsv/csv/json map to TabSeparated/CSV/JSON and "dataframe"
 * (or "explorer") resolves only when table decoding is available. Throws ValidationException
 * for unknown tokens and MissingDependencyException for an unavailable "dataframe".
 */
FormatDecision ResolveFormat(const std::string &token, bool tableDecodingAvailable);

std::string MissingTableDecoderMessage();

} // namespace chhttp
