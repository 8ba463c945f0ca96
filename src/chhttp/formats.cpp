#include <algorithm>

#include "chhttp/exception.hpp"
#include "chhttp/formats.hpp"

namespace chhttp {

const std::vector<std::string> &SupportedFormats() {
	// Output formats listed at FORMATS_PAGE, case-sensitive.
	static const std::vector<std::string> formats = {
	    "TabSeparated", "TabSeparatedRaw", "TabSeparatedWithNames", "TabSeparatedWithNamesAndTypes",
	    "TabSeparatedRawWithNames", "TabSeparatedRawWithNamesAndTypes", "Template", "TemplateIgnoreSpaces", "CSV",
	    "CSVWithNames", "CSVWithNamesAndTypes", "CustomSeparated", "CustomSeparatedWithNames",
	    "CustomSeparatedWithNamesAndTypes", "SQLInsert", "Values", "Vertical", "JSON", "JSONAsString",
	    "JSONAsObject", "JSONStrings", "JSONColumns", "JSONColumnsWithMetadata", "JSONCompact",
	    "JSONCompactStrings", "JSONCompactColumns", "JSONEachRow", "PrettyJSONEachRow", "JSONEachRowWithProgress",
	    "JSONStringsEachRow", "JSONStringsEachRowWithProgress", "JSONCompactEachRow",
	    "JSONCompactEachRowWithNames", "JSONCompactEachRowWithNamesAndTypes", "JSONCompactStringsEachRow",
	    "JSONCompactStringsEachRowWithNames", "JSONCompactStringsEachRowWithNamesAndTypes", "JSONObjectEachRow",
	    "BSONEachRow", "TSKV", "Pretty", "PrettyNoEscapes", "PrettyMonoBlock", "PrettyNoEscapesMonoBlock",
	    "PrettyCompact", "PrettyCompactNoEscapes", "PrettyCompactMonoBlock", "PrettyCompactNoEscapesMonoBlock",
	    "PrettySpace", "PrettySpaceNoEscapes", "PrettySpaceMonoBlock", "PrettySpaceNoEscapesMonoBlock",
	    "Prometheus", "Protobuf", "ProtobufSingle", "ProtobufList", "Avro", "AvroConfluent", "Parquet",
	    "ParquetMetadata", "Arrow", "ArrowStream", "ORC", "One", "Npy", "RowBinary", "RowBinaryWithNames",
	    "RowBinaryWithNamesAndTypes", "RowBinaryWithDefaults", "Native", "Null", "XML", "CapnProto",
	    "LineAsString", "Regexp", "RawBLOB", "MsgPack", "MySQLDump", "DWARF", "Markdown", "Form",
	};
	return formats;
}

bool IsSupportedFormat(const std::string &format) {
	const auto &formats = SupportedFormats();
	return std::find(formats.begin(), formats.end(), format) != formats.end();
}

std::string NormalizeFormatAlias(const std::string &token) {
	if (token == "tsv") {
		return "TabSeparated";
	}
	if (token == "csv") {
		return "CSV";
	}
	if (token == "json") {
		return "JSON";
	}
	return "";
}

std::string MissingTableDecoderMessage() {
	return std::string("format: ") + FORMAT_DATAFRAME +
	       " - a table decoder with Parquet support (DuckDB) must be available in order to use this format";
}

FormatDecision ResolveFormat(const std::string &token, bool tableDecodingAvailable) {
	if (token == FORMAT_DATAFRAME || token == FORMAT_EXPLORER) {
		if (!tableDecodingAvailable) {
			throw MissingDependencyException(MissingTableDecoderMessage());
		}
		return FormatDecision {FORMAT_DATAFRAME, FORMAT_PARQUET};
	}

	auto canonical = NormalizeFormatAlias(token);
	if (!canonical.empty()) {
		return FormatDecision {canonical, canonical};
	}
	if (IsSupportedFormat(token)) {
		return FormatDecision {token, token};
	}

	throw ValidationException("the given format \"" + token + "\" is invalid. Expecting one of [tsv, csv, json, " +
	                          FORMAT_DATAFRAME + "] or one of the valid options described in " + FORMATS_PAGE);
}

} // namespace chhttp
