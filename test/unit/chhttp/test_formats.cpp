#include "catch.hpp"

#include "chhttp/exception.hpp"
#include "chhttp/formats.hpp"

TEST_CASE("ResolveFormat returns canonical formats unchanged", "[formats]") {
	for (const auto &format : chhttp::SupportedFormats()) {
		auto decision = chhttp::ResolveFormat(format, false);
		REQUIRE(decision.format == format);
		REQUIRE(decision.header == format);
		REQUIRE_FALSE(decision.IsDataFrame());
	}
}

TEST_CASE("ResolveFormat maps aliases", "[formats]") {
	REQUIRE(chhttp::ResolveFormat("tsv", false).format == "TabSeparated");
	REQUIRE(chhttp::ResolveFormat("csv", false).format == "CSV");
	REQUIRE(chhttp::ResolveFormat("json", false).format == "JSON");
	REQUIRE(chhttp::ResolveFormat("csv", false).header == "CSV");
}

TEST_CASE("ResolveFormat is case-sensitive", "[formats]") {
	REQUIRE_THROWS_AS(chhttp::ResolveFormat("TSV", false), chhttp::ValidationException);
	REQUIRE_THROWS_AS(chhttp::ResolveFormat("parquet", false), chhttp::ValidationException);
}

TEST_CASE("ResolveFormat error names the bad token and lists the aliases", "[formats]") {
	try {
		chhttp::ResolveFormat("bogus", true);
		FAIL("expected ValidationException");
	} catch (const chhttp::ValidationException &e) {
		std::string message = e.what();
		REQUIRE(message.find("\"bogus\"") != std::string::npos);
		REQUIRE(message.find("[tsv, csv, json, dataframe]") != std::string::npos);
		REQUIRE(message.find("https://clickhouse.com/docs/en/interfaces/formats") != std::string::npos);
	}
}

TEST_CASE("ResolveFormat dataframe requests Parquet when decoding is available", "[formats]") {
	auto decision = chhttp::ResolveFormat("dataframe", true);
	REQUIRE(decision.format == "dataframe");
	REQUIRE(decision.header == "Parquet");
	REQUIRE(decision.IsDataFrame());
}

TEST_CASE("ResolveFormat dataframe without decoding is a missing dependency", "[formats]") {
	REQUIRE_THROWS_AS(chhttp::ResolveFormat("dataframe", false), chhttp::MissingDependencyException);
	REQUIRE_THROWS_WITH(chhttp::ResolveFormat("dataframe", false), chhttp::MissingTableDecoderMessage());
}

TEST_CASE("SupportedFormats covers the common formats", "[formats]") {
	REQUIRE(chhttp::IsSupportedFormat("TabSeparated"));
	REQUIRE(chhttp::IsSupportedFormat("JSONEachRow"));
	REQUIRE(chhttp::IsSupportedFormat("Parquet"));
	REQUIRE(chhttp::IsSupportedFormat("RowBinary"));
	REQUIRE_FALSE(chhttp::IsSupportedFormat("dataframe"));
	REQUIRE_FALSE(chhttp::IsSupportedFormat("tsv"));
}

TEST_CASE("ResolveFormat accepts explorer for dataframe", "[formats]") {
	auto decision = chhttp::ResolveFormat("explorer", true);
	REQUIRE(decision.format == "dataframe");
	REQUIRE(decision.header == "Parquet");
	REQUIRE(decision.IsDataFrame());
	REQUIRE_THROWS_AS(chhttp::ResolveFormat("explorer", false), chhttp::MissingDependencyException);
}
