#include "catch.hpp"

#include <set>
#include <thread>

#include "chhttp/auth/basic_auth.hpp"
#include "chhttp/auth/bearer_token_auth.hpp"
#include "chhttp/client.hpp"
#include "chhttp/exception.hpp"
#include "chhttp/table/mock_table_decoder.hpp"
#include "chhttp/transport/mock_http_client.hpp"

static chhttp::HttpResponse ClickHouseResponse(int status, const std::string &format, const std::string &body) {
	chhttp::HttpResponse response {status, {}, body};
	chhttp::AddHeader(response.headers, "X-ClickHouse-Format", format);
	return response;
}

// =============================================================================
// ClickHouseClient request shaping
// =============================================================================

TEST_CASE("ClickHouseClient sends a default TSV query", "[client]") {
	auto mockHttp = std::make_shared<chhttp::MockHttpClient>();
	mockHttp->AddResponse(ClickHouseResponse(200, "TabSeparated", "0\n1\n2\n"));
	chhttp::ClickHouseClient client(mockHttp);

	auto response = client.Query("SELECT number FROM numbers LIMIT 3");

	REQUIRE(response.statusCode == 200);
	REQUIRE(response.body == "0\n1\n2\n");
	auto requests = mockHttp->GetRecordedRequests();
	REQUIRE(requests.size() == 1);
	REQUIRE(requests[0].method == chhttp::HttpMethod::POST);
	REQUIRE(requests[0].url == "http://localhost:8123");
	REQUIRE(requests[0].body == "SELECT number FROM numbers LIMIT 3");
	REQUIRE(chhttp::GetHeader(requests[0].headers, "x-clickhouse-format") == "TabSeparated");
}

TEST_CASE("ClickHouseClient sets the User-Agent header", "[client]") {
	auto mockHttp = std::make_shared<chhttp::MockHttpClient>();
	mockHttp->AddResponse(ClickHouseResponse(200, "TabSeparated", "1\n"));
	chhttp::ClickHouseClient client(mockHttp);

	client.Query("SELECT 1");

	auto userAgent = chhttp::GetHeader(mockHttp->GetRecordedRequests()[0].headers, "User-Agent");
	REQUIRE(userAgent.find("chhttp/") == 0);
}

TEST_CASE("ClickHouseClient sets the Authorization header", "[client]") {
	auto mockHttp = std::make_shared<chhttp::MockHttpClient>();
	mockHttp->AddResponse(ClickHouseResponse(200, "TabSeparated", "1\n"));
	auto auth = std::make_shared<chhttp::BasicAuth>("default", "secret");
	chhttp::ClickHouseClient client(mockHttp, {}, auth);

	client.Query("SELECT 1");

	auto requests = mockHttp->GetRecordedRequests();
	REQUIRE(chhttp::GetHeader(requests[0].headers, "Authorization") == "Basic ZGVmYXVsdDpzZWNyZXQ=");
}

TEST_CASE("Per-query credentials replace the client's", "[client]") {
	auto mockHttp = std::make_shared<chhttp::MockHttpClient>();
	mockHttp->AddResponse(ClickHouseResponse(200, "TabSeparated", "1\n"));
	auto auth = std::make_shared<chhttp::BasicAuth>("default", "secret");
	chhttp::ClickHouseClient client(mockHttp, {}, auth);

	client.Query("SELECT 1", {}, {{"token", "abc"}});

	REQUIRE(chhttp::GetHeader(mockHttp->GetRecordedRequests()[0].headers, "Authorization") == "Bearer abc");
}

TEST_CASE("ClickHouseClient sends custom headers", "[client]") {
	auto mockHttp = std::make_shared<chhttp::MockHttpClient>();
	mockHttp->AddResponse(ClickHouseResponse(200, "TabSeparated", "1\n"));
	chhttp::HttpHeaders headers;
	chhttp::AddHeader(headers, "X-ClickHouse-Quota", "reports");
	chhttp::AddHeader(headers, "User-Agent", "reports-job/1.2");
	chhttp::ClickHouseClient client(mockHttp, {}, nullptr, nullptr, headers);

	client.Query("SELECT 1");

	auto requests = mockHttp->GetRecordedRequests();
	REQUIRE(chhttp::GetHeader(requests[0].headers, "X-ClickHouse-Quota") == "reports");
	REQUIRE(chhttp::GetHeaderValues(requests[0].headers, "User-Agent") == std::vector<std::string> {"reports-job/1.2"});
}

TEST_CASE("ClickHouseClient GET query", "[client]") {
	auto mockHttp = std::make_shared<chhttp::MockHttpClient>();
	mockHttp->AddResponse(ClickHouseResponse(200, "TabSeparated", "1\n"));
	chhttp::ClickHouseClient client(mockHttp, {{"method", "GET"}});

	client.Query("SELECT 1");

	auto requests = mockHttp->GetRecordedRequests();
	REQUIRE(requests[0].method == chhttp::HttpMethod::GET);
	REQUIRE(requests[0].url == "http://localhost:8123?query=SELECT+1");
	REQUIRE(requests[0].body.empty());
}

TEST_CASE("ClickHouseClient sends parameters and database", "[client]") {
	auto mockHttp = std::make_shared<chhttp::MockHttpClient>();
	mockHttp->AddResponse(ClickHouseResponse(200, "CSV", "\"a\",1\n"));
	chhttp::ClickHouseClient client(mockHttp, {{"base_url", "https://ch.example.com:8443"}, {"database", "system"}});

	client.Query("SELECT {name:String}, {ids:Array(UInt8)}", {{"name", "a"}, {"ids", chhttp::ParamValue::Array({1, 2})}},
	             {{"format", "csv"}});

	auto requests = mockHttp->GetRecordedRequests();
	REQUIRE(requests[0].url == "https://ch.example.com:8443?param_name=a&param_ids=%5B1%2C2%5D&database=system");
	REQUIRE(chhttp::GetHeader(requests[0].headers, "x-clickhouse-format") == "CSV");
}

TEST_CASE("Per-query options override client options", "[client]") {
	auto mockHttp = std::make_shared<chhttp::MockHttpClient>();
	mockHttp->AddResponse(ClickHouseResponse(200, "JSON", "{}"));
	mockHttp->AddResponse(ClickHouseResponse(200, "CSV", ""));
	chhttp::ClickHouseClient client(mockHttp, {{"format", "csv"}, {"database", "a"}});

	client.Query("SELECT 1", {}, {{"format", "json"}, {"database", "b"}});
	client.Query("SELECT 1");

	auto requests = mockHttp->GetRecordedRequests();
	REQUIRE(chhttp::GetHeader(requests[0].headers, "x-clickhouse-format") == "JSON");
	REQUIRE(requests[0].url == "http://localhost:8123?database=b");
	REQUIRE(chhttp::GetHeader(requests[1].headers, "x-clickhouse-format") == "CSV");
	REQUIRE(requests[1].url == "http://localhost:8123?database=a");
}

TEST_CASE("ClickHouseClient rejects unknown options", "[client]") {
	auto mockHttp = std::make_shared<chhttp::MockHttpClient>();
	REQUIRE_THROWS_AS(chhttp::ClickHouseClient(mockHttp, {{"hostname", "x"}}), chhttp::ValidationException);

	chhttp::ClickHouseClient client(mockHttp);
	REQUIRE_THROWS_AS(client.Query("SELECT 1", {}, {{"hostname", "x"}}), chhttp::ValidationException);
	REQUIRE(mockHttp->GetRecordedRequests().empty());
}

TEST_CASE("Proxy and timeout options are only accepted when the client is built", "[client]") {
	auto mockHttp = std::make_shared<chhttp::MockHttpClient>();
	chhttp::ClickHouseClient client(mockHttp, {{"connect_timeout", "5"}, {"http_proxy", "proxy:3128"}});

	for (const auto &name :
	     {"http_proxy", "http_proxy_username", "http_proxy_password", "connect_timeout", "read_timeout"}) {
		auto result = client.TryQuery("SELECT 1", {}, {{name, "5"}});
		REQUIRE(result.errorType == chhttp::ErrorType::VALIDATION);
		REQUIRE(result.GetError() == "option \"" + std::string(name) + "\" can only be set when the client is built");
	}
	REQUIRE_THROWS_AS(client.Query("SELECT 1", {}, {{"read_timeout", "abc"}}), chhttp::ValidationException);
	REQUIRE(mockHttp->GetRecordedRequests().empty());
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_CASE("Concurrent queries on one client keep their own settings", "[client]") {
	const int threadCount = 12;
	const char *formats[] = {"csv", "json", "dataframe"};
	const char *headers[] = {"CSV", "JSON", "Parquet"};

	auto mockHttp = std::make_shared<chhttp::MockHttpClient>();
	for (int i = 0; i < threadCount; i++) {
		mockHttp->AddResponse({200, {}, "ok"});
	}
	auto decoder = std::make_shared<chhttp::MockTableDecoder>();
	chhttp::ClickHouseClient client(mockHttp, {{"database", "default"}}, nullptr, decoder);

	std::vector<chhttp::ErrorType> errors(threadCount, chhttp::ErrorType::NONE);
	std::vector<std::thread> threads;
	for (int i = 0; i < threadCount; i++) {
		threads.emplace_back([&, i]() {
			auto result = client.TryQuery("SELECT {id:UInt32}", {{"id", i}},
			                              {{"format", formats[i % 3]}, {"database", "db" + std::to_string(i)}});
			errors[i] = result.errorType;
		});
	}
	for (auto &thread : threads) {
		thread.join();
	}

	for (auto error : errors) {
		REQUIRE(error == chhttp::ErrorType::NONE);
	}
	auto requests = mockHttp->GetRecordedRequests();
	REQUIRE(requests.size() == static_cast<size_t>(threadCount));
	std::set<int> seen;
	for (const auto &request : requests) {
		auto start = request.url.find("param_id=");
		REQUIRE(start != std::string::npos);
		start += 9;
		int id = std::stoi(request.url.substr(start, request.url.find('&', start) - start));
		seen.insert(id);

		REQUIRE(request.url ==
		        "http://localhost:8123?param_id=" + std::to_string(id) + "&database=db" + std::to_string(id));
		REQUIRE(request.body == "SELECT {id:UInt32}");
		REQUIRE(chhttp::GetHeaderValues(request.headers, "x-clickhouse-format") ==
		        std::vector<std::string> {headers[id % 3]});
	}
	REQUIRE(seen.size() == static_cast<size_t>(threadCount));
	REQUIRE(decoder->GetDecodedBodies().empty());
}

// =============================================================================
// Responses
// =============================================================================

TEST_CASE("Server errors are returned with the body intact", "[client]") {
	auto mockHttp = std::make_shared<chhttp::MockHttpClient>();
	std::string error = "Code: 81. DB::Exception: Database missing_db does not exist. (UNKNOWN_DATABASE)";
	mockHttp->AddResponse({404, {}, error});
	chhttp::ClickHouseClient client(mockHttp, {{"database", "missing_db"}});

	auto response = client.Query("SELECT 1");

	REQUIRE(response.statusCode == 404);
	REQUIRE(response.body == error);
	REQUIRE_FALSE(response.IsSuccess());
	REQUIRE_THROWS_AS(response.EnsureSuccess(), chhttp::ServerException);
	try {
		response.EnsureSuccess();
	} catch (const chhttp::ServerException &e) {
		REQUIRE(e.GetStatusCode() == 404);
		REQUIRE(e.GetServerMessage() == error);
	}
}

TEST_CASE("ClickHouseClient decodes JSON bodies", "[client]") {
	auto mockHttp = std::make_shared<chhttp::MockHttpClient>();
	auto http = ClickHouseResponse(200, "JSON", R"({"data": [{"number": "0"}], "rows": 1})");
	chhttp::AddHeader(http.headers, "Content-Type", "application/json; charset=UTF-8");
	mockHttp->AddResponse(http);
	mockHttp->AddResponse(http);
	chhttp::ClickHouseClient client(mockHttp);

	auto decoded = client.Query("SELECT number FROM numbers LIMIT 1", {}, {{"format", "json"}});
	REQUIRE(decoded.HasJson());
	REQUIRE(decoded.json["rows"] == 1);

	auto raw = client.Query("SELECT number FROM numbers LIMIT 1", {}, {{"format", "json"}, {"decode_body", "false"}});
	REQUIRE_FALSE(raw.HasJson());
	REQUIRE(raw.body == R"({"data": [{"number": "0"}], "rows": 1})");
}

TEST_CASE("ClickHouseClient decodes dataframe results", "[client]") {
	auto mockHttp = std::make_shared<chhttp::MockHttpClient>();
	auto http = ClickHouseResponse(200, "Parquet", "PAR1...PAR1");
	// A JSON content type must not reach decode_body once the table step halts.
	chhttp::AddHeader(http.headers, "Content-Type", "application/json");
	mockHttp->AddResponse(http);

	auto decoder = std::make_shared<chhttp::MockTableDecoder>();
	chhttp::DataColumn column;
	column.name = "number";
	column.type = duckdb::LogicalType::UBIGINT;
	column.values = {duckdb::Value::UBIGINT(0)};
	decoder->SetTable(std::make_shared<chhttp::DataTable>(std::vector<chhttp::DataColumn> {column}));
	chhttp::ClickHouseClient client(mockHttp, {}, nullptr, decoder);

	auto response = client.Query("SELECT number FROM numbers LIMIT 1", {}, {{"format", "dataframe"}});

	REQUIRE(chhttp::GetHeader(mockHttp->GetRecordedRequests()[0].headers, "x-clickhouse-format") == "Parquet");
	REQUIRE(response.HasTable());
	REQUIRE(response.table->ColumnIndex("number") == 0);
	REQUIRE(response.body.empty());
	REQUIRE_FALSE(response.HasJson());
}

TEST_CASE("dataframe results honour a FORMAT clause in the SQL", "[client]") {
	auto mockHttp = std::make_shared<chhttp::MockHttpClient>();
	mockHttp->AddResponse(ClickHouseResponse(200, "CSV", "0\n"));
	auto decoder = std::make_shared<chhttp::MockTableDecoder>();
	chhttp::ClickHouseClient client(mockHttp, {}, nullptr, decoder);

	auto response = client.Query("SELECT number FROM numbers LIMIT 1 FORMAT CSV", {}, {{"format", "dataframe"}});

	REQUIRE_FALSE(response.HasTable());
	REQUIRE(response.body == "0\n");
	REQUIRE(decoder->GetDecodedBodies().empty());
}

// =============================================================================
// TryQuery
// =============================================================================

TEST_CASE("TryQuery returns the response on success", "[client]") {
	auto mockHttp = std::make_shared<chhttp::MockHttpClient>();
	mockHttp->AddResponse(ClickHouseResponse(200, "TabSeparated", "0\n1\n2\n"));
	chhttp::ClickHouseClient client(mockHttp);

	auto result = client.TryQuery("SELECT number FROM numbers LIMIT 3");

	REQUIRE_FALSE(result.HasError());
	REQUIRE(result.errorType == chhttp::ErrorType::NONE);
	REQUIRE(result.response.body == "0\n1\n2\n");
}

TEST_CASE("TryQuery reports validation errors before sending", "[client]") {
	auto mockHttp = std::make_shared<chhttp::MockHttpClient>();
	chhttp::ClickHouseClient client(mockHttp);

	auto missingSql = client.TryQuery("");
	REQUIRE(missingSql.errorType == chhttp::ErrorType::VALIDATION);
	REQUIRE(missingSql.GetError() == "the sql query is required");

	auto badFormat = client.TryQuery("SELECT 1", {}, {{"format", "bogus"}});
	REQUIRE(badFormat.errorType == chhttp::ErrorType::VALIDATION);
	REQUIRE(badFormat.GetError().find("\"bogus\"") != std::string::npos);

	REQUIRE(mockHttp->GetRecordedRequests().empty());
}

TEST_CASE("TryQuery reports a missing table decoder", "[client]") {
	auto mockHttp = std::make_shared<chhttp::MockHttpClient>();
	chhttp::ClickHouseClient client(mockHttp);

	auto result = client.TryQuery("SELECT 1", {}, {{"format", "dataframe"}});

	REQUIRE(result.errorType == chhttp::ErrorType::MISSING_DEPENDENCY);
	REQUIRE(mockHttp->GetRecordedRequests().empty());
}

TEST_CASE("TryQuery reports transport failures", "[client]") {
	auto mockHttp = std::make_shared<chhttp::MockHttpClient>();
	mockHttp->AddFailure("HTTP request failed: Could not establish connection");
	chhttp::ClickHouseClient client(mockHttp);

	auto result = client.TryQuery("SELECT 1");

	REQUIRE(result.errorType == chhttp::ErrorType::TRANSPORT);
	REQUIRE(result.GetError() == "HTTP request failed: Could not establish connection");
}

TEST_CASE("TryQuery reports decode failures instead of the raw body", "[client]") {
	auto mockHttp = std::make_shared<chhttp::MockHttpClient>();
	mockHttp->AddResponse(ClickHouseResponse(200, "Parquet", "garbage"));
	auto decoder = std::make_shared<chhttp::MockTableDecoder>();
	decoder->SetFailure("Failed to decode Parquet body");
	chhttp::ClickHouseClient client(mockHttp, {}, nullptr, decoder);

	auto result = client.TryQuery("SELECT 1", {}, {{"format", "dataframe"}});

	REQUIRE(result.errorType == chhttp::ErrorType::DECODE);
	REQUIRE(result.response.body.empty());
}

TEST_CASE("TryQuery returns server errors as responses", "[client]") {
	auto mockHttp = std::make_shared<chhttp::MockHttpClient>();
	mockHttp->AddResponse({500, {}, "Code: 60. DB::Exception: Unknown table"});
	chhttp::ClickHouseClient client(mockHttp);

	auto result = client.TryQuery("SELECT * FROM missing");

	REQUIRE_FALSE(result.HasError());
	REQUIRE(result.response.statusCode == 500);
	REQUIRE(result.response.body == "Code: 60. DB::Exception: Unknown table");
}

// =============================================================================
// BuildClient
// =============================================================================

TEST_CASE("BuildClient validates options", "[client]") {
	REQUIRE_THROWS_AS(chhttp::BuildClient({{"hostname", "x"}}), chhttp::ValidationException);
	REQUIRE_THROWS_AS(chhttp::BuildClient({{"password", "secret"}}), chhttp::ValidationException);
	REQUIRE_THROWS_AS(chhttp::BuildClient({{"http_proxy", "proxy:notaport"}}), chhttp::ValidationException);
	REQUIRE_THROWS_AS(chhttp::BuildClient({{"read_timeout", "soon"}}), chhttp::ValidationException);
}

TEST_CASE("BuildClient keeps its options", "[client]") {
	auto client = chhttp::BuildClient({{"database", "system"}, {"format", "csv"}});
	REQUIRE(client->GetOptions().at("database") == "system");

	auto request = client->BuildRequest("SELECT 1");
	REQUIRE(request.body == "SELECT 1");
	REQUIRE(request.requestSteps.size() == 1);
	REQUIRE(request.responseSteps.size() == 1);
	REQUIRE(request.responseSteps[0].name == "decode_body");
}
