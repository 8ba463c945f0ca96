#pragma once

#include <memory>
#include <string>

#include "chhttp/auth/auth_provider.hpp"
#include "chhttp/param_value.hpp"
#include "chhttp/request.hpp"
#include "chhttp/table/table_decoder.hpp"
#include "chhttp/transport/http_client.hpp"
#include "chhttp/transport/http_type.hpp"
#include "chhttp/util/options.hpp"

namespace chhttp {

enum class ErrorType { NONE, VALIDATION, MISSING_DEPENDENCY, TRANSPORT, DECODE };

struct QueryResult {
	ErrorType errorType = ErrorType::NONE;
	std::string error;
	QueryResponse response;

	bool HasError() const {
		return errorType != ErrorType::NONE;
	}

	const std::string &GetError() const {
		return error;
	}
};

class ClickHouseClient {
public:
	// Throws ValidationException for unknown or malformed options.
	ClickHouseClient(std::shared_ptr<IHttpClient> http, OptionMap options = {},
	                 std::shared_ptr<IAuthProvider> auth = nullptr, std::shared_ptr<ITableDecoder> decoder = nullptr,
	                 HttpHeaders headers = {});

	// The request Query() would send, before its steps have run.
	QueryRequest BuildRequest(const std::string &sql, const QueryParams &params = {},
	                          const OptionMap &options = {}) const;

	// Non-2xx responses are returned, not thrown; see QueryResponse::EnsureSuccess().
	QueryResponse Query(const std::string &sql, const QueryParams &params = {}, const OptionMap &options = {}) const;

	// Same as Query(), with the library's errors reported in the result instead of thrown.
	QueryResult TryQuery(const std::string &sql, const QueryParams &params = {},
	                     const OptionMap &options = {}) const;

	const OptionMap &GetOptions() const {
		return options;
	}

private:
	std::shared_ptr<IHttpClient> http;
	OptionMap options;
	std::shared_ptr<IAuthProvider> auth;
	std::shared_ptr<ITableDecoder> decoder;
	HttpHeaders headers;

	static HttpHeaders BuildHeaders(IAuthProvider *auth, const HttpHeaders &custom);
};

/**
 * Client over cpp-httplib with credentials from user/password/token, proxy and timeouts from the
 * matching options and Parquet decoding through DuckDB.
 */
std::unique_ptr<ClickHouseClient> BuildClient(const OptionMap &options = {}, const HttpHeaders &headers = {});

} // namespace chhttp
