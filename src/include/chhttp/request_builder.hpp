#pragma once

#include <memory>
#include <string>

#include "chhttp/param_value.hpp"
#include "chhttp/request.hpp"
#include "chhttp/table/table_decoder.hpp"
#include "chhttp/util/options.hpp"

namespace chhttp {

constexpr const char *DEFAULT_BASE_URL = "http://localhost:8123";

constexpr const char *CLICKHOUSE_RUN_STEP = "clickhouse_run";
constexpr const char *CLICKHOUSE_RESULT_STEP = "clickhouse_result";

// "GET" or "POST", case-insensitive. Throws ValidationException otherwise.
HttpMethod ParseHttpMethod(const std::string &method);

/**
 * Turns a base request into a ClickHouse query.
 *
 * options are merged over base.options. The SQL text is placed in the body (POST) or in the query
 * parameter (GET), the parameters are appended as param_<name> pairs and the clickhouse_run step is
 * prepended. That step resolves the format, sets the format header, appends the database and
 * prepends the clickhouse_result response step when the pipeline runs.
 *
 * Throws ValidationException when sql is empty, a parameter name repeats or an option is malformed.
 */
QueryRequest BuildQueryRequest(QueryRequest base, const std::string &sql, const QueryParams &params,
                               const OptionMap &options, std::shared_ptr<ITableDecoder> decoder);

// The clickhouse_run step. Does nothing when the request already carries a format decision.
void RunClickHouseStep(QueryRequest &request, const std::shared_ptr<ITableDecoder> &decoder);

} // namespace chhttp
