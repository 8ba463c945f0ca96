#pragma once

#include "chhttp/request.hpp"
#include "chhttp/table/table_decoder.hpp"

namespace chhttp {

/**
 * The clickhouse_result response step.
 *
 * Decodes the body into a table only for a 200 response to a dataframe request whose echoed format
 * header is exactly Parquet. A FORMAT clause in the SQL makes the server answer in another format;
 * that body is left as it is. On decode the raw body is cleared and the pipeline halts.
 *
 * Throws MissingDependencyException when decoding is due but decoder is null or unavailable, and
 * lets DecodeException from the decoder through.
 */
StepResult HandleClickHouseResult(const QueryRequest &request, QueryResponse &response, ITableDecoder *decoder);

} // namespace chhttp
