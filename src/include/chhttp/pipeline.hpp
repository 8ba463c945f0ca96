#pragma once

#include <string>

#include "chhttp/request.hpp"
#include "chhttp/transport/http_client.hpp"

namespace chhttp {

constexpr const char *DECODE_BODY_STEP = "decode_body";

/**
 * Runs the request steps in order, sends the request and runs the response steps until one of them
 * returns StepResult::HALT. Steps may add further steps while they run.
 */
QueryResponse RunPipeline(QueryRequest &request, IHttpClient &http);

// Parses application/json bodies into QueryResponse::json. Turned off with decode_body=false.
StepResult DecodeJsonBody(const QueryRequest &request, QueryResponse &response);

// "application/json; charset=UTF-8" -> "application/json"
std::string MediaType(const std::string &contentType);

} // namespace chhttp
