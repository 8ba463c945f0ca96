#pragma once

#include <string>

#include "chhttp/param_value.hpp"
#include "chhttp/util/url.hpp"

namespace chhttp {

constexpr const char *PARAM_PREFIX = "param_";

// Renders a top-level parameter value in ClickHouse's parameter text syntax.
std::string EncodeParamValue(const ParamValue &value);

// Renders a value that sits inside an array, tuple or map.
std::string EncodeNestedParamValue(const ParamValue &value);

// Turns each name into param_<name> and renders its value. Duplicate names are rejected.
QueryPairs EncodeParams(const QueryParams &params);

// EncodeParams, then percent-encoded as a query string fragment.
std::string EncodeParamsQuery(const QueryParams &params);

std::string FormatEpochSeconds(int64_t utc_micros);
std::string FormatDate(int64_t days);
std::string FormatNaiveTimestamp(int64_t micros);
std::string FormatFloat(double value);

} // namespace chhttp
