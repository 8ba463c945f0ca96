#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <set>

#include "chhttp/exception.hpp"
#include "chhttp/param_encoder.hpp"

namespace chhttp {

constexpr int64_t MICROS_PER_SECOND = 1000000;
constexpr int64_t MICROS_PER_DAY = 86400 * MICROS_PER_SECOND;

static std::string EscapeText(const std::string &text) {
	std::string escaped;
	escaped.reserve(text.size());
	for (char c : text) {
		switch (c) {
		case '\\':
			escaped += "\\\\";
			break;
		case '\t':
			escaped += "\\t";
			break;
		case '\n':
			escaped += "\\n";
			break;
		default:
			escaped += c;
		}
	}
	return escaped;
}

static std::string Quote(const std::string &text) {
	std::string quoted = "'";
	for (char c : text) {
		if (c == '\'') {
			quoted += "''";
		} else {
			quoted += c;
		}
	}
	quoted += "'";
	return quoted;
}

static void CivilFromDays(int64_t days, int64_t &year, int64_t &month, int64_t &day) {
	days += 719468;
	int64_t era = (days >= 0 ? days : days - 146096) / 146097;
	int64_t doe = days - era * 146097;
	int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	int64_t mp = (5 * doy + 2) / 153;
	day = doy - (153 * mp + 2) / 5 + 1;
	month = mp < 10 ? mp + 3 : mp - 9;
	year = yoe + era * 400 + (month <= 2 ? 1 : 0);
}

std::string FormatEpochSeconds(int64_t utc_micros) {
	int64_t seconds = utc_micros / MICROS_PER_SECOND;
	int64_t fraction = utc_micros % MICROS_PER_SECOND;
	if (fraction == 0) {
		return std::to_string(seconds);
	}
	uint64_t absSeconds = seconds < 0 ? 0 - static_cast<uint64_t>(seconds) : static_cast<uint64_t>(seconds);
	uint64_t absFraction = fraction < 0 ? static_cast<uint64_t>(-fraction) : static_cast<uint64_t>(fraction);
	char buffer[48];
	std::snprintf(buffer, sizeof(buffer), "%s%llu.%06llu", utc_micros < 0 ? "-" : "",
	              static_cast<unsigned long long>(absSeconds), static_cast<unsigned long long>(absFraction));
	return buffer;
}

std::string FormatDate(int64_t days) {
	int64_t year, month, day;
	CivilFromDays(days, year, month, day);
	char buffer[32];
	std::snprintf(buffer, sizeof(buffer), "%04lld-%02lld-%02lld", static_cast<long long>(year),
	              static_cast<long long>(month), static_cast<long long>(day));
	return buffer;
}

std::string FormatNaiveTimestamp(int64_t micros) {
	int64_t days = micros / MICROS_PER_DAY;
	int64_t timeOfDay = micros % MICROS_PER_DAY;
	if (timeOfDay < 0) {
		days -= 1;
		timeOfDay += MICROS_PER_DAY;
	}
	int64_t fraction = timeOfDay % MICROS_PER_SECOND;
	int64_t secondOfDay = timeOfDay / MICROS_PER_SECOND;

	char buffer[48];
	std::snprintf(buffer, sizeof(buffer), "%s %02lld:%02lld:%02lld", FormatDate(days).c_str(),
	              static_cast<long long>(secondOfDay / 3600), static_cast<long long>((secondOfDay / 60) % 60),
	              static_cast<long long>(secondOfDay % 60));
	std::string result = buffer;
	if (fraction != 0) {
		std::snprintf(buffer, sizeof(buffer), ".%06lld", static_cast<long long>(fraction));
		result += buffer;
	}
	return result;
}

std::string FormatFloat(double value) {
	if (std::isnan(value)) {
		return "nan";
	}
	if (std::isinf(value)) {
		return value > 0 ? "inf" : "-inf";
	}
	// Shortest representation that parses back to the same double. Plain notation in [1e-4, 1e16).
	char buffer[400];
	double magnitude = std::fabs(value);
	bool fixed = magnitude == 0 || (magnitude >= 1e-4 && magnitude < 1e16);
	int maxPrecision = fixed ? 21 : 17;
	for (int precision = 1; precision <= maxPrecision; precision++) {
		std::snprintf(buffer, sizeof(buffer), fixed ? "%.*f" : "%.*g", precision, value);
		if (std::strtod(buffer, nullptr) == value) {
			break;
		}
	}
	std::string text = buffer;
	if (text.find_first_of(".e") == std::string::npos) {
		text += ".0";
	}
	return text;
}

static std::string JoinNested(const std::vector<ParamValue> &elements, char open, char close) {
	std::string result(1, open);
	for (size_t i = 0; i < elements.size(); i++) {
		if (i > 0) {
			result += ',';
		}
		result += EncodeNestedParamValue(elements[i]);
	}
	result += close;
	return result;
}

std::string EncodeParamValue(const ParamValue &value) {
	switch (value.Type()) {
	case ParamType::STRING:
		return EscapeText(value.GetString());
	case ParamType::INTEGER:
		return std::to_string(value.GetInteger());
	case ParamType::UNSIGNED:
		return std::to_string(value.GetUnsigned());
	case ParamType::FLOAT:
		return FormatFloat(value.GetFloat());
	case ParamType::BOOLEAN:
		return value.GetBoolean() ? "true" : "false";
	case ParamType::TIMESTAMP:
		return FormatEpochSeconds(value.GetMicros());
	case ParamType::DATE:
		return FormatDate(value.GetDays());
	case ParamType::NAIVE_TIMESTAMP:
		return FormatNaiveTimestamp(value.GetMicros());
	case ParamType::ARRAY:
		return JoinNested(value.GetChildren(), '[', ']');
	case ParamType::TUPLE:
		return JoinNested(value.GetChildren(), '(', ')');
	case ParamType::MAP: {
		const auto &keys = value.GetKeys();
		const auto &values = value.GetChildren();
		std::string result = "{";
		for (size_t i = 0; i < keys.size(); i++) {
			if (i > 0) {
				result += ',';
			}
			result += EncodeNestedParamValue(keys[i]) + ":" + EncodeNestedParamValue(values[i]);
		}
		result += "}";
		return result;
	}
	case ParamType::RAW:
		return value.GetString();
	}
	throw ValidationException("unsupported parameter type");
}

std::string EncodeNestedParamValue(const ParamValue &value) {
	switch (value.Type()) {
	case ParamType::STRING:
		return Quote(EscapeText(value.GetString()));
	case ParamType::DATE:
	case ParamType::NAIVE_TIMESTAMP:
		return Quote(EncodeParamValue(value));
	default:
		return EncodeParamValue(value);
	}
}

QueryPairs EncodeParams(const QueryParams &params) {
	QueryPairs pairs;
	pairs.reserve(params.size());
	std::set<std::string> seen;
	for (const auto &param : params) {
		if (param.first.empty()) {
			throw ValidationException("query parameter names must not be empty");
		}
		if (!seen.insert(param.first).second) {
			throw ValidationException("duplicate query parameter \"" + param.first + "\"");
		}
		pairs.emplace_back(PARAM_PREFIX + param.first, EncodeParamValue(param.second));
	}
	return pairs;
}

std::string EncodeParamsQuery(const QueryParams &params) {
	return EncodeQuery(EncodeParams(params), UrlEncoding::RFC3986);
}

} // namespace chhttp
