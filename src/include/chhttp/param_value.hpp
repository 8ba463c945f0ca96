#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace chhttp {

enum class ParamType : uint8_t {
	STRING,
	INTEGER,
	UNSIGNED,
	FLOAT,
	BOOLEAN,
	// Instant in time, stored as UTC microseconds since the Unix epoch.
	TIMESTAMP,
	// Calendar date without a time component.
	DATE,
	// Wall-clock date and time without a zone, microseconds since 1970-01-01 00:00:00.
	NAIVE_TIMESTAMP,
	ARRAY,
	TUPLE,
	MAP,
	// Pre-rendered text, emitted verbatim in every context.
	RAW
};

/**
 * A query parameter value bound to a {name:Type} placeholder.
 *
 * Scalars convert implicitly so that parameter lists read naturally:
 *
 *     QueryParams params = {{"num", 5}, {"name", "alice"}, {"ids", ParamValue::Array({1, 2, 3})}};
 */
class ParamValue {
public:
	ParamValue(const char *value);
	ParamValue(std::string value);
	// Any integer type except bool; signed ones become INTEGER, unsigned ones UNSIGNED.
	template <typename T, typename std::enable_if<std::is_integral<T>::value && !std::is_same<T, bool>::value &&
	                                                  std::is_signed<T>::value,
	                                              int>::type = 0>
	ParamValue(T value) : type(ParamType::INTEGER), integer(static_cast<int64_t>(value)) {
	}
	template <typename T, typename std::enable_if<std::is_integral<T>::value && !std::is_same<T, bool>::value &&
	                                                  std::is_unsigned<T>::value,
	                                              int>::type = 0>
	ParamValue(T value) : type(ParamType::UNSIGNED), unsignedInteger(static_cast<uint64_t>(value)) {
	}
	ParamValue(double value);
	ParamValue(bool value);

	static ParamValue Timestamp(std::chrono::system_clock::time_point instant);
	static ParamValue TimestampMicros(int64_t utc_micros);
	// local_micros is the wall-clock reading at the given offset east of UTC.
	static ParamValue ZonedTimestamp(int64_t local_micros, int32_t utc_offset_seconds);
	static ParamValue Date(int32_t year, int32_t month, int32_t day);
	static ParamValue NaiveTimestamp(int32_t year, int32_t month, int32_t day, int32_t hour, int32_t minute,
	                                 int32_t second, int32_t microsecond = 0);
	static ParamValue Array(std::vector<ParamValue> elements);
	static ParamValue Tuple(std::vector<ParamValue> elements);
	static ParamValue Map(std::vector<std::pair<ParamValue, ParamValue>> entries);
	static ParamValue Raw(std::string text);

	ParamType Type() const {
		return type;
	}

	const std::string &GetString() const;
	int64_t GetInteger() const;
	uint64_t GetUnsigned() const;
	double GetFloat() const;
	bool GetBoolean() const;
	// TIMESTAMP: UTC micros. NAIVE_TIMESTAMP: wall-clock micros. DATE: days since 1970-01-01.
	int64_t GetMicros() const;
	int64_t GetDays() const;
	// ARRAY and TUPLE elements, MAP values.
	const std::vector<ParamValue> &GetChildren() const;
	// MAP keys, parallel to GetChildren().
	const std::vector<ParamValue> &GetKeys() const;

private:
	explicit ParamValue(ParamType type) : type(type) {
	}

	ParamType type;
	std::string str;
	int64_t integer = 0;
	uint64_t unsignedInteger = 0;
	double floating = 0;
	bool boolean = false;
	std::vector<ParamValue> keys;
	std::vector<ParamValue> children;
};

using QueryParams = std::vector<std::pair<std::string, ParamValue>>;

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t DaysFromCivil(int32_t year, int32_t month, int32_t day);

} // namespace chhttp
