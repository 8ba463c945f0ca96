#include "chhttp/param_value.hpp"
#include "chhttp/exception.hpp"

namespace chhttp {

constexpr int64_t MICROS_PER_SECOND = 1000000;
constexpr int64_t MICROS_PER_DAY = 86400 * MICROS_PER_SECOND;

ParamValue::ParamValue(const char *value) : type(ParamType::STRING), str(value ? value : "") {
}

ParamValue::ParamValue(std::string value) : type(ParamType::STRING), str(std::move(value)) {
}

ParamValue::ParamValue(double value) : type(ParamType::FLOAT), floating(value) {
}

ParamValue::ParamValue(bool value) : type(ParamType::BOOLEAN), boolean(value) {
}

ParamValue ParamValue::Timestamp(std::chrono::system_clock::time_point instant) {
	auto micros = std::chrono::duration_cast<std::chrono::microseconds>(instant.time_since_epoch());
	return TimestampMicros(micros.count());
}

ParamValue ParamValue::TimestampMicros(int64_t utc_micros) {
	ParamValue result(ParamType::TIMESTAMP);
	result.integer = utc_micros;
	return result;
}

ParamValue ParamValue::ZonedTimestamp(int64_t local_micros, int32_t utc_offset_seconds) {
	return TimestampMicros(local_micros - static_cast<int64_t>(utc_offset_seconds) * MICROS_PER_SECOND);
}

static void CheckCivil(int32_t year, int32_t month, int32_t day) {
	static const int32_t DAYS_IN_MONTH[] = {31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (year < 0 || year > 9999 || month < 1 || month > 12 || day < 1 || day > DAYS_IN_MONTH[month - 1]) {
		throw ValidationException("invalid date " + std::to_string(year) + "-" + std::to_string(month) + "-" +
		                          std::to_string(day));
	}
	bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
	if (month == 2 && day == 29 && !leap) {
		throw ValidationException("invalid date " + std::to_string(year) + "-2-29");
	}
}

int64_t DaysFromCivil(int32_t year, int32_t month, int32_t day) {
	int64_t y = month <= 2 ? year - 1 : year;
	int64_t era = (y >= 0 ? y : y - 399) / 400;
	int64_t yoe = y - era * 400;
	int64_t mp = (month + 9) % 12;
	int64_t doy = (153 * mp + 2) / 5 + day - 1;
	int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + doe - 719468;
}

ParamValue ParamValue::Date(int32_t year, int32_t month, int32_t day) {
	CheckCivil(year, month, day);
	ParamValue result(ParamType::DATE);
	result.integer = DaysFromCivil(year, month, day);
	return result;
}

ParamValue ParamValue::NaiveTimestamp(int32_t year, int32_t month, int32_t day, int32_t hour, int32_t minute,
                                      int32_t second, int32_t microsecond) {
	CheckCivil(year, month, day);
	if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59 || microsecond < 0 ||
	    microsecond >= MICROS_PER_SECOND) {
		throw ValidationException("invalid time of day");
	}
	ParamValue result(ParamType::NAIVE_TIMESTAMP);
	result.integer = DaysFromCivil(year, month, day) * MICROS_PER_DAY +
	                 (static_cast<int64_t>(hour) * 3600 + minute * 60 + second) * MICROS_PER_SECOND + microsecond;
	return result;
}

ParamValue ParamValue::Array(std::vector<ParamValue> elements) {
	ParamValue result(ParamType::ARRAY);
	result.children = std::move(elements);
	return result;
}

ParamValue ParamValue::Tuple(std::vector<ParamValue> elements) {
	ParamValue result(ParamType::TUPLE);
	result.children = std::move(elements);
	return result;
}

ParamValue ParamValue::Map(std::vector<std::pair<ParamValue, ParamValue>> entries) {
	ParamValue result(ParamType::MAP);
	result.keys.reserve(entries.size());
	result.children.reserve(entries.size());
	for (auto &entry : entries) {
		result.keys.push_back(std::move(entry.first));
		result.children.push_back(std::move(entry.second));
	}
	return result;
}

ParamValue ParamValue::Raw(std::string text) {
	ParamValue result(ParamType::RAW);
	result.str = std::move(text);
	return result;
}

const std::string &ParamValue::GetString() const {
	return str;
}

int64_t ParamValue::GetInteger() const {
	return integer;
}

uint64_t ParamValue::GetUnsigned() const {
	return unsignedInteger;
}

double ParamValue::GetFloat() const {
	return floating;
}

bool ParamValue::GetBoolean() const {
	return boolean;
}

int64_t ParamValue::GetMicros() const {
	return integer;
}

int64_t ParamValue::GetDays() const {
	return integer;
}

const std::vector<ParamValue> &ParamValue::GetChildren() const {
	return children;
}

const std::vector<ParamValue> &ParamValue::GetKeys() const {
	return keys;
}

} // namespace chhttp
