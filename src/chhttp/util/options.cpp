#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>

#include "chhttp/exception.hpp"
#include "chhttp/util/options.hpp"

namespace chhttp {

static const char *const KNOWN_OPTIONS[] = {
    OPTION_BASE_URL,
    OPTION_FORMAT,
    OPTION_DATABASE,
    OPTION_METHOD,
    OPTION_DECODE_BODY,
    OPTION_USER,
    OPTION_PASSWORD,
    OPTION_TOKEN,
    OPTION_HTTP_PROXY,
    OPTION_HTTP_PROXY_USERNAME,
    OPTION_HTTP_PROXY_PASSWORD,
    OPTION_CONNECT_TIMEOUT,
    OPTION_READ_TIMEOUT,
};

// Read once when the transport is created.
static const char *const CLIENT_ONLY_OPTIONS[] = {
    OPTION_HTTP_PROXY,
    OPTION_HTTP_PROXY_USERNAME,
    OPTION_HTTP_PROXY_PASSWORD,
    OPTION_CONNECT_TIMEOUT,
    OPTION_READ_TIMEOUT,
};

std::string GetStringOption(const OptionMap &options, const std::string &name, const std::string &default_value) {
	const auto it = options.find(name);
	if (it == options.end()) {
		return default_value;
	}
	return it->second;
}

std::pair<bool, bool> GetBoolOption(const OptionMap &options, const std::string &name, bool default_value) {
	const auto it = options.find(name);
	if (it == options.end()) {
		return std::make_pair(default_value, false);
	}
	std::string val = it->second;
	std::transform(val.begin(), val.end(), val.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	if (val == "true" || val == "1") {
		return std::make_pair(true, true);
	}
	if (val == "false" || val == "0") {
		return std::make_pair(false, true);
	}
	throw ValidationException(name + " option must be a single boolean value");
}

int GetIntOption(const OptionMap &options, const std::string &name, int default_value) {
	const auto it = options.find(name);
	if (it == options.end()) {
		return default_value;
	}
	try {
		size_t consumed = 0;
		long val = std::stol(it->second, &consumed);
		if (consumed != it->second.size() || val < 0 || val > std::numeric_limits<int>::max()) {
			throw ValidationException(name + " option must be a non-negative integer");
		}
		return static_cast<int>(val);
	} catch (const std::invalid_argument &) {
		throw ValidationException(name + " option must be a non-negative integer");
	} catch (const std::out_of_range &) {
		throw ValidationException(name + " option must be a non-negative integer");
	}
}

void ValidateOptions(const OptionMap &options) {
	for (const auto &option : options) {
		bool known = false;
		for (const auto *name : KNOWN_OPTIONS) {
			if (option.first == name) {
				known = true;
				break;
			}
		}
		if (!known) {
			throw ValidationException("unknown option \"" + option.first + "\"");
		}
	}
}

void ValidateQueryOptions(const OptionMap &options) {
	ValidateOptions(options);
	for (const auto &option : options) {
		for (const auto *name : CLIENT_ONLY_OPTIONS) {
			if (option.first == name) {
				throw ValidationException("option \"" + option.first + "\" can only be set when the client is built");
			}
		}
	}
}

OptionMap MergeOptions(const OptionMap &base, const OptionMap &overrides) {
	OptionMap merged = base;
	for (const auto &option : overrides) {
		merged[option.first] = option.second;
	}
	return merged;
}

static void ReadEnv(OptionMap &options, const char *variable, const char *option) {
	const char *value = std::getenv(variable);
	if (value && *value) {
		options[option] = value;
	}
}

OptionMap OptionsFromEnvironment() {
	OptionMap options;
	ReadEnv(options, "CLICKHOUSE_URL", OPTION_BASE_URL);
	ReadEnv(options, "CLICKHOUSE_DATABASE", OPTION_DATABASE);
	ReadEnv(options, "CLICKHOUSE_USER", OPTION_USER);
	ReadEnv(options, "CLICKHOUSE_PASSWORD", OPTION_PASSWORD);
	ReadEnv(options, "http_proxy", OPTION_HTTP_PROXY);
	return options;
}

} // namespace chhttp
