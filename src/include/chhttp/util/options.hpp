#pragma once

#include <map>
#include <string>
#include <utility>

namespace chhttp {

using OptionMap = std::map<std::string, std::string>;

constexpr const char *OPTION_BASE_URL = "base_url";
constexpr const char *OPTION_FORMAT = "format";
constexpr const char *OPTION_DATABASE = "database";
constexpr const char *OPTION_METHOD = "method";
constexpr const char *OPTION_DECODE_BODY = "decode_body";
constexpr const char *OPTION_USER = "user";
constexpr const char *OPTION_PASSWORD = "password";
constexpr const char *OPTION_TOKEN = "token";
constexpr const char *OPTION_HTTP_PROXY = "http_proxy";
constexpr const char *OPTION_HTTP_PROXY_USERNAME = "http_proxy_username";
constexpr const char *OPTION_HTTP_PROXY_PASSWORD = "http_proxy_password";
constexpr const char *OPTION_CONNECT_TIMEOUT = "connect_timeout";
constexpr const char *OPTION_READ_TIMEOUT = "read_timeout";

std::string GetStringOption(const OptionMap &options, const std::string &name, const std::string &default_value = "");

// Returns {value, was_set}.
std::pair<bool, bool> GetBoolOption(const OptionMap &options, const std::string &name, bool default_value = false);

int GetIntOption(const OptionMap &options, const std::string &name, int default_value = 0);

// Throws ValidationException naming the first option that is not recognized.
void ValidateOptions(const OptionMap &options);

// ValidateOptions, then rejects the proxy and timeout options, which only BuildClient reads.
void ValidateQueryOptions(const OptionMap &options);

// Entries of overrides win over those of base.
OptionMap MergeOptions(const OptionMap &base, const OptionMap &overrides);

/**
 * Reads CLICKHOUSE_URL, CLICKHOUSE_DATABASE, CLICKHOUSE_USER, CLICKHOUSE_PASSWORD and
 * http_proxy from the environment. Unset or empty variables are left out.
 */
OptionMap OptionsFromEnvironment();

} // namespace chhttp
