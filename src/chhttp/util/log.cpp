#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <mutex>

#include "chhttp/transport/http_type.hpp"
#include "chhttp/util/log.hpp"

namespace chhttp {
namespace log {

static Level LevelFromEnvironment() {
	const char *value = std::getenv("CHHTTP_LOG_LEVEL");
	if (!value) {
		return Level::WARN;
	}
	std::string level(value);
	if (EqualsIgnoreCase(level, "debug")) {
		return Level::DBG;
	}
	if (EqualsIgnoreCase(level, "info")) {
		return Level::INFO;
	}
	if (EqualsIgnoreCase(level, "error")) {
		return Level::ERROR;
	}
	return Level::WARN;
}

static std::atomic<Level> &Threshold() {
	static std::atomic<Level> threshold(LevelFromEnvironment());
	return threshold;
}

static std::mutex &LogMutex() {
	static std::mutex m;
	return m;
}

Level GetLevel() {
	return Threshold().load(std::memory_order_relaxed);
}

void SetLevel(Level level) {
	Threshold().store(level, std::memory_order_relaxed);
}

bool IsEnabled(Level level) {
	return static_cast<int>(level) >= static_cast<int>(GetLevel());
}

void Write(Level level, const std::string &msg) {
	const char *tag = "";
	switch (level) {
	case Level::DBG:
		tag = "DEBUG";
		break;
	case Level::INFO:
		tag = "INFO ";
		break;
	case Level::WARN:
		tag = "WARN ";
		break;
	case Level::ERROR:
		tag = "ERROR";
		break;
	}

	const auto now = std::chrono::system_clock::now();
	auto time = std::chrono::system_clock::to_time_t(now);
	const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

	std::tm tm_buf;
	::localtime_r(&time, &tm_buf);

	char time_buf[16];
	std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

	char prefix[48];
	std::snprintf(prefix, sizeof(prefix), "%s.%03d [%s] chhttp: ", time_buf, static_cast<int>(ms.count()), tag);

	std::lock_guard<std::mutex> lock(LogMutex());
	std::cerr << prefix << msg << '\n';
}

} // namespace log
} // namespace chhttp
