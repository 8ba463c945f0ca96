#pragma once

#include <string>

namespace chhttp {
namespace log {

enum class Level { DBG, INFO, WARN, ERROR };

// Threshold comes from CHHTTP_LOG_LEVEL (debug, info, warn, error) and defaults to WARN.
Level GetLevel();
void SetLevel(Level level);
bool IsEnabled(Level level);

void Write(Level level, const std::string &msg);

inline void debug(const std::string &msg) {
	if (IsEnabled(Level::DBG)) {
		Write(Level::DBG, msg);
	}
}

inline void info(const std::string &msg) {
	if (IsEnabled(Level::INFO)) {
		Write(Level::INFO, msg);
	}
}

inline void warn(const std::string &msg) {
	if (IsEnabled(Level::WARN)) {
		Write(Level::WARN, msg);
	}
}

inline void error(const std::string &msg) {
	if (IsEnabled(Level::ERROR)) {
		Write(Level::ERROR, msg);
	}
}

} // namespace log
} // namespace chhttp
