#pragma once

#include <string>

namespace chhttp {

/**
 * Retrieves version from macro if present or empty string if not
 */
std::string getVersion();

} // namespace chhttp
