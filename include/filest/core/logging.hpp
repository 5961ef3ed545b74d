#pragma once

#include <string>

namespace filest {

/**
 * @brief Configure the default spdlog logger (pattern + level)
 *
 * Unknown level names fall back to info.
 */
void init_logging(const std::string& level);

} // namespace filest
