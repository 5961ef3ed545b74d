#include "filest/core/logging.hpp"

#include <spdlog/spdlog.h>

namespace filest {

void init_logging(const std::string& level) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
    }
    spdlog::set_level(parsed);
}

} // namespace filest
