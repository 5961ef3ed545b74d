#pragma once

#include "filest/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace filest {

/**
 * @brief Runtime settings for the upload server
 *
 * Built from defaults, then an optional JSON file, then command-line flags
 * (later sources win).
 */
struct ServerConfig {
    std::string bind_address{"0.0.0.0"};
    std::uint16_t port{3000};
    std::filesystem::path root{"./files"};
    std::string username{"admin"};
    std::string password{"admin123"};
    std::filesystem::path staging_dir{std::filesystem::temp_directory_path() / "filest-staging"};
    std::size_t worker_threads{1};
    std::chrono::seconds session_ttl{3600};
    std::chrono::seconds sweep_interval{60};
    std::uint64_t max_body_bytes{500ULL * 1024 * 1024};
    std::uint64_t progress_interval{2ULL * 1024 * 1024};
    std::string log_level{"info"};
};

/**
 * @brief Overlay the keys present in a JSON config file onto @p config
 */
Result<void> apply_config_file(ServerConfig& config, const std::filesystem::path& file);

/**
 * @brief Range checks plus the root/staging separation
 *
 * The staging directory may not be the root, inside it, or above it.
 */
Result<void> validate_config(const ServerConfig& config);

/**
 * @brief Parse command-line flags
 *
 * A `--config <file>` flag is applied first regardless of its position so
 * that explicit flags always override file values.
 */
Result<ServerConfig> parse_command_line(const std::vector<std::string>& args);

std::string usage_text(const std::string& program);

} // namespace filest
