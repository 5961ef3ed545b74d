#include "filest/core/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <limits>
#include <sstream>

namespace filest {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Result<std::uint64_t> parse_unsigned(const std::string& flag, const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return Err<std::uint64_t>(Error::invalid("Invalid value for " + flag + ": " + text));
    }
    try {
        return Ok(static_cast<std::uint64_t>(std::stoull(text)));
    } catch (const std::exception&) {
        return Err<std::uint64_t>(Error::invalid("Value out of range for " + flag + ": " + text));
    }
}

bool is_known_level(const std::string& level) {
    static const char* levels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    for (const auto* name : levels) {
        if (level == name) {
            return true;
        }
    }
    return false;
}

fs::path comparable(const fs::path& path) {
    std::error_code ec;
    auto resolved = fs::weakly_canonical(fs::absolute(path), ec);
    if (ec) {
        return fs::absolute(path).lexically_normal();
    }
    return resolved.lexically_normal();
}

// True when @p inner is @p outer or lies below it
bool contains(const fs::path& outer, const fs::path& inner) {
    const auto relative = inner.lexically_relative(outer);
    return !relative.empty() && *relative.begin() != "..";
}

Result<void> check_values(const ServerConfig& config) {
    if (config.worker_threads == 0) {
        return Err<void>(Error::invalid("worker_threads must be at least 1"));
    }
    if (config.progress_interval == 0) {
        return Err<void>(Error::invalid("progress_interval must be at least 1"));
    }
    if (config.session_ttl.count() < 1) {
        return Err<void>(Error::invalid("session_ttl must be at least 1 second"));
    }
    if (config.sweep_interval.count() < 1) {
        return Err<void>(Error::invalid("sweep_interval must be at least 1 second"));
    }
    if (!is_known_level(config.log_level)) {
        return Err<void>(Error::invalid("Unknown log level: " + config.log_level));
    }
    return Ok();
}

Result<void> apply_flag(ServerConfig& config, const std::string& flag, const std::string& value) {
    if (flag == "-r" || flag == "--root") {
        config.root = value;
    } else if (flag == "-u" || flag == "--user") {
        config.username = value;
    } else if (flag == "-P" || flag == "--password") {
        config.password = value;
    } else if (flag == "-b" || flag == "--bind") {
        config.bind_address = value;
    } else if (flag == "--staging") {
        config.staging_dir = value;
    } else if (flag == "--log-level") {
        if (!is_known_level(value)) {
            return Err<void>(Error::invalid("Unknown log level: " + value));
        }
        config.log_level = value;
    } else {
        auto number = parse_unsigned(flag, value);
        if (number.is_error()) {
            return Err<void>(number.error());
        }
        const auto n = number.value();
        if (flag == "-p" || flag == "--port") {
            if (n > std::numeric_limits<std::uint16_t>::max()) {
                return Err<void>(Error::invalid("Port out of range: " + value));
            }
            config.port = static_cast<std::uint16_t>(n);
        } else if (flag == "--threads") {
            if (n == 0) {
                return Err<void>(Error::invalid("--threads must be at least 1"));
            }
            config.worker_threads = static_cast<std::size_t>(n);
        } else if (flag == "--session-ttl") {
            if (n == 0) {
                return Err<void>(Error::invalid("--session-ttl must be at least 1"));
            }
            config.session_ttl = std::chrono::seconds(n);
        } else if (flag == "--sweep-interval") {
            if (n == 0) {
                return Err<void>(Error::invalid("--sweep-interval must be at least 1"));
            }
            config.sweep_interval = std::chrono::seconds(n);
        } else {
            return Err<void>(Error::invalid("Unknown option: " + flag));
        }
    }
    return Ok();
}

} // namespace

Result<void> apply_config_file(ServerConfig& config, const fs::path& file) {
    std::ifstream input(file);
    if (!input) {
        return Err<void>(Error::io("Failed to open config file: " + file.string()));
    }

    auto doc = json::parse(input, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Err<void>(Error::invalid("Config file is not a JSON object: " + file.string()));
    }

    try {
        config.bind_address = doc.value("bind_address", config.bind_address);
        config.port = doc.value("port", config.port);
        config.root = doc.value("root", config.root.string());
        config.username = doc.value("username", config.username);
        config.password = doc.value("password", config.password);
        config.staging_dir = doc.value("staging_dir", config.staging_dir.string());
        config.worker_threads = doc.value("worker_threads", config.worker_threads);
        config.session_ttl = std::chrono::seconds(doc.value("session_ttl", config.session_ttl.count()));
        config.sweep_interval = std::chrono::seconds(doc.value("sweep_interval", config.sweep_interval.count()));
        config.max_body_bytes = doc.value("max_body_bytes", config.max_body_bytes);
        config.progress_interval = doc.value("progress_interval", config.progress_interval);
        config.log_level = doc.value("log_level", config.log_level);
    } catch (const json::exception& e) {
        return Err<void>(Error::invalid(std::string("Invalid config value: ") + e.what()));
    }

    return check_values(config);
}

Result<void> validate_config(const ServerConfig& config) {
    if (auto res = check_values(config); res.is_error()) {
        return res;
    }

    // The staging sweep deletes directories, so it must never see user files
    const auto root = comparable(config.root);
    const auto staging = comparable(config.staging_dir);
    if (contains(root, staging) || contains(staging, root)) {
        return Err<void>(Error::invalid("Staging directory " + config.staging_dir.string() +
                                        " must not overlap the root directory " + config.root.string()));
    }
    return Ok();
}

Result<ServerConfig> parse_command_line(const std::vector<std::string>& args) {
    ServerConfig config;

    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                return Err<ServerConfig>(Error::invalid("Missing value for --config"));
            }
            auto loaded = apply_config_file(config, args[i + 1]);
            if (loaded.is_error()) {
                return Err<ServerConfig>(loaded.error());
            }
        }
    }

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& flag = args[i];
        if (flag == "--config") {
            ++i;
            continue;
        }
        if (i + 1 >= args.size()) {
            return Err<ServerConfig>(Error::invalid("Missing value for " + flag));
        }
        auto applied = apply_flag(config, flag, args[++i]);
        if (applied.is_error()) {
            return Err<ServerConfig>(applied.error());
        }
    }

    if (auto valid = validate_config(config); valid.is_error()) {
        return Err<ServerConfig>(valid.error());
    }
    return Ok(std::move(config));
}

std::string usage_text(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "  -r, --root <dir>         Sandbox root directory (default ./files)\n"
        << "  -p, --port <port>        Listen port (default 3000)\n"
        << "  -b, --bind <address>     Bind address (default 0.0.0.0)\n"
        << "  -u, --user <name>        Username (default admin)\n"
        << "  -P, --password <secret>  Password (default admin123)\n"
        << "      --staging <dir>      Chunk scratch area\n"
        << "      --threads <n>        Event loop threads (default 1)\n"
        << "      --session-ttl <sec>  Idle chunked-session lifetime (default 3600)\n"
        << "      --sweep-interval <sec> Idle-session sweep period (default 60)\n"
        << "      --log-level <level>  trace|debug|info|warn|error|off\n"
        << "      --config <file>      JSON config file\n";
    return oss.str();
}

} // namespace filest
