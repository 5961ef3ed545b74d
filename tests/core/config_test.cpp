#include "filest/core/config.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using filest::ErrorCode;
using filest::ServerConfig;
using filest::parse_command_line;

namespace {

fs::path write_config(const std::string& content) {
    static std::atomic<int> counter{0};
    const auto path = fs::temp_directory_path() / ("filest_config_test_" + std::to_string(counter++) + ".json");
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST(ConfigTest, Defaults) {
    auto result = parse_command_line({});
    ASSERT_TRUE(result.is_ok());
    const auto& config = result.value();
    EXPECT_EQ(config.port, 3000);
    EXPECT_EQ(config.bind_address, "0.0.0.0");
    EXPECT_EQ(config.username, "admin");
    EXPECT_EQ(config.password, "admin123");
    EXPECT_EQ(config.worker_threads, 1u);
    EXPECT_EQ(config.session_ttl.count(), 3600);
    EXPECT_EQ(config.max_body_bytes, 500ULL * 1024 * 1024);
}

TEST(ConfigTest, FlagsOverrideDefaults) {
    auto result = parse_command_line({"-p", "8081", "--root", "/srv/files", "-u", "alice", "-P", "secret",
                                      "--threads", "4", "--session-ttl", "60", "--log-level", "debug"});
    ASSERT_TRUE(result.is_ok());
    const auto& config = result.value();
    EXPECT_EQ(config.port, 8081);
    EXPECT_EQ(config.root, fs::path("/srv/files"));
    EXPECT_EQ(config.username, "alice");
    EXPECT_EQ(config.password, "secret");
    EXPECT_EQ(config.worker_threads, 4u);
    EXPECT_EQ(config.session_ttl.count(), 60);
    EXPECT_EQ(config.log_level, "debug");
}

TEST(ConfigTest, FlagsOverrideConfigFileRegardlessOfOrder) {
    const auto file = write_config(R"({"port": 9000, "username": "bob", "sweep_interval": 5})");

    auto result = parse_command_line({"-p", "9100", "--config", file.string()});
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().port, 9100);
    EXPECT_EQ(result.value().username, "bob");
    EXPECT_EQ(result.value().sweep_interval.count(), 5);

    fs::remove(file);
}

TEST(ConfigTest, RejectsBadInput) {
    EXPECT_EQ(parse_command_line({"--port", "http"}).error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(parse_command_line({"--port", "70000"}).error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(parse_command_line({"--port"}).error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(parse_command_line({"--frobnicate", "1"}).error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(parse_command_line({"--threads", "0"}).error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(parse_command_line({"--log-level", "loud"}).error().code, ErrorCode::InvalidArgument);
}

TEST(ConfigTest, RejectsMalformedConfigFile) {
    const auto file = write_config("{ not json");
    auto result = parse_command_line({"--config", file.string()});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    fs::remove(file);

    const auto wrong_type = write_config(R"({"port": "eighty"})");
    EXPECT_TRUE(parse_command_line({"--config", wrong_type.string()}).is_error());
    fs::remove(wrong_type);
}

TEST(ConfigTest, MissingConfigFileIsAnError) {
    auto result = parse_command_line({"--config", "/nonexistent/filest.json"});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::IoFailure);
}

TEST(ConfigTest, RejectsZeroOrNegativeTimings) {
    const auto busy_sweep = write_config(R"({"sweep_interval": 0})");
    auto sweep = parse_command_line({"--config", busy_sweep.string()});
    ASSERT_TRUE(sweep.is_error());
    EXPECT_EQ(sweep.error().code, ErrorCode::InvalidArgument);
    fs::remove(busy_sweep);

    const auto negative_ttl = write_config(R"({"session_ttl": -5})");
    auto ttl = parse_command_line({"--config", negative_ttl.string()});
    ASSERT_TRUE(ttl.is_error());
    EXPECT_EQ(ttl.error().code, ErrorCode::InvalidArgument);
    fs::remove(negative_ttl);

    EXPECT_EQ(parse_command_line({"--session-ttl", "0"}).error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(parse_command_line({"--sweep-interval", "0"}).error().code, ErrorCode::InvalidArgument);

    auto ok = parse_command_line({"--sweep-interval", "15"});
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value().sweep_interval.count(), 15);
}

TEST(ConfigTest, StagingMustNotOverlapRoot) {
    const auto base = fs::temp_directory_path() / "filest_config_overlap";
    const auto root = (base / "files").string();

    EXPECT_EQ(parse_command_line({"--root", root, "--staging", root}).error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(parse_command_line({"--root", root, "--staging", root + "/.staging"}).error().code,
              ErrorCode::InvalidArgument);
    EXPECT_EQ(parse_command_line({"--root", root + "/inner", "--staging", root}).error().code,
              ErrorCode::InvalidArgument);
    EXPECT_EQ(parse_command_line({"--root", root, "--staging", root + "/sub/../"}).error().code,
              ErrorCode::InvalidArgument);

    // Siblings sharing a name prefix are fine
    auto sibling = parse_command_line({"--root", root, "--staging", root + "-staging"});
    EXPECT_TRUE(sibling.is_ok());
}

TEST(ConfigTest, ValidateConfigChecksDefaults) {
    EXPECT_TRUE(filest::validate_config(ServerConfig{}).is_ok());

    ServerConfig config;
    config.staging_dir = config.root / "tmp";
    EXPECT_TRUE(filest::validate_config(config).is_error());
}
