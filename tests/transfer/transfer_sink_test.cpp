#include "filest/transfer/transfer_sink.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using filest::ErrorCode;
using filest::transfer::TransferSink;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    fs::path dir = fs::temp_directory_path() / ("filest_sink_test_" + std::to_string(counter++));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

std::vector<std::uint8_t> bytes(const std::string& s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

} // namespace

TEST(TransferSinkTest, AppendsAndFinalizes) {
    const auto dir = create_temp_dir();
    auto sink = TransferSink::open(dir / "out.bin", TransferSink::OpenMode::CreateNew);
    ASSERT_TRUE(sink.is_ok());

    ASSERT_TRUE(sink.value().append(bytes("hello ")).is_ok());
    ASSERT_TRUE(sink.value().append(bytes("world")).is_ok());
    EXPECT_EQ(sink.value().bytes_written(), 11u);
    ASSERT_TRUE(sink.value().finalize().is_ok());
    EXPECT_FALSE(sink.value().is_open());

    EXPECT_EQ(read_file(dir / "out.bin"), "hello world");
    fs::remove_all(dir);
}

TEST(TransferSinkTest, LargeWritesBypassBuffer) {
    const auto dir = create_temp_dir();
    auto sink = TransferSink::open(dir / "big.bin", TransferSink::OpenMode::CreateNew);
    ASSERT_TRUE(sink.is_ok());

    std::vector<std::uint8_t> block(TransferSink::kBufferSize * 3 + 17);
    for (std::size_t i = 0; i < block.size(); ++i) {
        block[i] = static_cast<std::uint8_t>(i * 31);
    }
    ASSERT_TRUE(sink.value().append(bytes("head")).is_ok());
    ASSERT_TRUE(sink.value().append(block).is_ok());
    ASSERT_TRUE(sink.value().finalize().is_ok());

    const auto content = read_file(dir / "big.bin");
    ASSERT_EQ(content.size(), block.size() + 4);
    EXPECT_EQ(content.substr(0, 4), "head");
    EXPECT_EQ(static_cast<std::uint8_t>(content[4 + 1000]), block[1000]);
    fs::remove_all(dir);
}

TEST(TransferSinkTest, CreateNewRefusesExistingFile) {
    const auto dir = create_temp_dir();
    std::ofstream(dir / "taken.bin") << "x";

    auto sink = TransferSink::open(dir / "taken.bin", TransferSink::OpenMode::CreateNew);
    ASSERT_TRUE(sink.is_error());
    EXPECT_EQ(sink.error().code, ErrorCode::AlreadyExists);

    auto truncating = TransferSink::open(dir / "taken.bin", TransferSink::OpenMode::Truncate);
    ASSERT_TRUE(truncating.is_ok());
    ASSERT_TRUE(truncating.value().finalize().is_ok());
    EXPECT_EQ(fs::file_size(dir / "taken.bin"), 0u);
    fs::remove_all(dir);
}

TEST(TransferSinkTest, OpenInMissingDirectoryFails) {
    auto sink = TransferSink::open("/nonexistent-dir/filest/out.bin", TransferSink::OpenMode::CreateNew);
    ASSERT_TRUE(sink.is_error());
    EXPECT_EQ(sink.error().code, ErrorCode::IoFailure);
}

TEST(TransferSinkTest, AppendAfterCloseFails) {
    const auto dir = create_temp_dir();
    auto sink = TransferSink::open(dir / "closed.bin", TransferSink::OpenMode::CreateNew);
    ASSERT_TRUE(sink.is_ok());
    sink.value().close();
    EXPECT_TRUE(sink.value().append(bytes("late")).is_error());
    fs::remove_all(dir);
}

TEST(TransferSinkTest, CommitRenameReplacesDestination) {
    const auto dir = create_temp_dir();
    std::ofstream(dir / "final.txt") << "old";
    std::ofstream(dir / "temp.txt") << "new";

    ASSERT_TRUE(filest::transfer::commit_rename(dir / "temp.txt", dir / "final.txt").is_ok());
    EXPECT_EQ(read_file(dir / "final.txt"), "new");
    EXPECT_FALSE(fs::exists(dir / "temp.txt"));
    fs::remove_all(dir);
}

TEST(TransferSinkTest, DiscardIsBestEffort) {
    const auto dir = create_temp_dir();
    std::ofstream(dir / "gone.txt") << "x";
    filest::transfer::discard_file(dir / "gone.txt");
    filest::transfer::discard_file(dir / "never-existed.txt");
    EXPECT_FALSE(fs::exists(dir / "gone.txt"));

    filest::transfer::discard_directory(dir);
    EXPECT_FALSE(fs::exists(dir));
}
