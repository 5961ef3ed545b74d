#pragma once

#include "filest/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace filest::transfer {

/**
 * @brief Buffered, durable write path shared by every upload protocol
 *
 * A sink owns an open file descriptor, never the file itself: whoever
 * created the file decides whether to keep it (commit_rename) or drop it
 * (discard_file). Destroying a sink closes the descriptor without syncing.
 */
class TransferSink {
public:
    enum class OpenMode {
        CreateNew,  ///< Fail if the file already exists
        Truncate    ///< Create or truncate
    };

    static constexpr std::size_t kBufferSize = 64 * 1024;

    static Result<TransferSink> open(const std::filesystem::path& path, OpenMode mode);

    TransferSink(TransferSink&& other) noexcept;
    TransferSink& operator=(TransferSink&& other) noexcept;
    TransferSink(const TransferSink&) = delete;
    TransferSink& operator=(const TransferSink&) = delete;
    ~TransferSink();

    Result<void> append(const std::uint8_t* data, std::size_t size);
    Result<void> append(const std::vector<std::uint8_t>& data) { return append(data.data(), data.size()); }

    /// Push buffered bytes to the kernel
    Result<void> flush();

    /// flush() + fsync() + close(); required before a rename the caller relies on
    Result<void> finalize();

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return bytes_written_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    TransferSink(int fd, std::filesystem::path path);

    Result<void> write_all(const std::uint8_t* data, std::size_t size);

    int fd_ = -1;
    std::filesystem::path path_;
    std::vector<std::uint8_t> buffer_;
    std::uint64_t bytes_written_ = 0;
};

/**
 * @brief Rename @p from over @p to and sync the containing directory
 *
 * Both paths must be on the same filesystem. An existing @p to is replaced.
 */
Result<void> commit_rename(const std::filesystem::path& from, const std::filesystem::path& to);

/// Best-effort removal; failures are logged, never returned
void discard_file(const std::filesystem::path& path);

/// Best-effort recursive removal; failures are logged, never returned
void discard_directory(const std::filesystem::path& path);

} // namespace filest::transfer
