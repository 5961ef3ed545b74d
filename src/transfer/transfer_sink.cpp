#include "filest/transfer/transfer_sink.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace filest::transfer {
namespace fs = std::filesystem;

namespace {

std::string errno_text(const std::string& what, const fs::path& path) {
    return what + " " + path.string() + ": " + std::strerror(errno);
}

void sync_directory(const fs::path& dir) {
    const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        spdlog::debug("Could not open {} for sync: {}", dir.string(), std::strerror(errno));
        return;
    }
    if (::fsync(fd) != 0) {
        spdlog::debug("fsync of directory {} failed: {}", dir.string(), std::strerror(errno));
    }
    ::close(fd);
}

} // namespace

Result<TransferSink> TransferSink::open(const fs::path& path, OpenMode mode) {
    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    flags |= mode == OpenMode::CreateNew ? O_EXCL : O_TRUNC;

    const int fd = ::open(path.c_str(), flags, 0644);
    if (fd < 0) {
        const auto code = errno == EEXIST ? ErrorCode::AlreadyExists : ErrorCode::IoFailure;
        return Err<TransferSink>(Error(code, errno_text("Failed to create", path)));
    }
    return Ok(TransferSink(fd, path));
}

TransferSink::TransferSink(int fd, fs::path path)
    : fd_(fd), path_(std::move(path)) {
    buffer_.reserve(kBufferSize);
}

TransferSink::TransferSink(TransferSink&& other) noexcept
    : fd_(other.fd_),
      path_(std::move(other.path_)),
      buffer_(std::move(other.buffer_)),
      bytes_written_(other.bytes_written_) {
    other.fd_ = -1;
}

TransferSink& TransferSink::operator=(TransferSink&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        buffer_ = std::move(other.buffer_);
        bytes_written_ = other.bytes_written_;
        other.fd_ = -1;
    }
    return *this;
}

TransferSink::~TransferSink() {
    close();
}

Result<void> TransferSink::append(const std::uint8_t* data, std::size_t size) {
    if (fd_ < 0) {
        return Err<void>(Error::io("File not open: " + path_.string()));
    }

    if (buffer_.size() + size > kBufferSize) {
        if (auto res = flush(); res.is_error()) {
            return res;
        }
    }

    if (size >= kBufferSize) {
        if (auto res = write_all(data, size); res.is_error()) {
            return res;
        }
    } else {
        buffer_.insert(buffer_.end(), data, data + size);
    }

    bytes_written_ += size;
    return Ok();
}

Result<void> TransferSink::flush() {
    if (fd_ < 0) {
        return Err<void>(Error::io("File not open: " + path_.string()));
    }
    if (buffer_.empty()) {
        return Ok();
    }
    auto res = write_all(buffer_.data(), buffer_.size());
    buffer_.clear();
    return res;
}

Result<void> TransferSink::finalize() {
    if (auto res = flush(); res.is_error()) {
        return res;
    }
    if (::fsync(fd_) != 0) {
        auto error = Error::io(errno_text("Failed to sync", path_));
        close();
        return Err<void>(std::move(error));
    }
    if (::close(fd_) != 0) {
        fd_ = -1;
        return Err<void>(Error::io(errno_text("Failed to close", path_)));
    }
    fd_ = -1;
    return Ok();
}

void TransferSink::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    buffer_.clear();
}

Result<void> TransferSink::write_all(const std::uint8_t* data, std::size_t size) {
    std::size_t offset = 0;
    while (offset < size) {
        const auto written = ::write(fd_, data + offset, size - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Err<void>(Error::io(errno_text("Write failed for", path_)));
        }
        offset += static_cast<std::size_t>(written);
    }
    return Ok();
}

Result<void> commit_rename(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        return Err<void>(Error::io("Failed to move " + from.filename().string() + " to " +
                                   to.string() + ": " + ec.message()));
    }
    sync_directory(to.parent_path());
    return Ok();
}

void discard_file(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("Failed to remove {}: {}", path.string(), ec.message());
    }
}

void discard_directory(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        spdlog::warn("Failed to remove directory {}: {}", path.string(), ec.message());
    }
}

} // namespace filest::transfer
