#include "filest/transfer/multipart_upload.hpp"

#include "filest/events/events.hpp"
#include "filest/transfer/transfer_sink.hpp"
#include "filest/transfer/upload_id.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace filest::transfer {
namespace fs = std::filesystem;
using events::TransferProtocol;

MultipartUploadService::MultipartUploadService(const PathResolver& resolver, events::EventBus& bus)
    : resolver_(resolver), event_bus_(bus) {}

Result<std::vector<CompletedUpload>> MultipartUploadService::store(const std::string& directory,
                                                                   const std::vector<IncomingFile>& files) {
    auto resolved = resolver_.resolve(directory);
    if (resolved.is_error()) {
        return Err<std::vector<CompletedUpload>>(resolved.error());
    }

    std::error_code ec;
    fs::create_directories(resolved.value().actual, ec);
    if (ec) {
        return Err<std::vector<CompletedUpload>>(Error::io("Failed to create directory: " + ec.message()));
    }

    std::vector<CompletedUpload> stored;
    stored.reserve(files.size());
    for (const auto& file : files) {
        auto result = store_one(resolved.value(), file);
        if (result.is_error()) {
            if (!stored.empty()) {
                spdlog::warn("Multipart upload stopped after {} file(s): {}", stored.size(),
                             result.error().message);
            }
            return Err<std::vector<CompletedUpload>>(result.error());
        }
        stored.push_back(std::move(result.value()));
    }
    return Ok(std::move(stored));
}

Result<CompletedUpload> MultipartUploadService::store_one(const SandboxedPath& directory, const IncomingFile& file) {
    const std::string filename = file.filename.empty() ? kDefaultFilename : file.filename;
    if (!is_valid_filename(filename)) {
        return Err<CompletedUpload>(Error::invalid("Invalid filename: " + filename));
    }

    const auto upload_id = generate_upload_id();
    const auto destination = directory.child(filename);
    const auto display = resolver_.display_path(destination.logical);
    const auto temp_path = directory.actual / (".upload_" + upload_id + ".tmp");
    const auto started = std::chrono::steady_clock::now();

    event_bus_.emit(events::UploadStartedEvent{upload_id, TransferProtocol::Multipart, display, file.size});

    auto fail = [&](const Error& error) {
        discard_file(temp_path);
        event_bus_.emit(events::UploadFailedEvent{upload_id, TransferProtocol::Multipart, error.message});
        return Err<CompletedUpload>(error);
    };

    auto opened = TransferSink::open(temp_path, TransferSink::OpenMode::CreateNew);
    if (opened.is_error()) {
        event_bus_.emit(events::UploadFailedEvent{upload_id, TransferProtocol::Multipart,
                                                  opened.error().message});
        return Err<CompletedUpload>(opened.error());
    }
    TransferSink sink = std::move(opened.value());

    if (auto res = sink.append(file.data, file.size); res.is_error()) {
        sink.close();
        return fail(res.error());
    }
    if (auto res = sink.finalize(); res.is_error()) {
        return fail(res.error());
    }
    if (auto res = commit_rename(temp_path, destination.actual); res.is_error()) {
        return fail(res.error());
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    event_bus_.emit(events::UploadCompletedEvent{upload_id, TransferProtocol::Multipart, display,
                                                 sink.bytes_written(), elapsed});
    return Ok(CompletedUpload{filename, sink.bytes_written(), display});
}

} // namespace filest::transfer
