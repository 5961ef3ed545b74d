#include "filest/transfer/chunked_upload.hpp"

#include "filest/events/events.hpp"
#include "filest/transfer/transfer_sink.hpp"
#include "filest/transfer/upload_id.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <fstream>
#include <vector>

namespace filest::transfer {
namespace fs = std::filesystem;
using events::TransferProtocol;

ChunkedUploadService::ChunkedUploadService(const PathResolver& resolver,
                                           SessionStore& store,
                                           fs::path staging_root,
                                           events::EventBus& bus)
    : resolver_(resolver),
      store_(store),
      staging_root_(std::move(staging_root)),
      event_bus_(bus) {
    std::error_code ec;
    fs::create_directories(staging_root_, ec);
    if (ec) {
        spdlog::error("Failed to create staging directory {}: {}", staging_root_.string(), ec.message());
    }
}

std::string ChunkedUploadService::chunk_file_name(std::uint32_t chunk_index) {
    char name[32];
    std::snprintf(name, sizeof(name), "chunk_%08u", static_cast<unsigned>(chunk_index));
    return name;
}

Result<ChunkedInitResponse> ChunkedUploadService::init(const ChunkedInitRequest& request) {
    if (!is_valid_filename(request.filename)) {
        return Err<ChunkedInitResponse>(Error::invalid("Invalid filename: " + request.filename));
    }
    if (request.total_chunks == 0 || request.total_chunks > kMaxChunks) {
        return Err<ChunkedInitResponse>(Error::invalid("totalChunks must be between 1 and " +
                                                       std::to_string(kMaxChunks)));
    }
    if (request.chunk_size == 0) {
        return Err<ChunkedInitResponse>(Error::invalid("chunkSize must be greater than 0"));
    }

    auto resolved = resolver_.resolve(request.path);
    if (resolved.is_error()) {
        return Err<ChunkedInitResponse>(resolved.error());
    }

    UploadSession session;
    session.upload_id = generate_upload_id();
    session.filename = request.filename;
    session.total_size = request.total_size;
    session.chunk_size = request.chunk_size;
    session.total_chunks = request.total_chunks;
    session.destination = resolved.value();
    session.scratch_dir = staging_root_ / session.upload_id;
    session.received.assign(request.total_chunks, false);
    session.created_at = std::chrono::system_clock::now();
    session.last_activity = std::chrono::steady_clock::now();

    std::error_code ec;
    if (!fs::create_directories(session.scratch_dir, ec)) {
        return Err<ChunkedInitResponse>(Error::io("Failed to create scratch directory: " +
                                                  (ec ? ec.message() : std::string("already exists"))));
    }

    const auto display = resolver_.display_path(session.destination.logical / session.filename);
    ChunkedInitResponse response{session.upload_id, session.chunk_size};
    if (!store_.create(session)) {
        discard_directory(session.scratch_dir);
        return Err<ChunkedInitResponse>(Error::io("Upload id collision"));
    }

    event_bus_.emit(events::UploadStartedEvent{response.upload_id, TransferProtocol::Chunked,
                                               display, request.total_size});
    return Ok(response);
}

Result<void> ChunkedUploadService::put_chunk(const std::string& upload_id,
                                             std::uint32_t chunk_index,
                                             const std::uint8_t* data,
                                             std::size_t size) {
    auto snapshot = store_.get(upload_id);
    if (!snapshot) {
        return Err<void>(Error::session_not_found(upload_id));
    }
    if (chunk_index >= snapshot->total_chunks) {
        return Err<void>(Error(ErrorCode::InvalidIndex,
                               "Chunk index " + std::to_string(chunk_index) + " out of range (total " +
                               std::to_string(snapshot->total_chunks) + ")"));
    }

    // Write beside the final name and rename, so a duplicate delivery never
    // exposes a half-written chunk to a concurrent Complete.
    const auto chunk_path = snapshot->scratch_dir / chunk_file_name(chunk_index);
    const auto temp_path = fs::path(chunk_path.string() + ".tmp-" + std::to_string(++write_counter_));

    auto written = [&]() -> Result<void> {
        auto sink = TransferSink::open(temp_path, TransferSink::OpenMode::CreateNew);
        if (sink.is_error()) {
            return Err<void>(sink.error());
        }
        if (auto res = sink.value().append(data, size); res.is_error()) {
            return res;
        }
        if (auto res = sink.value().flush(); res.is_error()) {
            return res;
        }
        sink.value().close();
        return commit_rename(temp_path, chunk_path);
    }();

    if (written.is_error()) {
        discard_file(temp_path);
        // Aborted or completed underneath us: the scratch directory is gone
        if (!store_.contains(upload_id)) {
            return Err<void>(Error::session_not_found(upload_id));
        }
        return written;
    }

    const bool marked = store_.mutate(upload_id, [&](UploadSession& session) {
        session.received[chunk_index] = true;
        session.last_activity = std::chrono::steady_clock::now();
    });
    if (!marked) {
        return Err<void>(Error::session_not_found(upload_id));
    }

    event_bus_.emit(events::ChunkReceivedEvent{upload_id, chunk_index, snapshot->total_chunks, size});
    return Ok();
}

Result<CompletedUpload> ChunkedUploadService::complete(const std::string& upload_id) {
    auto removed = store_.remove(upload_id);
    if (!removed) {
        return Err<CompletedUpload>(Error::session_not_found(upload_id));
    }
    UploadSession session = std::move(*removed);

    auto missing = session.missing_chunks();
    if (!missing.empty()) {
        spdlog::debug("Complete for {} rejected: {} chunk(s) missing", upload_id, missing.size());
        store_.create(std::move(session));
        return Err<CompletedUpload>(Error::missing(std::move(missing)));
    }

    const auto started = std::chrono::steady_clock::now();
    const auto destination = session.destination.child(session.filename);
    const auto display = resolver_.display_path(destination.logical);

    std::error_code ec;
    fs::create_directories(session.destination.actual, ec);
    if (ec) {
        auto error = Error::io("Failed to create directory: " + ec.message());
        event_bus_.emit(events::UploadFailedEvent{upload_id, TransferProtocol::Chunked, error.message});
        return Err<CompletedUpload>(std::move(error));
    }

    const auto part_path = session.destination.actual / (".upload_" + upload_id + ".part");
    if (auto merged = merge_chunks(session, part_path); merged.is_error()) {
        discard_file(part_path);
        event_bus_.emit(events::UploadFailedEvent{upload_id, TransferProtocol::Chunked,
                                                  merged.error().message});
        return Err<CompletedUpload>(merged.error());
    }

    if (auto renamed = commit_rename(part_path, destination.actual); renamed.is_error()) {
        discard_file(part_path);
        event_bus_.emit(events::UploadFailedEvent{upload_id, TransferProtocol::Chunked,
                                                  renamed.error().message});
        return Err<CompletedUpload>(renamed.error());
    }

    std::uint64_t size = fs::file_size(destination.actual, ec);
    if (ec) {
        size = 0;
    }
    discard_directory(session.scratch_dir);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    event_bus_.emit(events::UploadCompletedEvent{upload_id, TransferProtocol::Chunked, display, size, elapsed});

    return Ok(CompletedUpload{session.filename, size, display});
}

void ChunkedUploadService::abort(const std::string& upload_id) {
    auto removed = store_.remove(upload_id);
    if (!removed) {
        spdlog::debug("Abort for unknown upload {} ignored", upload_id);
        return;
    }
    discard_directory(removed->scratch_dir);
    event_bus_.emit(events::UploadAbortedEvent{upload_id, TransferProtocol::Chunked, "client abort"});
}

std::size_t ChunkedUploadService::sweep_expired(std::chrono::seconds ttl,
                                                std::chrono::steady_clock::time_point now) {
    auto expired = store_.remove_expired(now, ttl);
    for (const auto& session : expired) {
        discard_directory(session.scratch_dir);
        event_bus_.emit(events::SessionExpiredEvent{session.upload_id, session.received_count(),
                                                    session.total_chunks});
    }
    sweep_orphans(ttl);
    return expired.size();
}

Result<void> ChunkedUploadService::merge_chunks(const UploadSession& session, const fs::path& part_path) const {
    auto opened = TransferSink::open(part_path, TransferSink::OpenMode::Truncate);
    if (opened.is_error()) {
        return Err<void>(opened.error());
    }
    TransferSink sink = std::move(opened.value());

    std::vector<char> buffer(TransferSink::kBufferSize);
    // Reassemble strictly by index, whatever order the chunks arrived in
    for (std::uint32_t index = 0; index < session.total_chunks; ++index) {
        const auto chunk_path = session.scratch_dir / chunk_file_name(index);
        std::ifstream input(chunk_path, std::ios::binary);
        if (!input) {
            return Err<void>(Error::io("Failed to open chunk " + std::to_string(index)));
        }
        while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
            const auto count = static_cast<std::size_t>(input.gcount());
            auto res = sink.append(reinterpret_cast<const std::uint8_t*>(buffer.data()), count);
            if (res.is_error()) {
                return res;
            }
        }
        if (input.bad()) {
            return Err<void>(Error::io("Failed to read chunk " + std::to_string(index)));
        }
    }

    return sink.finalize();
}

void ChunkedUploadService::sweep_orphans(std::chrono::seconds ttl) {
    std::error_code ec;
    fs::directory_iterator it(staging_root_, ec);
    if (ec) {
        spdlog::warn("Cannot scan staging directory {}: {}", staging_root_.string(), ec.message());
        return;
    }

    const auto cutoff = fs::file_time_type::clock::now() - ttl;
    std::vector<fs::path> orphans;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code entry_ec;
        // Only directories named like a session id are ours to delete
        const auto name = it->path().filename().string();
        if (!is_upload_id(name) || !it->is_directory(entry_ec) || store_.contains(name)) {
            continue;
        }
        const auto modified = it->last_write_time(entry_ec);
        if (!entry_ec && modified <= cutoff) {
            orphans.push_back(it->path());
        }
    }

    for (const auto& dir : orphans) {
        spdlog::info("Removing orphaned scratch directory {}", dir.string());
        discard_directory(dir);
    }
}

} // namespace filest::transfer
