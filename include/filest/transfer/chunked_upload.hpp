#pragma once

#include "filest/core/result.hpp"
#include "filest/events/event_bus.hpp"
#include "filest/transfer/path_resolver.hpp"
#include "filest/transfer/session_store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace filest::transfer {

struct ChunkedInitRequest {
    std::string path;           ///< Destination directory, root-relative
    std::string filename;
    std::uint64_t total_size = 0;
    std::uint64_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
};

struct ChunkedInitResponse {
    std::string upload_id;
    std::uint64_t chunk_size = 0;
};

struct CompletedUpload {
    std::string name;
    std::uint64_t size = 0;
    std::string path;           ///< Logical display path ("/dir/name")
};

/**
 * @brief Resumable upload split into independently delivered chunks
 *
 * Init -> PutChunk* (any order, duplicates overwrite) -> Complete | Abort.
 *
 * Each session gets a private scratch directory under the staging root
 * holding one file per chunk index. Complete merges them in index order
 * into a `.part` file next to the destination, syncs it and renames it
 * into place.
 *
 * Complete removes the session before looking at it, so of two racing
 * Complete calls only one can merge. When chunks are missing the session
 * is put back and the client may keep sending. When the merge itself fails
 * the session is NOT restored and the scratch directory is left for the
 * orphan sweep; the client has to start over with a new Init.
 */
class ChunkedUploadService {
public:
    static constexpr std::uint32_t kMaxChunks = 1'000'000;

    ChunkedUploadService(const PathResolver& resolver,
                         SessionStore& store,
                         std::filesystem::path staging_root,
                         events::EventBus& bus);

    Result<ChunkedInitResponse> init(const ChunkedInitRequest& request);

    Result<void> put_chunk(const std::string& upload_id,
                           std::uint32_t chunk_index,
                           const std::uint8_t* data,
                           std::size_t size);

    Result<CompletedUpload> complete(const std::string& upload_id);

    /**
     * @brief Drop a session and its scratch directory; unknown ids are a no-op
     */
    void abort(const std::string& upload_id);

    /**
     * @brief Reclaim sessions idle for longer than @p ttl
     *
     * Also removes scratch directories that no registered session owns and
     * that have not been touched for @p ttl (left behind by failed merges or
     * a crash).
     * @return Number of sessions reclaimed
     */
    std::size_t sweep_expired(std::chrono::seconds ttl,
                              std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    [[nodiscard]] const std::filesystem::path& staging_root() const noexcept { return staging_root_; }

    static std::string chunk_file_name(std::uint32_t chunk_index);

private:
    Result<void> merge_chunks(const UploadSession& session, const std::filesystem::path& part_path) const;
    void sweep_orphans(std::chrono::seconds ttl);

    const PathResolver& resolver_;
    SessionStore& store_;
    std::filesystem::path staging_root_;
    events::EventBus& event_bus_;
    std::atomic<std::uint64_t> write_counter_{0};
};

} // namespace filest::transfer
