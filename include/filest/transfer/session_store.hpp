#pragma once

#include "filest/transfer/path_resolver.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace filest::transfer {

/**
 * @brief State of one chunked upload between Init and Complete/Abort
 */
struct UploadSession {
    std::string upload_id;
    std::string filename;
    std::uint64_t total_size = 0;
    std::uint64_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
    SandboxedPath destination;              ///< Destination directory
    std::filesystem::path scratch_dir;      ///< Private storage for received chunks
    std::vector<bool> received;             ///< One flag per chunk index
    std::chrono::system_clock::time_point created_at{};
    std::chrono::steady_clock::time_point last_activity{};

    [[nodiscard]] std::vector<std::uint32_t> missing_chunks() const;
    [[nodiscard]] std::size_t received_count() const;
};

/**
 * @brief Registry of in-progress chunked uploads
 *
 * The map itself is guarded by a reader/writer lock and every entry has its
 * own mutex, so work on unrelated sessions never serializes. mutate() holds
 * the map lock in shared mode for its whole duration, which keeps it atomic
 * with respect to remove(): once remove() returns, no later mutate() can
 * touch that session.
 *
 * Reads hand out copies; nothing returned by the store aliases live state.
 */
class SessionStore {
public:
    SessionStore() = default;

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    /**
     * @return false if a session with the same id is already registered
     */
    bool create(UploadSession session);

    std::optional<UploadSession> get(const std::string& upload_id) const;

    /**
     * @brief Atomically update one session
     * @return false if the session does not exist
     */
    bool mutate(const std::string& upload_id, const std::function<void(UploadSession&)>& fn);

    std::optional<UploadSession> remove(const std::string& upload_id);

    /**
     * @brief Remove and return every session idle for longer than @p ttl
     */
    std::vector<UploadSession> remove_expired(std::chrono::steady_clock::time_point now,
                                              std::chrono::seconds ttl);

    bool contains(const std::string& upload_id) const;

    std::size_t size() const;

private:
    struct Entry {
        mutable std::mutex mutex;
        UploadSession session;

        explicit Entry(UploadSession s) : session(std::move(s)) {}
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> sessions_;
};

} // namespace filest::transfer
