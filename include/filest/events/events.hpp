/**
 * @file events.hpp
 * @brief Event types emitted by the upload protocols and the server
 *
 * NAMING CONVENTION:
 * - Events are past-tense: UploadStartedEvent, SessionExpiredEvent
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace filest::events {

/**
 * @brief Which upload path produced an event
 */
enum class TransferProtocol {
    Multipart,
    Chunked,
    WebSocket
};

inline const char* protocol_name(TransferProtocol protocol) {
    switch (protocol) {
        case TransferProtocol::Multipart: return "multipart";
        case TransferProtocol::Chunked: return "chunked";
        case TransferProtocol::WebSocket: return "websocket";
    }
    return "unknown";
}

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when the server starts listening
 *
 * WHO EMITS: UploadServer::start()
 * WHO SUBSCRIBES: Logger
 */
struct ServerStartedEvent {
    uint16_t port;
    std::string root;
    std::chrono::system_clock::time_point timestamp;

    ServerStartedEvent(uint16_t p, std::string r)
        : port(p),
          root(std::move(r)),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted when the server is shutting down
 *
 * WHO EMITS: UploadServer::stop()
 * WHO SUBSCRIBES: Logger
 */
struct ServerShuttingDownEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerShuttingDownEvent(std::string r = "normal")
        : reason(std::move(r)),
          timestamp(std::chrono::system_clock::now())
    {}
};

// ════════════════════════════════════════════════════════
// Upload Events
// ════════════════════════════════════════════════════════

/**
 * @brief A session was opened (chunked Init, WebSocket Init) or a multipart
 *        file part started streaming to disk
 */
struct UploadStartedEvent {
    std::string upload_id;
    TransferProtocol protocol;
    std::string file_path;      ///< Logical destination ("/dir/name")
    std::uint64_t total_bytes;  ///< As declared by the client
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ChunkReceivedEvent {
    std::string upload_id;
    std::uint32_t chunk_index;
    std::uint32_t total_chunks;
    std::size_t bytes;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadCompletedEvent {
    std::string upload_id;
    TransferProtocol protocol;
    std::string file_path;
    std::uint64_t total_bytes;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Client gave up (Abort, Cancel, connection closed mid-upload)
 */
struct UploadAbortedEvent {
    std::string upload_id;
    TransferProtocol protocol;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Server side failure while writing or finalizing an upload
 */
struct UploadFailedEvent {
    std::string upload_id;
    TransferProtocol protocol;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A chunked session was reclaimed by the idle sweep
 */
struct SessionExpiredEvent {
    std::string upload_id;
    std::size_t chunks_received;
    std::uint32_t total_chunks;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace filest::events
