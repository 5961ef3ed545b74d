/**
 * @file components.hpp
 * @brief Bus subscribers that turn transfer events into logs and counters
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 */

#pragma once

#include "filest/events/event_bus.hpp"
#include "filest/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>

namespace filest::events {

/**
 * @brief Logs every transfer and server event with spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ServerStartedEvent>([this](const ServerStartedEvent& e) {
            on_server_started(e);
        });

        bus_.subscribe<ServerShuttingDownEvent>([this](const ServerShuttingDownEvent& e) {
            on_server_shutdown(e);
        });

        bus_.subscribe<UploadStartedEvent>([this](const UploadStartedEvent& e) {
            on_upload_started(e);
        });

        bus_.subscribe<ChunkReceivedEvent>([this](const ChunkReceivedEvent& e) {
            on_chunk_received(e);
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            on_upload_completed(e);
        });

        bus_.subscribe<UploadAbortedEvent>([this](const UploadAbortedEvent& e) {
            on_upload_aborted(e);
        });

        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent& e) {
            on_upload_failed(e);
        });

        bus_.subscribe<SessionExpiredEvent>([this](const SessionExpiredEvent& e) {
            on_session_expired(e);
        });
    }

private:
    void on_server_started(const ServerStartedEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("filest listening on port {}", e.port);
        spdlog::info("Sandbox root: {}", e.root);
        spdlog::info("════════════════════════════════════════════");
    }

    void on_server_shutdown(const ServerShuttingDownEvent& e) {
        spdlog::info("Server shutting down: {}", e.reason);
    }

    void on_upload_started(const UploadStartedEvent& e) {
        spdlog::info("[UploadStarted] id={} protocol={} path={} bytes={}",
                     e.upload_id, protocol_name(e.protocol), e.file_path, e.total_bytes);
    }

    void on_chunk_received(const ChunkReceivedEvent& e) {
        spdlog::debug("[ChunkReceived] id={} chunk={}/{} bytes={}",
                      e.upload_id, e.chunk_index + 1, e.total_chunks, e.bytes);
    }

    void on_upload_completed(const UploadCompletedEvent& e) {
        spdlog::info("[UploadCompleted] id={} protocol={} path={} bytes={} duration={}ms",
                     e.upload_id, protocol_name(e.protocol), e.file_path, e.total_bytes,
                     e.duration.count());
    }

    void on_upload_aborted(const UploadAbortedEvent& e) {
        spdlog::warn("[UploadAborted] id={} protocol={} reason={}",
                     e.upload_id, protocol_name(e.protocol), e.reason);
    }

    void on_upload_failed(const UploadFailedEvent& e) {
        spdlog::error("[UploadFailed] id={} protocol={} error={}",
                      e.upload_id, protocol_name(e.protocol), e.error_message);
    }

    void on_session_expired(const SessionExpiredEvent& e) {
        spdlog::warn("[SessionExpired] id={} received={}/{} chunks",
                     e.upload_id, e.chunks_received, e.total_chunks);
    }

    EventBus& bus_;
};

/**
 * @brief Counts transfer outcomes
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.get_stats().uploads_completed.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> uploads_started{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> uploads_aborted{0};
        std::atomic<uint64_t> uploads_failed{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> chunks_received{0};
        std::atomic<uint64_t> sessions_expired{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadStartedEvent>([this](const UploadStartedEvent&) {
            stats_.uploads_started++;
        });

        bus_.subscribe<ChunkReceivedEvent>([this](const ChunkReceivedEvent&) {
            stats_.chunks_received++;
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            stats_.uploads_completed++;
            stats_.bytes_uploaded += e.total_bytes;
        });

        bus_.subscribe<UploadAbortedEvent>([this](const UploadAbortedEvent&) {
            stats_.uploads_aborted++;
        });

        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent&) {
            stats_.uploads_failed++;
        });

        bus_.subscribe<SessionExpiredEvent>([this](const SessionExpiredEvent&) {
            stats_.sessions_expired++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Transfer statistics:");
        spdlog::info("  Uploads started:   {}", stats_.uploads_started.load());
        spdlog::info("  Uploads completed: {}", stats_.uploads_completed.load());
        spdlog::info("  Uploads aborted:   {}", stats_.uploads_aborted.load());
        spdlog::info("  Uploads failed:    {}", stats_.uploads_failed.load());
        spdlog::info("  Bytes uploaded:    {}", stats_.bytes_uploaded.load());
        spdlog::info("  Chunks received:   {}", stats_.chunks_received.load());
        spdlog::info("  Sessions expired:  {}", stats_.sessions_expired.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace filest::events
