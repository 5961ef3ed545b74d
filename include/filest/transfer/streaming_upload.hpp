#pragma once

#include "filest/core/authenticator.hpp"
#include "filest/events/event_bus.hpp"
#include "filest/transfer/path_resolver.hpp"
#include "filest/transfer/stream_messages.hpp"
#include "filest/transfer/transfer_sink.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace filest::transfer {

/**
 * @brief Per-connection state machine behind the WebSocket upload endpoint
 *
 * Knows nothing about sockets: the connection feeds it decoded frames and
 * sends back whatever it returns, in order.
 *
 * STATES:
 *   AwaitingAuth -> Authenticated -> SessionOpen -> Completed
 *                                               \-> Cancelled
 *   any state -> Closed (on_close, or a fatal write/complete failure)
 *
 * Bytes are appended to `.upload_<id>.tmp` inside the destination
 * directory and renamed over the final name on Complete. If the protocol
 * is closed or destroyed while a session is open the temp file is removed.
 */
class StreamingUploadProtocol {
public:
    enum class State {
        AwaitingAuth,
        Authenticated,
        SessionOpen,
        Completed,
        Cancelled,
        Closed
    };

    struct Reply {
        std::vector<ServerMessage> messages;
        bool finished = false;  ///< Connection should close after sending
    };

    static constexpr std::uint64_t kDefaultProgressInterval = 2 * 1024 * 1024;

    StreamingUploadProtocol(const PathResolver& resolver,
                            const Authenticator& authenticator,
                            events::EventBus& bus,
                            bool pre_authenticated,
                            std::uint64_t progress_interval = kDefaultProgressInterval);
    ~StreamingUploadProtocol();

    StreamingUploadProtocol(const StreamingUploadProtocol&) = delete;
    StreamingUploadProtocol& operator=(const StreamingUploadProtocol&) = delete;

    /**
     * @brief Messages to send right after the handshake (auth_required
     *        when the upgrade request carried no valid credentials)
     */
    std::vector<ServerMessage> start();

    Reply on_text(const std::string& text);
    Reply on_binary(const std::uint8_t* data, std::size_t size);

    /// Peer went away or the transport failed
    void on_close();

    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] bool authenticated() const noexcept { return authenticated_; }
    [[nodiscard]] bool finished() const noexcept;

    /// Temp file of the open session, if any
    [[nodiscard]] std::optional<std::filesystem::path> temp_path() const;

private:
    struct Session {
        std::string upload_id;
        std::string filename;
        SandboxedPath destination;       ///< Final file
        std::filesystem::path temp_path;
        std::uint64_t total_size = 0;
        std::uint64_t received = 0;
        std::uint64_t next_progress = 0;
        TransferSink sink;
        std::chrono::steady_clock::time_point started;
    };

    Reply handle_auth(const ClientMessage& message);
    Reply handle_init(const ClientMessage& message);
    Reply handle_complete();
    Reply handle_cancel();

    void drop_session(const std::string& reason);

    const PathResolver& resolver_;
    const Authenticator& authenticator_;
    events::EventBus& event_bus_;
    std::uint64_t progress_interval_;

    State state_;
    bool authenticated_;
    std::optional<Session> session_;
};

const char* state_name(StreamingUploadProtocol::State state);

} // namespace filest::transfer
