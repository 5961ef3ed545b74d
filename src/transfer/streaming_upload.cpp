#include "filest/transfer/streaming_upload.hpp"

#include "filest/events/events.hpp"
#include "filest/transfer/upload_id.hpp"

#include <spdlog/spdlog.h>

namespace filest::transfer {
namespace fs = std::filesystem;
using events::TransferProtocol;

namespace {

StreamingUploadProtocol::Reply reply(ServerMessage message, bool finished = false) {
    StreamingUploadProtocol::Reply r;
    r.messages.push_back(std::move(message));
    r.finished = finished;
    return r;
}

StreamingUploadProtocol::Reply finished_silently() {
    StreamingUploadProtocol::Reply r;
    r.finished = true;
    return r;
}

} // namespace

const char* state_name(StreamingUploadProtocol::State state) {
    using State = StreamingUploadProtocol::State;
    switch (state) {
        case State::AwaitingAuth: return "awaiting_auth";
        case State::Authenticated: return "authenticated";
        case State::SessionOpen: return "session_open";
        case State::Completed: return "completed";
        case State::Cancelled: return "cancelled";
        case State::Closed: return "closed";
    }
    return "unknown";
}

StreamingUploadProtocol::StreamingUploadProtocol(const PathResolver& resolver,
                                                 const Authenticator& authenticator,
                                                 events::EventBus& bus,
                                                 bool pre_authenticated,
                                                 std::uint64_t progress_interval)
    : resolver_(resolver),
      authenticator_(authenticator),
      event_bus_(bus),
      progress_interval_(progress_interval == 0 ? kDefaultProgressInterval : progress_interval),
      state_(pre_authenticated ? State::Authenticated : State::AwaitingAuth),
      authenticated_(pre_authenticated) {}

StreamingUploadProtocol::~StreamingUploadProtocol() {
    if (session_) {
        drop_session("connection dropped");
    }
}

bool StreamingUploadProtocol::finished() const noexcept {
    return state_ == State::Completed || state_ == State::Cancelled || state_ == State::Closed;
}

std::optional<fs::path> StreamingUploadProtocol::temp_path() const {
    if (!session_) {
        return std::nullopt;
    }
    return session_->temp_path;
}

std::vector<ServerMessage> StreamingUploadProtocol::start() {
    if (authenticated_) {
        return {};
    }
    return {ServerMessage::auth_required()};
}

StreamingUploadProtocol::Reply StreamingUploadProtocol::on_text(const std::string& text) {
    if (finished()) {
        return finished_silently();
    }

    auto parsed = parse_client_message(text);
    if (parsed.is_error()) {
        spdlog::debug("Rejected WebSocket message: {}", parsed.error().message);
        return reply(ServerMessage::error(kInvalidMessage, parsed.error().message));
    }

    const auto& message = parsed.value();
    if (message.type == ClientMessage::Type::Auth) {
        return handle_auth(message);
    }
    if (!authenticated_) {
        return reply(ServerMessage::auth_required());
    }

    switch (message.type) {
        case ClientMessage::Type::Init:
            return handle_init(message);
        case ClientMessage::Type::Complete:
            return handle_complete();
        case ClientMessage::Type::Cancel:
            return handle_cancel();
        case ClientMessage::Type::Auth:
            break;
    }
    return reply(ServerMessage::error(kInvalidMessage, "Unexpected message"));
}

StreamingUploadProtocol::Reply StreamingUploadProtocol::on_binary(const std::uint8_t* data, std::size_t size) {
    if (finished()) {
        return finished_silently();
    }
    if (!authenticated_) {
        return reply(ServerMessage::auth_required());
    }
    if (!session_) {
        return reply(ServerMessage::error(kNoSession, "Upload not initialized"));
    }

    auto& session = *session_;
    if (auto res = session.sink.append(data, size); res.is_error()) {
        spdlog::error("Write failed for upload {}: {}", session.upload_id, res.error().message);
        event_bus_.emit(events::UploadFailedEvent{session.upload_id, TransferProtocol::WebSocket,
                                                  res.error().message});
        session.sink.close();
        discard_file(session.temp_path);
        session_.reset();
        state_ = State::Closed;
        return reply(ServerMessage::error(kWriteFailed, res.error().message), true);
    }

    const auto before = session.received;
    session.received += size;

    Reply r;
    const bool crossed_milestone = session.received >= session.next_progress;
    const bool reached_total = session.total_size > 0 && before < session.total_size &&
                               session.received >= session.total_size;
    if (crossed_milestone || reached_total) {
        r.messages.push_back(ServerMessage::progress(session.received, session.total_size));
        session.next_progress = (session.received / progress_interval_ + 1) * progress_interval_;
    }
    return r;
}

void StreamingUploadProtocol::on_close() {
    if (session_) {
        drop_session("connection closed");
    }
    if (!finished()) {
        state_ = State::Closed;
    }
}

StreamingUploadProtocol::Reply StreamingUploadProtocol::handle_auth(const ClientMessage& message) {
    if (authenticator_.verify(message.username, message.password)) {
        authenticated_ = true;
        if (state_ == State::AwaitingAuth) {
            state_ = State::Authenticated;
        }
        return reply(ServerMessage::auth_ok());
    }
    spdlog::warn("WebSocket authentication failed for user '{}'", message.username);
    return reply(ServerMessage::auth_failed("Invalid credentials"));
}

StreamingUploadProtocol::Reply StreamingUploadProtocol::handle_init(const ClientMessage& message) {
    if (session_) {
        return reply(ServerMessage::error(kInitFailed, "Upload already in progress"));
    }
    if (!is_valid_filename(message.filename)) {
        return reply(ServerMessage::error(kInitFailed, "Invalid filename: " + message.filename));
    }

    auto resolved = resolver_.resolve(message.path);
    if (resolved.is_error()) {
        return reply(ServerMessage::error(kInitFailed, resolved.error().message));
    }
    const auto directory = resolved.value();

    std::error_code ec;
    fs::create_directories(directory.actual, ec);
    if (ec) {
        return reply(ServerMessage::error(kInitFailed, "Failed to create directory: " + ec.message()));
    }

    auto upload_id = generate_upload_id();
    auto temp = directory.actual / (".upload_" + upload_id + ".tmp");
    auto sink = TransferSink::open(temp, TransferSink::OpenMode::CreateNew);
    if (sink.is_error()) {
        return reply(ServerMessage::error(kInitFailed, "Failed to create file: " + sink.error().message));
    }

    session_.emplace(Session{upload_id,
                             message.filename,
                             directory.child(message.filename),
                             temp,
                             message.size,
                             0,
                             progress_interval_,
                             std::move(sink.value()),
                             std::chrono::steady_clock::now()});
    state_ = State::SessionOpen;

    event_bus_.emit(events::UploadStartedEvent{upload_id, TransferProtocol::WebSocket,
                                               resolver_.display_path(session_->destination.logical),
                                               message.size});
    return reply(ServerMessage::init_ok(upload_id));
}

StreamingUploadProtocol::Reply StreamingUploadProtocol::handle_complete() {
    if (!session_) {
        return reply(ServerMessage::error(kNoSession, "Upload not initialized"));
    }

    Session session = std::move(*session_);
    session_.reset();

    // The temp file stays on disk when finalizing fails
    auto fail = [&](const Error& error) {
        spdlog::error("Failed to complete upload {}: {} (temp file kept at {})",
                      session.upload_id, error.message, session.temp_path.string());
        event_bus_.emit(events::UploadFailedEvent{session.upload_id, TransferProtocol::WebSocket, error.message});
        state_ = State::Closed;
        return reply(ServerMessage::error(kCompleteFailed, error.message), true);
    };

    if (auto res = session.sink.finalize(); res.is_error()) {
        return fail(res.error());
    }
    if (auto res = commit_rename(session.temp_path, session.destination.actual); res.is_error()) {
        return fail(res.error());
    }

    const auto display = resolver_.display_path(session.destination.logical);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - session.started);
    event_bus_.emit(events::UploadCompletedEvent{session.upload_id, TransferProtocol::WebSocket, display,
                                                 session.received, elapsed});

    state_ = State::Completed;
    return reply(ServerMessage::complete_ok(display, session.received), true);
}

StreamingUploadProtocol::Reply StreamingUploadProtocol::handle_cancel() {
    if (session_) {
        drop_session("client cancel");
    }
    state_ = State::Cancelled;
    return finished_silently();
}

void StreamingUploadProtocol::drop_session(const std::string& reason) {
    auto& session = *session_;
    session.sink.close();
    discard_file(session.temp_path);
    event_bus_.emit(events::UploadAbortedEvent{session.upload_id, TransferProtocol::WebSocket, reason});
    spdlog::info("Upload {} dropped ({}), {} of {} bytes received",
                 session.upload_id, reason, session.received, session.total_size);
    session_.reset();
}

} // namespace filest::transfer
