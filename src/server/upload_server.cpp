#include "filest/server/upload_server.hpp"

#include "filest/network/multipart.hpp"
#include "filest/network/websocket_connection.hpp"
#include "filest/transfer/streaming_upload.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <csignal>
#include <thread>
#include <vector>

namespace filest::server {
namespace fs = std::filesystem;
using json = nlohmann::json;
using network::HttpContext;
using network::HttpRequest;
using network::HttpResponse;
using network::HttpStatus;

namespace {

HttpResponse json_response(const json& body, HttpStatus status = HttpStatus::OK) {
    HttpResponse response(status);
    response.set_body(body.dump());
    response.set_header("Content-Type", "application/json");
    return response;
}

/**
 * @brief Create the sandbox root if needed; PathResolver canonicalizes it
 */
fs::path prepare_root(const fs::path& root) {
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        spdlog::error("Failed to create root directory {}: {}", root.string(), ec.message());
    }
    return root;
}

Result<std::uint32_t> parse_index(const std::optional<std::string>& text) {
    if (!text || text->empty() || text->size() > 10 ||
        !std::all_of(text->begin(), text->end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return Err<std::uint32_t>(Error::invalid("chunkIndex must be a non-negative integer"));
    }
    const auto value = std::stoull(*text);
    if (value > 0xFFFFFFFFULL) {
        return Err<std::uint32_t>(Error(ErrorCode::InvalidIndex, "chunkIndex out of range"));
    }
    return Ok(static_cast<std::uint32_t>(value));
}

Result<json> parse_json_body(const HttpRequest& request) {
    auto body = json::parse(request.body.begin(), request.body.end(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return Err<json>(Error::invalid("Request body must be a JSON object"));
    }
    return Ok(std::move(body));
}

Result<std::string> upload_id_from(const json& body) {
    const auto it = body.find("uploadId");
    if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
        return Err<std::string>(Error::invalid("uploadId is required"));
    }
    return Ok(it->get<std::string>());
}

/**
 * @brief Bridges the WebSocket transport to the streaming upload state machine
 */
class StreamingUploadHandler : public network::WebSocketHandler {
public:
    StreamingUploadHandler(const transfer::PathResolver& resolver,
                           const Authenticator& authenticator,
                           events::EventBus& bus,
                           bool pre_authenticated,
                           std::uint64_t progress_interval)
        : protocol_(resolver, authenticator, bus, pre_authenticated, progress_interval) {}

    network::WebSocketReply on_open() override {
        network::WebSocketReply reply;
        for (const auto& message : protocol_.start()) {
            reply.texts.push_back(message.to_json());
        }
        return reply;
    }

    network::WebSocketReply on_text(const std::string& text) override {
        return convert(protocol_.on_text(text));
    }

    network::WebSocketReply on_binary(const uint8_t* data, size_t size) override {
        return convert(protocol_.on_binary(data, size));
    }

    void on_close() override {
        protocol_.on_close();
    }

private:
    static network::WebSocketReply convert(const transfer::StreamingUploadProtocol::Reply& reply) {
        network::WebSocketReply out;
        out.texts.reserve(reply.messages.size());
        for (const auto& message : reply.messages) {
            out.texts.push_back(message.to_json());
        }
        out.close = reply.finished;
        return out;
    }

    transfer::StreamingUploadProtocol protocol_;
};

} // namespace

HttpResponse error_response(const Error& error) {
    json body = {
        {"success", false},
        {"error", error.message},
        {"code", error_code_name(error.code)}
    };
    if (error.code == ErrorCode::MissingChunks) {
        body["missing"] = error.missing_chunks;
    }
    HttpResponse response = HttpResponse::with_status(http_status_for(error.code));
    response.set_body(body.dump());
    response.set_header("Content-Type", "application/json");
    return response;
}

UploadServer::UploadServer(ServerConfig config)
    : config_(std::move(config)),
      logger_(bus_),
      metrics_(bus_),
      authenticator_(config_.username, config_.password),
      resolver_(prepare_root(config_.root)),
      chunked_(resolver_, sessions_, config_.staging_dir, bus_),
      multipart_(resolver_, bus_),
      sweep_timer_(io_context_),
      signals_(io_context_) {
    register_routes();
}

UploadServer::~UploadServer() {
    if (http_) {
        stop("destroyed");
    }
}

HttpResponse UploadServer::handle(const HttpRequest& request) const {
    return router_.handle_request(request);
}

void UploadServer::register_routes() {
    router_.use([this](const HttpContext& ctx, HttpResponse& response) {
        return check_auth(ctx, response);
    });

    router_.post("/api/upload", [this](const HttpContext& ctx) { return upload_multipart(ctx); });
    router_.post("/api/upload/init", [this](const HttpContext& ctx) { return chunked_init(ctx); });
    router_.post("/api/upload/chunk", [this](const HttpContext& ctx) { return chunked_chunk(ctx); });
    router_.post("/api/upload/complete", [this](const HttpContext& ctx) { return chunked_complete(ctx); });
    router_.post("/api/upload/abort", [this](const HttpContext& ctx) { return chunked_abort(ctx); });

    // Reached only by non-upgrade GETs; real handshakes never hit the router
    router_.get(kWebSocketPath, [](const HttpContext&) {
        return json_response({{"success", false}, {"error", "WebSocket upgrade required"}, {"code", "PROTOCOL_ERROR"}},
                             HttpStatus::BAD_REQUEST);
    });
}

bool UploadServer::check_auth(const HttpContext& ctx, HttpResponse& response) const {
    const std::string path = ctx.request.path();
    if (path.rfind("/api/", 0) != 0 || path == kWebSocketPath) {
        return true;
    }

    const std::string header = ctx.request.get_header("Authorization");
    if (!header.empty() && authenticator_.verify_header(header)) {
        return true;
    }

    response = HttpResponse(HttpStatus::UNAUTHORIZED);
    response.set_body("Unauthorized");
    response.set_header("Content-Type", "text/plain");
    // Browsers pop a login dialog on this header; only send it when no credentials came at all
    if (!ctx.request.has_header("Authorization")) {
        response.set_header("WWW-Authenticate", "Basic realm=\"File Manager\", charset=\"UTF-8\"");
    } else {
        spdlog::warn("Rejected credentials for {}", path);
    }
    return false;
}

HttpResponse UploadServer::upload_multipart(const HttpContext& ctx) {
    const auto boundary = network::extract_boundary(ctx.request.get_header("Content-Type"));
    if (!boundary) {
        return error_response(Error::invalid("Expected multipart/form-data"));
    }
    auto parts = network::parse_multipart(ctx.request.body, *boundary);
    if (parts.is_error()) {
        return error_response(parts.error());
    }

    std::string directory;
    std::vector<transfer::IncomingFile> files;
    for (const auto& part : parts.value()) {
        if (part.is_file()) {
            files.push_back(transfer::IncomingFile{*part.filename, part.data, part.size});
        } else if (part.name == "path") {
            directory = part.text();
        }
    }
    if (files.empty()) {
        return error_response(Error::invalid("No files in request"));
    }

    auto stored = multipart_.store(directory, files);
    if (stored.is_error()) {
        return error_response(stored.error());
    }

    json list = json::array();
    for (const auto& file : stored.value()) {
        list.push_back({{"name", file.name}, {"size", file.size}, {"path", file.path}});
    }
    return json_response({{"success", true}, {"files", list}});
}

HttpResponse UploadServer::chunked_init(const HttpContext& ctx) {
    auto body = parse_json_body(ctx.request);
    if (body.is_error()) {
        return error_response(body.error());
    }
    const auto& doc = body.value();

    transfer::ChunkedInitRequest request;
    try {
        request.path = doc.value("path", std::string{});
        request.filename = doc.at("filename").get<std::string>();
        request.total_size = doc.value("totalSize", std::uint64_t{0});
        request.chunk_size = doc.at("chunkSize").get<std::uint64_t>();
        const auto total_chunks = doc.at("totalChunks").get<std::uint64_t>();
        if (total_chunks > transfer::ChunkedUploadService::kMaxChunks) {
            return error_response(Error::invalid("totalChunks must be between 1 and " +
                                                 std::to_string(transfer::ChunkedUploadService::kMaxChunks)));
        }
        request.total_chunks = static_cast<std::uint32_t>(total_chunks);
    } catch (const json::exception& e) {
        return error_response(Error::invalid(std::string("Invalid init request: ") + e.what()));
    }

    auto result = chunked_.init(request);
    if (result.is_error()) {
        return error_response(result.error());
    }
    return json_response({{"success", true},
                          {"uploadId", result.value().upload_id},
                          {"chunkSize", result.value().chunk_size}});
}

HttpResponse UploadServer::chunked_chunk(const HttpContext& ctx) {
    const auto upload_id = ctx.request.query_param("uploadId");
    if (!upload_id || upload_id->empty()) {
        return error_response(Error::invalid("uploadId is required"));
    }
    auto index = parse_index(ctx.request.query_param("chunkIndex"));
    if (index.is_error()) {
        return error_response(index.error());
    }

    const std::uint8_t* data = ctx.request.body.data();
    std::size_t size = ctx.request.body.size();

    std::vector<network::MultipartPart> parts;
    if (const auto boundary = network::extract_boundary(ctx.request.get_header("Content-Type"))) {
        auto parsed = network::parse_multipart(ctx.request.body, *boundary);
        if (parsed.is_error()) {
            return error_response(parsed.error());
        }
        parts = std::move(parsed.value());
        const auto file = std::find_if(parts.begin(), parts.end(),
                                       [](const network::MultipartPart& p) { return p.is_file(); });
        if (file == parts.end()) {
            return error_response(Error::invalid("No chunk data in request"));
        }
        data = file->data;
        size = file->size;
    }

    auto stored = chunked_.put_chunk(*upload_id, index.value(), data, size);
    if (stored.is_error()) {
        return error_response(stored.error());
    }
    return json_response({{"success", true}, {"chunkIndex", index.value()}, {"received", true}});
}

HttpResponse UploadServer::chunked_complete(const HttpContext& ctx) {
    auto body = parse_json_body(ctx.request);
    if (body.is_error()) {
        return error_response(body.error());
    }
    auto upload_id = upload_id_from(body.value());
    if (upload_id.is_error()) {
        return error_response(upload_id.error());
    }

    auto result = chunked_.complete(upload_id.value());
    if (result.is_error()) {
        return error_response(result.error());
    }
    const auto& done = result.value();
    return json_response({{"success", true}, {"name", done.name}, {"size", done.size}, {"path", done.path}});
}

HttpResponse UploadServer::chunked_abort(const HttpContext& ctx) {
    auto body = parse_json_body(ctx.request);
    if (body.is_error()) {
        return error_response(body.error());
    }
    auto upload_id = upload_id_from(body.value());
    if (upload_id.is_error()) {
        return error_response(upload_id.error());
    }

    chunked_.abort(upload_id.value());
    return json_response({{"success", true}});
}

void UploadServer::accept_websocket(network::tcp::socket socket, HttpRequest request) {
    bool pre_authenticated = false;
    if (const auto token = request.query_param("auth")) {
        pre_authenticated = authenticator_.verify_token(*token);
    }
    if (!pre_authenticated && request.has_header("Authorization")) {
        pre_authenticated = authenticator_.verify_header(request.get_header("Authorization"));
    }

    auto handler = std::make_unique<StreamingUploadHandler>(
        resolver_, authenticator_, bus_, pre_authenticated, config_.progress_interval);
    std::make_shared<network::WebSocketConnection>(std::move(socket), std::move(handler))->start(request);
}

Result<void> UploadServer::start() {
    if (auto valid = validate_config(config_); valid.is_error()) {
        return valid;
    }

    try {
        http_ = std::make_unique<network::HttpServerAsio>(
            io_context_, config_.bind_address, config_.port, config_.max_body_bytes);
    } catch (const boost::system::system_error& e) {
        return Err<void>(Error::io("Failed to listen on " + config_.bind_address + ":" +
                                   std::to_string(config_.port) + ": " + e.what()));
    }

    http_->set_handler([this](const HttpRequest& request) { return handle(request); });
    http_->set_upgrade_handler(kWebSocketPath, [this](network::tcp::socket socket, HttpRequest request) {
        accept_websocket(std::move(socket), std::move(request));
    });
    http_->start();

    boost::system::error_code ec;
    signals_.add(SIGINT, ec);
    signals_.add(SIGTERM, ec);
    if (ec) {
        spdlog::warn("Signal handling unavailable: {}", ec.message());
    }
    signals_.async_wait([this](const boost::system::error_code& error, int signal_number) {
        if (!error) {
            spdlog::info("Received signal {}, shutting down...", signal_number);
            stop("signal " + std::to_string(signal_number));
        }
    });

    schedule_sweep();
    bus_.emit(events::ServerStartedEvent(http_->get_port(), resolver_.root().string()));
    return Ok();
}

void UploadServer::run() {
    const std::size_t extra = config_.worker_threads > 1 ? config_.worker_threads - 1 : 0;
    std::vector<std::thread> workers;
    workers.reserve(extra);
    for (std::size_t i = 0; i < extra; ++i) {
        workers.emplace_back([this]() { io_context_.run(); });
    }
    io_context_.run();
    for (auto& worker : workers) {
        worker.join();
    }
}

void UploadServer::stop(const std::string& reason) {
    if (stopping_.exchange(true)) {
        return;
    }
    if (http_) {
        http_->stop();
    }

    bus_.emit(events::ServerShuttingDownEvent(reason));
    metrics_.print_stats();
    io_context_.stop();
}

std::size_t UploadServer::sweep() {
    return chunked_.sweep_expired(config_.session_ttl);
}

uint16_t UploadServer::port() const {
    return http_ ? http_->get_port() : config_.port;
}

void UploadServer::schedule_sweep() {
    sweep_timer_.expires_after(config_.sweep_interval);
    sweep_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || stopping_) {
            return;
        }
        const auto reclaimed = sweep();
        if (reclaimed > 0) {
            spdlog::info("Reclaimed {} idle upload session(s)", reclaimed);
        }
        schedule_sweep();
    });
}

} // namespace filest::server
