#pragma once

#include "filest/core/authenticator.hpp"
#include "filest/core/config.hpp"
#include "filest/core/result.hpp"
#include "filest/events/components.hpp"
#include "filest/events/event_bus.hpp"
#include "filest/network/http_router.hpp"
#include "filest/network/http_server_asio.hpp"
#include "filest/transfer/chunked_upload.hpp"
#include "filest/transfer/multipart_upload.hpp"
#include "filest/transfer/path_resolver.hpp"
#include "filest/transfer/session_store.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <memory>
#include <string>

namespace filest::server {

/**
 * @brief The upload server: REST routes, WebSocket endpoint, housekeeping
 *
 * ROUTES (all under HTTP Basic auth except the WebSocket endpoint):
 *   POST /api/upload            multipart/form-data, single shot
 *   POST /api/upload/init       chunked: open a session
 *   POST /api/upload/chunk      chunked: ?uploadId=&chunkIndex=, raw or multipart body
 *   POST /api/upload/complete   chunked: merge
 *   POST /api/upload/abort      chunked: drop
 *   GET  /api/ws/upload         WebSocket streaming upload (?auth=base64(user:pass))
 *
 * handle() answers a request without any socket, so the REST surface can
 * be exercised directly.
 */
class UploadServer {
public:
    static constexpr const char* kWebSocketPath = "/api/ws/upload";

    explicit UploadServer(ServerConfig config);
    ~UploadServer();

    UploadServer(const UploadServer&) = delete;
    UploadServer& operator=(const UploadServer&) = delete;

    network::HttpResponse handle(const network::HttpRequest& request) const;

    /**
     * @brief Bind the listener, arm the sweep timer and signal handling
     */
    Result<void> start();

    /**
     * @brief Run the event loop on the configured number of threads; returns after stop()
     */
    void run();

    /// Idempotent; safe from any thread
    void stop(const std::string& reason = "normal");

    /// Reclaim idle chunked sessions now
    std::size_t sweep();

    uint16_t port() const;
    const ServerConfig& config() const { return config_; }
    const transfer::PathResolver& resolver() const { return resolver_; }
    events::EventBus& bus() { return bus_; }
    const events::MetricsComponent& metrics() const { return metrics_; }

private:
    void register_routes();
    bool check_auth(const network::HttpContext& ctx, network::HttpResponse& response) const;
    void accept_websocket(network::tcp::socket socket, network::HttpRequest request);
    void schedule_sweep();

    network::HttpResponse upload_multipart(const network::HttpContext& ctx);
    network::HttpResponse chunked_init(const network::HttpContext& ctx);
    network::HttpResponse chunked_chunk(const network::HttpContext& ctx);
    network::HttpResponse chunked_complete(const network::HttpContext& ctx);
    network::HttpResponse chunked_abort(const network::HttpContext& ctx);

    ServerConfig config_;
    events::EventBus bus_;
    events::LoggerComponent logger_;
    events::MetricsComponent metrics_;
    Authenticator authenticator_;
    transfer::PathResolver resolver_;
    transfer::SessionStore sessions_;
    transfer::ChunkedUploadService chunked_;
    transfer::MultipartUploadService multipart_;
    network::HttpRouter router_;

    boost::asio::io_context io_context_;
    std::unique_ptr<network::HttpServerAsio> http_;
    boost::asio::steady_timer sweep_timer_;
    boost::asio::signal_set signals_;
    std::atomic<bool> stopping_{false};
};

/**
 * @brief JSON error envelope for @p error with the mapped HTTP status
 */
network::HttpResponse error_response(const Error& error);

} // namespace filest::server
