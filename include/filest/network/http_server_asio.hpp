#pragma once

#include "filest/network/http_parser.hpp"
#include "filest/network/http_types.hpp"

#include <boost/asio.hpp>

#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace filest {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief Takes over a socket whose request asked for a protocol upgrade
 *
 * The socket is handed off with the already parsed handshake request; the
 * HTTP connection forgets it afterwards.
 */
using UpgradeHandler = std::function<void(tcp::socket, HttpRequest)>;

/**
 * @brief One accepted HTTP connection
 *
 * Reads a single request, answers it and shuts the socket down
 * (`Connection: close`). Every completion handler runs on the strand the
 * socket was accepted on, so a connection never runs on two threads at once.
 *
 * Lifecycle:
 * 1. Created when the acceptor hands over a socket
 * 2. start() begins reading
 * 3. Request complete -> handler -> write -> shutdown
 *    or Upgrade: websocket on the upgrade path -> UpgradeHandler owns the socket
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket,
                   const HttpRequestHandler& handler,
                   const std::string& upgrade_path,
                   const UpgradeHandler& upgrade_handler,
                   uint64_t max_body_bytes);

    void start();

private:
    void do_read();
    void on_request(HttpRequest request);
    void do_write(const HttpResponse& response);
    void send_continue();
    void handle_error(HttpStatus status, const std::string& message);

    static HttpResponse create_error_response(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    const HttpRequestHandler& handler_;
    const std::string& upgrade_path_;
    const UpgradeHandler& upgrade_handler_;
    HttpParser parser_;
    std::array<char, 64 * 1024> buffer_;
    bool continue_sent_ = false;
};

/**
 * @brief Event-driven HTTP server on Boost.Asio
 *
 * Accepts on @p bind_address:@p port. The acceptor and every connection
 * run on their own strands
 * so the io_context may be run from several threads.
 *
 * ```cpp
 * asio::io_context io;
 * HttpServerAsio server(io, "0.0.0.0", 3000, max_body);
 * server.set_handler([&](const HttpRequest& req) { return router.handle_request(req); });
 * server.start();
 * io.run();
 * ```
 */
class HttpServerAsio {
public:
    /**
     * @throws boost::system::system_error when the address cannot be bound
     */
    HttpServerAsio(asio::io_context& io_context,
                   const std::string& bind_address,
                   uint16_t port,
                   uint64_t max_body_bytes = HttpParser::kDefaultMaxBody);

    /// Must be set before start(); not changed while running
    void set_handler(HttpRequestHandler handler);

    /**
     * @brief Hand WebSocket handshakes for @p path to @p handler
     *
     * Upgrade requests for any other path go through the normal handler.
     */
    void set_upgrade_handler(std::string path, UpgradeHandler handler);

    void start();

    /// Stop accepting; open connections finish on their own
    void stop();

    /// Port actually bound (differs from the requested one when that was 0)
    uint16_t get_port() const { return port_; }

private:
    void do_accept();

    asio::io_context& io_context_;
    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    std::string upgrade_path_;
    UpgradeHandler upgrade_handler_;
    uint64_t max_body_bytes_;
    uint16_t port_;
    std::atomic<bool> stopped_{false};
};

} // namespace network
} // namespace filest
