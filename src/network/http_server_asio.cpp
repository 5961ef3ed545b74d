#include "filest/network/http_server_asio.hpp"

#include <spdlog/spdlog.h>

namespace filest {
namespace network {

// ──────────────────────────────────────────────────────────
// HttpConnection Implementation
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket,
                               const HttpRequestHandler& handler,
                               const std::string& upgrade_path,
                               const UpgradeHandler& upgrade_handler,
                               uint64_t max_body_bytes)
    : socket_(std::move(socket))
    , handler_(handler)
    , upgrade_path_(upgrade_path)
    , upgrade_handler_(upgrade_handler)
    , parser_(max_body_bytes) {
}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                    spdlog::debug("Read error: {}", ec.message());
                }
                return;
            }

            auto parse_result = parser_.parse(buffer_.data(), bytes_transferred);
            if (parse_result.is_error()) {
                if (parser_.payload_too_large()) {
                    handle_error(HttpStatus::PAYLOAD_TOO_LARGE, parse_result.error().message);
                } else {
                    handle_error(HttpStatus::BAD_REQUEST, "Parse error: " + parse_result.error().message);
                }
                return;
            }

            if (parse_result.value()) {
                on_request(parser_.take_request());
            } else if (parser_.expects_continue() && !continue_sent_) {
                send_continue();
            } else {
                do_read();
            }
        });
}

void HttpConnection::on_request(HttpRequest request) {
    spdlog::info("{} {} HTTP/{}",
                 HttpMethodUtils::to_string(request.method),
                 request.path(),
                 request.version == HttpVersion::HTTP_1_1 ? "1.1" : "1.0");

    if (upgrade_handler_ && request.is_websocket_upgrade() && request.path() == upgrade_path_) {
        upgrade_handler_(std::move(socket_), std::move(request));
        return;
    }

    HttpResponse response;
    if (!handler_) {
        response = create_error_response(HttpStatus::NOT_IMPLEMENTED, "No handler installed");
    } else {
        try {
            response = handler_(request);
        } catch (const std::exception& e) {
            spdlog::error("Handler threw exception: {}", e.what());
            response = create_error_response(HttpStatus::INTERNAL_SERVER_ERROR, "Internal server error");
        }
    }
    do_write(response);
}

void HttpConnection::send_continue() {
    auto self = shared_from_this();
    continue_sent_ = true;

    static const std::string kContinue = "HTTP/1.1 100 Continue\r\n\r\n";
    asio::async_write(
        socket_,
        asio::buffer(kContinue),
        [this, self](boost::system::error_code ec, size_t) {
            if (ec) {
                spdlog::debug("Write error: {}", ec.message());
                return;
            }
            do_read();
        });
}

void HttpConnection::do_write(const HttpResponse& response) {
    auto self = shared_from_this();

    HttpResponse outgoing = response;
    outgoing.set_header("Connection", "close");
    auto data_ptr = std::make_shared<std::vector<uint8_t>>(outgoing.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*data_ptr),
        [this, self, data_ptr](boost::system::error_code ec, size_t bytes_transferred) {
            if (!ec) {
                spdlog::debug("Sent {} bytes", bytes_transferred);
                boost::system::error_code shutdown_ec;
                socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
            } else if (ec != asio::error::operation_aborted) {
                spdlog::debug("Write error: {}", ec.message());
            }
        });
}

void HttpConnection::handle_error(HttpStatus status, const std::string& message) {
    spdlog::warn("Connection error: {}", message);
    do_write(create_error_response(status, message));
}

HttpResponse HttpConnection::create_error_response(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_body(message);
    response.set_header("Content-Type", "text/plain");
    return response;
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio Implementation
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(asio::io_context& io_context,
                               const std::string& bind_address,
                               uint16_t port,
                               uint64_t max_body_bytes)
    : io_context_(io_context)
    , acceptor_(asio::make_strand(io_context))
    , max_body_bytes_(max_body_bytes)
    , port_(port) {
    const tcp::endpoint endpoint(asio::ip::make_address(bind_address), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
    port_ = acceptor_.local_endpoint().port();

    spdlog::info("HTTP server (Asio event-driven) listening on {}:{}", bind_address, port_);
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServerAsio::set_upgrade_handler(std::string path, UpgradeHandler handler) {
    upgrade_path_ = std::move(path);
    upgrade_handler_ = std::move(handler);
}

void HttpServerAsio::start() {
    do_accept();
}

void HttpServerAsio::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    asio::post(acceptor_.get_executor(), [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        if (ec) {
            spdlog::warn("Error closing acceptor: {}", ec.message());
        }
    });
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        asio::make_strand(io_context_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted || stopped_) {
                return;
            }
            if (!ec) {
                spdlog::debug("Accepted connection from {}",
                              socket.remote_endpoint(ec).address().to_string());
                std::make_shared<HttpConnection>(
                    std::move(socket), handler_, upgrade_path_, upgrade_handler_, max_body_bytes_)->start();
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }
            do_accept();
        });
}

} // namespace network
} // namespace filest
