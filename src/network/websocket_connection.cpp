#include "filest/network/websocket_connection.hpp"

#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>

namespace filest {
namespace network {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;

WebSocketConnection::WebSocketConnection(boost::asio::ip::tcp::socket socket,
                                         std::unique_ptr<WebSocketHandler> handler)
    : ws_(std::move(socket))
    , handler_(std::move(handler)) {
}

void WebSocketConnection::start(const HttpRequest& request) {
    // Rebuild the handshake for Beast from what HttpParser already consumed
    http::request<http::empty_body> handshake;
    handshake.method(http::verb::get);
    handshake.target(request.url);
    handshake.version(request.version == HttpVersion::HTTP_1_0 ? 10 : 11);
    for (const auto& [name, value] : request.headers) {
        handshake.set(name, value);
    }

    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, "filest");
    }));
    ws_.read_message_max(kMaxMessageBytes);

    ws_.async_accept(handshake, [self = shared_from_this()](beast::error_code ec) {
        self->on_accept(ec);
    });
}

void WebSocketConnection::on_accept(beast::error_code ec) {
    if (ec) {
        spdlog::warn("WebSocket handshake failed: {}", ec.message());
        finish();
        return;
    }
    spdlog::debug("WebSocket connection established");
    dispatch(handler_->on_open());
}

void WebSocketConnection::do_read() {
    ws_.async_read(buffer_, [self = shared_from_this()](beast::error_code ec, size_t bytes) {
        self->on_read(ec, bytes);
    });
}

void WebSocketConnection::on_read(beast::error_code ec, size_t) {
    if (ec) {
        if (ec != websocket::error::closed && ec != boost::asio::error::operation_aborted) {
            spdlog::debug("WebSocket read ended: {}", ec.message());
        }
        finish();
        return;
    }

    WebSocketReply reply;
    if (ws_.got_text()) {
        reply = handler_->on_text(beast::buffers_to_string(buffer_.data()));
    } else {
        const auto data = buffer_.data();
        reply = handler_->on_binary(static_cast<const uint8_t*>(data.data()), data.size());
    }
    buffer_.consume(buffer_.size());

    dispatch(std::move(reply));
}

void WebSocketConnection::dispatch(WebSocketReply reply) {
    for (auto& text : reply.texts) {
        outbox_.push_back(std::move(text));
    }
    close_after_write_ = reply.close;

    if (!outbox_.empty()) {
        do_write();
    } else if (close_after_write_) {
        do_close();
    } else {
        do_read();
    }
}

void WebSocketConnection::do_write() {
    ws_.text(true);
    ws_.async_write(boost::asio::buffer(outbox_.front()),
                    [self = shared_from_this()](beast::error_code ec, size_t) {
                        if (ec) {
                            spdlog::debug("WebSocket write failed: {}", ec.message());
                            self->finish();
                            return;
                        }
                        self->outbox_.pop_front();
                        if (!self->outbox_.empty()) {
                            self->do_write();
                        } else if (self->close_after_write_) {
                            self->do_close();
                        } else {
                            self->do_read();
                        }
                    });
}

void WebSocketConnection::do_close() {
    ws_.async_close(websocket::close_code::normal, [self = shared_from_this()](beast::error_code ec) {
        if (ec) {
            spdlog::debug("WebSocket close failed: {}", ec.message());
        }
        self->finish();
    });
}

void WebSocketConnection::finish() {
    if (finished_) {
        return;
    }
    finished_ = true;
    handler_->on_close();
}

} // namespace network
} // namespace filest
