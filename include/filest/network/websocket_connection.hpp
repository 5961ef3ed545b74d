#pragma once

#include "filest/network/http_types.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/websocket.hpp>

#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace filest {
namespace network {

/**
 * @brief What the application wants sent after a frame
 */
struct WebSocketReply {
    std::vector<std::string> texts;  ///< Sent as text frames, in order
    bool close = false;              ///< Close the connection once they are out
};

/**
 * @brief Application side of a WebSocket connection
 *
 * Called from the connection's strand only, one frame at a time. on_close()
 * is called exactly once, whichever way the connection ends.
 */
class WebSocketHandler {
public:
    virtual ~WebSocketHandler() = default;

    virtual WebSocketReply on_open() = 0;
    virtual WebSocketReply on_text(const std::string& text) = 0;
    virtual WebSocketReply on_binary(const uint8_t* data, size_t size) = 0;
    virtual void on_close() = 0;
};

/**
 * @brief Server side WebSocket session on Boost.Beast
 *
 * Completes the handshake for a request the HTTP layer already parsed, then
 * alternates: read one message, hand it to the handler, write the replies.
 * No new frame is read while replies are pending, so a slow client slows
 * the reads down instead of growing a queue.
 */
class WebSocketConnection : public std::enable_shared_from_this<WebSocketConnection> {
public:
    static constexpr uint64_t kMaxMessageBytes = 64ULL * 1024 * 1024;

    WebSocketConnection(boost::asio::ip::tcp::socket socket, std::unique_ptr<WebSocketHandler> handler);

    void start(const HttpRequest& request);

private:
    void on_accept(boost::beast::error_code ec);
    void do_read();
    void on_read(boost::beast::error_code ec, size_t bytes);
    void dispatch(WebSocketReply reply);
    void do_write();
    void do_close();
    void finish();

    boost::beast::websocket::stream<boost::asio::ip::tcp::socket> ws_;
    std::unique_ptr<WebSocketHandler> handler_;
    boost::beast::flat_buffer buffer_;
    std::deque<std::string> outbox_;
    bool close_after_write_ = false;
    bool finished_ = false;
};

} // namespace network
} // namespace filest
