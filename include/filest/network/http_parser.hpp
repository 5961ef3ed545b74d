#pragma once

#include "filest/core/result.hpp"
#include "filest/network/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>

#include <strings.h>

namespace filest {
namespace network {

/**
 * @brief Where the parser is inside the request
 *
 * METHOD SP URL SP VERSION CRLF
 * *(Header-Name: Header-Value CRLF)
 * CRLF
 * [Body]   (exactly Content-Length bytes)
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x request parser
 *
 * Feed it whatever the socket delivered; parse() returns true once a whole
 * request is available. The request line and headers are consumed one byte
 * at a time, the body is copied in bulk.
 *
 * ```cpp
 * HttpParser parser(max_body);
 * auto result = parser.parse(buf, n);
 * if (result.is_error()) { ... 400 / 413 ... }
 * if (result.value()) { handle(parser.get_request()); }
 * ```
 */
class HttpParser {
public:
    static constexpr size_t kMaxHeaderBytes = 64 * 1024;
    static constexpr uint64_t kDefaultMaxBody = 500ULL * 1024 * 1024;

    explicit HttpParser(uint64_t max_body_bytes = kDefaultMaxBody)
        : max_body_bytes_(max_body_bytes) {
        reset();
    }

    /**
     * @return true when the request is complete, false when more data is needed
     */
    Result<bool> parse(const char* data, size_t len) {
        size_t i = 0;
        while (i < len) {
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return Err<bool>(Error::protocol("Parser in error state"));
            }

            if (state_ == ParseState::BODY) {
                const size_t wanted = static_cast<size_t>(content_length_ - request_.body.size());
                const size_t take = std::min(wanted, len - i);
                request_.body.insert(request_.body.end(), data + i, data + i + take);
                i += take;
                if (request_.body.size() == content_length_) {
                    state_ = ParseState::COMPLETE;
                }
                continue;
            }

            const char c = data[i++];
            if (++header_bytes_ > kMaxHeaderBytes) {
                return fail("Request header too large");
            }
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::METHOD: ok = parse_method(c); break;
                case ParseState::URL: ok = parse_url(c); break;
                case ParseState::VERSION: ok = parse_version(c); break;
                case ParseState::HEADER_NAME: ok = parse_header_name(c); break;
                case ParseState::HEADER_VALUE: ok = parse_header_value(c); break;
                default: break;
            }
            if (!ok) {
                if (state_ == ParseState::PARSE_ERROR) {
                    return Err<bool>(error_);
                }
                return fail("Malformed request at line " + std::to_string(line_));
            }
        }

        return Ok(state_ == ParseState::COMPLETE);
    }

    HttpRequest get_request() const {
        return request_;
    }

    /// Move the finished request out; the parser must be reset() before reuse
    HttpRequest take_request() {
        return std::move(request_);
    }

    bool is_complete() const {
        return state_ == ParseState::COMPLETE;
    }

    /// Headers are in and the client waits for "100 Continue" before the body
    bool expects_continue() const {
        return state_ == ParseState::BODY &&
               strcasecmp(request_.get_header("Expect").c_str(), "100-continue") == 0;
    }

    /// The last failure was a Content-Length above the configured limit
    bool payload_too_large() const {
        return payload_too_large_;
    }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        content_length_ = 0;
        header_bytes_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
        payload_too_large_ = false;
        error_ = Error();
    }

private:
    Result<bool> fail(std::string message) {
        state_ = ParseState::PARSE_ERROR;
        error_ = Error::protocol(std::move(message));
        return Err<bool>(error_);
    }

    bool parse_method(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                return false;
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }
        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.url = std::move(buffer_);
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }
        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_version(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            if (buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                return false;
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            return finish_headers();
        }
        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = std::move(buffer_);
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            request_.headers[current_header_name_] = std::move(buffer_);
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool finish_headers() {
        if (request_.has_header("Transfer-Encoding")) {
            state_ = ParseState::PARSE_ERROR;
            error_ = Error::protocol("Transfer-Encoding is not supported");
            return false;
        }

        const std::string length = request_.get_header("Content-Length");
        if (length.empty()) {
            state_ = ParseState::COMPLETE;
            return true;
        }
        if (!std::all_of(length.begin(), length.end(),
                         [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)); }) ||
            length.size() > 19) {
            state_ = ParseState::PARSE_ERROR;
            error_ = Error::protocol("Invalid Content-Length");
            return false;
        }

        content_length_ = std::stoull(length);
        if (content_length_ > max_body_bytes_) {
            payload_too_large_ = true;
            state_ = ParseState::PARSE_ERROR;
            error_ = Error(ErrorCode::InvalidArgument, "Request body too large");
            return false;
        }
        if (content_length_ == 0) {
            state_ = ParseState::COMPLETE;
            return true;
        }
        request_.body.reserve(static_cast<size_t>(content_length_));
        state_ = ParseState::BODY;
        return true;
    }

    uint64_t max_body_bytes_;
    ParseState state_;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    uint64_t content_length_;
    size_t header_bytes_;
    size_t line_;
    bool last_char_was_cr_;
    bool payload_too_large_;
    Error error_;
};

} // namespace network
} // namespace filest
