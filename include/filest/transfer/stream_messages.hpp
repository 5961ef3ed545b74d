#pragma once

#include "filest/core/result.hpp"

#include <cstdint>
#include <string>

namespace filest::transfer {

/**
 * @brief Text frame sent by a WebSocket upload client
 *
 * Wire form is a JSON object tagged by "type":
 *   {"type":"auth","username":"..","password":".."}
 *   {"type":"init","filename":"..","size":N,"path":".."}   (path optional)
 *   {"type":"complete"}
 *   {"type":"cancel"}
 */
struct ClientMessage {
    enum class Type { Auth, Init, Complete, Cancel };

    Type type = Type::Cancel;
    std::string username;
    std::string password;
    std::string filename;
    std::string path;
    std::uint64_t size = 0;
};

Result<ClientMessage> parse_client_message(const std::string& text);

/**
 * @brief Text frame sent back to the client
 */
struct ServerMessage {
    enum class Type { AuthRequired, AuthOk, AuthFailed, InitOk, Progress, CompleteOk, Error };

    Type type = Type::Error;
    std::string code;        ///< Error
    std::string message;     ///< Error, AuthFailed
    std::string upload_id;   ///< InitOk
    std::string path;        ///< CompleteOk
    std::uint64_t received = 0;
    std::uint64_t total = 0;
    std::uint64_t size = 0;
    std::uint8_t percent = 0;

    static ServerMessage auth_required();
    static ServerMessage auth_ok();
    static ServerMessage auth_failed(std::string message);
    static ServerMessage init_ok(std::string upload_id);
    static ServerMessage progress(std::uint64_t received, std::uint64_t total);
    static ServerMessage complete_ok(std::string path, std::uint64_t size);
    static ServerMessage error(std::string code, std::string message);

    std::string to_json() const;
};

// Error codes carried by ServerMessage::error
inline constexpr const char* kInvalidMessage = "INVALID_MESSAGE";
inline constexpr const char* kInitFailed = "INIT_FAILED";
inline constexpr const char* kCompleteFailed = "COMPLETE_FAILED";
inline constexpr const char* kWriteFailed = "WRITE_FAILED";
inline constexpr const char* kNoSession = "NO_SESSION";

} // namespace filest::transfer
