#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace filest {

/**
 * @brief Failure categories shared by every transfer path
 *
 * AccessDenied never says whether the path tried to climb above the root
 * or resolved through a symlink that leaves it.
 */
enum class ErrorCode {
    AccessDenied,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    SessionNotFound,
    InvalidIndex,
    MissingChunks,
    IoFailure,
    AuthRequired,
    AuthFailed,
    ProtocolError
};

struct Error {
    ErrorCode code = ErrorCode::IoFailure;
    std::string message;
    std::vector<std::uint32_t> missing_chunks;  ///< Populated when code == MissingChunks

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    static Error access_denied();
    static Error session_not_found(const std::string& session_id);
    static Error missing(std::vector<std::uint32_t> indices);
    static Error io(std::string detail);
    static Error invalid(std::string detail);
    static Error protocol(std::string detail);
};

/**
 * @brief Stable upper-case name for an error code ("ACCESS_DENIED", ...)
 */
const char* error_code_name(ErrorCode code);

/**
 * @brief HTTP status a REST handler answers with for this error
 */
int http_status_for(ErrorCode code);

} // namespace filest
