#include "filest/core/error.hpp"

namespace filest {

Error Error::access_denied() {
    return Error(ErrorCode::AccessDenied, "Access denied: Invalid path");
}

Error Error::session_not_found(const std::string& session_id) {
    return Error(ErrorCode::SessionNotFound, "Upload session not found: " + session_id);
}

Error Error::missing(std::vector<std::uint32_t> indices) {
    Error error(ErrorCode::MissingChunks,
                "Missing " + std::to_string(indices.size()) + " chunk(s)");
    error.missing_chunks = std::move(indices);
    return error;
}

Error Error::io(std::string detail) {
    return Error(ErrorCode::IoFailure, std::move(detail));
}

Error Error::invalid(std::string detail) {
    return Error(ErrorCode::InvalidArgument, std::move(detail));
}

Error Error::protocol(std::string detail) {
    return Error(ErrorCode::ProtocolError, std::move(detail));
}

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::AccessDenied: return "ACCESS_DENIED";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::AlreadyExists: return "ALREADY_EXISTS";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::SessionNotFound: return "SESSION_NOT_FOUND";
        case ErrorCode::InvalidIndex: return "INVALID_INDEX";
        case ErrorCode::MissingChunks: return "MISSING_CHUNKS";
        case ErrorCode::IoFailure: return "IO_FAILURE";
        case ErrorCode::AuthRequired: return "AUTH_REQUIRED";
        case ErrorCode::AuthFailed: return "AUTH_FAILED";
        case ErrorCode::ProtocolError: return "PROTOCOL_ERROR";
    }
    return "UNKNOWN";
}

int http_status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::AccessDenied: return 403;
        case ErrorCode::NotFound:
        case ErrorCode::SessionNotFound: return 404;
        case ErrorCode::AlreadyExists:
        case ErrorCode::MissingChunks: return 409;
        case ErrorCode::InvalidArgument:
        case ErrorCode::InvalidIndex:
        case ErrorCode::ProtocolError: return 400;
        case ErrorCode::AuthRequired:
        case ErrorCode::AuthFailed: return 401;
        case ErrorCode::IoFailure: return 500;
    }
    return 500;
}

} // namespace filest
