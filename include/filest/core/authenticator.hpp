#pragma once

#include <optional>
#include <string>
#include <utility>

namespace filest {

/**
 * @brief Fixed single-user credential check (HTTP Basic semantics)
 */
class Authenticator {
public:
    Authenticator(std::string username, std::string password);

    [[nodiscard]] bool verify(const std::string& username, const std::string& password) const;

    /**
     * @brief Check a base64 "user:password" token (Basic header payload or
     *        the WebSocket `auth` query parameter)
     */
    [[nodiscard]] bool verify_token(const std::string& token) const;

    /**
     * @brief Check a full `Authorization` header value ("Basic <token>")
     */
    [[nodiscard]] bool verify_header(const std::string& header_value) const;

    /**
     * @brief Split a base64 "user:password" token; nullopt when malformed
     */
    static std::optional<std::pair<std::string, std::string>> decode_token(const std::string& token);

private:
    std::string username_;
    std::string password_;
};

} // namespace filest
