#include "filest/core/authenticator.hpp"

#include "filest/core/base64.hpp"

namespace filest {

namespace {

// Length-independent of where the first mismatch is
bool constant_time_equals(const std::string& a, const std::string& b) {
    unsigned char diff = a.size() == b.size() ? 0 : 1;
    const std::size_t n = a.size() < b.size() ? a.size() : b.size();
    for (std::size_t i = 0; i < n; ++i) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}

} // namespace

Authenticator::Authenticator(std::string username, std::string password)
    : username_(std::move(username)), password_(std::move(password)) {
}

bool Authenticator::verify(const std::string& username, const std::string& password) const {
    const bool user_ok = constant_time_equals(username, username_);
    const bool pass_ok = constant_time_equals(password, password_);
    return user_ok && pass_ok;
}

bool Authenticator::verify_token(const std::string& token) const {
    auto credentials = decode_token(token);
    return credentials && verify(credentials->first, credentials->second);
}

bool Authenticator::verify_header(const std::string& header_value) const {
    static const std::string prefix = "Basic ";
    if (header_value.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return verify_token(header_value.substr(prefix.size()));
}

std::optional<std::pair<std::string, std::string>> Authenticator::decode_token(const std::string& token) {
    auto decoded = base64_decode(token);
    if (!decoded) {
        return std::nullopt;
    }
    const auto colon = decoded->find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    return std::make_pair(decoded->substr(0, colon), decoded->substr(colon + 1));
}

} // namespace filest
