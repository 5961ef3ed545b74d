#pragma once

#include <optional>
#include <string>

namespace filest {

std::string base64_encode(const std::string& data);

/**
 * @brief Decode standard (RFC 4648) base64
 * @return std::nullopt when the input contains characters outside the alphabet
 */
std::optional<std::string> base64_decode(const std::string& input);

} // namespace filest
