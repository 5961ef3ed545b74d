#pragma once

#include "filest/core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace filest {
namespace network {

/**
 * @brief One part of a multipart/form-data body
 *
 * `data` points into the body the part was parsed from and is only valid
 * while that body is alive.
 */
struct MultipartPart {
    std::string name;                     ///< Content-Disposition name
    std::optional<std::string> filename;  ///< Present for file parts (may be empty)
    std::string content_type;
    const uint8_t* data = nullptr;
    size_t size = 0;

    bool is_file() const { return filename.has_value(); }
    std::string text() const { return std::string(reinterpret_cast<const char*>(data), size); }
};

/**
 * @brief boundary parameter of a `multipart/form-data; boundary=...` header
 */
std::optional<std::string> extract_boundary(const std::string& content_type);

/**
 * @brief Split @p body on @p boundary
 *
 * Preamble and epilogue are ignored. A body that never reaches the closing
 * delimiter is a ProtocolError.
 */
Result<std::vector<MultipartPart>> parse_multipart(const std::vector<uint8_t>& body,
                                                   const std::string& boundary);

} // namespace network
} // namespace filest
