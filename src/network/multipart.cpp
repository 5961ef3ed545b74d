#include "filest/network/multipart.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <string_view>

#include <strings.h>

namespace filest {
namespace network {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

std::string unquote(std::string_view value) {
    value = trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    return std::string(value);
}

/**
 * @brief Value of `key=...` among the `;` separated parameters of a header
 */
std::optional<std::string> header_param(std::string_view header, std::string_view key) {
    size_t pos = 0;
    while (pos < header.size()) {
        // Quoted values may contain ';'
        size_t end = pos;
        bool quoted = false;
        while (end < header.size() && (quoted || header[end] != ';')) {
            if (header[end] == '"') {
                quoted = !quoted;
            }
            ++end;
        }

        const auto item = trim(header.substr(pos, end - pos));
        const auto eq = item.find('=');
        if (eq != std::string_view::npos) {
            const auto name = trim(item.substr(0, eq));
            if (name.size() == key.size() &&
                strncasecmp(name.data(), key.data(), key.size()) == 0) {
                return unquote(item.substr(eq + 1));
            }
        }
        pos = end + 1;
    }
    return std::nullopt;
}

size_t find(std::string_view haystack, std::string_view needle, size_t from) {
    if (from > haystack.size()) {
        return std::string_view::npos;
    }
    const auto it = std::search(haystack.begin() + from, haystack.end(),
                                std::boyer_moore_horspool_searcher(needle.begin(), needle.end()));
    if (it == haystack.end()) {
        return std::string_view::npos;
    }
    return static_cast<size_t>(it - haystack.begin());
}

Result<void> parse_part_headers(std::string_view headers, MultipartPart& part) {
    size_t pos = 0;
    while (pos < headers.size()) {
        auto end = headers.find("\r\n", pos);
        if (end == std::string_view::npos) {
            end = headers.size();
        }
        const auto line = headers.substr(pos, end - pos);
        pos = end + 2;
        if (line.empty()) {
            continue;
        }

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return Err<void>(Error::protocol("Malformed part header"));
        }
        const auto name = trim(line.substr(0, colon));
        const auto value = trim(line.substr(colon + 1));

        if (strncasecmp(name.data(), "Content-Disposition", name.size()) == 0 &&
            name.size() == 19) {
            part.name = header_param(value, "name").value_or("");
            part.filename = header_param(value, "filename");
        } else if (strncasecmp(name.data(), "Content-Type", name.size()) == 0 &&
                   name.size() == 12) {
            part.content_type = std::string(value);
        }
    }
    return Ok();
}

} // namespace

std::optional<std::string> extract_boundary(const std::string& content_type) {
    const std::string_view header(content_type);
    const auto semi = header.find(';');
    const auto media = trim(header.substr(0, semi));
    static constexpr std::string_view kFormData = "multipart/form-data";
    if (media.size() != kFormData.size() ||
        strncasecmp(media.data(), kFormData.data(), kFormData.size()) != 0) {
        return std::nullopt;
    }
    if (semi == std::string_view::npos) {
        return std::nullopt;
    }

    auto boundary = header_param(header.substr(semi + 1), "boundary");
    if (!boundary || boundary->empty() || boundary->size() > 70) {
        return std::nullopt;
    }
    return boundary;
}

Result<std::vector<MultipartPart>> parse_multipart(const std::vector<uint8_t>& body,
                                                   const std::string& boundary) {
    const std::string_view data(reinterpret_cast<const char*>(body.data()), body.size());
    const std::string delimiter = "--" + boundary;
    const std::string separator = "\r\n" + delimiter;

    std::vector<MultipartPart> parts;

    size_t pos = 0;
    if (data.substr(0, delimiter.size()) != delimiter) {
        const auto first = find(data, separator, 0);
        if (first == std::string_view::npos) {
            return Err<std::vector<MultipartPart>>(Error::protocol("Multipart boundary not found"));
        }
        pos = first + 2;
    }

    while (true) {
        pos += delimiter.size();
        if (data.substr(pos, 2) == "--") {
            return Ok(std::move(parts));
        }
        // Transport padding after the delimiter is allowed
        while (pos < data.size() && (data[pos] == ' ' || data[pos] == '\t')) {
            ++pos;
        }
        if (data.substr(pos, 2) != "\r\n") {
            return Err<std::vector<MultipartPart>>(Error::protocol("Malformed multipart delimiter"));
        }
        pos += 2;

        const auto headers_end = find(data, "\r\n\r\n", pos);
        MultipartPart part;
        size_t content_start;
        if (data.substr(pos, 2) == "\r\n") {
            content_start = pos + 2;  // part without headers
        } else if (headers_end == std::string_view::npos) {
            return Err<std::vector<MultipartPart>>(Error::protocol("Unterminated part headers"));
        } else {
            auto headers = parse_part_headers(data.substr(pos, headers_end - pos), part);
            if (headers.is_error()) {
                return Err<std::vector<MultipartPart>>(headers.error());
            }
            content_start = headers_end + 4;
        }

        const auto content_end = find(data, separator, content_start);
        if (content_end == std::string_view::npos) {
            return Err<std::vector<MultipartPart>>(Error::protocol("Missing closing multipart boundary"));
        }

        part.data = body.data() + content_start;
        part.size = content_end - content_start;
        parts.push_back(std::move(part));

        pos = content_end + 2;
    }
}

} // namespace network
} // namespace filest
