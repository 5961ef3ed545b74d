#include "filest/transfer/path_resolver.hpp"

#include <algorithm>
#include <vector>

namespace filest::transfer {
namespace fs = std::filesystem;

namespace {

std::vector<std::string> split_components(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            parts.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(std::move(current));
    return parts;
}

} // namespace

PathResolver::PathResolver(fs::path root) {
    std::error_code ec;
    auto canonical = fs::canonical(root, ec);
    root_ = ec ? fs::absolute(root).lexically_normal() : canonical;
    if (root_.has_relative_path() && root_.filename().empty()) {
        root_ = root_.parent_path();
    }
}

Result<SandboxedPath> PathResolver::resolve(const std::string& user_path) const {
    if (user_path.find('\0') != std::string::npos) {
        return Err<SandboxedPath>(Error::access_denied());
    }

    const auto first = user_path.find_first_not_of('/');
    const std::string normalized = first == std::string::npos ? std::string{} : user_path.substr(first);

    fs::path logical = root_;
    std::size_t depth = 0;
    for (const auto& component : split_components(normalized)) {
        if (component.empty() || component == ".") {
            continue;
        }
        if (component == "..") {
            // Climbing above the root is always an error, even if later
            // components would come back down.
            if (depth == 0) {
                return Err<SandboxedPath>(Error::access_denied());
            }
            logical = logical.parent_path();
            --depth;
            continue;
        }
        logical /= component;
        ++depth;
    }

    if (!is_within(root_, logical)) {
        return Err<SandboxedPath>(Error::access_denied());
    }

    std::error_code ec;
    fs::path actual;
    const auto status = fs::symlink_status(logical, ec);
    if (!ec && fs::exists(status)) {
        // Existing entry: resolve every symlink. A dangling or looping link
        // cannot be resolved and is rejected rather than written through.
        actual = fs::canonical(logical, ec);
        if (ec) {
            return Err<SandboxedPath>(Error::access_denied());
        }
    } else {
        // Not there yet: only symlinked ancestors can move it.
        actual = fs::weakly_canonical(logical, ec);
        if (ec) {
            actual = logical;
        }
    }

    if (!is_within(root_, actual)) {
        return Err<SandboxedPath>(Error::access_denied());
    }

    return Ok(SandboxedPath{logical, actual});
}

std::string PathResolver::display_path(const fs::path& logical) const {
    const auto relative = logical.lexically_relative(root_);
    const std::string text = relative.generic_string();
    if (text.empty() || text == ".") {
        return "/";
    }
    return "/" + text;
}

bool PathResolver::is_within(const fs::path& root, const fs::path& path) {
    auto path_it = path.begin();
    for (const auto& part : root) {
        if (path_it == path.end() || part != *path_it) {
            return false;
        }
        ++path_it;
    }
    return std::none_of(path_it, path.end(), [](const fs::path& part) {
        return part == "..";
    });
}

bool is_valid_filename(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

} // namespace filest::transfer
