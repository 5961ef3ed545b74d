#pragma once

#include "filest/core/result.hpp"

#include <filesystem>
#include <string>

namespace filest::transfer {

/**
 * @brief A location inside the sandbox, in two forms
 *
 * `logical` is built from the requested components only and never follows
 * symlinks; it is what gets reported back to clients. `actual` is the
 * symlink-resolved location used for I/O (equal to `logical` when nothing
 * on the path is a symlink). Both are descendants of the sandbox root.
 */
struct SandboxedPath {
    std::filesystem::path logical;
    std::filesystem::path actual;

    SandboxedPath child(const std::string& name) const {
        return SandboxedPath{logical / name, actual / name};
    }
};

class PathResolver {
public:
    /**
     * @param root Sandbox root. Must exist; it is canonicalized here.
     */
    explicit PathResolver(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    /**
     * @brief Resolve a client supplied path against the root
     *
     * Leading separators are ignored, "." and empty components are skipped,
     * ".." pops one level and fails when already at the root. Every failure
     * is reported as the same AccessDenied error.
     */
    Result<SandboxedPath> resolve(const std::string& user_path) const;

    /**
     * @brief Root-relative display form of a logical path ("/a/b", "/" for the root)
     */
    std::string display_path(const std::filesystem::path& logical) const;

    /**
     * @brief True when @p path equals @p root or lies below it (component-wise)
     */
    static bool is_within(const std::filesystem::path& root, const std::filesystem::path& path);

private:
    std::filesystem::path root_;
};

/**
 * @brief Accept only a single, plain path component as a file name
 */
bool is_valid_filename(const std::string& name);

} // namespace filest::transfer
