#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Path helpers shared by the allow-list parser and the resolver.
 */
namespace PathUtils {
    /**
     * @brief Expand a leading "~" or "~/" to the current user's home directory.
     *
     * "~user" forms are not expanded. If no home directory can be determined
     * the input is returned unchanged.
     */
    std::string expandHome(const std::string& path);

    /**
     * @brief Canonicalize a path without requiring it to exist.
     *
     * Walks the path one component at a time. Components that exist are
     * resolved through the filesystem (symlinks followed), "." is dropped and
     * ".." pops the already canonical prefix. Components that do not exist are
     * appended as-is; a later component that exists again is resolved again.
     * Relative input is made absolute against the working directory.
     *
     * @param path Input path (home shorthand must already be expanded)
     * @param failure Optional; receives the reason when resolution fails
     * @return Canonical absolute path, or std::nullopt if a symlink cannot be
     *         resolved (dangling, loop) or the filesystem reports an error
     */
    std::optional<fs::path> canonicalize(const fs::path& path, std::string* failure = nullptr);

    /**
     * @brief Separator-exact containment test on canonical paths.
     *
     * True if candidate equals base, or starts with base followed
     * immediately by a separator. "/allowed-evil" is not inside "/allowed".
     */
    bool isContained(const fs::path& candidate, const fs::path& base);
}
