#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace fs = std::filesystem;

/**
 * Shell-style glob matched against relative paths (generic '/' separators).
 * - "*" matches within one path segment, "?" one character of a segment
 * - a segment that is exactly "**" matches zero or more whole segments
 * - "[abc]", "[a-z]", "[!abc]" character classes
 * Matching is iterative with a single backtrack point per level, so the cost
 * is bounded by pattern length times path length.
 * Throws std::invalid_argument for an unterminated class or an empty pattern.
 */
class GlobPattern {
public:
    explicit GlobPattern(const std::string& glob);
    ~GlobPattern();

    GlobPattern(GlobPattern&&) noexcept;
    GlobPattern& operator=(GlobPattern&&) noexcept;

    bool matches(const fs::path& relativePath) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
