#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Ordered, immutable set of canonical base directories.
 *
 * Built once at startup. An empty AllowList permits nothing.
 */
class AllowList {
public:
    AllowList() = default;
    explicit AllowList(std::vector<fs::path> entries);

    /**
     * @brief Parse a raw configuration value.
     *
     * A JSON array of strings is used verbatim; anything else is split on
     * commas with whitespace trimmed and empty segments dropped. Absent input
     * yields an empty list. Every entry is home-expanded and canonicalized;
     * entries that cannot be resolved are skipped with a warning.
     */
    static AllowList parse(const std::optional<std::string>& raw);

    /** @brief Split step of parse(), before expansion and canonicalization. */
    static std::vector<std::string> splitRaw(const std::string& raw);

    const std::vector<fs::path>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }

    /** @brief Entries as plain strings, for capability reports. */
    std::vector<std::string> toStrings() const;

private:
    std::vector<fs::path> entries_;
};
