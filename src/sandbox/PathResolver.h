#pragma once
#include <filesystem>
#include <string>
#include "sandbox/AllowList.h"
#include "sandbox/SandboxError.h"

namespace fs = std::filesystem;

/**
 * @brief Canonical form of a requested path and the AllowList entry it matched.
 */
struct ResolvedPath {
    fs::path path;
    fs::path base;
};

/**
 * @brief Validates caller-supplied paths against the AllowList.
 *
 * Resolution is repeated on every call; nothing is cached, since symlink
 * targets may change between calls.
 */
class PathResolver {
public:
    static constexpr size_t kDefaultMaxPathLength = 4096;

    explicit PathResolver(AllowList allowList, size_t maxPathLength = kDefaultMaxPathLength);

    /**
     * @brief Resolve and check containment.
     * @param requested Path as supplied by the caller
     * @param canonicalOut Optional; receives the canonical form whenever it
     *        could be computed, including for paths outside the sandbox
     * @return ResolvedPath, or InvalidArgument / OutsideSandbox
     */
    SandboxResult<ResolvedPath> validate(const std::string& requested, fs::path* canonicalOut = nullptr) const;

    const AllowList& allowList() const { return allowList_; }

private:
    AllowList allowList_;
    size_t maxPathLength_;
};
