#include "sandbox/PathResolver.h"
#include "utils/PathUtils.h"

PathResolver::PathResolver(AllowList allowList, size_t maxPathLength)
    : allowList_(std::move(allowList)), maxPathLength_(maxPathLength) {}

SandboxResult<ResolvedPath> PathResolver::validate(const std::string& requested, fs::path* canonicalOut) const {
    using Result = SandboxResult<ResolvedPath>;

    if (requested.empty()) {
        return Result::fail(SandboxErrorCode::InvalidArgument, "Path must not be empty");
    }
    if (requested.size() > maxPathLength_) {
        return Result::fail(SandboxErrorCode::InvalidArgument,
                            "Path exceeds " + std::to_string(maxPathLength_) + " characters");
    }
    if (requested.find('\0') != std::string::npos) {
        return Result::fail(SandboxErrorCode::InvalidArgument, "Path contains a NUL byte");
    }

    std::string failure;
    auto canonical = PathUtils::canonicalize(PathUtils::expandHome(requested), &failure);
    if (!canonical) {
        // Cannot prove containment of what we cannot resolve.
        return Result::fail(SandboxErrorCode::OutsideSandbox,
                            "Path could not be resolved safely: " + requested + " (" + failure + ")");
    }
    if (canonicalOut) *canonicalOut = *canonical;

    for (const auto& base : allowList_.entries()) {
        if (PathUtils::isContained(*canonical, base)) {
            return Result::ok(ResolvedPath{*canonical, base});
        }
    }
    return Result::fail(SandboxErrorCode::OutsideSandbox, "Path outside sandbox: " + requested);
}
