#include "utils/PathUtils.h"
#include <cstdlib>
#include <system_error>

#ifndef _WIN32
#include <pwd.h>
#include <unistd.h>
#endif

namespace PathUtils {

namespace {
    std::string homeDirectory() {
        const char* home = std::getenv("HOME");
        if (home && *home) return home;
#ifndef _WIN32
        struct passwd* pw = getpwuid(getuid());
        if (pw && pw->pw_dir) return pw->pw_dir;
#else
        const char* profile = std::getenv("USERPROFILE");
        if (profile && *profile) return profile;
#endif
        return "";
    }

    void setFailure(std::string* failure, const std::string& reason) {
        if (failure) *failure = reason;
    }
}

std::string expandHome(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/' && path[1] != '\\') return path;

    std::string home = homeDirectory();
    if (home.empty()) return path;
    if (path.size() == 1) return home;
    return (fs::path(home) / path.substr(2)).string();
}

std::optional<fs::path> canonicalize(const fs::path& path, std::string* failure) {
    std::error_code ec;
    fs::path absolute = path;
    if (!absolute.is_absolute()) {
        fs::path cwd = fs::current_path(ec);
        if (ec) {
            setFailure(failure, "cannot determine working directory: " + ec.message());
            return std::nullopt;
        }
        absolute = cwd / path;
    }

    fs::path resolved = absolute.root_path();
    for (const auto& part : absolute.relative_path()) {
        if (part.empty() || part == ".") continue;
        if (part == "..") {
            resolved = resolved.parent_path();
            continue;
        }

        fs::path candidate = resolved / part;
        fs::file_status st = fs::symlink_status(candidate, ec);
        if (st.type() == fs::file_type::not_found) {
            // Missing components stay lexical until something exists again.
            resolved = candidate;
            continue;
        }
        if (ec) {
            setFailure(failure, "cannot stat path component: " + ec.message());
            return std::nullopt;
        }

        if (fs::is_symlink(st)) {
            fs::path target = fs::canonical(candidate, ec);
            if (ec) {
                setFailure(failure, "unresolvable symbolic link: " + ec.message());
                return std::nullopt;
            }
            resolved = target;
        } else {
            resolved = candidate;
        }
    }
    return resolved;
}

bool isContained(const fs::path& candidate, const fs::path& base) {
    const std::string c = candidate.string();
    const std::string b = base.string();
    if (b.empty()) return false;
    if (c == b) return true;

    // The filesystem root already ends with a separator.
    if (b.back() == static_cast<char>(fs::path::preferred_separator)) {
        return c.size() > b.size() && c.compare(0, b.size(), b) == 0;
    }
    return c.size() > b.size()
        && c.compare(0, b.size(), b) == 0
        && c[b.size()] == static_cast<char>(fs::path::preferred_separator);
}

}
