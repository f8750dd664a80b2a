#include "sandbox/CapacityGuard.h"
#include <atomic>
#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>

#ifndef _WIN32
#include <unistd.h>
#else
#include <process.h>
#endif

namespace {
    std::atomic<unsigned long> tempCounter{0};

    fs::path temporarySibling(const fs::path& target) {
#ifndef _WIN32
        long pid = static_cast<long>(getpid());
#else
        long pid = static_cast<long>(_getpid());
#endif
        auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
        std::ostringstream name;
        name << "." << target.filename().string() << ".tmp-" << pid << "-" << ticks << "-" << tempCounter++;
        return target.parent_path() / name.str();
    }
}

CapacityGuard::CapacityGuard(std::uintmax_t maxReadBytes, std::uintmax_t maxWriteBytes)
    : maxReadBytes(maxReadBytes), maxWriteBytes(maxWriteBytes) {}

SandboxResult<std::uintmax_t> CapacityGuard::checkSize(const fs::path& path, std::uintmax_t limitBytes) {
    using Result = SandboxResult<std::uintmax_t>;

    std::error_code ec;
    fs::file_status st = fs::status(path, ec);
    if (st.type() == fs::file_type::not_found) {
        return Result::fail(SandboxErrorCode::NotFound, "File not found: " + path.string());
    }
    if (ec) {
        return Result::fail(SandboxErrorCode::Unexpected, "Cannot stat " + path.string() + ": " + ec.message());
    }
    if (fs::is_directory(st)) {
        return Result::fail(SandboxErrorCode::InvalidArgument, "Path is a directory: " + path.string());
    }

    std::uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        return Result::fail(SandboxErrorCode::Unexpected, "Cannot stat " + path.string() + ": " + ec.message());
    }
    if (size > limitBytes) {
        return Result::fail(SandboxErrorCode::TooLarge,
                            "File too large: " + std::to_string(size) + " bytes (max: " + std::to_string(limitBytes) + ")");
    }
    return Result::ok(size);
}

SandboxStatus CapacityGuard::checkWriteSize(std::uintmax_t length) const {
    if (length > maxWriteBytes) {
        return SandboxStatus::fail(SandboxErrorCode::TooLarge,
                                   "Content too large: " + std::to_string(length) + " bytes (max: " + std::to_string(maxWriteBytes) + ")");
    }
    return okStatus();
}

SandboxResult<std::string> CapacityGuard::readBounded(const fs::path& path) const {
    using Result = SandboxResult<std::string>;

    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        return Result::fail(SandboxErrorCode::Unexpected, "Cannot open file: " + path.string());
    }

    std::string data;
    char buffer[64 * 1024];
    while (in) {
        in.read(buffer, sizeof(buffer));
        std::streamsize got = in.gcount();
        if (got <= 0) break;
        if (data.size() + static_cast<std::uintmax_t>(got) > maxReadBytes) {
            return Result::fail(SandboxErrorCode::TooLarge,
                                "File grew beyond " + std::to_string(maxReadBytes) + " bytes while reading");
        }
        data.append(buffer, static_cast<size_t>(got));
    }
    if (in.bad()) {
        return Result::fail(SandboxErrorCode::Unexpected, "Read failed: " + path.string());
    }
    return Result::ok(std::move(data));
}

SandboxResult<std::uintmax_t> CapacityGuard::writeAtomic(const fs::path& path, const std::string& bytes) const {
    using Result = SandboxResult<std::uintmax_t>;

    auto sizeCheck = checkWriteSize(bytes.size());
    if (!sizeCheck) return Result::fail(sizeCheck.error());

    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return Result::fail(SandboxErrorCode::InvalidArgument, "Path is a directory: " + path.string());
    }

    fs::path parent = path.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return Result::fail(SandboxErrorCode::Unexpected,
                                "Cannot create parent directories: " + ec.message());
        }
    }

    fs::path temp = temporarySibling(path);
    {
        std::ofstream out(temp, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return Result::fail(SandboxErrorCode::Unexpected, "Cannot open file for writing: " + path.string());
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out.good()) {
            out.close();
            fs::remove(temp, ec);
            return Result::fail(SandboxErrorCode::Unexpected, "Write failed: " + path.string());
        }
    }

    // An existing target keeps its permission bits.
    fs::file_status existing = fs::status(path, ec);
    if (!ec && fs::is_regular_file(existing)) {
        fs::permissions(temp, existing.permissions(), fs::perm_options::replace, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            return Result::fail(SandboxErrorCode::Unexpected,
                                "Cannot copy permissions to " + path.string() + ": " + ec.message());
        }
    }
    ec.clear();

    fs::rename(temp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return Result::fail(SandboxErrorCode::Unexpected, "Cannot replace " + path.string() + ": " + ec.message());
    }
    return Result::ok(static_cast<std::uintmax_t>(bytes.size()));
}
