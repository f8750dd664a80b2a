#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include "sandbox/SandboxError.h"

namespace fs = std::filesystem;

/**
 * @brief Size ceilings for reads and writes, and the bounded I/O that honours them.
 *
 * Reads are checked by stat before any byte is loaded. Writes are checked on
 * the caller-declared length before anything touches the disk, and land via
 * a temporary sibling file so that a rejected or failed write leaves the
 * target untouched.
 */
class CapacityGuard {
public:
    CapacityGuard(std::uintmax_t maxReadBytes, std::uintmax_t maxWriteBytes);

    /**
     * @brief Stat a path and compare its size with a limit.
     * @return File size in bytes, or NotFound / InvalidArgument (directory) / TooLarge
     */
    static SandboxResult<std::uintmax_t> checkSize(const fs::path& path, std::uintmax_t limitBytes);

    SandboxResult<std::uintmax_t> checkReadSize(const fs::path& path) const {
        return checkSize(path, maxReadBytes);
    }

    /** @brief Compare a caller-supplied content length with the write ceiling. */
    SandboxStatus checkWriteSize(std::uintmax_t length) const;

    /**
     * @brief Load a file that already passed checkReadSize().
     *
     * Never reads more than the read ceiling; a file that grew past it since
     * the stat is reported as TooLarge.
     */
    SandboxResult<std::string> readBounded(const fs::path& path) const;

    /**
     * @brief Write all bytes or none.
     *
     * Missing parent directories are created. The content goes to a
     * temporary file in the target directory which is renamed over the target
     * once fully written. An existing target keeps its permission bits.
     * @return Number of bytes written
     */
    SandboxResult<std::uintmax_t> writeAtomic(const fs::path& path, const std::string& bytes) const;

    std::uintmax_t readLimit() const { return maxReadBytes; }
    std::uintmax_t writeLimit() const { return maxWriteBytes; }

private:
    std::uintmax_t maxReadBytes;
    std::uintmax_t maxWriteBytes;
};
