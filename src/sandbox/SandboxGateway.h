#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/ConfigManager.h"
#include "sandbox/AllowList.h"
#include "sandbox/AuditRecorder.h"
#include "sandbox/CapacityGuard.h"
#include "sandbox/PathResolver.h"
#include "sandbox/RateLimiter.h"
#include "sandbox/SandboxError.h"

#ifndef BASTION_VERSION
#define BASTION_VERSION "1.0.0"
#endif

// Tool names as published to clients and written to the audit log.
namespace ToolNames {
    constexpr const char* kRead = "read_file_sandboxed";
    constexpr const char* kWrite = "write_file_sandboxed";
    constexpr const char* kList = "list_directory";
    constexpr const char* kSearch = "search_glob";
    constexpr const char* kHealth = "health_check";
    constexpr const char* kCapabilities = "capabilities";
}

struct GatewayLimits {
    std::uintmax_t maxReadBytes = 100ull * 1024 * 1024;
    std::uintmax_t maxWriteBytes = 10ull * 1024 * 1024;
    int rateLimit = 60;
    std::chrono::milliseconds rateWindow{60000};
    size_t maxPathLength = PathResolver::kDefaultMaxPathLength;
    size_t maxSearchResults = 200;
    size_t maxSearchVisited = 100000;

    static GatewayLimits fromConfig(const Config& cfg);
};

/**
 * @brief Mutable state shared by all gateway calls.
 *
 * Owned explicitly so that tests can inject a fresh state (and a fake clock
 * or audit sink) per case.
 */
class GatewayState {
public:
    explicit GatewayState(const GatewayLimits& limits,
                          AuditRecorder::Sink auditSink = AuditRecorder::Sink(),
                          RateLimiter::TimeSource clock = RateLimiter::TimeSource());

    RateLimiter& rateLimiter() { return limiter; }
    AuditRecorder& auditRecorder() { return recorder; }
    std::atomic<int>& activeOperations() { return active; }

private:
    RateLimiter limiter;
    AuditRecorder recorder;
    std::atomic<int> active{0};
};

enum class ContentEncoding {
    Utf8,
    Base64
};

std::optional<ContentEncoding> parseEncoding(const std::string& name);
const char* encodingName(ContentEncoding encoding);

enum class EntryKind {
    File,
    Directory
};

struct ReadResult {
    std::string path;
    std::uintmax_t size = 0;
    std::string content;
    ContentEncoding encoding = ContentEncoding::Utf8;
};

struct WriteResult {
    std::string path;
    std::string message;
    std::uintmax_t bytesWritten = 0;
};

struct DirectoryEntry {
    std::string name;
    EntryKind kind = EntryKind::File;
};

struct ListResult {
    std::vector<DirectoryEntry> entries;
};

struct SearchResult {
    std::string base;
    size_t count = 0;  // total matches, may exceed results.size()
    std::vector<std::string> results;
    bool truncated = false;
};

struct HealthReport {
    std::string status;
    std::string version;
    int64_t uptimeSeconds = 0;
    uint64_t requestCount = 0;
    int activeOperations = 0;
};

struct CapabilityLimits {
    std::uintmax_t maxFileSize = 0;
    std::uintmax_t maxWriteSize = 0;
    int rateLimitPerMinute = 0;
    std::vector<std::string> allowedDirectories;
};

class AuditScope;

/**
 * @brief Single entry point for every sandboxed operation.
 *
 * Each call runs admit -> validate -> size check -> I/O -> record. The first
 * failing stage ends the pipeline; the audit record is written on every exit
 * path, including exceptions.
 */
class SandboxGateway {
public:
    SandboxGateway(AllowList allowList, const GatewayLimits& limits, std::shared_ptr<GatewayState> state);

    /** @brief Convenience: fresh state with the default audit sink and clock. */
    SandboxGateway(AllowList allowList, const GatewayLimits& limits);

    /**
     * @brief Read a file inside the sandbox.
     * @param encoding "utf8" (invalid sequences become U+FFFD) or "base64"
     */
    SandboxResult<ReadResult> read(const std::string& path, const std::string& encoding = "utf8",
                                   const std::string& clientId = RateLimiter::kDefaultClient);

    /**
     * @brief Write a whole file inside the sandbox, creating parent directories.
     *
     * The content length is checked against the write ceiling before it is
     * decoded; the file is replaced atomically or not at all.
     */
    SandboxResult<WriteResult> write(const std::string& path, const std::string& content,
                                     const std::string& encoding = "utf8",
                                     const std::string& clientId = RateLimiter::kDefaultClient);

    /** @brief Immediate children of a directory, sorted by name. */
    SandboxResult<ListResult> list(const std::string& path,
                                   const std::string& clientId = RateLimiter::kDefaultClient);

    /**
     * @brief Glob search for regular files.
     * @param pattern Relative glob: *, ?, ** and [...] classes
     * @param cwd Directory to search; defaults to the first allowed directory
     */
    SandboxResult<SearchResult> search(const std::string& pattern, const std::optional<std::string>& cwd,
                                       const std::string& clientId = RateLimiter::kDefaultClient);

    SandboxResult<HealthReport> health(const std::string& clientId = RateLimiter::kDefaultClient);

    SandboxResult<CapabilityLimits> capabilities(const std::string& clientId = RateLimiter::kDefaultClient);

    /**
     * @brief Audit an invocation that never reached a gateway operation
     *        (unknown tool, malformed arguments). Counts against the rate limit.
     */
    SandboxError rejectInvocation(const std::string& tool, SandboxErrorCode code, const std::string& message,
                                  const std::string& clientId = RateLimiter::kDefaultClient);

private:
    template <typename T, typename Body>
    SandboxResult<T> run(const char* tool, const std::string& clientId, Body&& body);

    SandboxResult<ResolvedPath> validate(const std::string& requested, AuditScope& audit) const;

    PathResolver resolver_;
    GatewayLimits limits_;
    CapacityGuard guard_;
    std::shared_ptr<GatewayState> state_;
};
