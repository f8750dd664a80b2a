#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

enum class AuditOutcome {
    Success,
    Error
};

/**
 * @brief The only detail fields an audit entry may carry.
 *
 * path is hashed before it reaches the entry; it is never stored.
 */
struct AuditDetails {
    std::optional<std::string> errorCode;
    std::optional<std::string> path;

    bool empty() const { return !errorCode && !path; }
};

/**
 * @brief One redacted audit record.
 *
 * Serialized as {timestamp, tool, outcome, duration_ms, request_number,
 * details?} with details limited to error_code and path_hash.
 */
struct AuditEntry {
    std::string timestamp;
    std::string tool;
    AuditOutcome outcome = AuditOutcome::Success;
    int64_t durationMs = 0;
    uint64_t requestNumber = 0;
    std::optional<std::string> errorCode;
    std::optional<std::string> pathHash;

    nlohmann::json toJson() const;
};

/**
 * @brief Builds audit entries and hands each one to a sink as a JSON line.
 *
 * The sequence number and the process clock start when the recorder is
 * constructed and are never reset.
 */
class AuditRecorder {
public:
    using Sink = std::function<void(const std::string&)>;

    static constexpr size_t kPathHashLength = 8;

    /** @param sink Receives each serialized entry; defaults to Logger::audit */
    explicit AuditRecorder(Sink sink = Sink());

    AuditEntry record(const std::string& tool, AuditOutcome outcome, const AuditDetails& details = AuditDetails());

    /**
     * @brief Record with loosely typed details.
     *
     * Only "error_code" (string) and "path" (string) are read; every other
     * field is dropped.
     */
    AuditEntry record(const std::string& tool, AuditOutcome outcome, const nlohmann::json& details);

    /** @brief First kPathHashLength hex chars of SHA-256 of the path string. */
    static std::string hashPath(const std::string& canonicalPath);

    uint64_t requestCount() const { return sequence.load(); }
    std::chrono::steady_clock::time_point startTime() const { return start; }

private:
    Sink sink;
    std::chrono::steady_clock::time_point start;
    std::atomic<uint64_t> sequence{0};

    static std::string utcTimestamp();
};
