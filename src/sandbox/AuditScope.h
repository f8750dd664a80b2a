#pragma once
#include <optional>
#include <string>
#include "sandbox/AuditRecorder.h"
#include "sandbox/SandboxError.h"
#include "utils/Logger.h"

/**
 * @brief Guarantees exactly one audit record per tool invocation.
 *
 * finish() records the pipeline outcome. If the scope is destroyed without
 * finish() (exception, abandoned pipeline) the destructor records an
 * UNEXPECTED error instead. Recording is best effort: a failing sink is
 * logged, never propagated.
 */
class AuditScope {
public:
    AuditScope(AuditRecorder& recorder, std::string tool)
        : recorder(recorder), tool(std::move(tool)) {}

    AuditScope(const AuditScope&) = delete;
    AuditScope& operator=(const AuditScope&) = delete;

    ~AuditScope() {
        if (recorded) return;
        AuditDetails details;
        details.errorCode = errorCodeName(SandboxErrorCode::Unexpected);
        details.path = path;
        recordOnce(AuditOutcome::Error, details);
    }

    /** @brief Path to hash into the record; should be the canonical form. */
    void setPath(std::string value) { path = std::move(value); }

    template <typename T>
    SandboxResult<T> finish(SandboxResult<T> result) {
        AuditDetails details;
        details.path = path;
        if (result) {
            recordOnce(AuditOutcome::Success, details);
        } else {
            details.errorCode = result.error().codeName();
            recordOnce(AuditOutcome::Error, details);
        }
        return result;
    }

    bool isRecorded() const { return recorded; }

private:
    void recordOnce(AuditOutcome outcome, const AuditDetails& details) noexcept {
        if (recorded) return;
        recorded = true;
        try {
            recorder.record(tool, outcome, details);
        } catch (const std::exception& e) {
            try {
                Logger::getInstance().error(std::string("Failed to write audit record: ") + e.what());
            } catch (const std::exception&) {
                // Nothing left to report to.
            }
        }
    }

    AuditRecorder& recorder;
    std::string tool;
    std::optional<std::string> path;
    bool recorded = false;
};
