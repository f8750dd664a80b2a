#include "sandbox/AuditRecorder.h"
#include "utils/Logger.h"
#include "utils/TextEncoding.h"
#include <ctime>
#include <iomanip>
#include <sstream>

nlohmann::json AuditEntry::toJson() const {
    nlohmann::json j;
    j["timestamp"] = timestamp;
    j["tool"] = tool;
    j["outcome"] = outcome == AuditOutcome::Success ? "success" : "error";
    j["duration_ms"] = durationMs;
    j["request_number"] = requestNumber;

    if (errorCode || pathHash) {
        nlohmann::json details = nlohmann::json::object();
        if (errorCode) details["error_code"] = *errorCode;
        if (pathHash) details["path_hash"] = *pathHash;
        j["details"] = details;
    }
    return j;
}

AuditRecorder::AuditRecorder(Sink sink)
    : sink(std::move(sink)), start(std::chrono::steady_clock::now()) {
    if (!this->sink) {
        this->sink = [](const std::string& line) { Logger::getInstance().audit(line); };
    }
}

std::string AuditRecorder::hashPath(const std::string& canonicalPath) {
    return TextEncoding::sha256Hex(canonicalPath).substr(0, kPathHashLength);
}

std::string AuditRecorder::utcTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);

    std::tm utc{};
#ifndef _WIN32
    gmtime_r(&t, &utc);
#else
    gmtime_s(&utc, &t);
#endif

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

AuditEntry AuditRecorder::record(const std::string& tool, AuditOutcome outcome, const AuditDetails& details) {
    AuditEntry entry;
    entry.timestamp = utcTimestamp();
    entry.tool = tool;
    entry.outcome = outcome;
    entry.durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    entry.requestNumber = ++sequence;
    entry.errorCode = details.errorCode;
    if (details.path) {
        entry.pathHash = hashPath(*details.path);
    }

    // Tool names come from the caller; keep the line valid JSON whatever they contain.
    sink(entry.toJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    return entry;
}

AuditEntry AuditRecorder::record(const std::string& tool, AuditOutcome outcome, const nlohmann::json& details) {
    AuditDetails safe;
    if (details.is_object()) {
        auto code = details.find("error_code");
        if (code != details.end() && code->is_string()) safe.errorCode = code->get<std::string>();
        auto path = details.find("path");
        if (path != details.end() && path->is_string()) safe.path = path->get<std::string>();
    }
    return record(tool, outcome, safe);
}
