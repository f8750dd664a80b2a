#pragma once
#include <optional>
#include <string>
#include <utility>

/**
 * @brief Error kinds reported by the sandbox gateway.
 *
 * Each kind maps to a stable classification string that is returned to the
 * caller and written to the audit log.
 */
enum class SandboxErrorCode {
    OutsideSandbox,
    TooLarge,
    RateLimited,
    NotFound,
    NotADirectory,
    InvalidArgument,
    Unexpected
};

inline const char* errorCodeName(SandboxErrorCode code) {
    switch (code) {
        case SandboxErrorCode::OutsideSandbox: return "OUTSIDE_SANDBOX";
        case SandboxErrorCode::TooLarge: return "TOO_LARGE";
        case SandboxErrorCode::RateLimited: return "RATE_LIMITED";
        case SandboxErrorCode::NotFound: return "NOT_FOUND";
        case SandboxErrorCode::NotADirectory: return "NOT_A_DIRECTORY";
        case SandboxErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case SandboxErrorCode::Unexpected: return "UNEXPECTED";
    }
    return "UNEXPECTED";
}

struct SandboxError {
    SandboxErrorCode code;
    std::string message;

    const char* codeName() const { return errorCodeName(code); }
};

/**
 * @brief Success-or-error value returned by every pipeline stage.
 *
 * Holds either a value or a SandboxError, never both.
 */
template <typename T>
class SandboxResult {
public:
    static SandboxResult ok(T value) {
        SandboxResult r;
        r.value_ = std::move(value);
        return r;
    }

    static SandboxResult fail(SandboxErrorCode code, std::string message) {
        SandboxResult r;
        r.error_ = SandboxError{code, std::move(message)};
        return r;
    }

    static SandboxResult fail(SandboxError error) {
        SandboxResult r;
        r.error_ = std::move(error);
        return r;
    }

    bool isOk() const { return value_.has_value(); }
    explicit operator bool() const { return isOk(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }
    const SandboxError& error() const { return *error_; }

private:
    SandboxResult() = default;

    std::optional<T> value_;
    std::optional<SandboxError> error_;
};

/** Value type for stages that only succeed or fail. */
struct Unit {};

using SandboxStatus = SandboxResult<Unit>;

inline SandboxStatus okStatus() { return SandboxStatus::ok(Unit{}); }
