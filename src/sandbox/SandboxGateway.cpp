#include "sandbox/SandboxGateway.h"
#include "sandbox/AuditScope.h"
#include "utils/GlobPattern.h"
#include "utils/Logger.h"
#include "utils/TextEncoding.h"
#include <algorithm>
#include <new>
#include <stdexcept>
#include <system_error>

namespace {
    // Keeps the in-flight counter balanced on every exit path.
    class ActiveOperation {
    public:
        explicit ActiveOperation(std::atomic<int>& counter) : counter(counter) { ++counter; }
        ~ActiveOperation() { --counter; }
        ActiveOperation(const ActiveOperation&) = delete;
        ActiveOperation& operator=(const ActiveOperation&) = delete;
    private:
        std::atomic<int>& counter;
    };

    bool hasParentReference(const fs::path& p) {
        for (const auto& part : p) {
            if (part == "..") return true;
        }
        return false;
    }
}

GatewayLimits GatewayLimits::fromConfig(const Config& cfg) {
    GatewayLimits limits;
    limits.maxReadBytes = cfg.sandbox.maxFileSize;
    limits.maxWriteBytes = cfg.sandbox.maxWriteSize;
    limits.rateLimit = cfg.sandbox.rateLimit;
    limits.rateWindow = std::chrono::seconds(cfg.sandbox.rateWindowSeconds);
    return limits;
}

GatewayState::GatewayState(const GatewayLimits& limits, AuditRecorder::Sink auditSink, RateLimiter::TimeSource clock)
    : limiter(limits.rateLimit, limits.rateWindow, std::move(clock)),
      recorder(std::move(auditSink)) {}

std::optional<ContentEncoding> parseEncoding(const std::string& name) {
    if (name.empty() || name == "utf8" || name == "utf-8") return ContentEncoding::Utf8;
    if (name == "base64") return ContentEncoding::Base64;
    return std::nullopt;
}

const char* encodingName(ContentEncoding encoding) {
    return encoding == ContentEncoding::Base64 ? "base64" : "utf8";
}

SandboxGateway::SandboxGateway(AllowList allowList, const GatewayLimits& limits, std::shared_ptr<GatewayState> state)
    : resolver_(std::move(allowList), limits.maxPathLength),
      limits_(limits),
      guard_(limits.maxReadBytes, limits.maxWriteBytes),
      state_(std::move(state)) {
    if (!state_) {
        throw std::invalid_argument("SandboxGateway requires a GatewayState");
    }
    if (resolver_.allowList().empty()) {
        Logger::getInstance().warn("No allowed directories configured; every path request will be rejected");
    }
}

SandboxGateway::SandboxGateway(AllowList allowList, const GatewayLimits& limits)
    : SandboxGateway(std::move(allowList), limits, std::make_shared<GatewayState>(limits)) {}

template <typename T, typename Body>
SandboxResult<T> SandboxGateway::run(const char* tool, const std::string& clientId, Body&& body) {
    ActiveOperation active(state_->activeOperations());
    AuditScope audit(state_->auditRecorder(), tool);

    SandboxResult<T> result = [&]() -> SandboxResult<T> {
        try {
            auto admitted = state_->rateLimiter().admit(clientId);
            if (!admitted) return SandboxResult<T>::fail(admitted.error());
            return body(audit);
        } catch (const std::bad_alloc&) {
            return SandboxResult<T>::fail(SandboxErrorCode::Unexpected, "Out of memory");
        } catch (const fs::filesystem_error& e) {
            return SandboxResult<T>::fail(SandboxErrorCode::Unexpected, e.what());
        } catch (const std::exception& e) {
            return SandboxResult<T>::fail(SandboxErrorCode::Unexpected,
                                          std::string("An unexpected error occurred: ") + e.what());
        }
    }();

    if (!result) {
        Logger::getInstance().debug(std::string(tool) + " failed [" + result.error().codeName() + "]");
    }
    return audit.finish(std::move(result));
}

SandboxResult<ResolvedPath> SandboxGateway::validate(const std::string& requested, AuditScope& audit) const {
    fs::path canonical;
    auto resolved = resolver_.validate(requested, &canonical);
    if (!canonical.empty()) {
        audit.setPath(canonical.string());
    } else if (!requested.empty()) {
        audit.setPath(requested);
    }
    return resolved;
}

SandboxResult<ReadResult> SandboxGateway::read(const std::string& path, const std::string& encoding,
                                               const std::string& clientId) {
    return run<ReadResult>(ToolNames::kRead, clientId, [&](AuditScope& audit) -> SandboxResult<ReadResult> {
        using Result = SandboxResult<ReadResult>;

        auto resolved = validate(path, audit);
        if (!resolved) return Result::fail(resolved.error());

        auto enc = parseEncoding(encoding);
        if (!enc) {
            return Result::fail(SandboxErrorCode::InvalidArgument, "Unsupported encoding: " + encoding);
        }

        auto size = guard_.checkReadSize(resolved.value().path);
        if (!size) return Result::fail(size.error());

        auto bytes = guard_.readBounded(resolved.value().path);
        if (!bytes) return Result::fail(bytes.error());

        ReadResult out;
        out.path = resolved.value().path.string();
        out.size = bytes.value().size();
        out.encoding = *enc;
        out.content = *enc == ContentEncoding::Utf8
            ? UTF8Utils::sanitize(bytes.value())
            : TextEncoding::base64Encode(bytes.value());
        return Result::ok(std::move(out));
    });
}

SandboxResult<WriteResult> SandboxGateway::write(const std::string& path, const std::string& content,
                                                 const std::string& encoding, const std::string& clientId) {
    return run<WriteResult>(ToolNames::kWrite, clientId, [&](AuditScope& audit) -> SandboxResult<WriteResult> {
        using Result = SandboxResult<WriteResult>;

        auto resolved = validate(path, audit);
        if (!resolved) return Result::fail(resolved.error());

        auto sizeCheck = guard_.checkWriteSize(content.size());
        if (!sizeCheck) return Result::fail(sizeCheck.error());

        auto enc = parseEncoding(encoding);
        if (!enc) {
            return Result::fail(SandboxErrorCode::InvalidArgument, "Unsupported encoding: " + encoding);
        }

        std::string bytes;
        if (*enc == ContentEncoding::Base64) {
            auto decoded = TextEncoding::base64Decode(content);
            if (!decoded) {
                return Result::fail(SandboxErrorCode::InvalidArgument, "Content is not valid base64");
            }
            bytes = std::move(*decoded);
        } else {
            bytes = content;
        }

        auto written = guard_.writeAtomic(resolved.value().path, bytes);
        if (!written) return Result::fail(written.error());

        WriteResult out;
        out.path = resolved.value().path.string();
        out.message = "File written successfully: " + path;
        out.bytesWritten = written.value();
        return Result::ok(std::move(out));
    });
}

SandboxResult<ListResult> SandboxGateway::list(const std::string& path, const std::string& clientId) {
    return run<ListResult>(ToolNames::kList, clientId, [&](AuditScope& audit) -> SandboxResult<ListResult> {
        using Result = SandboxResult<ListResult>;

        auto resolved = validate(path, audit);
        if (!resolved) return Result::fail(resolved.error());
        const fs::path& dir = resolved.value().path;

        std::error_code ec;
        fs::file_status st = fs::status(dir, ec);
        if (st.type() == fs::file_type::not_found) {
            return Result::fail(SandboxErrorCode::NotFound, "Directory not found: " + path);
        }
        if (ec) {
            return Result::fail(SandboxErrorCode::Unexpected, "Cannot stat " + path + ": " + ec.message());
        }
        if (!fs::is_directory(st)) {
            return Result::fail(SandboxErrorCode::NotADirectory, "Not a directory: " + path);
        }

        ListResult out;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            return Result::fail(SandboxErrorCode::Unexpected, "Cannot open directory " + path + ": " + ec.message());
        }
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            std::error_code kindEc;
            DirectoryEntry entry;
            entry.name = it->path().filename().string();
            entry.kind = it->is_directory(kindEc) ? EntryKind::Directory : EntryKind::File;
            out.entries.push_back(std::move(entry));
        }
        if (ec) {
            return Result::fail(SandboxErrorCode::Unexpected, "Cannot read directory " + path + ": " + ec.message());
        }

        std::sort(out.entries.begin(), out.entries.end(),
                  [](const DirectoryEntry& a, const DirectoryEntry& b) { return a.name < b.name; });
        return Result::ok(std::move(out));
    });
}

SandboxResult<SearchResult> SandboxGateway::search(const std::string& pattern, const std::optional<std::string>& cwd,
                                                   const std::string& clientId) {
    return run<SearchResult>(ToolNames::kSearch, clientId, [&](AuditScope& audit) -> SandboxResult<SearchResult> {
        using Result = SandboxResult<SearchResult>;

        if (pattern.size() > limits_.maxPathLength) {
            return Result::fail(SandboxErrorCode::InvalidArgument, "Pattern is too long");
        }
        fs::path patternPath(pattern);
        if (patternPath.is_absolute() || hasParentReference(patternPath)) {
            return Result::fail(SandboxErrorCode::InvalidArgument,
                                "Pattern must be relative and must not contain '..'");
        }

        std::optional<GlobPattern> glob;
        try {
            glob.emplace(pattern);
        } catch (const std::invalid_argument& e) {
            return Result::fail(SandboxErrorCode::InvalidArgument, e.what());
        }

        fs::path base;
        if (cwd && !cwd->empty()) {
            auto resolved = validate(*cwd, audit);
            if (!resolved) return Result::fail(resolved.error());
            base = resolved.value().path;
        } else {
            const auto& entries = resolver_.allowList().entries();
            if (entries.empty()) {
                return Result::fail(SandboxErrorCode::OutsideSandbox, "No allowed directories configured");
            }
            base = entries.front();
            audit.setPath(base.string());
        }

        std::error_code ec;
        fs::file_status st = fs::status(base, ec);
        if (st.type() == fs::file_type::not_found) {
            return Result::fail(SandboxErrorCode::NotFound, "Directory not found: " + base.string());
        }
        if (!fs::is_directory(st)) {
            return Result::fail(SandboxErrorCode::NotADirectory, "Not a directory: " + base.string());
        }

        SearchResult out;
        out.base = base.string();

        // Directory symlinks are not followed; file symlinks are re-validated below.
        fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            return Result::fail(SandboxErrorCode::Unexpected, "Cannot open directory: " + ec.message());
        }

        size_t visited = 0;
        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) break;
            if (++visited > limits_.maxSearchVisited) {
                out.truncated = true;
                break;
            }

            std::error_code typeEc;
            if (!it->is_regular_file(typeEc)) continue;

            fs::path relative = it->path().lexically_relative(base);
            if (!glob->matches(relative)) continue;

            auto contained = resolver_.validate(it->path().string());
            if (!contained) continue;

            out.count++;
            if (out.results.size() < limits_.maxSearchResults) {
                out.results.push_back(contained.value().path.string());
            } else {
                out.truncated = true;
            }
        }
        if (ec) {
            Logger::getInstance().warn("search_glob stopped early: " + ec.message());
            out.truncated = true;
        }

        std::sort(out.results.begin(), out.results.end());
        return Result::ok(std::move(out));
    });
}

SandboxResult<HealthReport> SandboxGateway::health(const std::string& clientId) {
    return run<HealthReport>(ToolNames::kHealth, clientId, [&](AuditScope&) -> SandboxResult<HealthReport> {
        HealthReport report;
        report.status = "ok";
        report.version = BASTION_VERSION;
        report.uptimeSeconds = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - state_->auditRecorder().startTime()).count();
        report.requestCount = state_->auditRecorder().requestCount();
        report.activeOperations = state_->activeOperations().load();
        return SandboxResult<HealthReport>::ok(report);
    });
}

SandboxResult<CapabilityLimits> SandboxGateway::capabilities(const std::string& clientId) {
    return run<CapabilityLimits>(ToolNames::kCapabilities, clientId, [&](AuditScope&) -> SandboxResult<CapabilityLimits> {
        // Report the ceilings actually enforced by the guard and the limiter.
        const RateLimiter& limiter = state_->rateLimiter();
        CapabilityLimits caps;
        caps.maxFileSize = guard_.readLimit();
        caps.maxWriteSize = guard_.writeLimit();
        caps.rateLimitPerMinute = static_cast<int>(
            static_cast<int64_t>(limiter.limit()) * 60000 / std::max<int64_t>(limiter.window().count(), 1));
        caps.allowedDirectories = resolver_.allowList().toStrings();
        return SandboxResult<CapabilityLimits>::ok(caps);
    });
}

SandboxError SandboxGateway::rejectInvocation(const std::string& tool, SandboxErrorCode code,
                                              const std::string& message, const std::string& clientId) {
    auto result = run<Unit>(tool.c_str(), clientId, [&](AuditScope&) -> SandboxStatus {
        return SandboxStatus::fail(code, message);
    });
    return result.error();
}
