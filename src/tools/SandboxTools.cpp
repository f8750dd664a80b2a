#include "SandboxTools.h"
#include "ToolRegistry.h"

namespace ToolJson {
    nlohmann::json error(const SandboxError& err) {
        return {
            {"error", err.message},
            {"error_code", err.codeName()}
        };
    }

    nlohmann::json toJson(const ReadResult& r) {
        return {
            {"path", r.path},
            {"size", r.size},
            {"content", r.content},
            {"encoding", encodingName(r.encoding)}
        };
    }

    nlohmann::json toJson(const WriteResult& r) {
        return {
            {"path", r.path},
            {"message", r.message},
            {"bytes_written", r.bytesWritten}
        };
    }

    nlohmann::json toJson(const ListResult& r) {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& e : r.entries) {
            entries.push_back({
                {"name", e.name},
                {"kind", e.kind == EntryKind::Directory ? "directory" : "file"}
            });
        }
        return entries;
    }

    nlohmann::json toJson(const SearchResult& r) {
        nlohmann::json out = {
            {"base", r.base},
            {"count", r.count},
            {"results", r.results}
        };
        if (r.truncated) out["truncated"] = true;
        return out;
    }

    nlohmann::json toJson(const HealthReport& r) {
        return {
            {"status", r.status},
            {"version", r.version},
            {"uptime", r.uptimeSeconds},
            {"request_count", r.requestCount},
            {"active_operations", r.activeOperations}
        };
    }

    nlohmann::json toJson(const CapabilityLimits& r) {
        return {
            {"max_file_size", r.maxFileSize},
            {"max_write_size", r.maxWriteSize},
            {"rate_limit_per_minute", r.rateLimitPerMinute},
            {"allowed_directories", r.allowedDirectories}
        };
    }
}

ArgumentReader::ArgumentReader(const nlohmann::json& args) : args(args) {
    if (!args.is_null() && !args.is_object()) {
        problem_ = "Arguments must be a JSON object";
    }
}

std::string ArgumentReader::required(const char* key) {
    auto value = optional(key);
    if (!value) {
        if (!problem_) problem_ = std::string("Missing required argument: ") + key;
        return std::string();
    }
    return *value;
}

std::optional<std::string> ArgumentReader::optional(const char* key) {
    if (problem_ || !args.is_object()) return std::nullopt;
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        problem_ = std::string("Argument '") + key + "' must be a string";
        return std::nullopt;
    }
    return it->get<std::string>();
}

nlohmann::json GatewayTool::reject(const std::string& clientId, const std::string& message) {
    return ToolJson::error(gateway.rejectInvocation(getName(), SandboxErrorCode::InvalidArgument, message, clientId));
}

// ---------------------------------------------------------------------------
// read_file_sandboxed

std::string ReadFileTool::getDescription() const {
    return "Read a file inside the allowed directories. Text is returned as UTF-8 "
           "(invalid bytes replaced); use encoding=base64 for binary files.";
}

nlohmann::json ReadFileTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {
                {"type", "string"},
                {"description", "Absolute path, or relative to the server's working directory. '~' expands to the home directory."}
            }},
            {"encoding", {
                {"type", "string"},
                {"enum", nlohmann::json::array({"utf8", "base64"})},
                {"description", "Content encoding of the result (default: utf8)"}
            }}
        }},
        {"required", {"path"}}
    };
}

nlohmann::json ReadFileTool::execute(const nlohmann::json& args, const std::string& clientId) {
    ArgumentReader reader(args);
    std::string path = reader.required("path");
    std::string encoding = reader.optional("encoding").value_or("utf8");
    if (reader.problem()) return reject(clientId, *reader.problem());

    return respond(gateway.read(path, encoding, clientId));
}

// ---------------------------------------------------------------------------
// write_file_sandboxed

std::string WriteFileTool::getDescription() const {
    return "Create or replace a file inside the allowed directories. Missing parent "
           "directories are created and the file is replaced atomically.";
}

nlohmann::json WriteFileTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {
                {"type", "string"},
                {"description", "Target file path"}
            }},
            {"content", {
                {"type", "string"},
                {"description", "Full file content, encoded as given by 'encoding'"}
            }},
            {"encoding", {
                {"type", "string"},
                {"enum", nlohmann::json::array({"utf8", "base64"})},
                {"description", "Encoding of 'content' (default: utf8)"}
            }}
        }},
        {"required", nlohmann::json::array({"path", "content"})}
    };
}

nlohmann::json WriteFileTool::execute(const nlohmann::json& args, const std::string& clientId) {
    ArgumentReader reader(args);
    std::string path = reader.required("path");
    std::string content = reader.required("content");
    std::string encoding = reader.optional("encoding").value_or("utf8");
    if (reader.problem()) return reject(clientId, *reader.problem());

    return respond(gateway.write(path, content, encoding, clientId));
}

// ---------------------------------------------------------------------------
// list_directory

std::string ListDirectoryTool::getDescription() const {
    return "List the immediate children of a directory inside the allowed directories.";
}

nlohmann::json ListDirectoryTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {
                {"type", "string"},
                {"description", "Directory to list"}
            }}
        }},
        {"required", {"path"}}
    };
}

nlohmann::json ListDirectoryTool::execute(const nlohmann::json& args, const std::string& clientId) {
    ArgumentReader reader(args);
    std::string path = reader.required("path");
    if (reader.problem()) return reject(clientId, *reader.problem());

    return respond(gateway.list(path, clientId));
}

// ---------------------------------------------------------------------------
// search_glob

std::string SearchGlobTool::getDescription() const {
    return "Find regular files matching a glob pattern (*, ?, ** and [...]) below a directory "
           "inside the allowed directories.";
}

nlohmann::json SearchGlobTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"pattern", {
                {"type", "string"},
                {"description", "Relative glob, e.g. \"**/*.md\""}
            }},
            {"cwd", {
                {"type", "string"},
                {"description", "Directory to search (default: first allowed directory)"}
            }}
        }},
        {"required", {"pattern"}}
    };
}

nlohmann::json SearchGlobTool::execute(const nlohmann::json& args, const std::string& clientId) {
    ArgumentReader reader(args);
    std::string pattern = reader.required("pattern");
    std::optional<std::string> cwd = reader.optional("cwd");
    if (reader.problem()) return reject(clientId, *reader.problem());

    return respond(gateway.search(pattern, cwd, clientId));
}

// ---------------------------------------------------------------------------
// health_check

std::string HealthCheckTool::getDescription() const {
    return "Report server status, version, uptime and request counters.";
}

nlohmann::json HealthCheckTool::getSchema() const {
    return {{"type", "object"}, {"properties", nlohmann::json::object()}};
}

nlohmann::json HealthCheckTool::execute(const nlohmann::json& args, const std::string& clientId) {
    ArgumentReader reader(args);
    if (reader.problem()) return reject(clientId, *reader.problem());

    return respond(gateway.health(clientId));
}

// ---------------------------------------------------------------------------
// capabilities

std::string CapabilitiesTool::getDescription() const {
    return "Describe the available tools, prompts and the configured limits.";
}

nlohmann::json CapabilitiesTool::getSchema() const {
    return {{"type", "object"}, {"properties", nlohmann::json::object()}};
}

nlohmann::json CapabilitiesTool::execute(const nlohmann::json& args, const std::string& clientId) {
    ArgumentReader reader(args);
    if (reader.problem()) return reject(clientId, *reader.problem());

    auto limits = gateway.capabilities(clientId);
    if (!limits) return ToolJson::error(limits.error());

    return {
        {"name", "bastion"},
        {"version", BASTION_VERSION},
        {"tools", {
            ToolNames::kRead, ToolNames::kWrite, ToolNames::kList,
            ToolNames::kSearch, ToolNames::kHealth, ToolNames::kCapabilities
        }},
        {"prompts", promptNames},
        {"limits", ToolJson::toJson(limits.value())}
    };
}

void registerSandboxTools(ToolRegistry& registry, SandboxGateway& gateway,
                          const std::vector<std::string>& promptNames) {
    registry.registerTool(std::make_unique<ReadFileTool>(gateway));
    registry.registerTool(std::make_unique<WriteFileTool>(gateway));
    registry.registerTool(std::make_unique<ListDirectoryTool>(gateway));
    registry.registerTool(std::make_unique<SearchGlobTool>(gateway));
    registry.registerTool(std::make_unique<HealthCheckTool>(gateway));
    registry.registerTool(std::make_unique<CapabilitiesTool>(gateway, promptNames));

    registry.setUnknownToolHandler([&gateway](const std::string& name, const std::string& clientId) {
        return ToolJson::error(gateway.rejectInvocation(name, SandboxErrorCode::InvalidArgument,
                                                        "Unknown tool: " + name, clientId));
    });
}
