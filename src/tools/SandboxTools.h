#pragma once
#include "ITool.h"
#include "sandbox/SandboxGateway.h"

/**
 * @brief JSON conversions for gateway results.
 *
 * Errors become {"error": message, "error_code": code}.
 */
namespace ToolJson {
    nlohmann::json error(const SandboxError& err);
    nlohmann::json toJson(const ReadResult& r);
    nlohmann::json toJson(const WriteResult& r);
    nlohmann::json toJson(const ListResult& r);
    nlohmann::json toJson(const SearchResult& r);
    nlohmann::json toJson(const HealthReport& r);
    nlohmann::json toJson(const CapabilityLimits& r);
}

/**
 * @brief Reads string fields from a tool arguments object.
 *
 * Records the first shape problem (non-object arguments, missing or
 * mistyped field) instead of throwing. A null arguments value counts as an
 * empty object.
 */
class ArgumentReader {
public:
    explicit ArgumentReader(const nlohmann::json& args);

    std::string required(const char* key);
    std::optional<std::string> optional(const char* key);

    const std::optional<std::string>& problem() const { return problem_; }

private:
    const nlohmann::json& args;
    std::optional<std::string> problem_;
};

/**
 * @brief Base for tools backed by one gateway operation.
 *
 * Argument shape errors are routed through SandboxGateway::rejectInvocation
 * so they are rate limited and audited like any other call.
 */
class GatewayTool : public ITool {
public:
    explicit GatewayTool(SandboxGateway& gateway) : gateway(gateway) {}

protected:
    SandboxGateway& gateway;

    nlohmann::json reject(const std::string& clientId, const std::string& message);

    template <typename T>
    static nlohmann::json respond(const SandboxResult<T>& result) {
        if (!result) return ToolJson::error(result.error());
        return ToolJson::toJson(result.value());
    }
};

/**
 * @brief Read a file inside the allowed directories
 */
class ReadFileTool : public GatewayTool {
public:
    using GatewayTool::GatewayTool;

    std::string getName() const override { return ToolNames::kRead; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args, const std::string& clientId) override;
};

/**
 * @brief Create or replace a whole file inside the allowed directories
 */
class WriteFileTool : public GatewayTool {
public:
    using GatewayTool::GatewayTool;

    std::string getName() const override { return ToolNames::kWrite; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args, const std::string& clientId) override;
};

class ListDirectoryTool : public GatewayTool {
public:
    using GatewayTool::GatewayTool;

    std::string getName() const override { return ToolNames::kList; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args, const std::string& clientId) override;
};

class SearchGlobTool : public GatewayTool {
public:
    using GatewayTool::GatewayTool;

    std::string getName() const override { return ToolNames::kSearch; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args, const std::string& clientId) override;
};

class HealthCheckTool : public GatewayTool {
public:
    using GatewayTool::GatewayTool;

    std::string getName() const override { return ToolNames::kHealth; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args, const std::string& clientId) override;
};

/**
 * @brief Static description of the server: tools, prompts and limits
 */
class CapabilitiesTool : public GatewayTool {
public:
    CapabilitiesTool(SandboxGateway& gateway, std::vector<std::string> promptNames)
        : GatewayTool(gateway), promptNames(std::move(promptNames)) {}

    std::string getName() const override { return ToolNames::kCapabilities; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args, const std::string& clientId) override;

private:
    std::vector<std::string> promptNames;
};

class ToolRegistry;

/** @brief Register every sandbox tool with a registry. */
void registerSandboxTools(ToolRegistry& registry, SandboxGateway& gateway,
                          const std::vector<std::string>& promptNames);
