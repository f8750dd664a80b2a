#pragma once
#include <iosfwd>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

class ToolRegistry;
class PromptCatalog;

/**
 * @brief JSON-RPC 2.0 server over a line-oriented stream (one object per line).
 *
 * Methods: initialize, ping, tools/list, tools/call, prompts/list,
 * prompts/get. Requests without an id are notifications and get no reply.
 * No request, however malformed, stops the loop.
 */
class StdioServer {
public:
    static constexpr const char* kProtocolVersion = "2024-11-05";

    // JSON-RPC error codes
    static constexpr int kParseError = -32700;
    static constexpr int kInvalidRequest = -32600;
    static constexpr int kMethodNotFound = -32601;
    static constexpr int kInvalidParams = -32602;
    static constexpr int kInternalError = -32603;

    StdioServer(ToolRegistry& registry, const PromptCatalog& prompts);

    /** @brief Serve until the input stream ends. */
    void run(std::istream& in, std::ostream& out);

    /**
     * @brief Handle one raw line.
     * @return Serialized response, or std::nullopt for blank lines and notifications
     */
    std::optional<std::string> handleLine(const std::string& line);

    /** @brief Handle one decoded message; std::nullopt for notifications. */
    std::optional<nlohmann::json> handleMessage(const nlohmann::json& message);

private:
    ToolRegistry& registry;
    const PromptCatalog& prompts;

    nlohmann::json dispatch(const std::string& method, const nlohmann::json& params);
    nlohmann::json callTool(const nlohmann::json& params);
    nlohmann::json getPrompt(const nlohmann::json& params);

    static std::string clientIdOf(const nlohmann::json& params);
    static nlohmann::json errorResponse(const nlohmann::json& id, int code, const std::string& message);
    static std::string serialize(const nlohmann::json& j, int indent = -1);
};
