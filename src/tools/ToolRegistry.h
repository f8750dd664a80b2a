#pragma once
#include <functional>
#include <string>
#include <memory>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "ITool.h"

/**
 * @brief Owns the registered tools and dispatches calls to them.
 */
class ToolRegistry {
public:
    /** Produces the error result for a call to an unregistered tool. */
    using UnknownToolHandler = std::function<nlohmann::json(const std::string& name, const std::string& clientId)>;

    ToolRegistry() = default;
    ~ToolRegistry() = default;

    /**
     * @brief Register a tool, replacing any tool with the same name
     * @param tool Tool instance (ownership is transferred)
     */
    void registerTool(std::unique_ptr<ITool> tool);

    /**
     * @brief Look up a tool
     * @return Tool pointer, or nullptr if not registered
     */
    ITool* getTool(const std::string& name);

    /**
     * @brief Tool descriptors in registration order
     *
     * Format:
     * [
     *   {"name": "tool_name", "description": "...", "inputSchema": { JSON Schema }}
     * ]
     */
    std::vector<nlohmann::json> listToolSchemas() const;

    /**
     * @brief Execute a tool
     *
     * Never throws for tool failures: an exception escaping the tool becomes
     * {"error": ..., "error_code": "UNEXPECTED"}. An unknown name goes to the
     * unknown-tool handler, or yields {"error": "Tool not found: xxx"}.
     */
    nlohmann::json executeTool(const std::string& name, const nlohmann::json& args, const std::string& clientId);

    void setUnknownToolHandler(UnknownToolHandler handler) { unknownTool = std::move(handler); }

    size_t getToolCount() const { return tools.size(); }

    bool hasTool(const std::string& name) const;

private:
    std::unordered_map<std::string, std::unique_ptr<ITool>> tools;
    std::vector<std::string> order;
    UnknownToolHandler unknownTool;
};
