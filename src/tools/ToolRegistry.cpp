#include "ToolRegistry.h"
#include "sandbox/SandboxError.h"
#include "utils/Logger.h"

void ToolRegistry::registerTool(std::unique_ptr<ITool> tool) {
    if (!tool) return;

    std::string name = tool->getName();
    if (tools.count(name)) {
        Logger::getInstance().warn("Tool registered twice, replacing: " + name);
    } else {
        order.push_back(name);
    }

    tools[name] = std::move(tool);
}

ITool* ToolRegistry::getTool(const std::string& name) {
    auto it = tools.find(name);
    if (it == tools.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<nlohmann::json> ToolRegistry::listToolSchemas() const {
    std::vector<nlohmann::json> schemas;

    for (const auto& name : order) {
        const auto& tool = tools.at(name);
        nlohmann::json schema;
        schema["name"] = tool->getName();
        schema["description"] = tool->getDescription();
        schema["inputSchema"] = tool->getSchema();
        schemas.push_back(schema);
    }

    return schemas;
}

nlohmann::json ToolRegistry::executeTool(const std::string& name, const nlohmann::json& args,
                                         const std::string& clientId) {
    ITool* tool = getTool(name);
    if (!tool) {
        if (unknownTool) {
            return unknownTool(name, clientId);
        }
        nlohmann::json error;
        error["error"] = "Tool not found: " + name;
        error["error_code"] = errorCodeName(SandboxErrorCode::InvalidArgument);
        return error;
    }

    try {
        return tool->execute(args, clientId);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Tool " + name + " threw: " + e.what());
        nlohmann::json error;
        error["error"] = std::string("Tool execution failed: ") + e.what();
        error["error_code"] = errorCodeName(SandboxErrorCode::Unexpected);
        return error;
    }
}

bool ToolRegistry::hasTool(const std::string& name) const {
    return tools.count(name) > 0;
}
