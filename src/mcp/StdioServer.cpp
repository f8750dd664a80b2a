#include "StdioServer.h"
#include "PromptCatalog.h"
#include "sandbox/RateLimiter.h"
#include "sandbox/SandboxGateway.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"
#include <istream>
#include <ostream>
#include <stdexcept>

namespace {
    // Carries a JSON-RPC error out of a method handler.
    struct RpcError : std::runtime_error {
        RpcError(int code, const std::string& message) : std::runtime_error(message), code(code) {}
        int code;
    };
}

StdioServer::StdioServer(ToolRegistry& registry, const PromptCatalog& prompts)
    : registry(registry), prompts(prompts) {}

void StdioServer::run(std::istream& in, std::ostream& out) {
    std::string line;
    while (std::getline(in, line)) {
        auto response = handleLine(line);
        if (!response) continue;
        out << *response << "\n";
        out.flush();
    }
    Logger::getInstance().info("Input closed, shutting down");
}

std::optional<std::string> StdioServer::handleLine(const std::string& line) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) return std::nullopt;

    nlohmann::json message = nlohmann::json::parse(line, nullptr, false);
    if (message.is_discarded()) {
        Logger::getInstance().warn("Discarding unparseable request line");
        return serialize(errorResponse(nullptr, kParseError, "Parse error"));
    }

    auto response = handleMessage(message);
    if (!response) return std::nullopt;
    return serialize(*response);
}

std::optional<nlohmann::json> StdioServer::handleMessage(const nlohmann::json& message) {
    if (!message.is_object() || !message.contains("method") || !message["method"].is_string()) {
        nlohmann::json id = message.is_object() && message.contains("id") ? message["id"] : nlohmann::json();
        return errorResponse(id, kInvalidRequest, "Invalid Request");
    }

    const std::string method = message["method"].get<std::string>();
    const bool isNotification = !message.contains("id");
    nlohmann::json id = isNotification ? nlohmann::json() : message["id"];
    nlohmann::json params = message.value("params", nlohmann::json::object());

    nlohmann::json result;
    try {
        result = dispatch(method, params);
    } catch (const RpcError& e) {
        if (isNotification) return std::nullopt;
        return errorResponse(id, e.code, e.what());
    } catch (const std::exception& e) {
        Logger::getInstance().error("Request " + method + " failed: " + e.what());
        if (isNotification) return std::nullopt;
        return errorResponse(id, kInternalError, std::string("Internal error: ") + e.what());
    }

    if (isNotification) return std::nullopt;
    return nlohmann::json{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json StdioServer::dispatch(const std::string& method, const nlohmann::json& params) {
    if (method == "initialize") {
        return {
            {"protocolVersion", kProtocolVersion},
            {"capabilities", {
                {"tools", nlohmann::json::object()},
                {"prompts", nlohmann::json::object()}
            }},
            {"serverInfo", {{"name", "bastion"}, {"version", BASTION_VERSION}}}
        };
    }
    if (method == "ping") {
        return nlohmann::json::object();
    }
    if (method == "tools/list") {
        return {{"tools", registry.listToolSchemas()}};
    }
    if (method == "tools/call") {
        return callTool(params);
    }
    if (method == "prompts/list") {
        return {{"prompts", prompts.list()}};
    }
    if (method == "prompts/get") {
        return getPrompt(params);
    }
    if (method.rfind("notifications/", 0) == 0) {
        return nlohmann::json::object();
    }
    throw RpcError(kMethodNotFound, "Method not found: " + method);
}

nlohmann::json StdioServer::callTool(const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        throw RpcError(kInvalidParams, "tools/call requires a string 'name'");
    }
    const std::string name = params["name"].get<std::string>();
    nlohmann::json arguments = params.value("arguments", nlohmann::json::object());

    nlohmann::json output = registry.executeTool(name, arguments, clientIdOf(params));
    bool isError = output.is_object() && output.contains("error");

    return {
        {"content", nlohmann::json::array({
            {{"type", "text"}, {"text", serialize(output, 2)}}
        })},
        {"isError", isError}
    };
}

nlohmann::json StdioServer::getPrompt(const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        throw RpcError(kInvalidParams, "prompts/get requires a string 'name'");
    }
    try {
        return prompts.get(params["name"].get<std::string>(),
                           params.value("arguments", nlohmann::json::object()));
    } catch (const std::invalid_argument& e) {
        throw RpcError(kInvalidParams, e.what());
    }
}

std::string StdioServer::clientIdOf(const nlohmann::json& params) {
    if (params.is_object() && params.contains("_meta")) {
        const auto& meta = params["_meta"];
        if (meta.is_object() && meta.contains("client_id") && meta["client_id"].is_string()) {
            std::string id = meta["client_id"].get<std::string>();
            if (!id.empty()) return id;
        }
    }
    return RateLimiter::kDefaultClient;
}

nlohmann::json StdioServer::errorResponse(const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

std::string StdioServer::serialize(const nlohmann::json& j, int indent) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}
