#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Tool interface.
 *
 * A tool is a thin adapter: it checks the shape of its JSON arguments, calls
 * one gateway operation and converts the result back to JSON. Policy lives
 * in the gateway, never in the tool.
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief Unique tool name, as published to clients
     */
    virtual std::string getName() const = 0;

    /**
     * @brief Short description shown to clients
     */
    virtual std::string getDescription() const = 0;

    /**
     * @brief JSON Schema of the arguments object
     */
    virtual nlohmann::json getSchema() const = 0;

    /**
     * @brief Run the tool
     * @param args Arguments object (JSON)
     * @param clientId Caller identity used for rate limiting
     * @return Result object on success. On failure:
     * {
     *   "error": "message",
     *   "error_code": "OUTSIDE_SANDBOX" | ...
     * }
     */
    virtual nlohmann::json execute(const nlohmann::json& args, const std::string& clientId) = 0;
};
