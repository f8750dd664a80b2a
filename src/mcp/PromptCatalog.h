#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Fixed set of prompt templates offered over prompts/list and prompts/get.
 */
class PromptCatalog {
public:
    static constexpr const char* kAnalyzeFile = "analyze_file";

    /** @brief Descriptors: [{name, description, arguments: [{name, description, required}]}] */
    nlohmann::json list() const;

    std::vector<std::string> names() const;

    /**
     * @brief Render a prompt
     * @return {description, messages: [{role, content: {type, text}}]}
     * @throws std::invalid_argument for an unknown prompt or a missing argument
     */
    nlohmann::json get(const std::string& name, const nlohmann::json& arguments) const;
};
