#include "PromptCatalog.h"
#include <stdexcept>

nlohmann::json PromptCatalog::list() const {
    return nlohmann::json::array({
        {
            {"name", kAnalyzeFile},
            {"description", "Analyze a file and provide insights"},
            {"arguments", nlohmann::json::array({
                {
                    {"name", "filepath"},
                    {"description", "Path to the file to analyze"},
                    {"required", true}
                }
            })}
        }
    });
}

std::vector<std::string> PromptCatalog::names() const {
    return {kAnalyzeFile};
}

nlohmann::json PromptCatalog::get(const std::string& name, const nlohmann::json& arguments) const {
    if (name != kAnalyzeFile) {
        throw std::invalid_argument("Unknown prompt: " + name);
    }

    std::string filepath;
    if (arguments.is_object()) {
        auto it = arguments.find("filepath");
        if (it != arguments.end() && it->is_string()) filepath = it->get<std::string>();
    }
    if (filepath.empty()) {
        throw std::invalid_argument("filepath argument is required");
    }

    std::string text = "Please analyze the file at " + filepath + " and provide:\n"
                       "1. File type and format\n"
                       "2. Size and metadata\n"
                       "3. Key insights or patterns\n"
                       "4. Potential issues or concerns\n"
                       "5. Recommendations for processing or usage";

    return {
        {"description", "Analyze the file at " + filepath},
        {"messages", nlohmann::json::array({
            {
                {"role", "user"},
                {"content", {{"type", "text"}, {"text", text}}}
            }
        })}
    };
}
