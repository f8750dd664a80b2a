#include "sandbox/AllowList.h"
#include "utils/Logger.h"
#include "utils/PathUtils.h"
#include <nlohmann/json.hpp>
#include <sstream>

namespace {
    std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        size_t start = s.find_first_not_of(ws);
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(ws);
        return s.substr(start, end - start + 1);
    }

    bool parseJsonArray(const std::string& raw, std::vector<std::string>& out) {
        nlohmann::json j = nlohmann::json::parse(raw, nullptr, false);
        if (j.is_discarded() || !j.is_array()) return false;
        std::vector<std::string> items;
        for (const auto& item : j) {
            if (!item.is_string()) return false;
            items.push_back(item.get<std::string>());
        }
        out = std::move(items);
        return true;
    }
}

AllowList::AllowList(std::vector<fs::path> entries) : entries_(std::move(entries)) {}

std::vector<std::string> AllowList::splitRaw(const std::string& raw) {
    std::vector<std::string> parts;
    if (parseJsonArray(raw, parts)) return parts;

    std::stringstream ss(raw);
    std::string segment;
    while (std::getline(ss, segment, ',')) {
        segment = trim(segment);
        if (!segment.empty()) parts.push_back(segment);
    }
    return parts;
}

AllowList AllowList::parse(const std::optional<std::string>& raw) {
    if (!raw || trim(*raw).empty()) {
        return AllowList();
    }

    std::vector<fs::path> entries;
    for (const auto& item : splitRaw(*raw)) {
        // An empty entry would canonicalize to the working directory.
        if (trim(item).empty()) {
            Logger::getInstance().warn("Ignoring empty allowed directory entry");
            continue;
        }

        std::string failure;
        auto canonical = PathUtils::canonicalize(PathUtils::expandHome(item), &failure);
        if (!canonical) {
            Logger::getInstance().warn("Ignoring allowed directory '" + item + "': " + failure);
            continue;
        }
        entries.push_back(*canonical);
    }
    return AllowList(std::move(entries));
}

std::vector<std::string> AllowList::toStrings() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.string());
    return out;
}
