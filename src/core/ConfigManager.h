#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <filesystem>
#include <functional>
#include <optional>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <nlohmann/json.hpp>

struct Config {
    struct Sandbox {
        // Raw value: JSON array text or comma separated list. Parsed by AllowList.
        std::optional<std::string> allowedDirectories = std::string("~/Desktop");
        std::uintmax_t maxFileSize = 100ull * 1024 * 1024;
        std::uintmax_t maxWriteSize = 10ull * 1024 * 1024;
        int rateLimit = 60;
        int rateWindowSeconds = 60;
    } sandbox;

    struct Logging {
        std::string level = "info";
        std::string file;
    } logging;

    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    static std::optional<std::string> processEnv(const std::string& name) {
        const char* value = std::getenv(name.c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    }

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        // Read the file content into a string first to ensure proper encoding handling
        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }
        return fromJson(j);
    }

    static Config fromJson(const nlohmann::json& j) {
        if (!j.is_object()) {
            throw std::runtime_error("Config root must be a JSON object");
        }

        Config cfg;
        try {
            if (j.contains("allowed_directories")) {
                const auto& dirs = j["allowed_directories"];
                if (dirs.is_array()) {
                    // Keep the array form; AllowList takes JSON arrays verbatim.
                    cfg.sandbox.allowedDirectories = dirs.dump();
                } else if (dirs.is_string()) {
                    cfg.sandbox.allowedDirectories = dirs.get<std::string>();
                } else if (dirs.is_null()) {
                    cfg.sandbox.allowedDirectories = std::nullopt;
                } else {
                    throw std::runtime_error("allowed_directories must be an array or a string");
                }
            }
            cfg.sandbox.maxFileSize = readSize(j, "max_file_size", cfg.sandbox.maxFileSize);
            cfg.sandbox.maxWriteSize = readSize(j, "max_write_size", cfg.sandbox.maxWriteSize);
            cfg.sandbox.rateLimit = j.value("rate_limit", cfg.sandbox.rateLimit);
            cfg.sandbox.rateWindowSeconds = j.value("rate_window_seconds", cfg.sandbox.rateWindowSeconds);
            cfg.logging.level = j.value("log_level", cfg.logging.level);
            cfg.logging.file = j.value("log_file", cfg.logging.file);
        } catch (const nlohmann::json::type_error& e) {
            throw std::runtime_error(std::string("Invalid config value: ") + e.what());
        }
        cfg.validate();
        return cfg;
    }

    /**
     * @brief Override fields from environment variables.
     *
     * ALLOWED_DIRS, MAX_FILE_SIZE, MAX_MB (read ceiling in MiB, used only when
     * MAX_FILE_SIZE is unset), MAX_WRITE_SIZE, RATE_LIMIT, RATE_WINDOW_SECONDS,
     * LOG_LEVEL, LOG_FILE.
     */
    void applyEnvironment(const EnvLookup& lookup = processEnv) {
        if (auto v = lookup("ALLOWED_DIRS")) sandbox.allowedDirectories = *v;

        if (auto v = lookup("MAX_FILE_SIZE")) {
            sandbox.maxFileSize = parseUnsigned("MAX_FILE_SIZE", *v);
        } else if (auto mb = lookup("MAX_MB")) {
            std::uintmax_t n = parseUnsigned("MAX_MB", *mb, kMaxCount);
            sandbox.maxFileSize = (n < 1 ? 1 : n) * 1024 * 1024;
        }
        if (auto v = lookup("MAX_WRITE_SIZE")) sandbox.maxWriteSize = parseUnsigned("MAX_WRITE_SIZE", *v);
        if (auto v = lookup("RATE_LIMIT")) {
            sandbox.rateLimit = static_cast<int>(parseUnsigned("RATE_LIMIT", *v, kMaxCount));
        }
        if (auto v = lookup("RATE_WINDOW_SECONDS")) {
            sandbox.rateWindowSeconds = static_cast<int>(parseUnsigned("RATE_WINDOW_SECONDS", *v, kMaxCount));
        }
        if (auto v = lookup("LOG_LEVEL")) logging.level = *v;
        if (auto v = lookup("LOG_FILE")) logging.file = *v;
        validate();
    }

    void validate() const {
        if (sandbox.rateLimit < 0) {
            throw std::runtime_error("rate_limit must not be negative");
        }
        if (sandbox.rateWindowSeconds <= 0) {
            throw std::runtime_error("rate_window_seconds must be positive");
        }
    }

private:
    static constexpr std::uintmax_t kMaxCount = 1000000000ull;

    static std::uintmax_t parseUnsigned(const std::string& name, const std::string& raw,
                                        std::uintmax_t maxValue = 1000000000000000ull) {
        if (raw.empty() || raw.find_first_not_of("0123456789") != std::string::npos || raw.size() > 16) {
            throw std::runtime_error("Invalid value for " + name + ": '" + raw + "'");
        }
        std::uintmax_t value = std::stoull(raw);
        if (value > maxValue) {
            throw std::runtime_error("Value for " + name + " is out of range: " + raw);
        }
        return value;
    }

    static std::uintmax_t readSize(const nlohmann::json& j, const char* key, std::uintmax_t def) {
        if (!j.contains(key)) return def;
        const auto& v = j[key];
        if (!v.is_number_integer() || (!v.is_number_unsigned() && v.get<int64_t>() < 0)) {
            throw std::runtime_error(std::string(key) + " must be a non-negative integer");
        }
        return v.get<std::uintmax_t>();
    }
};
