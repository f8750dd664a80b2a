#pragma once
#include <string>
#include <functional>
#include <mutex>
#include <fstream>

enum class LogLevel {
    DEBUG,
    INFO,
    SUCCESS,
    WARNING,
    ERROR,
    AUDIT
};

/**
 * @brief Process-wide logger.
 *
 * Everything goes to stderr because stdout carries the protocol. Audit lines
 * are written verbatim (one JSON object per line) and bypass the level filter.
 */
class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setCallback(LogCallback callback) {
        std::lock_guard<std::mutex> lock(mtx);
        this->callback = callback;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx);
        minLevel = level;
    }

    /**
     * @brief Mirror all output to a file (appended). Empty path disables it.
     * @return false if the file could not be opened
     */
    bool setLogFile(const std::string& path);

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mtx);
        if (level != LogLevel::AUDIT && level < minLevel) return;
        printToConsole(level, message);

        if (callback) {
            callback(level, message);
        }
    }

    // Convenience methods
    void debug(const std::string& m) { log(LogLevel::DEBUG, m); }
    void info(const std::string& m) { log(LogLevel::INFO, m); }
    void success(const std::string& m) { log(LogLevel::SUCCESS, m); }
    void warn(const std::string& m) { log(LogLevel::WARNING, m); }
    void error(const std::string& m) { log(LogLevel::ERROR, m); }
    void audit(const std::string& line) { log(LogLevel::AUDIT, line); }

    /** @brief Map "debug"/"info"/"warn"/"error" to a level (INFO if unknown). */
    static LogLevel parseLevel(const std::string& name);

private:
    Logger() = default;
    LogCallback callback;
    std::mutex mtx;
    LogLevel minLevel = LogLevel::INFO;
    std::ofstream logFile;

    void printToConsole(LogLevel level, const std::string& message);
};
