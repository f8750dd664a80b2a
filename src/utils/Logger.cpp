#include "utils/Logger.h"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <sstream>

#ifndef _WIN32
#include <unistd.h>
#else
#include <io.h>
#endif

namespace {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string GREEN = "\033[38;5;46m";
    const std::string YELLOW = "\033[38;5;226m";
    const std::string CYAN = "\033[38;5;51m";
    const std::string GRAY = "\033[38;5;242m";

    bool stderrIsTerminal() {
#ifndef _WIN32
        static const bool tty = isatty(STDERR_FILENO) != 0;
#else
        static const bool tty = _isatty(_fileno(stderr)) != 0;
#endif
        return tty;
    }

    const char* levelTag(LogLevel level) {
        switch (level) {
            case LogLevel::ERROR: return "[ERROR] ";
            case LogLevel::WARNING: return "[WARN] ";
            case LogLevel::INFO: return "[INFO] ";
            case LogLevel::SUCCESS: return "[OK] ";
            case LogLevel::AUDIT: return "[AUDIT] ";
            default: return "[DEBUG] ";
        }
    }
}

bool Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mtx);
    if (logFile.is_open()) logFile.close();
    if (path.empty()) return true;
    logFile.open(path, std::ios::app);
    return logFile.is_open();
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

void Logger::printToConsole(LogLevel level, const std::string& message) {
    // Trim trailing newlines from message to avoid double spacing
    std::string trimmedMsg = message;
    while (!trimmedMsg.empty() && (trimmedMsg.back() == '\n' || trimmedMsg.back() == '\r')) {
        trimmedMsg.pop_back();
    }

    if (logFile.is_open()) {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        logFile << std::put_time(std::localtime(&now), "[%Y-%m-%d %H:%M:%S] ")
                << levelTag(level) << trimmedMsg << std::endl;
    }

    // Audit records are machine-read: no prefix, no colour.
    if (level == LogLevel::AUDIT) {
        std::cerr << trimmedMsg << std::endl;
        return;
    }

    std::string prefix;
    if (stderrIsTerminal()) {
        switch (level) {
            case LogLevel::INFO: prefix = CYAN + "[Info] " + RESET; break;
            case LogLevel::SUCCESS: prefix = GREEN + "✔ " + RESET; break;
            case LogLevel::WARNING: prefix = YELLOW + "⚠ " + RESET; break;
            case LogLevel::ERROR: prefix = RED + BOLD + "✖ " + RESET; break;
            default: prefix = GRAY + "[Debug] " + RESET; break;
        }
    } else {
        prefix = levelTag(level);
    }

    // Handle multi-line messages by prepending prefix to each line
    std::stringstream ss(trimmedMsg);
    std::string line;
    while (std::getline(ss, line)) {
        std::cerr << prefix << line << std::endl;
    }
}
