#include <iostream>
#include <string>
#include <memory>
#include "core/ConfigManager.h"
#include "mcp/PromptCatalog.h"
#include "mcp/StdioServer.h"
#include "sandbox/AllowList.h"
#include "sandbox/AuditRecorder.h"
#include "sandbox/SandboxGateway.h"
#include "tools/SandboxTools.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"

void printUsage() {
    std::cerr << "Usage: bastion [config_path]" << std::endl;
    std::cerr << "Environment overrides: ALLOWED_DIRS, MAX_FILE_SIZE, MAX_MB, MAX_WRITE_SIZE," << std::endl;
    std::cerr << "  RATE_LIMIT, RATE_WINDOW_SECONDS, LOG_LEVEL, LOG_FILE" << std::endl;
}

// Emitted before exiting so that a failed start is visible in the audit trail.
void recordStartupFailure(const std::string& reason) {
    Logger::getInstance().error("Startup failed: " + reason);
    AuditDetails details;
    details.errorCode = "STARTUP_FAILURE";
    AuditRecorder recorder;
    recorder.record("system", AuditOutcome::Error, details);
}

int main(int argc, char* argv[]) {
    std::string configPath;
    if (argc >= 2) {
        std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        }
        if (arg == "--version") {
            std::cout << "bastion " << BASTION_VERSION << std::endl;
            return 0;
        }
        configPath = arg;
    }

    Config cfg;
    try {
        if (!configPath.empty()) {
            cfg = Config::load(configPath);
        }
        cfg.applyEnvironment();
    } catch (const std::exception& e) {
        recordStartupFailure(e.what());
        return 1;
    }

    Logger& logger = Logger::getInstance();
    logger.setLevel(Logger::parseLevel(cfg.logging.level));
    if (!cfg.logging.file.empty() && !logger.setLogFile(cfg.logging.file)) {
        logger.warn("Could not open log file: " + cfg.logging.file);
    }
    if (!configPath.empty()) {
        logger.info("Loaded configuration from: " + configPath);
    }

    AllowList allowList = AllowList::parse(cfg.sandbox.allowedDirectories);
    for (const auto& dir : allowList.toStrings()) {
        logger.info("Allowed directory: " + dir);
    }

    GatewayLimits limits = GatewayLimits::fromConfig(cfg);
    SandboxGateway gateway(std::move(allowList), limits);

    PromptCatalog prompts;
    ToolRegistry registry;
    registerSandboxTools(registry, gateway, prompts.names());

    logger.success("bastion " + std::string(BASTION_VERSION) + " ready (" +
                   std::to_string(registry.getToolCount()) + " tools)");

    StdioServer server(registry, prompts);
    server.run(std::cin, std::cout);
    return 0;
}
