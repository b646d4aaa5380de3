// Orexa - Game Server Supervisor
// Supervisor daemon: loads configuration, starts the supervisor and runs
// until SIGINT or SIGTERM.

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "orexa/orexa.hpp"
#include "orexa/core/config_manager.hpp"
#include "orexa/core/log_sinks.hpp"
#include "orexa/core/structured_logger.hpp"
#include "orexa/pal/linux/linux_log_pal.hpp"

namespace {

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

void printUsage(const char* programName) {
    std::cout << "Orexa Supervisor v" << orexa::version() << "\n"
              << "Usage: " << programName << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config FILE     Configuration file (.json, .yaml, .yml)\n"
              << "  --base-dir DIR        Directory holding data/, Servers/ and Backups/\n"
              << "  --log-level LEVEL     debug, info, warning or error\n"
              << "  --json-logs           Write log lines as JSON objects\n"
              << "  -h, --help            Show this help\n"
              << std::endl;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace orexa;

    std::string configPath;
    std::string baseDir;
    std::string logLevel;
    bool jsonLogs = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--base-dir" && i + 1 < argc) {
            baseDir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            logLevel = argv[++i];
        } else if (arg == "--json-logs") {
            jsonLogs = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }

    // Configuration: file (or defaults), environment, then command line
    std::vector<std::string> configMessages;
    core::ConfigManager configManager;
    configManager.setLogCallback([&configMessages](const std::string& message) {
        configMessages.push_back(message);
    });

    if (!configPath.empty()) {
        auto loaded = configManager.loadFromFile(configPath);
        if (loaded.isError()) {
            std::cerr << "Failed to load " << configPath << ": " << loaded.error().message
                      << std::endl;
            return 1;
        }
    } else {
        (void)configManager.loadDefaults();
    }
    configManager.applyEnvironmentOverrides();

    core::Configuration config = configManager.getConfig();
    if (!baseDir.empty()) {
        config.supervisor.baseDir = baseDir;
    }
    if (!logLevel.empty()) {
        config.logging.level = core::stringToLogLevel(logLevel);
    }
    if (jsonLogs) {
        config.logging.enableJson = true;
    }
    configManager.setConfig(config);

    auto valid = configManager.validate();
    if (valid.isError()) {
        std::cerr << "Invalid configuration";
        if (!valid.error().field.empty()) {
            std::cerr << " (" << valid.error().field << ")";
        }
        std::cerr << ": " << valid.error().message << std::endl;
        return 1;
    }

    // Logging
    auto logger = std::make_shared<core::StructuredLogger>();
    logger->setLevel(config.logging.level);
    logger->setJsonFormat(config.logging.enableJson);

    if (config.logging.enableConsole || config.logging.enableSyslog) {
        auto logPal = std::make_shared<pal::linux::LinuxLogPAL>(
            config.logging.enableSyslog, config.logging.enableConsole);
        logPal->setMinLevel(pal::LogLevel::Trace);
        logger->addSink(std::make_shared<core::PlatformLogSink>(logPal));
    }
    if (config.logging.enableFile && !config.logging.filePath.empty()) {
        core::RotationPolicy policy;
        policy.maxFileSize = static_cast<uint64_t>(config.logging.maxFileSizeMB) * 1024 * 1024;
        policy.maxBackupFiles = config.logging.maxFiles;
        policy.compress = config.logging.compressRotated;
        logger->addSink(std::make_shared<core::FileSink>(config.logging.filePath, policy));
    }

    for (const auto& message : configMessages) {
        logger->info(message, "Config");
    }
    configManager.setLogCallback([logger](const std::string& message) {
        logger->info(message, "Config");
    });
    configManager.logEffectiveConfig();

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    // Supervisor
    api::Supervisor supervisor(config, logger);
    auto started = supervisor.start();
    if (started.isError()) {
        logger->error("Failed to start supervisor: " + started.error().message, "Supervisor");
        return 1;
    }

    logger->info("Orexa " + std::string(version()) + " running, managing " +
                 std::to_string(started.value()) + " server(s)", "Supervisor");

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    logger->info("Shutdown signal received", "Supervisor");
    supervisor.shutdown();
    logger->flush();

    return 0;
}
