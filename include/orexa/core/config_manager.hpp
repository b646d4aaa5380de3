// Orexa - Game Server Supervisor
// Configuration Manager
//
// Loads supervisor configuration from JSON or YAML files, applies OREXA_*
// environment overrides, validates the result and logs the effective values.

#ifndef OREXA_CORE_CONFIG_MANAGER_HPP
#define OREXA_CORE_CONFIG_MANAGER_HPP

#include "orexa/core/result.hpp"
#include "orexa/core/structured_logger.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

namespace orexa {
namespace core {

struct JsonValue;

/**
 * @brief Configuration file format.
 */
enum class ConfigFormat {
    JSON,
    YAML
};

// =============================================================================
// Configuration Structures
// =============================================================================

/**
 * @brief Supervisor process settings.
 */
struct SupervisorConfig {
    std::string baseDir = ".";                  ///< Holds data/, Servers/, Backups/
    uint32_t stopTimeoutSeconds = 30;           ///< Grace period before SIGKILL
    uint32_t metricsIntervalMs = 2000;          ///< Metrics loop tick
    uint32_t backupCheckIntervalSeconds = 60;   ///< Backup scheduler tick
    uint32_t autoStartDelayMs = 2000;           ///< Delay before autostarting instances
    uint32_t workerThreads = 4;                 ///< Metrics/scheduler pool size
    uint32_t restartWarningMs = 10000;          ///< Between the two restart warnings
    uint32_t restartSettleMs = 3000;            ///< Between stop and start of a restart
    std::string javaPath = "java";              ///< JVM used by the default launch command
    std::string artifactMirrorDir;              ///< Empty means <baseDir>/artifacts
};

/**
 * @brief Console pipeline settings.
 */
struct ConsoleConfig {
    uint32_t bufferCapacity = 2000;             ///< Lines retained per instance
    uint32_t trimBatch = 200;                   ///< Lines dropped when full
    uint32_t subscriberQueueCapacity = 1000;    ///< Pending lines per subscriber
};

/**
 * @brief Logging configuration section.
 */
struct LoggingConfig {
    LogLevelConfig level = LogLevelConfig::Info;
    bool enableConsole = true;                  ///< Mirror to stderr
    bool enableSyslog = false;                  ///< Send to syslog
    bool enableFile = false;                    ///< Append to filePath
    std::string filePath;
    bool enableJson = false;                    ///< One JSON object per line
    uint32_t maxFileSizeMB = 100;               ///< Rotate after this size
    uint32_t maxFiles = 5;                      ///< Rotated files kept
    bool compressRotated = false;               ///< gzip rotated files
};

/**
 * @brief Complete supervisor configuration.
 */
struct Configuration {
    SupervisorConfig supervisor;
    ConsoleConfig console;
    LoggingConfig logging;

    /**
     * @brief artifactMirrorDir, or <baseDir>/artifacts when unset.
     */
    std::string artifactMirrorPath() const;
};

// =============================================================================
// Configuration Error
// =============================================================================

/**
 * @brief Configuration error with detailed information.
 */
struct ConfigError {
    enum class Code {
        None,
        FileNotFound,
        ParseError,
        ValidationError,
        UnsupportedFormat,
        IOError
    };

    Code code = Code::None;
    std::string message;
    std::string field;        ///< Field that caused the error (if applicable)
    int line = -1;            ///< Line number in config file (if applicable)

    ConfigError() = default;
    ConfigError(Code c, std::string msg) : code(c), message(std::move(msg)) {}
    ConfigError(Code c, std::string msg, std::string f)
        : code(c), message(std::move(msg)), field(std::move(f)) {}
    ConfigError(Code c, std::string msg, std::string f, int l)
        : code(c), message(std::move(msg)), field(std::move(f)), line(l) {}
};

// =============================================================================
// Configuration Manager
// =============================================================================

using ConfigLogCallback = std::function<void(const std::string&)>;

/**
 * @brief Loads and validates supervisor configuration.
 *
 * Sources are applied in order: built-in defaults, the configuration file,
 * then OREXA_* environment variables. Unknown keys are ignored.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - Uses shared_mutex for read/write locking
 *
 * @code
 * ConfigManager manager;
 * manager.setLogCallback([&](const std::string& msg) { logger->info(msg, "Config"); });
 *
 * auto result = manager.loadFromFile("orexa.json");
 * if (result.isError() && result.error().code == ConfigError::Code::FileNotFound) {
 *     manager.loadDefaults();
 * }
 * manager.applyEnvironmentOverrides();
 * if (manager.validate().isError()) {
 *     return 1;
 * }
 * Configuration config = manager.getConfig();
 * @endcode
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Non-copyable, non-movable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Load configuration from a .json, .yaml or .yml file.
     *
     * Fields absent from the file keep their current values.
     */
    Result<void, ConfigError> loadFromFile(const std::string& filePath);

    Result<void, ConfigError> loadFromJsonString(const std::string& jsonContent);

    Result<void, ConfigError> loadFromYamlString(const std::string& yamlContent);

    /**
     * @brief Reset every field to its default.
     */
    Result<void, ConfigError> loadDefaults();

    /**
     * @brief Apply OREXA_* environment variables.
     *
     * Supported: OREXA_BASE_DIR, OREXA_LOG_LEVEL, OREXA_LOG_JSON,
     * OREXA_LOG_FILE (also enables file logging), OREXA_STOP_TIMEOUT,
     * OREXA_WORKER_THREADS, OREXA_JAVA_PATH, OREXA_ARTIFACT_DIR.
     * Malformed values are logged and skipped.
     */
    void applyEnvironmentOverrides();

    Result<void, ConfigError> validate() const;

    Configuration getConfig() const;

    /**
     * @brief Replace the configuration (command-line overrides).
     */
    void setConfig(const Configuration& config);

    std::string dumpConfig(ConfigFormat format = ConfigFormat::JSON) const;

    void setLogCallback(ConfigLogCallback callback);

    /**
     * @brief Report every effective value through the log callback.
     */
    void logEffectiveConfig() const;

private:
    Result<void, ConfigError> applyDocument(const JsonValue& root);

    std::optional<ConfigFormat> detectFormat(const std::string& filePath) const;

    Result<std::string, ConfigError> readFile(const std::string& filePath) const;

    void log(const std::string& message) const;

    std::optional<std::string> getEnvVar(const std::string& name) const;

    static Result<void, ConfigError> validateConfig(const Configuration& config);

    JsonValue toDocument() const;

    mutable std::shared_mutex configMutex_;
    Configuration config_;

    mutable std::mutex logMutex_;
    ConfigLogCallback logCallback_;
};

} // namespace core
} // namespace orexa

#endif // OREXA_CORE_CONFIG_MANAGER_HPP
