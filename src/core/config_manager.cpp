// Orexa - Game Server Supervisor
// Configuration Manager Implementation

#include "orexa/core/config_manager.hpp"
#include "orexa/core/json.hpp"
#include "orexa/core/types.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace orexa {
namespace core {

namespace {

constexpr uint32_t MAX_WORKER_THREADS = 64;
constexpr uint32_t MIN_METRICS_INTERVAL_MS = 100;

bool isTruthy(const std::string& value) {
    std::string lower = toLower(trim(value));
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

std::optional<uint32_t> parseUnsigned(const std::string& value) {
    std::string text = trim(value);
    if (text.empty() || text[0] == '-') {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long parsed = std::strtoul(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0' || parsed > UINT32_MAX) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(parsed);
}

std::optional<LogLevelConfig> parseLevelName(const std::string& value) {
    std::string lower = toLower(trim(value));
    if (lower == "debug" || lower == "info" || lower == "warning" ||
        lower == "warn" || lower == "error") {
        return stringToLogLevel(lower);
    }
    return std::nullopt;
}

/**
 * @brief Reads optional members of one configuration section.
 */
class SectionReader {
public:
    SectionReader(const JsonValue& section, std::string name)
        : section_(section), name_(std::move(name)) {}

    Result<void, ConfigError> readUnsigned(const std::string& key, uint32_t& out) const {
        if (!section_.contains(key)) {
            return Result<void, ConfigError>::success();
        }
        const JsonValue& value = section_[key];
        double number = value.getDouble(-1.0);
        if (!value.isNumber() || number < 0 || number > UINT32_MAX || std::floor(number) != number) {
            return Result<void, ConfigError>::error(
                ConfigError(ConfigError::Code::ValidationError,
                            field(key) + " must be a non-negative integer",
                            field(key)));
        }
        out = static_cast<uint32_t>(number);
        return Result<void, ConfigError>::success();
    }

    Result<void, ConfigError> readString(const std::string& key, std::string& out) const {
        if (!section_.contains(key)) {
            return Result<void, ConfigError>::success();
        }
        const JsonValue& value = section_[key];
        if (!value.isString()) {
            return Result<void, ConfigError>::error(
                ConfigError(ConfigError::Code::ValidationError,
                            field(key) + " must be a string",
                            field(key)));
        }
        out = value.stringValue;
        return Result<void, ConfigError>::success();
    }

    Result<void, ConfigError> readBool(const std::string& key, bool& out) const {
        if (!section_.contains(key)) {
            return Result<void, ConfigError>::success();
        }
        const JsonValue& value = section_[key];
        if (!value.isBool()) {
            return Result<void, ConfigError>::error(
                ConfigError(ConfigError::Code::ValidationError,
                            field(key) + " must be true or false",
                            field(key)));
        }
        out = value.boolValue;
        return Result<void, ConfigError>::success();
    }

private:
    std::string field(const std::string& key) const {
        return name_ + "." + key;
    }

    const JsonValue& section_;
    std::string name_;
};

#define OREXA_CONFIG_TRY(expr)                                          \
    do {                                                                \
        auto tryResult_ = (expr);                                       \
        if (tryResult_.isError()) {                                     \
            return tryResult_;                                          \
        }                                                               \
    } while (0)

void appendYaml(std::ostringstream& ss, const JsonValue& value, int depth) {
    std::string pad(static_cast<size_t>(depth) * 2, ' ');
    for (const auto& member : value.objectValue) {
        if (member.second.isObject()) {
            ss << pad << member.first << ":\n";
            appendYaml(ss, member.second, depth + 1);
        } else if (member.second.isString()) {
            ss << pad << member.first << ": \"" << escapeJsonString(member.second.stringValue) << "\"\n";
        } else {
            ss << pad << member.first << ": " << toJson(member.second) << "\n";
        }
    }
}

} // anonymous namespace

std::string Configuration::artifactMirrorPath() const {
    if (!supervisor.artifactMirrorDir.empty()) {
        return supervisor.artifactMirrorDir;
    }
    return supervisor.baseDir + "/artifacts";
}

// =============================================================================
// ConfigManager Implementation
// =============================================================================

ConfigManager::ConfigManager() = default;

ConfigManager::~ConfigManager() = default;

Result<void, ConfigError> ConfigManager::loadFromFile(const std::string& filePath) {
    auto format = detectFormat(filePath);
    if (!format) {
        return Result<void, ConfigError>::error(
            ConfigError(ConfigError::Code::UnsupportedFormat,
                        "Unsupported configuration file format. Use .json, .yaml, or .yml"));
    }

    auto contentResult = readFile(filePath);
    if (contentResult.isError()) {
        return Result<void, ConfigError>::error(contentResult.error());
    }

    log("Loading configuration from " + filePath);
    if (*format == ConfigFormat::YAML) {
        return loadFromYamlString(contentResult.value());
    }
    return loadFromJsonString(contentResult.value());
}

Result<void, ConfigError> ConfigManager::loadFromJsonString(const std::string& jsonContent) {
    auto parsed = parseJson(jsonContent);
    if (parsed.isError()) {
        return Result<void, ConfigError>::error(
            ConfigError(ConfigError::Code::ParseError,
                        "Invalid JSON: " + parsed.error().message,
                        "", parsed.error().line));
    }
    return applyDocument(parsed.value());
}

Result<void, ConfigError> ConfigManager::loadFromYamlString(const std::string& yamlContent) {
    auto parsed = parseYaml(yamlContent);
    if (parsed.isError()) {
        return Result<void, ConfigError>::error(
            ConfigError(ConfigError::Code::ParseError,
                        "Invalid YAML: " + parsed.error().message,
                        "", parsed.error().line));
    }
    return applyDocument(parsed.value());
}

Result<void, ConfigError> ConfigManager::loadDefaults() {
    {
        std::unique_lock<std::shared_mutex> lock(configMutex_);
        config_ = Configuration{};
    }
    log("Configuration loaded with default values");
    return Result<void, ConfigError>::success();
}

void ConfigManager::applyEnvironmentOverrides() {
    std::unique_lock<std::shared_mutex> lock(configMutex_);

    if (auto val = getEnvVar("OREXA_BASE_DIR")) {
        config_.supervisor.baseDir = *val;
        log("Environment override: OREXA_BASE_DIR=" + *val);
    }

    if (auto val = getEnvVar("OREXA_LOG_LEVEL")) {
        if (auto level = parseLevelName(*val)) {
            config_.logging.level = *level;
            log("Environment override: OREXA_LOG_LEVEL=" + *val);
        } else {
            log("Warning: Invalid OREXA_LOG_LEVEL value: " + *val);
        }
    }

    if (auto val = getEnvVar("OREXA_LOG_JSON")) {
        config_.logging.enableJson = isTruthy(*val);
        log("Environment override: OREXA_LOG_JSON=" + *val);
    }

    if (auto val = getEnvVar("OREXA_LOG_FILE")) {
        config_.logging.filePath = *val;
        config_.logging.enableFile = !val->empty();
        log("Environment override: OREXA_LOG_FILE=" + *val);
    }

    if (auto val = getEnvVar("OREXA_STOP_TIMEOUT")) {
        if (auto seconds = parseUnsigned(*val)) {
            config_.supervisor.stopTimeoutSeconds = *seconds;
            log("Environment override: OREXA_STOP_TIMEOUT=" + *val);
        } else {
            log("Warning: Invalid OREXA_STOP_TIMEOUT value: " + *val);
        }
    }

    if (auto val = getEnvVar("OREXA_WORKER_THREADS")) {
        if (auto threads = parseUnsigned(*val)) {
            config_.supervisor.workerThreads = *threads;
            log("Environment override: OREXA_WORKER_THREADS=" + *val);
        } else {
            log("Warning: Invalid OREXA_WORKER_THREADS value: " + *val);
        }
    }

    if (auto val = getEnvVar("OREXA_JAVA_PATH")) {
        config_.supervisor.javaPath = *val;
        log("Environment override: OREXA_JAVA_PATH=" + *val);
    }

    if (auto val = getEnvVar("OREXA_ARTIFACT_DIR")) {
        config_.supervisor.artifactMirrorDir = *val;
        log("Environment override: OREXA_ARTIFACT_DIR=" + *val);
    }
}

Result<void, ConfigError> ConfigManager::validate() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);
    return validateConfig(config_);
}

Result<void, ConfigError> ConfigManager::validateConfig(const Configuration& config) {
    auto invalid = [](const std::string& message, const std::string& field) {
        return Result<void, ConfigError>::error(
            ConfigError(ConfigError::Code::ValidationError, message, field));
    };

    const SupervisorConfig& sup = config.supervisor;
    if (sup.baseDir.empty()) {
        return invalid("supervisor.baseDir must not be empty", "supervisor.baseDir");
    }
    if (sup.stopTimeoutSeconds == 0) {
        return invalid("supervisor.stopTimeoutSeconds must be greater than 0",
                       "supervisor.stopTimeoutSeconds");
    }
    if (sup.metricsIntervalMs < MIN_METRICS_INTERVAL_MS) {
        return invalid("supervisor.metricsIntervalMs must be at least " +
                       std::to_string(MIN_METRICS_INTERVAL_MS),
                       "supervisor.metricsIntervalMs");
    }
    if (sup.backupCheckIntervalSeconds == 0) {
        return invalid("supervisor.backupCheckIntervalSeconds must be greater than 0",
                       "supervisor.backupCheckIntervalSeconds");
    }
    if (sup.workerThreads == 0 || sup.workerThreads > MAX_WORKER_THREADS) {
        return invalid("supervisor.workerThreads must be between 1 and " +
                       std::to_string(MAX_WORKER_THREADS),
                       "supervisor.workerThreads");
    }
    if (sup.javaPath.empty()) {
        return invalid("supervisor.javaPath must not be empty", "supervisor.javaPath");
    }

    const ConsoleConfig& console = config.console;
    if (console.bufferCapacity == 0) {
        return invalid("console.bufferCapacity must be greater than 0", "console.bufferCapacity");
    }
    if (console.trimBatch == 0 || console.trimBatch > console.bufferCapacity) {
        return invalid("console.trimBatch must be between 1 and console.bufferCapacity",
                       "console.trimBatch");
    }
    if (console.subscriberQueueCapacity == 0) {
        return invalid("console.subscriberQueueCapacity must be greater than 0",
                       "console.subscriberQueueCapacity");
    }

    if (config.logging.enableFile && config.logging.filePath.empty()) {
        return invalid("logging.filePath is required when file logging is enabled",
                       "logging.filePath");
    }

    return Result<void, ConfigError>::success();
}

Configuration ConfigManager::getConfig() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);
    return config_;
}

void ConfigManager::setConfig(const Configuration& config) {
    std::unique_lock<std::shared_mutex> lock(configMutex_);
    config_ = config;
}

std::string ConfigManager::dumpConfig(ConfigFormat format) const {
    JsonValue document = toDocument();

    if (format == ConfigFormat::JSON) {
        return toJson(document, 2) + "\n";
    }

    std::ostringstream ss;
    appendYaml(ss, document, 0);
    return ss.str();
}

void ConfigManager::setLogCallback(ConfigLogCallback callback) {
    std::lock_guard<std::mutex> lock(logMutex_);
    logCallback_ = std::move(callback);
}

void ConfigManager::logEffectiveConfig() const {
    Configuration config = getConfig();
    log("Effective configuration:");
    log("  supervisor.baseDir: " + config.supervisor.baseDir);
    log("  supervisor.stopTimeoutSeconds: " + std::to_string(config.supervisor.stopTimeoutSeconds));
    log("  supervisor.metricsIntervalMs: " + std::to_string(config.supervisor.metricsIntervalMs));
    log("  supervisor.backupCheckIntervalSeconds: " +
        std::to_string(config.supervisor.backupCheckIntervalSeconds));
    log("  supervisor.autoStartDelayMs: " + std::to_string(config.supervisor.autoStartDelayMs));
    log("  supervisor.workerThreads: " + std::to_string(config.supervisor.workerThreads));
    log("  supervisor.restartWarningMs: " + std::to_string(config.supervisor.restartWarningMs));
    log("  supervisor.restartSettleMs: " + std::to_string(config.supervisor.restartSettleMs));
    log("  supervisor.javaPath: " + config.supervisor.javaPath);
    log("  supervisor.artifactMirrorDir: " + config.artifactMirrorPath());
    log("  console.bufferCapacity: " + std::to_string(config.console.bufferCapacity));
    log("  console.trimBatch: " + std::to_string(config.console.trimBatch));
    log("  console.subscriberQueueCapacity: " + std::to_string(config.console.subscriberQueueCapacity));
    log("  logging.level: " + logLevelToString(config.logging.level));
    log("  logging.enableJson: " + std::string(config.logging.enableJson ? "true" : "false"));
    log("  logging.enableFile: " + std::string(config.logging.enableFile ? "true" : "false"));
}

// =============================================================================
// Private Implementation
// =============================================================================

Result<void, ConfigError> ConfigManager::applyDocument(const JsonValue& root) {
    if (!root.isObject()) {
        return Result<void, ConfigError>::error(
            ConfigError(ConfigError::Code::ParseError,
                        "Configuration root must be an object"));
    }

    Configuration updated = getConfig();

    if (root.contains("supervisor")) {
        SectionReader sup(root["supervisor"], "supervisor");
        SupervisorConfig& out = updated.supervisor;
        OREXA_CONFIG_TRY(sup.readString("baseDir", out.baseDir));
        OREXA_CONFIG_TRY(sup.readUnsigned("stopTimeoutSeconds", out.stopTimeoutSeconds));
        OREXA_CONFIG_TRY(sup.readUnsigned("metricsIntervalMs", out.metricsIntervalMs));
        OREXA_CONFIG_TRY(sup.readUnsigned("backupCheckIntervalSeconds", out.backupCheckIntervalSeconds));
        OREXA_CONFIG_TRY(sup.readUnsigned("autoStartDelayMs", out.autoStartDelayMs));
        OREXA_CONFIG_TRY(sup.readUnsigned("workerThreads", out.workerThreads));
        OREXA_CONFIG_TRY(sup.readUnsigned("restartWarningMs", out.restartWarningMs));
        OREXA_CONFIG_TRY(sup.readUnsigned("restartSettleMs", out.restartSettleMs));
        OREXA_CONFIG_TRY(sup.readString("javaPath", out.javaPath));
        OREXA_CONFIG_TRY(sup.readString("artifactMirrorDir", out.artifactMirrorDir));
    }

    if (root.contains("console")) {
        SectionReader console(root["console"], "console");
        ConsoleConfig& out = updated.console;
        OREXA_CONFIG_TRY(console.readUnsigned("bufferCapacity", out.bufferCapacity));
        OREXA_CONFIG_TRY(console.readUnsigned("trimBatch", out.trimBatch));
        OREXA_CONFIG_TRY(console.readUnsigned("subscriberQueueCapacity", out.subscriberQueueCapacity));
    }

    if (root.contains("logging")) {
        const JsonValue& logging = root["logging"];
        SectionReader reader(logging, "logging");
        LoggingConfig& out = updated.logging;

        if (logging.contains("level")) {
            std::string levelStr = logging["level"].getString();
            auto level = parseLevelName(levelStr);
            if (!level) {
                return Result<void, ConfigError>::error(
                    ConfigError(ConfigError::Code::ValidationError,
                                "Invalid logging.level: " + levelStr +
                                ". Valid values: debug, info, warning, error",
                                "logging.level"));
            }
            out.level = *level;
        }
        OREXA_CONFIG_TRY(reader.readBool("enableConsole", out.enableConsole));
        OREXA_CONFIG_TRY(reader.readBool("enableSyslog", out.enableSyslog));
        OREXA_CONFIG_TRY(reader.readBool("enableFile", out.enableFile));
        OREXA_CONFIG_TRY(reader.readString("filePath", out.filePath));
        OREXA_CONFIG_TRY(reader.readBool("enableJson", out.enableJson));
        OREXA_CONFIG_TRY(reader.readUnsigned("maxFileSizeMB", out.maxFileSizeMB));
        OREXA_CONFIG_TRY(reader.readUnsigned("maxFiles", out.maxFiles));
        OREXA_CONFIG_TRY(reader.readBool("compressRotated", out.compressRotated));
    }

    auto valid = validateConfig(updated);
    if (valid.isError()) {
        return valid;
    }

    setConfig(updated);
    return Result<void, ConfigError>::success();
}

std::optional<ConfigFormat> ConfigManager::detectFormat(const std::string& filePath) const {
    size_t dotPos = filePath.rfind('.');
    if (dotPos == std::string::npos) {
        return ConfigFormat::JSON;
    }

    std::string ext = toLower(filePath.substr(dotPos));
    if (ext == ".json") return ConfigFormat::JSON;
    if (ext == ".yaml" || ext == ".yml") return ConfigFormat::YAML;

    return std::nullopt;
}

Result<std::string, ConfigError> ConfigManager::readFile(const std::string& filePath) const {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return Result<std::string, ConfigError>::error(
            ConfigError(ConfigError::Code::FileNotFound,
                        "Configuration file not found: " + filePath));
    }

    std::ostringstream ss;
    ss << file.rdbuf();

    if (file.bad()) {
        return Result<std::string, ConfigError>::error(
            ConfigError(ConfigError::Code::IOError,
                        "Error reading configuration file: " + filePath));
    }

    return Result<std::string, ConfigError>::success(ss.str());
}

void ConfigManager::log(const std::string& message) const {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logCallback_) {
        logCallback_(message);
    }
}

std::optional<std::string> ConfigManager::getEnvVar(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

JsonValue ConfigManager::toDocument() const {
    Configuration config = getConfig();
    auto number = [](uint32_t v) { return JsonValue::makeNumber(static_cast<double>(v)); };

    JsonValue supervisor = JsonValue::makeObject();
    supervisor.set("baseDir", JsonValue::makeString(config.supervisor.baseDir));
    supervisor.set("stopTimeoutSeconds", number(config.supervisor.stopTimeoutSeconds));
    supervisor.set("metricsIntervalMs", number(config.supervisor.metricsIntervalMs));
    supervisor.set("backupCheckIntervalSeconds", number(config.supervisor.backupCheckIntervalSeconds));
    supervisor.set("autoStartDelayMs", number(config.supervisor.autoStartDelayMs));
    supervisor.set("workerThreads", number(config.supervisor.workerThreads));
    supervisor.set("restartWarningMs", number(config.supervisor.restartWarningMs));
    supervisor.set("restartSettleMs", number(config.supervisor.restartSettleMs));
    supervisor.set("javaPath", JsonValue::makeString(config.supervisor.javaPath));
    supervisor.set("artifactMirrorDir", JsonValue::makeString(config.supervisor.artifactMirrorDir));

    JsonValue console = JsonValue::makeObject();
    console.set("bufferCapacity", number(config.console.bufferCapacity));
    console.set("trimBatch", number(config.console.trimBatch));
    console.set("subscriberQueueCapacity", number(config.console.subscriberQueueCapacity));

    JsonValue logging = JsonValue::makeObject();
    logging.set("level", JsonValue::makeString(logLevelToString(config.logging.level)));
    logging.set("enableConsole", JsonValue::makeBool(config.logging.enableConsole));
    logging.set("enableSyslog", JsonValue::makeBool(config.logging.enableSyslog));
    logging.set("enableFile", JsonValue::makeBool(config.logging.enableFile));
    logging.set("filePath", JsonValue::makeString(config.logging.filePath));
    logging.set("enableJson", JsonValue::makeBool(config.logging.enableJson));
    logging.set("maxFileSizeMB", number(config.logging.maxFileSizeMB));
    logging.set("maxFiles", number(config.logging.maxFiles));
    logging.set("compressRotated", JsonValue::makeBool(config.logging.compressRotated));

    JsonValue root = JsonValue::makeObject();
    root.set("supervisor", std::move(supervisor));
    root.set("console", std::move(console));
    root.set("logging", std::move(logging));
    return root;
}

} // namespace core
} // namespace orexa
