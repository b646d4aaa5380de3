// Orexa - Game Server Supervisor
// Structured Logging Component
//
// Plain-text or JSON line logging with per-instance context, fanned out to
// pluggable sinks (stderr/syslog through the platform PAL, rotating files).

#ifndef OREXA_CORE_STRUCTURED_LOGGER_HPP
#define OREXA_CORE_STRUCTURED_LOGGER_HPP

#include "orexa/core/types.hpp"
#include "orexa/pal/log_pal.hpp"
#include "orexa/pal/pal_types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace orexa {
namespace core {

/**
 * @brief Configurable log levels.
 *
 * Messages below the configured level are filtered out.
 */
enum class LogLevelConfig {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

std::string logLevelToString(LogLevelConfig level);

/**
 * @brief Parse a level name (case-insensitive, "warn" accepted).
 * @return Corresponding LogLevelConfig, Info for unknown names
 */
LogLevelConfig stringToLogLevel(const std::string& str);

/**
 * @brief Lifecycle events recorded for a managed instance.
 */
enum class InstanceEventType {
    Created,
    Starting,
    Ready,
    Stopped,
    Crashed,
    InstallStarted,
    InstallCompleted,
    InstallFailed,
    RestartScheduled,
    RestartCancelled,
    BackupCreated,
    BackupFailed,
    Deleted
};

std::string instanceEventTypeToString(InstanceEventType eventType);

/**
 * @brief Context attached to error logs.
 */
struct LogContext {
    InstanceId instanceId;
    std::string instanceName;
    ProcessId pid = INVALID_PROCESS_ID;
    int32_t errorCode = 0;

    LogContext() = default;
};

/**
 * @brief Structured logger with JSON format support.
 *
 * Timestamps are ISO 8601 UTC with millisecond precision. In JSON mode every
 * line is one object with "timestamp", "level", "category" and "message"
 * members plus any context fields.
 *
 * ## Thread Safety
 * All methods are thread-safe.
 *
 * ## Usage Example
 * @code
 * auto logger = std::make_shared<StructuredLogger>();
 * logger->setLevel(LogLevelConfig::Info);
 * logger->addSink(std::make_shared<PlatformLogSink>(logPal));
 *
 * logger->info("Supervisor started", "Supervisor");
 * logger->logInstanceEvent(InstanceEventType::Ready, id, "Survival");
 *
 * LogContext ctx;
 * ctx.instanceId = id;
 * ctx.pid = 4242;
 * logger->errorWithContext("Failed to write command", ctx, "Console");
 * @endcode
 */
class StructuredLogger {
public:
    StructuredLogger();

    /**
     * @brief Flushes all sinks.
     */
    ~StructuredLogger();

    // Non-copyable, non-movable
    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;
    StructuredLogger(StructuredLogger&&) = delete;
    StructuredLogger& operator=(StructuredLogger&&) = delete;

    // =========================================================================
    // Configuration
    // =========================================================================

    void setLevel(LogLevelConfig level);
    LogLevelConfig getLevel() const;

    void setJsonFormat(bool enabled);
    bool isJsonFormat() const;

    // =========================================================================
    // Basic Logging Methods
    // =========================================================================

    void debug(const std::string& message, const std::string& category = "Orexa");
    void info(const std::string& message, const std::string& category = "Orexa");
    void warning(const std::string& message, const std::string& category = "Orexa");
    void error(const std::string& message, const std::string& category = "Orexa");

    // =========================================================================
    // Instance Logging
    // =========================================================================

    /**
     * @brief Log a lifecycle event of a managed instance.
     *
     * Failure events (Crashed, InstallFailed, BackupFailed) are logged at
     * Warning level, everything else at Info.
     *
     * @param detail Optional free text (version, backup name, failure cause)
     */
    void logInstanceEvent(
        InstanceEventType eventType,
        const InstanceId& instanceId,
        const std::string& instanceName,
        const std::string& detail = ""
    );

    /**
     * @brief Log an error with instance context.
     */
    void errorWithContext(
        const std::string& message,
        const LogContext& context,
        const std::string& category = "Orexa"
    );

    // =========================================================================
    // Sink Management
    // =========================================================================

    void addSink(std::shared_ptr<pal::ILogSink> sink);
    void removeSink(std::shared_ptr<pal::ILogSink> sink);
    void flush();

private:
    bool enabled(LogLevelConfig level) const;

    void log(LogLevelConfig level, const std::string& message, const std::string& category);

    void dispatch(LogLevelConfig level, const std::string& formatted, const std::string& category);

    std::string formatMessage(
        LogLevelConfig level,
        const std::string& message,
        const std::string& category,
        const LogContext* context = nullptr
    ) const;

    std::string formatJson(
        LogLevelConfig level,
        const std::string& message,
        const std::string& category,
        const LogContext* context
    ) const;

    std::string formatPlainText(
        LogLevelConfig level,
        const std::string& message,
        const std::string& category,
        const LogContext* context
    ) const;

    static std::string getTimestamp();

    static pal::LogLevel toPalLogLevel(LogLevelConfig level);

    std::atomic<LogLevelConfig> level_{LogLevelConfig::Info};
    std::atomic<bool> jsonFormat_{false};
    mutable std::mutex sinksMutex_;
    std::vector<std::shared_ptr<pal::ILogSink>> sinks_;
};

} // namespace core
} // namespace orexa

#endif // OREXA_CORE_STRUCTURED_LOGGER_HPP
