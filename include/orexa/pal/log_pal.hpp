// Orexa - Game Server Supervisor
// Platform Abstraction Layer - Logging Interface
//
// This interface abstracts the platform logging facility. On Linux the
// implementation writes to syslog and stderr.

#ifndef OREXA_PAL_LOG_PAL_HPP
#define OREXA_PAL_LOG_PAL_HPP

#include "orexa/pal/pal_types.hpp"

#include <string>
#include <memory>

namespace orexa {
namespace pal {

/**
 * @brief Interface for log output sinks.
 *
 * Log sinks receive formatted log messages and handle output to
 * their respective destinations (console, file, system log, etc.).
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /**
     * @brief Write a log message.
     *
     * @param level Log level of the message
     * @param message Formatted log message
     * @param category Log category (e.g., "Supervisor", "Console")
     * @param context Source context (file, line, function)
     */
    virtual void write(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) = 0;

    /**
     * @brief Flush any buffered output.
     */
    virtual void flush() = 0;

    /**
     * @brief Get the sink name for debugging.
     */
    virtual std::string getName() const = 0;
};

/**
 * @brief Abstract interface for platform-specific logging.
 *
 * ## Thread Safety
 * - All methods are thread-safe
 * - Log messages from different threads may interleave
 * - Sinks must handle concurrent write calls
 *
 * @invariant Messages below minLevel are not processed
 * @invariant All registered sinks receive qualifying messages
 */
class ILogPAL {
public:
    virtual ~ILogPAL() = default;

    // =========================================================================
    // Logging Operations
    // =========================================================================

    /**
     * @brief Log a message.
     *
     * Returns immediately when level is below the minimum level.
     *
     * @param level Severity level of the message
     * @param message The log message
     * @param category Category for filtering/routing
     * @param context Source location context
     */
    virtual void log(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) = 0;

    /**
     * @brief Set the minimum log level.
     */
    virtual void setMinLevel(LogLevel level) = 0;

    /**
     * @brief Get the current minimum log level.
     */
    virtual LogLevel getMinLevel() const = 0;

    /**
     * @brief Flush all log sinks.
     */
    virtual void flush() = 0;

    // =========================================================================
    // Sink Management
    // =========================================================================

    /**
     * @brief Add a log sink.
     *
     * @param sink Sink to add (ownership is shared)
     */
    virtual void addSink(std::shared_ptr<ILogSink> sink) = 0;

    /**
     * @brief Remove a log sink. Unknown sinks are ignored.
     */
    virtual void removeSink(std::shared_ptr<ILogSink> sink) = 0;
};

} // namespace pal
} // namespace orexa

#endif // OREXA_PAL_LOG_PAL_HPP
