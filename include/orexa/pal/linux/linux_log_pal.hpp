// Orexa - Game Server Supervisor
// Linux Log PAL Implementation
//
// Writes to syslog (ident "orexa") and optionally mirrors to stderr.

#ifndef OREXA_PAL_LINUX_LINUX_LOG_PAL_HPP
#define OREXA_PAL_LINUX_LINUX_LOG_PAL_HPP

#include "orexa/pal/log_pal.hpp"
#include "orexa/pal/pal_types.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <vector>

#if defined(__linux__)

namespace orexa {
namespace pal {
namespace linux {

/**
 * @brief Linux implementation of ILogPAL.
 *
 * Messages at or above the minimum level go to syslog (when enabled), to
 * stderr (when enabled) and to every registered sink.
 */
class LinuxLogPAL : public ILogPAL {
public:
    /**
     * @param useSyslog Open a syslog connection for platform logging
     * @param mirrorToStderr Also write each message to stderr
     */
    explicit LinuxLogPAL(bool useSyslog = true, bool mirrorToStderr = true);

    ~LinuxLogPAL() override;

    // Non-copyable, non-movable
    LinuxLogPAL(const LinuxLogPAL&) = delete;
    LinuxLogPAL& operator=(const LinuxLogPAL&) = delete;
    LinuxLogPAL(LinuxLogPAL&&) = delete;
    LinuxLogPAL& operator=(LinuxLogPAL&&) = delete;

    // =========================================================================
    // ILogPAL Implementation
    // =========================================================================

    void log(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) override;

    void setMinLevel(LogLevel level) override;

    LogLevel getMinLevel() const override;

    void flush() override;

    void addSink(std::shared_ptr<ILogSink> sink) override;

    void removeSink(std::shared_ptr<ILogSink> sink) override;

private:
    void logToPlatform(LogLevel level, const std::string& message, const std::string& category);

    int toSyslogPriority(LogLevel level) const;

    std::atomic<LogLevel> minLevel_{LogLevel::Info};
    bool syslogOpened_ = false;
    bool mirrorToStderr_ = true;

    std::mutex stderrMutex_;
    mutable std::mutex sinksMutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
};

} // namespace linux
} // namespace pal
} // namespace orexa

#endif // defined(__linux__)
#endif // OREXA_PAL_LINUX_LINUX_LOG_PAL_HPP
