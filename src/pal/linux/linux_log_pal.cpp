// Orexa - Game Server Supervisor
// Linux Log PAL Implementation

#include "orexa/pal/linux/linux_log_pal.hpp"

#if defined(__linux__)

#include <syslog.h>
#include <cstdio>

namespace orexa {
namespace pal {
namespace linux {

// =============================================================================
// Constructor / Destructor
// =============================================================================

LinuxLogPAL::LinuxLogPAL(bool useSyslog, bool mirrorToStderr)
    : mirrorToStderr_(mirrorToStderr) {
    if (useSyslog) {
        openlog("orexa", LOG_PID | LOG_NDELAY, LOG_DAEMON);
        syslogOpened_ = true;
    }
}

LinuxLogPAL::~LinuxLogPAL() {
    flush();

    if (syslogOpened_) {
        closelog();
        syslogOpened_ = false;
    }
}

// =============================================================================
// Logging Operations
// =============================================================================

void LinuxLogPAL::log(
    LogLevel level,
    const std::string& message,
    const std::string& category,
    const LogContext& context
) {
    if (level == LogLevel::Off ||
        static_cast<uint32_t>(level) < static_cast<uint32_t>(minLevel_.load())) {
        return;
    }

    logToPlatform(level, message, category);

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        sink->write(level, message, category, context);
    }
}

void LinuxLogPAL::logToPlatform(
    LogLevel level,
    const std::string& message,
    const std::string& category
) {
    if (syslogOpened_) {
        syslog(toSyslogPriority(level), "[%s] %s", category.c_str(), message.c_str());
    }

    // The message arrives fully formatted from the structured logger
    if (mirrorToStderr_) {
        std::lock_guard<std::mutex> lock(stderrMutex_);
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

int LinuxLogPAL::toSyslogPriority(LogLevel level) const {
    switch (level) {
        case LogLevel::Trace:
        case LogLevel::Debug:
            return LOG_DEBUG;
        case LogLevel::Info:
            return LOG_INFO;
        case LogLevel::Warning:
            return LOG_WARNING;
        case LogLevel::Error:
            return LOG_ERR;
        case LogLevel::Critical:
            return LOG_CRIT;
        case LogLevel::Off:
        default:
            return LOG_DEBUG;
    }
}

// =============================================================================
// Level Management
// =============================================================================

void LinuxLogPAL::setMinLevel(LogLevel level) {
    minLevel_ = level;
}

LogLevel LinuxLogPAL::getMinLevel() const {
    return minLevel_.load();
}

// =============================================================================
// Sink Management
// =============================================================================

void LinuxLogPAL::flush() {
    if (mirrorToStderr_) {
        std::lock_guard<std::mutex> lock(stderrMutex_);
        std::fflush(stderr);
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

void LinuxLogPAL::addSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void LinuxLogPAL::removeSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(
        std::remove(sinks_.begin(), sinks_.end(), sink),
        sinks_.end()
    );
}

} // namespace linux
} // namespace pal
} // namespace orexa

#endif // defined(__linux__)
