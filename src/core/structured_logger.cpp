// Orexa - Game Server Supervisor
// Structured Logging Component Implementation

#include "orexa/core/structured_logger.hpp"
#include "orexa/core/json.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace orexa {
namespace core {

// =============================================================================
// Helper Functions
// =============================================================================

std::string logLevelToString(LogLevelConfig level) {
    switch (level) {
        case LogLevelConfig::Debug:
            return "debug";
        case LogLevelConfig::Info:
            return "info";
        case LogLevelConfig::Warning:
            return "warning";
        case LogLevelConfig::Error:
            return "error";
        default:
            return "info";
    }
}

LogLevelConfig stringToLogLevel(const std::string& str) {
    std::string lower = toLower(trim(str));

    if (lower == "debug" || lower == "trace") {
        return LogLevelConfig::Debug;
    } else if (lower == "info") {
        return LogLevelConfig::Info;
    } else if (lower == "warning" || lower == "warn") {
        return LogLevelConfig::Warning;
    } else if (lower == "error") {
        return LogLevelConfig::Error;
    }

    return LogLevelConfig::Info;
}

std::string instanceEventTypeToString(InstanceEventType eventType) {
    switch (eventType) {
        case InstanceEventType::Created:
            return "created";
        case InstanceEventType::Starting:
            return "starting";
        case InstanceEventType::Ready:
            return "ready";
        case InstanceEventType::Stopped:
            return "stopped";
        case InstanceEventType::Crashed:
            return "crashed";
        case InstanceEventType::InstallStarted:
            return "install_started";
        case InstanceEventType::InstallCompleted:
            return "install_completed";
        case InstanceEventType::InstallFailed:
            return "install_failed";
        case InstanceEventType::RestartScheduled:
            return "restart_scheduled";
        case InstanceEventType::RestartCancelled:
            return "restart_cancelled";
        case InstanceEventType::BackupCreated:
            return "backup_created";
        case InstanceEventType::BackupFailed:
            return "backup_failed";
        case InstanceEventType::Deleted:
            return "deleted";
        default:
            return "unknown";
    }
}

// =============================================================================
// StructuredLogger Implementation
// =============================================================================

StructuredLogger::StructuredLogger() = default;

StructuredLogger::~StructuredLogger() {
    flush();
}

void StructuredLogger::setLevel(LogLevelConfig level) {
    level_.store(level);
}

LogLevelConfig StructuredLogger::getLevel() const {
    return level_.load();
}

void StructuredLogger::setJsonFormat(bool enabled) {
    jsonFormat_.store(enabled);
}

bool StructuredLogger::isJsonFormat() const {
    return jsonFormat_.load();
}

void StructuredLogger::debug(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Debug, message, category);
}

void StructuredLogger::info(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Info, message, category);
}

void StructuredLogger::warning(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Warning, message, category);
}

void StructuredLogger::error(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Error, message, category);
}

void StructuredLogger::logInstanceEvent(
    InstanceEventType eventType,
    const InstanceId& instanceId,
    const std::string& instanceName,
    const std::string& detail)
{
    LogLevelConfig level = LogLevelConfig::Info;
    if (eventType == InstanceEventType::Crashed ||
        eventType == InstanceEventType::InstallFailed ||
        eventType == InstanceEventType::BackupFailed) {
        level = LogLevelConfig::Warning;
    }
    if (!enabled(level)) {
        return;
    }

    const std::string category = "Instance";
    const std::string event = instanceEventTypeToString(eventType);
    std::ostringstream oss;

    if (jsonFormat_.load()) {
        oss << "{";
        oss << "\"timestamp\":\"" << getTimestamp() << "\"";
        oss << ",\"level\":\"" << logLevelToString(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"event\":\"" << event << "\"";
        oss << ",\"instance_id\":\"" << escapeJsonString(instanceId) << "\"";
        if (!instanceName.empty()) {
            oss << ",\"instance_name\":\"" << escapeJsonString(instanceName) << "\"";
        }
        if (!detail.empty()) {
            oss << ",\"detail\":\"" << escapeJsonString(detail) << "\"";
        }
        oss << "}";
    } else {
        oss << "[" << getTimestamp() << "] ";
        oss << "[" << logLevelToString(level) << "] ";
        oss << "[" << category << "] ";
        oss << "Event: " << event;
        oss << ", Instance: " << instanceId;
        if (!instanceName.empty()) {
            oss << " (" << instanceName << ")";
        }
        if (!detail.empty()) {
            oss << ", " << detail;
        }
    }

    dispatch(level, oss.str(), category);
}

void StructuredLogger::errorWithContext(
    const std::string& message,
    const LogContext& context,
    const std::string& category)
{
    if (!enabled(LogLevelConfig::Error)) {
        return;
    }

    dispatch(LogLevelConfig::Error,
             formatMessage(LogLevelConfig::Error, message, category, &context),
             category);
}

void StructuredLogger::addSink(std::shared_ptr<pal::ILogSink> sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void StructuredLogger::removeSink(std::shared_ptr<pal::ILogSink> sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(
        std::remove(sinks_.begin(), sinks_.end(), sink),
        sinks_.end()
    );
}

void StructuredLogger::flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

bool StructuredLogger::enabled(LogLevelConfig level) const {
    return static_cast<int>(level) >= static_cast<int>(level_.load());
}

void StructuredLogger::log(LogLevelConfig level, const std::string& message, const std::string& category) {
    if (!enabled(level)) {
        return;
    }

    dispatch(level, formatMessage(level, message, category), category);
}

void StructuredLogger::dispatch(
    LogLevelConfig level,
    const std::string& formatted,
    const std::string& category)
{
    pal::LogContext palContext;
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        sink->write(toPalLogLevel(level), formatted, category, palContext);
    }
}

std::string StructuredLogger::formatMessage(
    LogLevelConfig level,
    const std::string& message,
    const std::string& category,
    const LogContext* context) const
{
    if (jsonFormat_.load()) {
        return formatJson(level, message, category, context);
    }
    return formatPlainText(level, message, category, context);
}

std::string StructuredLogger::formatJson(
    LogLevelConfig level,
    const std::string& message,
    const std::string& category,
    const LogContext* context) const
{
    std::ostringstream oss;
    oss << "{";
    oss << "\"timestamp\":\"" << getTimestamp() << "\"";
    oss << ",\"level\":\"" << logLevelToString(level) << "\"";
    oss << ",\"category\":\"" << escapeJsonString(category) << "\"";
    oss << ",\"message\":\"" << escapeJsonString(message) << "\"";

    if (context) {
        if (!context->instanceId.empty()) {
            oss << ",\"instance_id\":\"" << escapeJsonString(context->instanceId) << "\"";
        }
        if (!context->instanceName.empty()) {
            oss << ",\"instance_name\":\"" << escapeJsonString(context->instanceName) << "\"";
        }
        if (context->pid != INVALID_PROCESS_ID) {
            oss << ",\"pid\":" << context->pid;
        }
        if (context->errorCode != 0) {
            oss << ",\"error_code\":" << context->errorCode;
        }
    }

    oss << "}";
    return oss.str();
}

std::string StructuredLogger::formatPlainText(
    LogLevelConfig level,
    const std::string& message,
    const std::string& category,
    const LogContext* context) const
{
    std::ostringstream oss;
    oss << "[" << getTimestamp() << "] ";
    oss << "[" << logLevelToString(level) << "] ";
    oss << "[" << category << "] ";
    oss << message;

    if (context) {
        if (!context->instanceId.empty()) {
            oss << " (instance=" << context->instanceId;
            if (!context->instanceName.empty()) {
                oss << " name=" << context->instanceName;
            }
            if (context->pid != INVALID_PROCESS_ID) {
                oss << " pid=" << context->pid;
            }
            if (context->errorCode != 0) {
                oss << " code=" << context->errorCode;
            }
            oss << ")";
        } else if (context->errorCode != 0) {
            oss << " (code=" << context->errorCode << ")";
        }
    }
    return oss.str();
}

std::string StructuredLogger::getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeNow = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tmBuf;
    gmtime_r(&timeNow, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    oss << "Z";
    return oss.str();
}

pal::LogLevel StructuredLogger::toPalLogLevel(LogLevelConfig level) {
    switch (level) {
        case LogLevelConfig::Debug:
            return pal::LogLevel::Debug;
        case LogLevelConfig::Info:
            return pal::LogLevel::Info;
        case LogLevelConfig::Warning:
            return pal::LogLevel::Warning;
        case LogLevelConfig::Error:
            return pal::LogLevel::Error;
        default:
            return pal::LogLevel::Info;
    }
}

} // namespace core
} // namespace orexa
