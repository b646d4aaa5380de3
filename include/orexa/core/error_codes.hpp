// Orexa - Game Server Supervisor
// Common error codes and Error structure

#ifndef OREXA_CORE_ERROR_CODES_HPP
#define OREXA_CORE_ERROR_CODES_HPP

#include <string>
#include <cstdint>

namespace orexa {
namespace core {

/**
 * @brief Error codes reported by supervisor operations.
 *
 * Codes are grouped by range so that callers can classify a failure
 * (validation, lifecycle precondition, external dependency) without
 * matching on individual values.
 */
enum class ErrorCode : uint32_t {
    // General and validation errors (0-99)
    Success = 0,
    Unknown = 1,
    InvalidArgument = 2,
    InvalidState = 3,
    NotInitialized = 4,
    AlreadyExists = 5,
    NotFound = 6,
    NotSupported = 7,
    PortInUse = 8,
    InvalidSchedule = 9,

    // Timeout and cancellation (100-199)
    Timeout = 100,
    Cancelled = 101,

    // Process errors (200-299)
    ProcessError = 200,
    SpawnFailed = 201,
    ArtifactMissing = 202,
    NoInputStream = 203,
    WriteFailed = 204,
    KillFailed = 205,

    // Lifecycle precondition errors (300-399)
    NotRunning = 300,
    AlreadyRunning = 301,
    StillInstalling = 302,
    Busy = 303,
    NoRestartScheduled = 304,
    NotInErrorState = 305,

    // Install errors (400-499)
    InstallFailed = 400,
    ProviderNotFound = 401,
    VersionResolveFailed = 402,
    DownloadFailed = 403,
    ChecksumMismatch = 404,

    // Backup and archive errors (500-599)
    BackupFailed = 500,
    BackupNotFound = 501,
    RestoreFailed = 502,
    PathEscape = 503,

    // Configuration errors (600-699)
    ConfigError = 600,
    ConfigInvalid = 601,
    ConfigNotFound = 602,
    ConfigParseError = 603,
    RegistryCorrupt = 604,

    // I/O errors (900-999)
    IOError = 900,
    FileNotFound = 901,
    FileAccessDenied = 902,
    FileReadError = 903,
    FileWriteError = 904,
};

/**
 * @brief Convert error code to human-readable string.
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::NotInitialized: return "Not initialized";
        case ErrorCode::AlreadyExists: return "Already exists";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::PortInUse: return "Port in use";
        case ErrorCode::InvalidSchedule: return "Invalid schedule";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::ProcessError: return "Process error";
        case ErrorCode::SpawnFailed: return "Spawn failed";
        case ErrorCode::ArtifactMissing: return "Artifact missing";
        case ErrorCode::NoInputStream: return "No input stream";
        case ErrorCode::WriteFailed: return "Write failed";
        case ErrorCode::KillFailed: return "Kill failed";
        case ErrorCode::NotRunning: return "Not running";
        case ErrorCode::AlreadyRunning: return "Already running";
        case ErrorCode::StillInstalling: return "Still installing";
        case ErrorCode::Busy: return "Busy";
        case ErrorCode::NoRestartScheduled: return "No restart scheduled";
        case ErrorCode::NotInErrorState: return "Not in error state";
        case ErrorCode::InstallFailed: return "Install failed";
        case ErrorCode::ProviderNotFound: return "Provider not found";
        case ErrorCode::VersionResolveFailed: return "Version resolve failed";
        case ErrorCode::DownloadFailed: return "Download failed";
        case ErrorCode::ChecksumMismatch: return "Checksum mismatch";
        case ErrorCode::BackupFailed: return "Backup failed";
        case ErrorCode::BackupNotFound: return "Backup not found";
        case ErrorCode::RestoreFailed: return "Restore failed";
        case ErrorCode::PathEscape: return "Path escapes base directory";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::ConfigInvalid: return "Configuration invalid";
        case ErrorCode::ConfigNotFound: return "Configuration not found";
        case ErrorCode::ConfigParseError: return "Configuration parse error";
        case ErrorCode::RegistryCorrupt: return "Registry corrupt";
        case ErrorCode::IOError: return "I/O error";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileAccessDenied: return "File access denied";
        case ErrorCode::FileReadError: return "File read error";
        case ErrorCode::FileWriteError: return "File write error";
        default: return "Unknown error code";
    }
}

/**
 * @brief Check whether a code belongs to the lifecycle precondition range.
 */
inline bool isPreconditionError(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    return (value >= 300 && value < 400) || code == ErrorCode::InvalidState;
}

/**
 * @brief Error structure containing error code, message, and optional context.
 *
 * The message is the operator-facing text; context carries the instance ID
 * or path involved, when there is one.
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;

    Error(ErrorCode c = ErrorCode::Unknown,
          std::string msg = "",
          std::string ctx = "")
        : code(c)
        , message(std::move(msg))
        , context(std::move(ctx)) {}

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == ErrorCode::Success;
    }

    /**
     * @brief Get a formatted error string.
     */
    [[nodiscard]] std::string toString() const {
        std::string result = errorCodeToString(code);
        if (!message.empty()) {
            result += ": " + message;
        }
        if (!context.empty()) {
            result += " [" + context + "]";
        }
        return result;
    }
};

} // namespace core
} // namespace orexa

#endif // OREXA_CORE_ERROR_CODES_HPP
