// Orexa - Game Server Supervisor
// Log sinks for the structured logger
//
// FileSink appends formatted lines to a log file and rotates it by size,
// optionally gzip-compressing rotated files. PlatformLogSink forwards lines to
// the platform logging PAL (syslog and stderr on Linux).

#ifndef OREXA_CORE_LOG_SINKS_HPP
#define OREXA_CORE_LOG_SINKS_HPP

#include "orexa/core/result.hpp"
#include "orexa/pal/log_pal.hpp"
#include "orexa/pal/pal_types.hpp"

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace orexa {
namespace core {

enum class LogFileErrorCode {
    Success = 0,
    FileOpenFailed,
    RotationFailed,
    CompressionFailed,
    Unknown
};

struct LogFileError {
    LogFileErrorCode code;
    std::string message;

    LogFileError(LogFileErrorCode c = LogFileErrorCode::Unknown,
                 std::string msg = "")
        : code(c), message(std::move(msg)) {}
};

/**
 * @brief Size-based rotation settings.
 *
 * With maxFileSize 0 the file grows without bound.
 */
struct RotationPolicy {
    uint64_t maxFileSize = 0;       ///< Bytes before rotating
    uint32_t maxBackupFiles = 5;    ///< Rotated files kept (log.1 .. log.N)
    bool compress = false;          ///< gzip rotated files to log.N.gz
};

/**
 * @brief gzip-compress a file with zlib.
 */
Result<void, LogFileError> gzipFile(const std::string& inputPath,
                                    const std::string& outputPath);

/**
 * @brief Appending, rotating log file sink.
 *
 * Rotation shifts log.1 -> log.2 and so on, renames the active file to
 * log.1 (or log.1.gz when compression is on) and reopens a fresh file.
 * Parent directories are created on open.
 */
class FileSink : public pal::ILogSink {
public:
    explicit FileSink(const std::string& filePath);

    FileSink(const std::string& filePath, const RotationPolicy& policy);

    ~FileSink() override;

    // Non-copyable, non-movable
    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;
    FileSink(FileSink&&) = delete;
    FileSink& operator=(FileSink&&) = delete;

    // ILogSink interface
    void write(pal::LogLevel level, const std::string& message,
               const std::string& category, const pal::LogContext& context) override;
    void flush() override;
    std::string getName() const override;

    bool isOpen() const;

    uint64_t getCurrentFileSize() const;

    Result<void, LogFileError> forceRotation();

private:
    Result<void, LogFileError> performRotation();

    void shiftBackups();

    void removeExcessBackups();

    bool openFile();

    std::string backupPath(uint32_t index) const;

    std::string filePath_;
    RotationPolicy policy_;
    mutable std::mutex mutex_;
    std::ofstream file_;
    uint64_t currentSize_ = 0;
};

/**
 * @brief Forwards already formatted lines to a platform log PAL.
 */
class PlatformLogSink : public pal::ILogSink {
public:
    explicit PlatformLogSink(std::shared_ptr<pal::ILogPAL> logPal);

    void write(pal::LogLevel level, const std::string& message,
               const std::string& category, const pal::LogContext& context) override;
    void flush() override;
    std::string getName() const override;

private:
    std::shared_ptr<pal::ILogPAL> logPal_;
};

} // namespace core
} // namespace orexa

#endif // OREXA_CORE_LOG_SINKS_HPP
