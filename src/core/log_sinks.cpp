// Orexa - Game Server Supervisor
// Log sinks implementation

#include "orexa/core/log_sinks.hpp"

#include <filesystem>
#include <vector>
#include <zlib.h>

namespace orexa {
namespace core {

namespace fs = std::filesystem;

// =============================================================================
// gzip Compression
// =============================================================================

Result<void, LogFileError> gzipFile(const std::string& inputPath,
                                    const std::string& outputPath)
{
    std::ifstream inFile(inputPath, std::ios::binary);
    if (!inFile) {
        return Result<void, LogFileError>::error(
            LogFileError(LogFileErrorCode::FileOpenFailed,
                         "Cannot open input file: " + inputPath)
        );
    }

    gzFile gzOut = gzopen(outputPath.c_str(), "wb9");
    if (!gzOut) {
        return Result<void, LogFileError>::error(
            LogFileError(LogFileErrorCode::FileOpenFailed,
                         "Cannot create gzip file: " + outputPath)
        );
    }

    std::vector<char> chunk(64 * 1024);
    bool ok = true;
    while (inFile) {
        inFile.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        std::streamsize got = inFile.gcount();
        if (got <= 0) {
            break;
        }
        if (gzwrite(gzOut, chunk.data(), static_cast<unsigned>(got)) != static_cast<int>(got)) {
            ok = false;
            break;
        }
    }

    if (gzclose(gzOut) != Z_OK) {
        ok = false;
    }

    if (!ok) {
        std::error_code ec;
        fs::remove(outputPath, ec);
        return Result<void, LogFileError>::error(
            LogFileError(LogFileErrorCode::CompressionFailed,
                         "gzwrite failed for: " + outputPath)
        );
    }

    return Result<void, LogFileError>::success();
}

// =============================================================================
// FileSink Implementation
// =============================================================================

FileSink::FileSink(const std::string& filePath)
    : filePath_(filePath)
{
    openFile();
}

FileSink::FileSink(const std::string& filePath, const RotationPolicy& policy)
    : filePath_(filePath)
    , policy_(policy)
{
    openFile();
}

FileSink::~FileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void FileSink::write(pal::LogLevel /*level*/, const std::string& message,
                     const std::string& /*category*/, const pal::LogContext& /*context*/)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (!file_.is_open()) {
        return;
    }

    if (policy_.maxFileSize > 0 && currentSize_ >= policy_.maxFileSize) {
        // A failed rotation keeps appending to the current file
        if (performRotation().isError() && !file_.is_open()) {
            return;
        }
    }

    file_ << message << "\n";
    currentSize_ += message.size() + 1;
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

std::string FileSink::getName() const {
    return "FileSink";
}

bool FileSink::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

uint64_t FileSink::getCurrentFileSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentSize_;
}

Result<void, LogFileError> FileSink::forceRotation() {
    std::lock_guard<std::mutex> lock(mutex_);
    return performRotation();
}

std::string FileSink::backupPath(uint32_t index) const {
    std::string path = filePath_ + "." + std::to_string(index);
    if (policy_.compress) {
        path += ".gz";
    }
    return path;
}

Result<void, LogFileError> FileSink::performRotation() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }

    if (policy_.maxBackupFiles == 0) {
        // Nothing is kept: start over with an empty file
        std::error_code ec;
        fs::remove(filePath_, ec);
    } else {
        shiftBackups();

        std::error_code ec;
        if (policy_.compress) {
            auto compressed = gzipFile(filePath_, backupPath(1));
            if (compressed.isError()) {
                openFile();
                return compressed;
            }
            fs::remove(filePath_, ec);
        } else {
            fs::rename(filePath_, backupPath(1), ec);
        }

        if (ec) {
            openFile();
            return Result<void, LogFileError>::error(
                LogFileError(LogFileErrorCode::RotationFailed,
                             "Failed to rotate log file: " + ec.message())
            );
        }

        removeExcessBackups();
    }

    if (!openFile()) {
        return Result<void, LogFileError>::error(
            LogFileError(LogFileErrorCode::FileOpenFailed,
                         "Failed to open new log file after rotation")
        );
    }

    return Result<void, LogFileError>::success();
}

void FileSink::shiftBackups() {
    // log.(n-1) -> log.n ... log.1 -> log.2; the oldest is overwritten
    for (uint32_t i = policy_.maxBackupFiles; i > 1; --i) {
        std::string from = backupPath(i - 1);
        std::error_code ec;
        if (fs::exists(from, ec)) {
            fs::rename(from, backupPath(i), ec);
        }
    }
}

void FileSink::removeExcessBackups() {
    for (uint32_t i = policy_.maxBackupFiles + 1; i <= policy_.maxBackupFiles + 10; ++i) {
        std::error_code ec;
        fs::remove(filePath_ + "." + std::to_string(i), ec);
        fs::remove(filePath_ + "." + std::to_string(i) + ".gz", ec);
    }
}

bool FileSink::openFile() {
    fs::path path(filePath_);
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
    }

    file_.open(filePath_, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        return false;
    }

    uint64_t size = fs::file_size(filePath_, ec);
    currentSize_ = ec ? 0 : size;
    return true;
}

// =============================================================================
// PlatformLogSink Implementation
// =============================================================================

PlatformLogSink::PlatformLogSink(std::shared_ptr<pal::ILogPAL> logPal)
    : logPal_(std::move(logPal))
{
}

void PlatformLogSink::write(pal::LogLevel level, const std::string& message,
                            const std::string& category, const pal::LogContext& context)
{
    if (logPal_) {
        logPal_->log(level, message, category, context);
    }
}

void PlatformLogSink::flush() {
    if (logPal_) {
        logPal_->flush();
    }
}

std::string PlatformLogSink::getName() const {
    return "PlatformLogSink";
}

} // namespace core
} // namespace orexa
