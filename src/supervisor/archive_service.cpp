// Orexa - Game Server Supervisor
// Compressed directory archives implementation

#include "orexa/supervisor/archive_service.hpp"

#include "orexa/core/types.hpp"

namespace orexa {
namespace supervisor {

TarArchiveService::TarArchiveService(std::shared_ptr<pal::IProcessPAL> processPal,
                                     std::string tarPath)
    : processPal_(std::move(processPal))
    , tarPath_(std::move(tarPath))
{
}

core::Result<void, core::Error> TarArchiveService::createArchive(
    const std::string& sourceDir,
    const std::string& archivePath,
    const std::vector<std::string>& excludes)
{
    std::vector<std::string> argv = {tarPath_, "-czf", archivePath};
    for (const auto& exclude : excludes) {
        argv.push_back("--exclude=" + exclude);
    }
    argv.push_back("-C");
    argv.push_back(sourceDir);
    argv.push_back(".");

    return run(argv, core::ErrorCode::BackupFailed, "tar failed");
}

core::Result<void, core::Error> TarArchiveService::extractArchive(
    const std::string& archivePath,
    const std::string& destDir)
{
    return run({tarPath_, "-xzf", archivePath, "-C", destDir},
               core::ErrorCode::RestoreFailed, "tar extract failed");
}

core::Result<void, core::Error> TarArchiveService::run(const std::vector<std::string>& argv,
                                                       core::ErrorCode failureCode,
                                                       const std::string& what)
{
    auto result = processPal_->runAndCapture(argv, "");
    if (result.isError()) {
        return core::Result<void, core::Error>::error(
            core::Error(failureCode, what + ": " + result.error().message));
    }

    const pal::CommandOutput& output = result.value();
    if (!output.status.success()) {
        std::string detail = core::trim(output.output);
        if (detail.empty()) {
            detail = output.status.exited
                ? "exit status " + std::to_string(output.status.exitCode)
                : "signal " + std::to_string(output.status.signal);
        }
        return core::Result<void, core::Error>::error(
            core::Error(failureCode, what + ": " + detail));
    }
    return core::Result<void, core::Error>::success();
}

} // namespace supervisor
} // namespace orexa
