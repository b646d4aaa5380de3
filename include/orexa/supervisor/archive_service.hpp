// Orexa - Game Server Supervisor
// Compressed directory archives
//
// Backups are gzip-compressed tar archives of an instance directory,
// produced and unpacked by the system tar binary.

#ifndef OREXA_SUPERVISOR_ARCHIVE_SERVICE_HPP
#define OREXA_SUPERVISOR_ARCHIVE_SERVICE_HPP

#include "orexa/core/error_codes.hpp"
#include "orexa/core/result.hpp"
#include "orexa/pal/process_pal.hpp"

#include <memory>
#include <string>
#include <vector>

namespace orexa {
namespace supervisor {

/**
 * @brief Creates and extracts directory archives.
 */
class IArchiveService {
public:
    virtual ~IArchiveService() = default;

    /**
     * @brief Archive the contents of sourceDir into archivePath.
     *
     * Entries are stored relative to sourceDir. Names listed in excludes are
     * skipped wherever they appear.
     */
    virtual core::Result<void, core::Error> createArchive(
        const std::string& sourceDir,
        const std::string& archivePath,
        const std::vector<std::string>& excludes) = 0;

    /**
     * @brief Unpack archivePath into destDir, which must exist.
     */
    virtual core::Result<void, core::Error> extractArchive(
        const std::string& archivePath,
        const std::string& destDir) = 0;
};

/**
 * @brief IArchiveService backed by `tar -czf` / `tar -xzf`.
 */
class TarArchiveService : public IArchiveService {
public:
    explicit TarArchiveService(std::shared_ptr<pal::IProcessPAL> processPal,
                               std::string tarPath = "tar");

    core::Result<void, core::Error> createArchive(
        const std::string& sourceDir,
        const std::string& archivePath,
        const std::vector<std::string>& excludes) override;

    core::Result<void, core::Error> extractArchive(
        const std::string& archivePath,
        const std::string& destDir) override;

private:
    core::Result<void, core::Error> run(const std::vector<std::string>& argv,
                                        core::ErrorCode failureCode,
                                        const std::string& what);

    std::shared_ptr<pal::IProcessPAL> processPal_;
    std::string tarPath_;
};

} // namespace supervisor
} // namespace orexa

#endif // OREXA_SUPERVISOR_ARCHIVE_SERVICE_HPP
