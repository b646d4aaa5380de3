// Orexa - Game Server Supervisor
// Per-instance backup directories

#ifndef OREXA_SUPERVISOR_BACKUP_STORE_HPP
#define OREXA_SUPERVISOR_BACKUP_STORE_HPP

#include "orexa/core/error_codes.hpp"
#include "orexa/core/result.hpp"
#include "orexa/core/types.hpp"
#include "orexa/supervisor/archive_service.hpp"

#include <ctime>
#include <memory>
#include <string>
#include <vector>

namespace orexa {
namespace supervisor {

/**
 * @brief Name of the directory excluded from every archive.
 */
constexpr const char* BACKUP_EXCLUDE_DIR = "backups";

/**
 * @brief Archive file name for a backup taken at the given time (local time).
 *
 * "backup_2024-05-01_13-45-00.tar.gz"
 */
std::string backupFileName(std::time_t when);

/**
 * @brief Backup folder for an instance.
 *
 * The sanitized name, or "<sanitized>_<id>" when another instance already
 * uses that folder.
 *
 * @param taken Folders of every other instance
 */
std::string backupFolderName(const std::string& instanceName, const core::InstanceId& id,
                             const std::vector<std::string>& taken);

/**
 * @brief Backup archives of all instances, one folder per instance.
 *
 * Folders are named by the caller (see backupFolderName) and sanitized
 * again here so no folder escapes the root.
 *
 * The store holds no state besides its root; concurrent calls for the same
 * instance are serialized by the caller's instance state checks.
 */
class BackupStore {
public:
    BackupStore(std::string backupRoot, std::shared_ptr<IArchiveService> archive);

    BackupStore(const BackupStore&) = delete;
    BackupStore& operator=(const BackupStore&) = delete;

    /**
     * @brief `<root>/<sanitized folder>`.
     */
    std::string dirFor(const std::string& folder) const;

    /**
     * @brief Archive files, newest first. A missing directory lists as empty.
     */
    core::Result<std::vector<core::BackupInfo>, core::Error> list(
        const std::string& folder) const;

    /**
     * @brief Archive instanceDir into a new timestamped file.
     *
     * The archive is staged under a hidden name and published with a
     * suffix ("_1", "_2") when a backup of the same second already exists.
     * A failed run leaves earlier backups untouched.
     */
    core::Result<core::BackupInfo, core::Error> create(const std::string& folder,
                                                       const std::string& instanceDir);

    core::Result<void, core::Error> remove(const std::string& folder,
                                           const std::string& fileName);

    /**
     * @brief Replace the contents of instanceDir with the archive's.
     */
    core::Result<void, core::Error> restore(const std::string& folder,
                                            const std::string& fileName,
                                            const std::string& instanceDir);

    /**
     * @brief Move backups to a new folder after a rename.
     *
     * The old directory is renamed when the new one does not exist yet.
     * Otherwise each archive is moved over; a name that already exists
     * becomes "name(1).ext", "name(2).ext" and so on.
     */
    core::Result<void, core::Error> migrate(const std::string& oldFolder,
                                            const std::string& newFolder);

    /**
     * @brief Remove a backup folder and everything in it.
     */
    core::Result<void, core::Error> removeAll(const std::string& folder);

    /**
     * @brief Resolve fileName inside dir, rejecting anything that escapes it.
     */
    static core::Result<std::string, core::Error> resolveInside(const std::string& dir,
                                                                const std::string& fileName);

    const std::string& root() const { return root_; }

private:
    std::string root_;
    std::shared_ptr<IArchiveService> archive_;
};

} // namespace supervisor
} // namespace orexa

#endif // OREXA_SUPERVISOR_BACKUP_STORE_HPP
