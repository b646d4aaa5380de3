// Orexa - Game Server Supervisor
// Per-instance backup directories implementation

#include "orexa/supervisor/backup_store.hpp"

#include "orexa/supervisor/backup_scheduler.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace orexa {
namespace supervisor {

namespace {

core::Error ioError(core::ErrorCode code, const std::string& message,
                    const std::string& path, const std::error_code& ec) {
    return core::Error(code, message + ": " + ec.message(), path);
}

constexpr const char* BACKUP_EXTENSION = ".tar.gz";
constexpr const char* STAGING_PATTERN = ".backup-XXXXXX";

struct ArchiveEntry {
    core::BackupInfo info;
    std::time_t mtime = 0;
};

} // anonymous namespace

std::string backupFileName(std::time_t when) {
    struct tm local{};
    localtime_r(&when, &local);
    char buffer[64];
    std::strftime(buffer, sizeof(buffer), "backup_%Y-%m-%d_%H-%M-%S.tar.gz", &local);
    return buffer;
}

std::string backupFolderName(const std::string& instanceName, const core::InstanceId& id,
                             const std::vector<std::string>& taken)
{
    std::string folder = core::sanitizeName(instanceName);
    if (std::find(taken.begin(), taken.end(), folder) != taken.end()) {
        folder += "_" + id;
    }
    return folder;
}

BackupStore::BackupStore(std::string backupRoot, std::shared_ptr<IArchiveService> archive)
    : root_(std::move(backupRoot))
    , archive_(std::move(archive))
{
}

std::string BackupStore::dirFor(const std::string& folder) const {
    return (fs::path(root_) / core::sanitizeName(folder)).string();
}

core::Result<std::vector<core::BackupInfo>, core::Error> BackupStore::list(
    const std::string& folder) const
{
    std::string dir = dirFor(folder);
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return core::Result<std::vector<core::BackupInfo>, core::Error>::success({});
    }

    std::vector<ArchiveEntry> entries;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return core::Result<std::vector<core::BackupInfo>, core::Error>::error(
            ioError(core::ErrorCode::FileReadError, "failed to read backup directory", dir, ec));
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        std::string fileName = it->path().filename().string();
        if (fileName.empty() || fileName[0] == '.') {
            continue;
        }
        struct stat st{};
        if (::stat(it->path().c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
            continue;
        }
        ArchiveEntry entry;
        entry.info.name = fileName;
        entry.info.sizeBytes = static_cast<uint64_t>(st.st_size);
        entry.info.size = core::formatFileSize(entry.info.sizeBytes);
        entry.info.date = formatRfc3339Utc(st.st_mtime);
        entry.mtime = st.st_mtime;
        entries.push_back(std::move(entry));
    }

    std::stable_sort(entries.begin(), entries.end(),
        [](const ArchiveEntry& a, const ArchiveEntry& b) {
            if (a.mtime != b.mtime) {
                return a.mtime > b.mtime;
            }
            return a.info.name > b.info.name;
        });

    std::vector<core::BackupInfo> backups;
    backups.reserve(entries.size());
    for (auto& entry : entries) {
        backups.push_back(std::move(entry.info));
    }
    return core::Result<std::vector<core::BackupInfo>, core::Error>::success(std::move(backups));
}

core::Result<core::BackupInfo, core::Error> BackupStore::create(const std::string& folder,
                                                                const std::string& instanceDir)
{
    std::string dir = dirFor(folder);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return core::Result<core::BackupInfo, core::Error>::error(
            ioError(core::ErrorCode::BackupFailed, "failed to create backup directory", dir, ec));
    }

    std::time_t now = std::time(nullptr);

    // Archive into a private staging file first; a failed run never touches
    // a published backup
    std::string pattern = (fs::path(dir) / STAGING_PATTERN).string();
    std::vector<char> staging(pattern.begin(), pattern.end());
    staging.push_back('\0');
    int fd = ::mkstemp(staging.data());
    if (fd < 0) {
        return core::Result<core::BackupInfo, core::Error>::error(
            core::Error(core::ErrorCode::BackupFailed,
                        std::string("failed to create staging file: ") + std::strerror(errno), dir));
    }
    ::close(fd);
    std::string stagingPath = staging.data();

    auto archived = archive_->createArchive(instanceDir, stagingPath, {BACKUP_EXCLUDE_DIR});
    if (archived.isError()) {
        fs::remove(stagingPath, ec);
        return core::Result<core::BackupInfo, core::Error>::error(archived.error());
    }

    // link() refuses an existing name, so two backups in the same second
    // get "_1", "_2" and so on instead of overwriting each other
    std::string base = backupFileName(now);
    std::string stem = base.substr(0, base.size() - std::strlen(BACKUP_EXTENSION));
    std::string name;
    std::string path;
    for (int suffix = 0;; suffix++) {
        name = suffix == 0 ? base : stem + "_" + std::to_string(suffix) + BACKUP_EXTENSION;
        path = (fs::path(dir) / name).string();
        if (::link(stagingPath.c_str(), path.c_str()) == 0) {
            break;
        }
        if (errno != EEXIST) {
            int savedErrno = errno;
            fs::remove(stagingPath, ec);
            return core::Result<core::BackupInfo, core::Error>::error(
                core::Error(core::ErrorCode::BackupFailed,
                            std::string("failed to publish backup archive: ") +
                            std::strerror(savedErrno), path));
        }
    }
    fs::remove(stagingPath, ec);

    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return core::Result<core::BackupInfo, core::Error>::error(
            core::Error(core::ErrorCode::BackupFailed,
                        std::string("backup archive missing after creation: ") + std::strerror(errno),
                        path));
    }

    core::BackupInfo info;
    info.name = name;
    info.sizeBytes = static_cast<uint64_t>(st.st_size);
    info.size = core::formatFileSize(info.sizeBytes);
    info.date = formatRfc3339Utc(st.st_mtime);
    return core::Result<core::BackupInfo, core::Error>::success(std::move(info));
}

core::Result<void, core::Error> BackupStore::remove(const std::string& folder,
                                                    const std::string& fileName)
{
    auto resolved = resolveInside(dirFor(folder), fileName);
    if (resolved.isError()) {
        return core::Result<void, core::Error>::error(resolved.error());
    }

    std::error_code ec;
    if (!fs::remove(resolved.value(), ec)) {
        if (ec) {
            return core::Result<void, core::Error>::error(
                ioError(core::ErrorCode::FileWriteError, "failed to delete backup",
                        resolved.value(), ec));
        }
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::BackupNotFound, "backup " + fileName + " not found"));
    }
    return core::Result<void, core::Error>::success();
}

core::Result<void, core::Error> BackupStore::restore(const std::string& folder,
                                                     const std::string& fileName,
                                                     const std::string& instanceDir)
{
    auto resolved = resolveInside(dirFor(folder), fileName);
    if (resolved.isError()) {
        return core::Result<void, core::Error>::error(resolved.error());
    }

    std::error_code ec;
    if (!fs::is_regular_file(resolved.value(), ec)) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::BackupNotFound, "backup " + fileName + " not found"));
    }

    fs::create_directories(instanceDir, ec);
    fs::directory_iterator it(instanceDir, ec);
    if (ec) {
        return core::Result<void, core::Error>::error(
            ioError(core::ErrorCode::RestoreFailed, "failed to read server directory",
                    instanceDir, ec));
    }
    std::vector<fs::path> existing;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        existing.push_back(it->path());
    }
    for (const auto& path : existing) {
        fs::remove_all(path, ec);
        if (ec) {
            return core::Result<void, core::Error>::error(
                ioError(core::ErrorCode::RestoreFailed, "failed to clear server directory",
                        path.string(), ec));
        }
    }

    return archive_->extractArchive(resolved.value(), instanceDir);
}

core::Result<void, core::Error> BackupStore::migrate(const std::string& oldFolder,
                                                     const std::string& newFolder)
{
    std::string oldDir = dirFor(oldFolder);
    std::string newDir = dirFor(newFolder);
    if (oldDir == newDir) {
        return core::Result<void, core::Error>::success();
    }

    std::error_code ec;
    if (!fs::exists(oldDir, ec)) {
        return core::Result<void, core::Error>::success();
    }

    if (!fs::exists(newDir, ec)) {
        fs::create_directories(fs::path(newDir).parent_path(), ec);
        fs::rename(oldDir, newDir, ec);
        if (ec) {
            return core::Result<void, core::Error>::error(
                ioError(core::ErrorCode::FileWriteError, "failed to move backup directory",
                        oldDir, ec));
        }
        return core::Result<void, core::Error>::success();
    }

    std::vector<fs::path> archives;
    for (fs::directory_iterator it(oldDir, ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        archives.push_back(it->path());
    }
    if (ec) {
        return core::Result<void, core::Error>::error(
            ioError(core::ErrorCode::FileReadError, "failed to read backup directory", oldDir, ec));
    }

    for (const auto& source : archives) {
        fs::path target = fs::path(newDir) / source.filename();
        std::string stem = source.stem().string();
        std::string extension = source.extension().string();
        for (int suffix = 1; fs::exists(target, ec); suffix++) {
            target = fs::path(newDir) / (stem + "(" + std::to_string(suffix) + ")" + extension);
        }
        fs::rename(source, target, ec);
        if (ec) {
            return core::Result<void, core::Error>::error(
                ioError(core::ErrorCode::FileWriteError, "failed to move backup",
                        source.string(), ec));
        }
    }

    fs::remove(oldDir, ec);
    return core::Result<void, core::Error>::success();
}

core::Result<void, core::Error> BackupStore::removeAll(const std::string& folder) {
    std::string dir = dirFor(folder);
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        return core::Result<void, core::Error>::error(
            ioError(core::ErrorCode::FileWriteError, "failed to remove backup directory", dir, ec));
    }
    return core::Result<void, core::Error>::success();
}

core::Result<std::string, core::Error> BackupStore::resolveInside(const std::string& dir,
                                                                  const std::string& fileName)
{
    fs::path base = fs::path(dir).lexically_normal();
    fs::path candidate = (base / fileName).lexically_normal();

    fs::path relative = candidate.lexically_relative(base);
    if (fileName.empty() || relative.empty() || relative == "." ||
        *relative.begin() == "..") {
        return core::Result<std::string, core::Error>::error(
            core::Error(core::ErrorCode::PathEscape, "invalid backup name: " + fileName, dir));
    }
    return core::Result<std::string, core::Error>::success(candidate.string());
}

} // namespace supervisor
} // namespace orexa
