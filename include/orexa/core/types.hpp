// Orexa - Game Server Supervisor
// Common type definitions

#ifndef OREXA_CORE_TYPES_HPP
#define OREXA_CORE_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace orexa {
namespace core {

// Type aliases for IDs
using InstanceId = std::string;
using SequenceNumber = uint64_t;
using ProcessId = int32_t;

constexpr ProcessId INVALID_PROCESS_ID = 0;

/**
 * @brief Lifecycle status of a managed instance.
 *
 * Installing -> {Stopped, Error}
 * Stopped/Crashed/Error -> Booting -> Running -> {Stopped, Crashed}
 * Any state may re-enter Installing through retry or version update.
 */
enum class InstanceStatus {
    Installing,
    Stopped,
    Booting,
    Running,
    Crashed,
    Error
};

const char* instanceStatusToString(InstanceStatus status);

std::optional<InstanceStatus> parseInstanceStatus(const std::string& str);

/**
 * @brief True while a child process is (or is about to be) alive.
 */
inline bool isLiveStatus(InstanceStatus status) {
    return status == InstanceStatus::Running || status == InstanceStatus::Booting;
}

/**
 * @brief True for states from which start/delete/restore are allowed.
 */
inline bool isTerminalStatus(InstanceStatus status) {
    return status == InstanceStatus::Stopped ||
           status == InstanceStatus::Crashed ||
           status == InstanceStatus::Error;
}

/**
 * @brief One buffered console line with its per-launch sequence number.
 */
struct ConsoleEntry {
    SequenceNumber seq = 0;
    std::string line;

    bool operator==(const ConsoleEntry& other) const {
        return seq == other.seq && line == other.line;
    }
};

/**
 * @brief Player roster entry as reported to callers.
 */
struct PlayerInfo {
    std::string name;
    std::string ip;
    int32_t ping = -1;          ///< Latency in ms, -1 when unknown
    std::string world;
    std::string onlineTime;     ///< "1h 5m" or "12m"
};

/**
 * @brief Aggregate status view of one instance.
 */
struct InstanceInfo {
    InstanceId id;
    std::string name;
    std::string type;
    std::string version;
    InstanceStatus status = InstanceStatus::Stopped;
    double cpu = 0.0;           ///< Percent of one core
    uint64_t ramMB = 0;
    double tps = 0.0;
    uint16_t port = 0;
    std::string maxRam;
    std::string minRam;
    int32_t maxPlayers = 0;
    bool autoStart = false;
    std::string flags;
    bool alwaysPreTouch = false;
    std::string installError;
    bool fabricTpsAvailable = false;
};

/**
 * @brief Backup archive descriptor.
 */
struct BackupInfo {
    std::string name;
    std::string date;           ///< RFC 3339
    std::string size;           ///< Human readable
    uint64_t sizeBytes = 0;
};

/**
 * @brief Recurring backup cadence and its bookkeeping.
 */
struct BackupScheduleInfo {
    std::string schedule;
    std::string lastBackup;     ///< RFC 3339 UTC, empty if never
    std::string nextBackup;     ///< RFC 3339 UTC, empty if no cadence
};

/**
 * @brief One version offered by an artifact provider.
 */
struct VersionInfo {
    std::string version;
    bool latest = false;
};

/**
 * @brief Whether per-player latency polling is available for an instance.
 */
struct LatencySupport {
    bool supported = false;
    std::string reason;
};

/**
 * @brief Format a byte count as "512 B", "1.5 KB", "2.0 MB" and so on.
 */
std::string formatFileSize(uint64_t bytes);

/**
 * @brief Make a display name safe for use as a directory name.
 *
 * Spaces become underscores, anything outside [A-Za-z0-9_.-] is removed,
 * and an empty result becomes "server".
 */
std::string sanitizeName(const std::string& name);

/**
 * @brief Trim ASCII whitespace from both ends.
 */
std::string trim(const std::string& str);

/**
 * @brief Lower-case an ASCII string.
 */
std::string toLower(const std::string& str);

/**
 * @brief Split on a delimiter character, keeping empty fields.
 */
std::vector<std::string> split(const std::string& str, char delimiter);

} // namespace core
} // namespace orexa

#endif // OREXA_CORE_TYPES_HPP
