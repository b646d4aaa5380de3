// Orexa - Game Server Supervisor
// Durable per-instance configuration

#ifndef OREXA_SUPERVISOR_INSTANCE_CONFIG_HPP
#define OREXA_SUPERVISOR_INSTANCE_CONFIG_HPP

#include "orexa/core/error_codes.hpp"
#include "orexa/core/json.hpp"
#include "orexa/core/result.hpp"
#include "orexa/core/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace orexa {
namespace supervisor {

constexpr const char* DEFAULT_JAR_FILE = "server.jar";
constexpr uint16_t MIN_INSTANCE_PORT = 1024;

/**
 * @brief Everything about an instance that survives a supervisor restart.
 *
 * Persisted as one element of the registry array. Optional members
 * (startCommand, backupDir, backupSchedule, lastScheduledBackup) are
 * omitted from the document when empty.
 */
struct InstanceConfig {
    core::InstanceId id;
    std::string name;
    std::string type;                       ///< paper, vanilla, fabric, forge, velocity, ...
    std::string version;
    uint16_t port = 0;
    std::string jarFile = DEFAULT_JAR_FILE;
    std::string maxRam;                     ///< JVM size string, e.g. "4G"
    std::string minRam;
    int32_t maxPlayers = 20;
    std::string dir;                        ///< Working directory
    std::vector<std::string> startCommand;  ///< Overrides the java launch when set
    bool autoStart = false;
    std::string flags;                      ///< JVM flag preset name
    bool alwaysPreTouch = false;
    std::string backupDir;                  ///< Folder under the backup root
    std::string backupSchedule;             ///< "", daily, weekly, monthly, sixmonths, yearly
    std::string lastScheduledBackup;        ///< RFC 3339 UTC
};

core::JsonValue instanceConfigToJson(const InstanceConfig& config);

/**
 * @brief Read one registry element.
 *
 * @return RegistryCorrupt when the element is not an object or has no id
 */
core::Result<InstanceConfig, core::Error> instanceConfigFromJson(const core::JsonValue& value);

} // namespace supervisor
} // namespace orexa

#endif // OREXA_SUPERVISOR_INSTANCE_CONFIG_HPP
