// Orexa - Game Server Supervisor
// Server flavor rules
//
// Per-flavor knowledge the supervisor needs without talking to the server:
// which status commands it understands, which JVM flags a preset expands to,
// and whether per-player latency polling is available.

#ifndef OREXA_SUPERVISOR_SERVER_FLAVOR_HPP
#define OREXA_SUPERVISOR_SERVER_FLAVOR_HPP

#include "orexa/core/error_codes.hpp"
#include "orexa/core/result.hpp"
#include "orexa/core/types.hpp"
#include "orexa/supervisor/instance_config.hpp"

#include <optional>
#include <string>
#include <vector>

namespace orexa {
namespace supervisor {

constexpr const char* MANAGED_JVM_ARGS_HEADER = "# JVM flags managed by Orexa";
constexpr const char* JVM_ARGS_FILE = "user_jvm_args.txt";
constexpr const char* DISABLED_DIR_SUFFIX = "_disabled";

/// forge, fabric, neoforge
bool isModdedType(const std::string& type);

/// velocity
bool isProxyType(const std::string& type);

/// paper, spigot, purpur, folia
bool isBukkitType(const std::string& type);

/**
 * @brief Command that lists online players.
 */
std::string listCommandForType(const std::string& type);

/**
 * @brief Command that reports ticks per second, if the flavor has one.
 *
 * Fabric needs a fabric-tps mod; pass whether one is installed.
 * Proxies never report TPS.
 */
std::optional<std::string> tpsCommandForType(const std::string& type, bool fabricTpsInstalled);

/**
 * @brief Expand a JVM flag preset (aikars, velocity, modded, none).
 *
 * Unknown presets get the baseline vector-module flag.
 */
std::vector<std::string> buildJvmFlags(const std::string& preset, bool alwaysPreTouch);

/**
 * @brief Write the preset flags to user_jvm_args.txt for script launches.
 *
 * The file is left untouched when its content already matches.
 */
core::Result<void, core::Error> writeManagedJvmArgs(const std::string& path,
                                                    const std::vector<std::string>& flags);

/**
 * @brief argv for the default launch: java -Xmx -Xms <flags> -jar <jar> nogui.
 */
std::vector<std::string> buildLaunchCommand(const InstanceConfig& config,
                                            const std::string& javaPath);

/**
 * @brief A fabric-tps mod jar is present in modsDir.
 */
bool hasFabricTps(const std::string& modsDir);

/**
 * @brief Decide whether per-player latency polling works for an instance.
 *
 * Modded flavors need a player-ping mod, vanilla cannot, everything else
 * needs the PingPlayer plugin.
 */
core::LatencySupport detectLatencySupport(const std::string& type, const std::string& instanceDir);

} // namespace supervisor
} // namespace orexa

#endif // OREXA_SUPERVISOR_SERVER_FLAVOR_HPP
