// Orexa - Game Server Supervisor
// Server flavor rules implementation

#include "orexa/supervisor/server_flavor.hpp"

#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>

namespace orexa {
namespace supervisor {

namespace fs = std::filesystem;

namespace {

// Lower-cased names of the regular .jar files directly inside dir.
std::vector<std::string> jarNames(const std::string& dir) {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return names;
    }
    for (const auto& entry : it) {
        std::error_code typeEc;
        if (entry.is_directory(typeEc)) {
            continue;
        }
        std::string name = core::toLower(entry.path().filename().string());
        if (name.size() > 4 && name.compare(name.size() - 4, 4, ".jar") == 0) {
            names.push_back(name);
        }
    }
    return names;
}

bool anyJarContains(const std::string& dir, std::initializer_list<const char*> needles) {
    for (const auto& name : jarNames(dir)) {
        for (const char* needle : needles) {
            if (name.find(needle) != std::string::npos) {
                return true;
            }
        }
    }
    return false;
}

} // anonymous namespace

bool isModdedType(const std::string& type) {
    std::string t = core::toLower(type);
    return t == "forge" || t == "fabric" || t == "neoforge";
}

bool isProxyType(const std::string& type) {
    return core::toLower(type) == "velocity";
}

bool isBukkitType(const std::string& type) {
    std::string t = core::toLower(type);
    return t == "paper" || t == "spigot" || t == "purpur" || t == "folia";
}

std::string listCommandForType(const std::string& type) {
    return isBukkitType(type) ? "minecraft:list" : "list";
}

std::optional<std::string> tpsCommandForType(const std::string& type, bool fabricTpsInstalled) {
    std::string t = core::toLower(type);
    if (isBukkitType(t)) {
        return std::string("tps");
    }
    if (t == "forge") {
        return std::string("forge tps");
    }
    if (t == "neoforge") {
        return std::string("neoforge tps");
    }
    if (t == "fabric" && fabricTpsInstalled) {
        return std::string("fabric tps");
    }
    return std::nullopt;
}

std::vector<std::string> buildJvmFlags(const std::string& preset, bool alwaysPreTouch) {
    std::vector<std::string> args;
    if (preset == "aikars") {
        args = {
            "--add-modules=jdk.incubator.vector",
            "-XX:+UseG1GC",
            "-XX:+ParallelRefProcEnabled",
            "-XX:MaxGCPauseMillis=200",
            "-XX:+UnlockExperimentalVMOptions",
            "-XX:+DisableExplicitGC",
            "-XX:G1HeapWastePercent=5",
            "-XX:G1MixedGCCountTarget=4",
            "-XX:InitiatingHeapOccupancyPercent=15",
            "-XX:G1MixedGCLiveThresholdPercent=90",
            "-XX:G1RSetUpdatingPauseTimePercent=5",
            "-XX:SurvivorRatio=32",
            "-XX:+PerfDisableSharedMem",
            "-XX:MaxTenuringThreshold=1",
            "-Dusing.aikars.flags=https://mcflags.emc.gs",
            "-Daikars.new.flags=true",
            "-XX:G1NewSizePercent=30",
            "-XX:G1MaxNewSizePercent=40",
            "-XX:G1HeapRegionSize=8M",
            "-XX:G1ReservePercent=20",
        };
    } else if (preset == "velocity") {
        args = {
            "-XX:+UseG1GC",
            "-XX:G1HeapRegionSize=4M",
            "-XX:+UnlockExperimentalVMOptions",
            "-XX:+ParallelRefProcEnabled",
            "-XX:MaxInlineLevel=15",
        };
    } else if (preset == "modded") {
        args = {
            "-XX:+UseG1GC",
            "-XX:+UnlockExperimentalVMOptions",
            "-XX:MaxGCPauseMillis=50",
            "-XX:+DisableExplicitGC",
            "-XX:G1NewSizePercent=30",
            "-XX:G1MaxNewSizePercent=40",
            "-XX:G1HeapRegionSize=16M",
            "-XX:InitiatingHeapOccupancyPercent=15",
            "-XX:G1MixedGCLiveThresholdPercent=50",
            "-XX:+PerfDisableSharedMem",
        };
    } else {
        // "none", empty and unknown presets
        args = {"--add-modules=jdk.incubator.vector"};
    }

    if (alwaysPreTouch) {
        args.push_back("-XX:+AlwaysPreTouch");
    }
    return args;
}

core::Result<void, core::Error> writeManagedJvmArgs(const std::string& path,
                                                    const std::vector<std::string>& flags)
{
    std::string content = std::string(MANAGED_JVM_ARGS_HEADER) + "\n";
    for (const auto& flag : flags) {
        content += flag + "\n";
    }

    {
        std::ifstream existing(path, std::ios::binary);
        if (existing.is_open()) {
            std::stringstream current;
            current << existing.rdbuf();
            if (current.str() == content) {
                return core::Result<void, core::Error>::success();
            }
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return core::Result<void, core::Error>::error(core::Error(
            core::ErrorCode::FileWriteError, "failed to write " + std::string(JVM_ARGS_FILE), path));
    }
    out << content;
    if (!out.good()) {
        return core::Result<void, core::Error>::error(core::Error(
            core::ErrorCode::FileWriteError, "failed to write " + std::string(JVM_ARGS_FILE), path));
    }
    return core::Result<void, core::Error>::success();
}

std::vector<std::string> buildLaunchCommand(const InstanceConfig& config,
                                            const std::string& javaPath)
{
    std::vector<std::string> argv;
    argv.push_back(javaPath);
    argv.push_back("-Xmx" + config.maxRam);
    argv.push_back("-Xms" + config.minRam);
    for (auto& flag : buildJvmFlags(config.flags, config.alwaysPreTouch)) {
        argv.push_back(std::move(flag));
    }
    argv.push_back("-jar");
    argv.push_back(config.jarFile);
    argv.push_back("nogui");
    return argv;
}

bool hasFabricTps(const std::string& modsDir) {
    return anyJarContains(modsDir, {"fabric-tps", "fabric_tps", "fabrictps"});
}

core::LatencySupport detectLatencySupport(const std::string& type, const std::string& instanceDir) {
    core::LatencySupport support;

    if (isModdedType(type)) {
        support.supported = anyJarContains((fs::path(instanceDir) / "mods").string(),
            {"player-ping", "player_ping", "playerping", "pingplayer"});
        if (!support.supported) {
            support.reason = "missing_pingplayer_mod";
        }
        return support;
    }

    if (core::toLower(type) == "vanilla") {
        support.reason = "unsupported_server_type";
        return support;
    }

    support.supported = anyJarContains((fs::path(instanceDir) / "plugins").string(),
        {"pingplayer"});
    if (!support.supported) {
        support.reason = "missing_pingplayer";
    }
    return support;
}

} // namespace supervisor
} // namespace orexa
