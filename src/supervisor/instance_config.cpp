// Orexa - Game Server Supervisor
// Instance configuration JSON mapping

#include "orexa/supervisor/instance_config.hpp"

namespace orexa {
namespace supervisor {

using core::JsonValue;

JsonValue instanceConfigToJson(const InstanceConfig& config) {
    JsonValue obj = JsonValue::makeObject();
    obj.set("id", JsonValue::makeString(config.id));
    obj.set("name", JsonValue::makeString(config.name));
    obj.set("type", JsonValue::makeString(config.type));
    obj.set("version", JsonValue::makeString(config.version));
    obj.set("port", JsonValue::makeNumber(config.port));
    obj.set("jarFile", JsonValue::makeString(config.jarFile));
    obj.set("maxRam", JsonValue::makeString(config.maxRam));
    obj.set("minRam", JsonValue::makeString(config.minRam));
    obj.set("maxPlayers", JsonValue::makeNumber(config.maxPlayers));
    obj.set("dir", JsonValue::makeString(config.dir));
    if (!config.startCommand.empty()) {
        JsonValue command = JsonValue::makeArray();
        for (const auto& arg : config.startCommand) {
            command.push(JsonValue::makeString(arg));
        }
        obj.set("startCommand", command);
    }
    obj.set("autoStart", JsonValue::makeBool(config.autoStart));
    obj.set("flags", JsonValue::makeString(config.flags));
    obj.set("alwaysPreTouch", JsonValue::makeBool(config.alwaysPreTouch));
    if (!config.backupDir.empty()) {
        obj.set("backupDir", JsonValue::makeString(config.backupDir));
    }
    if (!config.backupSchedule.empty()) {
        obj.set("backupSchedule", JsonValue::makeString(config.backupSchedule));
    }
    if (!config.lastScheduledBackup.empty()) {
        obj.set("lastScheduledBackup", JsonValue::makeString(config.lastScheduledBackup));
    }
    return obj;
}

core::Result<InstanceConfig, core::Error> instanceConfigFromJson(const JsonValue& value) {
    using ResultType = core::Result<InstanceConfig, core::Error>;

    if (!value.isObject()) {
        return ResultType::error(core::Error(core::ErrorCode::RegistryCorrupt,
            "registry entry is not an object"));
    }

    InstanceConfig config;
    config.id = value["id"].getString();
    if (config.id.empty()) {
        return ResultType::error(core::Error(core::ErrorCode::RegistryCorrupt,
            "registry entry has no id"));
    }

    config.name = value["name"].getString();
    config.type = value["type"].getString();
    config.version = value["version"].getString();

    int64_t port = value["port"].getInt();
    if (port < 0 || port > 65535) {
        return ResultType::error(core::Error(core::ErrorCode::RegistryCorrupt,
            "registry entry has an invalid port", config.id));
    }
    config.port = static_cast<uint16_t>(port);

    config.jarFile = value["jarFile"].getString(DEFAULT_JAR_FILE);
    if (config.jarFile.empty()) {
        config.jarFile = DEFAULT_JAR_FILE;
    }
    config.maxRam = value["maxRam"].getString();
    config.minRam = value["minRam"].getString();
    config.maxPlayers = static_cast<int32_t>(value["maxPlayers"].getInt(20));
    config.dir = value["dir"].getString();

    const JsonValue& command = value["startCommand"];
    if (command.isArray()) {
        for (const auto& arg : command.arrayValue) {
            if (arg.isString()) {
                config.startCommand.push_back(arg.stringValue);
            }
        }
    }

    config.autoStart = value["autoStart"].getBool();
    config.flags = value["flags"].getString();
    config.alwaysPreTouch = value["alwaysPreTouch"].getBool();
    config.backupDir = value["backupDir"].getString();
    config.backupSchedule = value["backupSchedule"].getString();
    config.lastScheduledBackup = value["lastScheduledBackup"].getString();

    return ResultType::success(std::move(config));
}

} // namespace supervisor
} // namespace orexa
