// Orexa - Game Server Supervisor
// Instance registry persistence implementation

#include "orexa/supervisor/instance_registry.hpp"
#include "orexa/core/json.hpp"
#include "orexa/core/types.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace orexa {
namespace supervisor {

namespace fs = std::filesystem;

InstanceRegistry::InstanceRegistry(std::string filePath)
    : filePath_(std::move(filePath))
{
}

core::Result<std::vector<InstanceConfig>, core::Error> InstanceRegistry::load() const {
    using ResultType = core::Result<std::vector<InstanceConfig>, core::Error>;

    std::ifstream file(filePath_, std::ios::binary);
    if (!file.is_open()) {
        std::error_code ec;
        if (!fs::exists(filePath_, ec)) {
            return ResultType::success({});
        }
        return ResultType::error(core::Error(core::ErrorCode::FileReadError,
            "failed to read data file", filePath_));
    }

    std::stringstream content;
    content << file.rdbuf();

    std::string text = content.str();
    if (core::trim(text).empty()) {
        return ResultType::success({});
    }

    auto parsed = core::parseJson(text);
    if (parsed.isError()) {
        return ResultType::error(core::Error(core::ErrorCode::RegistryCorrupt,
            "failed to parse data file: " + parsed.error().message, filePath_));
    }

    const core::JsonValue& root = parsed.value();
    if (root.isNull()) {
        return ResultType::success({});
    }
    if (!root.isArray()) {
        return ResultType::error(core::Error(core::ErrorCode::RegistryCorrupt,
            "failed to parse data file: expected an array", filePath_));
    }

    std::vector<InstanceConfig> configs;
    std::set<std::string> seen;
    configs.reserve(root.arrayValue.size());
    for (const auto& element : root.arrayValue) {
        auto config = instanceConfigFromJson(element);
        if (config.isError()) {
            core::Error err = config.error();
            err.context = filePath_;
            return ResultType::error(err);
        }
        if (!seen.insert(config.value().id).second) {
            return ResultType::error(core::Error(core::ErrorCode::RegistryCorrupt,
                "duplicate server id " + config.value().id, filePath_));
        }
        configs.push_back(std::move(config).value());
    }

    return ResultType::success(std::move(configs));
}

core::Result<void, core::Error> InstanceRegistry::save(
    const std::vector<InstanceConfig>& configs) const
{
    core::JsonValue root = core::JsonValue::makeArray();
    for (const auto& config : configs) {
        root.push(instanceConfigToJson(config));
    }
    std::string data = core::toJson(root, 2);

    std::error_code ec;
    fs::path parent = fs::path(filePath_).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }

    std::string tmpFile = filePath_ + ".tmp";
    {
        std::ofstream out(tmpFile, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return core::Result<void, core::Error>::error(core::Error(
                core::ErrorCode::FileWriteError, "failed to write temp file", tmpFile));
        }
        out << data;
        out.flush();
        if (!out.good()) {
            return core::Result<void, core::Error>::error(core::Error(
                core::ErrorCode::FileWriteError, "failed to write temp file", tmpFile));
        }
    }

    if (std::rename(tmpFile.c_str(), filePath_.c_str()) != 0) {
        int err = errno;
        fs::remove(tmpFile, ec);
        return core::Result<void, core::Error>::error(core::Error(
            core::ErrorCode::FileWriteError,
            std::string("failed to rename temp file: ") + std::strerror(err), filePath_));
    }

    return core::Result<void, core::Error>::success();
}

} // namespace supervisor
} // namespace orexa
