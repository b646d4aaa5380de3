// Orexa - Game Server Supervisor
// Version resolution and artifact installation implementation

#include "orexa/supervisor/install_pipeline.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace orexa {
namespace supervisor {

namespace {

bool usesLauncherScript(const std::string& type) {
    std::string lower = core::toLower(type);
    return lower == "forge" || lower == "neoforge";
}

} // anonymous namespace

InstallPipeline::InstallPipeline(ArtifactProviderRegistry& providers)
    : providers_(providers)
    , versionCache_(std::chrono::duration_cast<std::chrono::milliseconds>(VERSION_CACHE_TTL))
{
}

std::optional<std::string> InstallPipeline::resolveLatest(
    const std::vector<core::VersionInfo>& versions)
{
    if (versions.empty()) {
        return std::nullopt;
    }
    for (const auto& version : versions) {
        if (version.latest && !version.version.empty() &&
            core::toLower(version.version) != "latest") {
            return version.version;
        }
    }
    return versions.front().version;
}

core::Result<InstallOutcome, core::Error> InstallPipeline::run(const InstallRequest& request,
                                                               const ProgressCallback& progress)
{
    auto provider = providers_.find(request.type);
    if (provider.isError()) {
        return core::Result<InstallOutcome, core::Error>::error(provider.error());
    }

    InstallOutcome outcome;
    outcome.resolvedVersion = request.version;

    std::string requested = core::toLower(request.version);
    if (requested.empty() || requested == "latest") {
        auto listed = provider.value()->fetchVersions();
        std::optional<std::string> latest;
        if (listed.isSuccess()) {
            latest = resolveLatest(listed.value());
        }
        if (!latest || latest->empty()) {
            return core::Result<InstallOutcome, core::Error>::error(
                core::Error(core::ErrorCode::VersionResolveFailed,
                            "Failed to resolve latest version", request.type));
        }
        outcome.resolvedVersion = *latest;
    }

    auto downloaded = provider.value()->downloadArtifact(outcome.resolvedVersion, request.dir,
                                                         progress);
    if (downloaded.isError()) {
        return core::Result<InstallOutcome, core::Error>::error(
            core::Error(core::ErrorCode::DownloadFailed,
                        "Download failed: " + downloaded.error().message,
                        downloaded.error().context));
    }

    if (usesLauncherScript(request.type)) {
        fs::path launcher = fs::path(request.dir) / "run.sh";
        std::error_code ec;
        if (fs::is_regular_file(launcher, ec)) {
            fs::permissions(launcher, fs::perms::owner_all | fs::perms::group_read |
                            fs::perms::group_exec | fs::perms::others_read |
                            fs::perms::others_exec, ec);
            outcome.startCommand = std::vector<std::string>{"bash", "run.sh", "nogui"};
            if (progress) {
                progress("Detected run.sh, server will use the Forge/NeoForge launch script.");
            }
        }
    }

    return core::Result<InstallOutcome, core::Error>::success(std::move(outcome));
}

core::Result<std::vector<core::VersionInfo>, core::Error> InstallPipeline::versions(
    const std::string& type)
{
    std::string key = core::toLower(type);
    if (auto cached = versionCache_.get(key)) {
        return core::Result<std::vector<core::VersionInfo>, core::Error>::success(std::move(*cached));
    }

    auto provider = providers_.find(key);
    if (provider.isError()) {
        return core::Result<std::vector<core::VersionInfo>, core::Error>::error(provider.error());
    }

    auto listed = provider.value()->fetchVersions();
    if (listed.isError()) {
        return core::Result<std::vector<core::VersionInfo>, core::Error>::error(
            core::Error(core::ErrorCode::InstallFailed,
                        "failed to fetch versions for " + type + ": " + listed.error().message));
    }

    versionCache_.put(key, listed.value());
    return listed;
}

} // namespace supervisor
} // namespace orexa
