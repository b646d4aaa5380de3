// Orexa - Game Server Supervisor
// Version resolution and artifact installation

#ifndef OREXA_SUPERVISOR_INSTALL_PIPELINE_HPP
#define OREXA_SUPERVISOR_INSTALL_PIPELINE_HPP

#include "orexa/core/error_codes.hpp"
#include "orexa/core/result.hpp"
#include "orexa/core/ttl_cache.hpp"
#include "orexa/core/types.hpp"
#include "orexa/supervisor/artifact_provider.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace orexa {
namespace supervisor {

constexpr std::chrono::minutes VERSION_CACHE_TTL{15};

struct InstallRequest {
    std::string type;
    std::string version;        ///< "latest" or empty resolves to the newest
    std::string dir;
};

struct InstallOutcome {
    std::string resolvedVersion;
    /// Set when the flavor ships a launcher script that replaces java -jar
    std::optional<std::vector<std::string>> startCommand;
};

/**
 * @brief Resolves a version and places its artifact into an instance directory.
 *
 * Runs on a background task. The error message of a failed run is the
 * text recorded as the instance's install error.
 */
class InstallPipeline {
public:
    explicit InstallPipeline(ArtifactProviderRegistry& providers);

    InstallPipeline(const InstallPipeline&) = delete;
    InstallPipeline& operator=(const InstallPipeline&) = delete;

    core::Result<InstallOutcome, core::Error> run(const InstallRequest& request,
                                                  const ProgressCallback& progress);

    /**
     * @brief Versions offered for a flavor, cached per lower-cased flavor.
     */
    core::Result<std::vector<core::VersionInfo>, core::Error> versions(const std::string& type);

    /**
     * @brief Pick the version "latest" stands for.
     * @return std::nullopt for an empty list
     */
    static std::optional<std::string> resolveLatest(const std::vector<core::VersionInfo>& versions);

private:
    ArtifactProviderRegistry& providers_;
    core::TtlCache<std::string, std::vector<core::VersionInfo>> versionCache_;
};

} // namespace supervisor
} // namespace orexa

#endif // OREXA_SUPERVISOR_INSTALL_PIPELINE_HPP
