// Orexa - Game Server Supervisor
// Server artifact providers
//
// A provider knows the versions of one server flavor and can place a
// runnable artifact for a version into an instance directory. Providers are
// registered per flavor; the supervisor never talks to an upstream directly.

#ifndef OREXA_SUPERVISOR_ARTIFACT_PROVIDER_HPP
#define OREXA_SUPERVISOR_ARTIFACT_PROVIDER_HPP

#include "orexa/core/error_codes.hpp"
#include "orexa/core/result.hpp"
#include "orexa/core/types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace orexa {
namespace supervisor {

/**
 * @brief Receives human-readable progress messages during a download.
 */
using ProgressCallback = std::function<void(const std::string&)>;

/**
 * @brief Version catalog and artifact download for one flavor.
 */
class IArtifactProvider {
public:
    virtual ~IArtifactProvider() = default;

    /**
     * @brief Known versions, newest first. At most one is marked latest.
     */
    virtual core::Result<std::vector<core::VersionInfo>, core::Error> fetchVersions() = 0;

    /**
     * @brief Place the artifact for version into destDir.
     *
     * On success destDir contains server.jar, and for loader-based flavors
     * possibly a run.sh launcher.
     */
    virtual core::Result<void, core::Error> downloadArtifact(
        const std::string& version,
        const std::string& destDir,
        const ProgressCallback& progress) = 0;
};

/**
 * @brief Flavor name to provider lookup.
 *
 * Flavor names are matched case-insensitively.
 */
class ArtifactProviderRegistry {
public:
    void registerProvider(const std::string& type, std::shared_ptr<IArtifactProvider> provider);

    /**
     * @return ProviderNotFound when no provider serves type
     */
    core::Result<std::shared_ptr<IArtifactProvider>, core::Error> find(const std::string& type) const;

    std::vector<std::string> types() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<IArtifactProvider>> providers_;
};

/**
 * @brief Serves artifacts from a local mirror directory.
 *
 * Layout: `<mirror>/<type>/<version>/server.jar`, with an optional
 * `server.jar.sha256` holding the hex digest (first token of the file) and
 * an optional `run.sh`. Versions are listed in descending version order and
 * the first one is reported as latest.
 */
class LocalArtifactProvider : public IArtifactProvider {
public:
    LocalArtifactProvider(std::string mirrorRoot, std::string type);

    core::Result<std::vector<core::VersionInfo>, core::Error> fetchVersions() override;

    core::Result<void, core::Error> downloadArtifact(
        const std::string& version,
        const std::string& destDir,
        const ProgressCallback& progress) override;

    std::string flavorDir() const;

private:
    std::string mirrorRoot_;
    std::string type_;
};

/**
 * @brief Lower-case hex SHA-256 digest of a file.
 */
core::Result<std::string, core::Error> sha256File(const std::string& path);

/**
 * @brief Order version strings so that "1.20.4" sorts after "1.9".
 *
 * Numeric runs compare numerically, everything else byte-wise.
 */
bool versionLess(const std::string& a, const std::string& b);

} // namespace supervisor
} // namespace orexa

#endif // OREXA_SUPERVISOR_ARTIFACT_PROVIDER_HPP
