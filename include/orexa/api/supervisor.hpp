// Orexa - Game Server Supervisor
// Supervisor Public API - Main entry point
//
// Responsibilities:
// - Build the platform layer (process, timer and thread PALs, worker pool)
// - Register the bundled artifact providers for every supported flavor
// - Own the instance manager and drive its start/shutdown sequence
// - Ensure thread-safe method invocation from any thread

#ifndef OREXA_API_SUPERVISOR_HPP
#define OREXA_API_SUPERVISOR_HPP

#include "orexa/core/config_manager.hpp"
#include "orexa/core/error_codes.hpp"
#include "orexa/core/result.hpp"
#include "orexa/core/structured_logger.hpp"
#include "orexa/supervisor/artifact_provider.hpp"
#include "orexa/supervisor/instance_manager.hpp"

#include <memory>
#include <string>
#include <vector>

namespace orexa {
namespace api {

// =============================================================================
// Supervisor State Enumeration
// =============================================================================

/**
 * @brief Supervisor lifecycle state enumeration.
 */
enum class SupervisorState {
    Created,    ///< Constructed, registry not loaded
    Running,    ///< Registry loaded, schedulers active
    Stopping,   ///< stopAll in progress
    Stopped     ///< Every instance stopped
};

inline const char* supervisorStateToString(SupervisorState state) {
    switch (state) {
        case SupervisorState::Created:  return "Created";
        case SupervisorState::Running:  return "Running";
        case SupervisorState::Stopping: return "Stopping";
        case SupervisorState::Stopped:  return "Stopped";
        default:                        return "Unknown";
    }
}

/**
 * @brief Flavors served by the bundled local mirror provider.
 */
const std::vector<std::string>& supportedServerTypes();

// =============================================================================
// Supervisor
// =============================================================================

/**
 * @brief Game server supervisor.
 *
 * Wraps an InstanceManager together with the Linux platform layer it runs
 * on. Instance operations are reached through instances().
 *
 * @code
 * core::ConfigManager configManager;
 * configManager.loadDefaults();
 *
 * api::Supervisor supervisor(configManager.getConfig(), logger);
 * auto started = supervisor.start();
 * if (started.isError()) {
 *     return 1;
 * }
 *
 * supervisor::CreateInstanceRequest request;
 * request.name = "Survival";
 * request.type = "paper";
 * request.version = "latest";
 * auto info = supervisor.instances().create(request);
 *
 * // ... on shutdown
 * supervisor.shutdown();
 * @endcode
 */
class Supervisor {
public:
    /**
     * @param config Effective configuration
     * @param logger Shared logger; a sink-less logger is created when null
     */
    explicit Supervisor(const core::Configuration& config,
                        std::shared_ptr<core::StructuredLogger> logger = nullptr);

    /**
     * @brief Stops every instance that is still live.
     */
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /**
     * @brief Load the registry, autostart instances and start the backup
     * scheduler.
     *
     * @return Number of instances loaded
     */
    core::Result<size_t, core::Error> start();

    /**
     * @brief Stop the backup scheduler and every live instance.
     *
     * Idempotent.
     */
    void shutdown();

    SupervisorState state() const;

    bool isRunning() const;

    // -------------------------------------------------------------------------
    // Components
    // -------------------------------------------------------------------------

    /**
     * @brief Replace or add the artifact provider of a flavor.
     */
    void registerArtifactProvider(const std::string& type,
                                  std::shared_ptr<supervisor::IArtifactProvider> provider);

    supervisor::InstanceManager& instances();

    /**
     * @brief Run every due scheduled backup now.
     */
    size_t checkScheduledBackups();

    const core::Configuration& config() const;

    std::shared_ptr<core::StructuredLogger> logger() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace api
} // namespace orexa

#endif // OREXA_API_SUPERVISOR_HPP
