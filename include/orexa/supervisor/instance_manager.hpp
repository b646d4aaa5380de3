// Orexa - Game Server Supervisor
// Instance manager
//
// Owns every managed instance: the durable configurations, the runtime
// state, the child processes and the per-launch tasks around them. All
// public operations are keyed by instance id and may be called concurrently
// from any thread.
//
// Locking is two-level. The registry lock guards the id -> configuration and
// id -> runtime maps; each instance's lock guards its runtime fields. The
// registry lock may be held while taking an instance lock, never the other
// way round, and neither is held across process I/O or a blocking wait.

#ifndef OREXA_SUPERVISOR_INSTANCE_MANAGER_HPP
#define OREXA_SUPERVISOR_INSTANCE_MANAGER_HPP

#include "orexa/console/console_buffer.hpp"
#include "orexa/core/error_codes.hpp"
#include "orexa/core/result.hpp"
#include "orexa/core/structured_logger.hpp"
#include "orexa/core/types.hpp"
#include "orexa/pal/process_pal.hpp"
#include "orexa/pal/thread_pal.hpp"
#include "orexa/pal/timer_pal.hpp"
#include "orexa/supervisor/archive_service.hpp"
#include "orexa/supervisor/artifact_provider.hpp"
#include "orexa/supervisor/background_tasks.hpp"
#include "orexa/supervisor/backup_scheduler.hpp"
#include "orexa/supervisor/backup_store.hpp"
#include "orexa/supervisor/install_pipeline.hpp"
#include "orexa/supervisor/instance_config.hpp"
#include "orexa/supervisor/instance_lock.hpp"
#include "orexa/supervisor/instance_registry.hpp"
#include "orexa/supervisor/restart_scheduler.hpp"
#include "orexa/supervisor/runtime_state.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace orexa {
namespace supervisor {

/**
 * @brief Tunables of the instance manager.
 */
struct InstanceManagerOptions {
    std::string baseDir = ".";
    std::chrono::seconds stopTimeout{30};
    std::chrono::milliseconds metricsInterval{2000};
    std::chrono::milliseconds autoStartDelay{2000};
    RestartTiming restart;
    std::string javaPath = "java";
    size_t consoleCapacity = 2000;
    size_t consoleTrimBatch = 200;
    size_t subscriberQueueCapacity = 1000;
};

/**
 * @brief Parameters of a new instance.
 */
struct CreateInstanceRequest {
    std::string name;
    std::string type;
    std::string version;
    int32_t port = 25565;
    std::string minRam = "1G";
    std::string maxRam = "2G";
    int32_t maxPlayers = 20;
    std::string flags;
    bool alwaysPreTouch = false;
};

/**
 * @brief Resource settings editable while an instance is not running.
 */
struct InstanceSettings {
    std::string minRam;
    std::string maxRam;
    int32_t maxPlayers = 20;
    int32_t port = 0;
};

/**
 * @brief Random 8-character lower-case hex id from the OpenSSL CSPRNG.
 */
core::Result<std::string, core::Error> generateInstanceId();

/**
 * @brief Rewrite max-players= and server-port= in a server.properties body.
 *
 * CRLF line endings are normalized to LF; missing keys are appended.
 */
std::string rewriteServerProperties(const std::string& content, int32_t maxPlayers, int32_t port);

class InstanceManager : public IScheduledBackupTarget,
                        public IRestartTarget {
public:
    InstanceManager(InstanceManagerOptions options,
                    std::shared_ptr<pal::IProcessPAL> processPal,
                    std::shared_ptr<pal::ITimerPAL> timerPal,
                    std::shared_ptr<pal::IThreadPAL> threadPal,
                    pal::ThreadPoolHandle pool,
                    ArtifactProviderRegistry& providers,
                    std::shared_ptr<IArchiveService> archive,
                    std::shared_ptr<core::StructuredLogger> logger);

    /**
     * @brief Stops timers and loops, kills surviving children and joins
     * every background task.
     */
    ~InstanceManager() override;

    InstanceManager(const InstanceManager&) = delete;
    InstanceManager& operator=(const InstanceManager&) = delete;

    // =========================================================================
    // Supervisor Lifecycle
    // =========================================================================

    /**
     * @brief Read the registry file and create a Stopped runtime per entry.
     * @return Number of instances loaded
     */
    core::Result<size_t, core::Error> load();

    /**
     * @brief Start every autostart instance after the configured delay.
     */
    void autoStartAll();

    core::Result<void, core::Error> startBackupScheduler(std::chrono::milliseconds interval);

    /**
     * @brief Stop the backup scheduler, then every running or booting instance.
     */
    void stopAll();

    // =========================================================================
    // Process Lifecycle
    // =========================================================================

    core::Result<core::InstanceInfo, core::Error> create(const CreateInstanceRequest& request);

    core::Result<void, core::Error> start(const core::InstanceId& id) override;

    /**
     * @brief Start with plugins/ and mods/ renamed aside until the process exits.
     */
    core::Result<void, core::Error> startSafeMode(const core::InstanceId& id);

    /**
     * @brief Graceful stop, escalating to SIGKILL after the stop timeout.
     */
    core::Result<void, core::Error> stop(const core::InstanceId& id) override;

    core::Result<void, core::Error> sendCommand(const core::InstanceId& id,
                                                const std::string& text) override;

    /**
     * @brief Append "> text" to the console as an operator echo.
     */
    core::Result<void, core::Error> recordConsoleCommand(const core::InstanceId& id,
                                                         const std::string& text);

    core::Result<core::InstanceInfo, core::Error> getStatus(const core::InstanceId& id);

    /**
     * @brief Every instance in creation order.
     */
    std::vector<core::InstanceInfo> list();

    // =========================================================================
    // Configuration
    // =========================================================================

    core::Result<core::InstanceInfo, core::Error> rename(const core::InstanceId& id,
                                                         const std::string& name);

    core::Result<core::InstanceInfo, core::Error> updateSettings(const core::InstanceId& id,
                                                                 const InstanceSettings& settings);

    core::Result<core::InstanceInfo, core::Error> setAutoStart(const core::InstanceId& id,
                                                               bool enabled);

    core::Result<core::InstanceInfo, core::Error> setFlags(const core::InstanceId& id,
                                                           const std::string& flags,
                                                           bool alwaysPreTouch);

    core::Result<std::string, core::Error> getServerDir(const core::InstanceId& id);

    core::Result<void, core::Error> remove(const core::InstanceId& id);

    // =========================================================================
    // Restarts and Installs
    // =========================================================================

    core::Result<void, core::Error> scheduleRestart(const core::InstanceId& id,
                                                    std::chrono::seconds delay);

    core::Result<void, core::Error> cancelRestart(const core::InstanceId& id);

    core::Result<void, core::Error> retryInstall(const core::InstanceId& id);

    core::Result<core::InstanceInfo, core::Error> updateVersion(const core::InstanceId& id,
                                                                const std::string& version);

    core::Result<std::vector<core::VersionInfo>, core::Error> getVersions(const std::string& type);

    // =========================================================================
    // Console and Players
    // =========================================================================

    core::Result<console::ConsoleSubscription, core::Error> subscribeConsole(
        const core::InstanceId& id, core::SequenceNumber lastSeq);

    /**
     * @brief Safe to call more than once and after the instance was deleted.
     */
    void unsubscribeConsole(const core::InstanceId& id, console::SubscriberId subscriber);

    core::Result<std::vector<core::PlayerInfo>, core::Error> listPlayers(const core::InstanceId& id);

    core::Result<void, core::Error> kickPlayer(const core::InstanceId& id,
                                               const std::string& player,
                                               const std::string& reason);

    core::Result<void, core::Error> banPlayer(const core::InstanceId& id,
                                              const std::string& player,
                                              const std::string& reason);

    core::Result<void, core::Error> killPlayer(const core::InstanceId& id,
                                               const std::string& player);

    core::Result<core::LatencySupport, core::Error> getLatencySupport(const core::InstanceId& id);

    // =========================================================================
    // Backups
    // =========================================================================

    core::Result<std::vector<core::BackupInfo>, core::Error> listBackups(const core::InstanceId& id);

    core::Result<core::BackupInfo, core::Error> createBackup(const core::InstanceId& id);

    core::Result<void, core::Error> deleteBackup(const core::InstanceId& id,
                                                 const std::string& fileName);

    core::Result<void, core::Error> restoreBackup(const core::InstanceId& id,
                                                  const std::string& fileName);

    core::Result<void, core::Error> setBackupSchedule(const core::InstanceId& id,
                                                      const std::string& cadence);

    core::Result<core::BackupScheduleInfo, core::Error> getBackupSchedule(const core::InstanceId& id);

    /**
     * @brief Run every scheduled backup due now on the calling thread.
     */
    size_t checkScheduledBackups();

    // IScheduledBackupTarget
    std::vector<ScheduledBackupCandidate> scheduledBackupCandidates() override;
    core::Result<core::BackupInfo, core::Error> runScheduledBackup(const core::InstanceId& id) override;

private:
    struct InstanceRef {
        InstanceConfig config;
        std::shared_ptr<InstanceRuntime> runtime;
    };

    core::Result<InstanceRef, core::Error> lookup(const core::InstanceId& id) const;

    std::shared_ptr<InstanceRuntime> makeRuntime() const;

    core::Result<void, core::Error> persist(const RegistryWriteLock& lock);

    /// Caller holds registryMutex_
    std::string backupFolderFor(const std::string& name, const core::InstanceId& id) const;

    core::InstanceInfo buildInfo(const InstanceConfig& config, InstanceRuntime& runtime) const;

    core::Result<core::InstanceInfo, core::Error> infoFor(const core::InstanceId& id);

    core::Result<void, core::Error> launch(const core::InstanceId& id,
                                           std::vector<std::string> safeModeDirs);

    void readOutput(std::shared_ptr<InstanceRuntime> runtime,
                    std::shared_ptr<pal::IChildProcess> child,
                    pal::ProcessStream stream,
                    uint64_t generation,
                    const core::InstanceId& id,
                    const std::string& name);

    void awaitExit(std::shared_ptr<InstanceRuntime> runtime,
                   std::shared_ptr<pal::IChildProcess> child,
                   std::shared_ptr<ExitSignal> exitSignal,
                   std::shared_ptr<MetricsLoop> metrics,
                   uint64_t generation,
                   const core::InstanceId& id,
                   const std::string& name);

    void restoreSafeModeDirs(std::vector<std::string> dirs, const std::string& name);

    void beginInstall(const core::InstanceId& id, const std::string& type,
                      const std::string& version, const std::string& dir,
                      const std::string& name);

    void runInstall(const core::InstanceId& id, const std::string& type,
                    const std::string& version, const std::string& dir,
                    const std::string& name);

    void appendConsoleLine(InstanceRuntime& runtime, const std::string& line);

    InstanceManagerOptions options_;
    std::shared_ptr<pal::IProcessPAL> processPal_;
    std::shared_ptr<pal::ITimerPAL> timerPal_;
    std::shared_ptr<pal::IThreadPAL> threadPal_;
    pal::ThreadPoolHandle pool_;
    std::shared_ptr<core::StructuredLogger> logger_;

    InstanceRegistry registry_;
    BackupStore backups_;
    InstallPipeline installer_;
    BackgroundTasks tasks_;
    std::shared_ptr<RestartScheduler> restarts_;
    std::shared_ptr<BackupScheduler> backupScheduler_;

    mutable RegistryMutex registryMutex_;
    std::vector<core::InstanceId> order_;
    std::map<core::InstanceId, InstanceConfig> configs_;
    std::map<core::InstanceId, std::shared_ptr<InstanceRuntime>> runtimes_;
};

} // namespace supervisor
} // namespace orexa

#endif // OREXA_SUPERVISOR_INSTANCE_MANAGER_HPP
