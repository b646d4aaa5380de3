// Orexa - Game Server Supervisor
// Supervisor Public API Implementation
//
// Wires the Linux platform layer, the artifact providers and the archive
// service into an InstanceManager and sequences its start and shutdown.

#include "orexa/api/supervisor.hpp"
#include "orexa/supervisor/archive_service.hpp"

#if defined(__linux__)
#include "orexa/pal/linux/linux_process_pal.hpp"
#include "orexa/pal/linux/linux_thread_pal.hpp"
#include "orexa/pal/linux/linux_timer_pal.hpp"
using PlatformProcessPAL = orexa::pal::linux::LinuxProcessPAL;
using PlatformThreadPAL = orexa::pal::linux::LinuxThreadPAL;
using PlatformTimerPAL = orexa::pal::linux::LinuxTimerPAL;
#endif

#include <algorithm>
#include <chrono>
#include <mutex>

namespace orexa {
namespace api {

namespace {

constexpr const char* CATEGORY = "Supervisor";

supervisor::InstanceManagerOptions toManagerOptions(const core::Configuration& config) {
    supervisor::InstanceManagerOptions options;
    options.baseDir = config.supervisor.baseDir;
    options.stopTimeout = std::chrono::seconds(config.supervisor.stopTimeoutSeconds);
    options.metricsInterval = std::chrono::milliseconds(config.supervisor.metricsIntervalMs);
    options.autoStartDelay = std::chrono::milliseconds(config.supervisor.autoStartDelayMs);
    options.restart.warning = std::chrono::milliseconds(config.supervisor.restartWarningMs);
    options.restart.settle = std::chrono::milliseconds(config.supervisor.restartSettleMs);
    options.javaPath = config.supervisor.javaPath;
    options.consoleCapacity = config.console.bufferCapacity;
    options.consoleTrimBatch = config.console.trimBatch;
    options.subscriberQueueCapacity = config.console.subscriberQueueCapacity;
    return options;
}

} // anonymous namespace

const std::vector<std::string>& supportedServerTypes() {
    static const std::vector<std::string> TYPES = {
        "paper", "spigot", "purpur", "folia", "vanilla",
        "fabric", "forge", "neoforge", "velocity"
    };
    return TYPES;
}

// =============================================================================
// Supervisor Implementation Class
// =============================================================================

class Supervisor::Impl {
public:
    Impl(const core::Configuration& config, std::shared_ptr<core::StructuredLogger> logger)
        : config_(config)
        , logger_(logger ? std::move(logger) : std::make_shared<core::StructuredLogger>())
        , state_(SupervisorState::Created)
    {
#if defined(__linux__)
        processPal_ = std::make_shared<PlatformProcessPAL>();
        timerPal_ = std::make_shared<PlatformTimerPAL>();
        threadPal_ = std::make_shared<PlatformThreadPAL>();
#endif

        size_t workers = std::max<size_t>(1, config_.supervisor.workerThreads);
        pal::ThreadPoolOptions poolOptions;
        poolOptions.name = "orexa-worker";
        auto pool = threadPal_->createThreadPool(workers, workers, poolOptions);
        if (pool.isSuccess()) {
            pool_ = pool.value();
        } else {
            logger_->error("Failed to create worker pool: " + pool.error().message, CATEGORY);
        }

        std::string mirror = config_.artifactMirrorPath();
        for (const auto& type : supportedServerTypes()) {
            providers_.registerProvider(
                type, std::make_shared<supervisor::LocalArtifactProvider>(mirror, type));
        }

        manager_ = std::make_unique<supervisor::InstanceManager>(
            toManagerOptions(config_), processPal_, timerPal_, threadPal_, pool_,
            providers_, std::make_shared<supervisor::TarArchiveService>(processPal_),
            logger_);
    }

    ~Impl() {
        shutdown();

        // The manager joins its tasks and cancels its timers before the pool
        // and the PALs go away.
        manager_.reset();
        if (pool_ != pal::INVALID_THREAD_POOL_HANDLE) {
            auto destroyed = threadPal_->destroyThreadPool(pool_);
            if (destroyed.isError()) {
                logger_->warning("Failed to destroy worker pool: " + destroyed.error().message,
                                 CATEGORY);
            }
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    core::Result<size_t, core::Error> start() {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_ == SupervisorState::Running) {
            return core::Result<size_t, core::Error>::error(
                core::Error(core::ErrorCode::InvalidState, "supervisor is already running"));
        }
        if (pool_ == pal::INVALID_THREAD_POOL_HANDLE) {
            return core::Result<size_t, core::Error>::error(
                core::Error(core::ErrorCode::NotInitialized, "worker pool is not available"));
        }

        auto loaded = manager_->load();
        if (loaded.isError()) {
            return loaded;
        }

        manager_->autoStartAll();

        auto interval = std::chrono::seconds(config_.supervisor.backupCheckIntervalSeconds);
        auto scheduler = manager_->startBackupScheduler(
            std::chrono::duration_cast<std::chrono::milliseconds>(interval));
        if (scheduler.isError()) {
            logger_->warning("Backup scheduler not started: " + scheduler.error().message, CATEGORY);
        }

        state_ = SupervisorState::Running;
        logger_->info("Supervisor started with " + std::to_string(loaded.value()) +
                      " server(s) from " + config_.supervisor.baseDir, CATEGORY);
        return loaded;
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != SupervisorState::Running) {
                return;
            }
            state_ = SupervisorState::Stopping;
        }

        logger_->info("Stopping all servers", CATEGORY);
        manager_->stopAll();

        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SupervisorState::Stopped;
        logger_->info("Supervisor stopped", CATEGORY);
    }

    SupervisorState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    void registerArtifactProvider(const std::string& type,
                                  std::shared_ptr<supervisor::IArtifactProvider> provider) {
        providers_.registerProvider(type, std::move(provider));
    }

    supervisor::InstanceManager& instances() { return *manager_; }

    const core::Configuration& config() const { return config_; }

    std::shared_ptr<core::StructuredLogger> logger() const { return logger_; }

private:
    core::Configuration config_;
    std::shared_ptr<core::StructuredLogger> logger_;

    std::shared_ptr<pal::IProcessPAL> processPal_;
    std::shared_ptr<pal::ITimerPAL> timerPal_;
    std::shared_ptr<pal::IThreadPAL> threadPal_;
    pal::ThreadPoolHandle pool_ = pal::INVALID_THREAD_POOL_HANDLE;

    supervisor::ArtifactProviderRegistry providers_;
    std::unique_ptr<supervisor::InstanceManager> manager_;

    mutable std::mutex mutex_;
    SupervisorState state_;
};

// =============================================================================
// Supervisor Public Methods
// =============================================================================

Supervisor::Supervisor(const core::Configuration& config,
                       std::shared_ptr<core::StructuredLogger> logger)
    : impl_(std::make_unique<Impl>(config, std::move(logger)))
{
}

Supervisor::~Supervisor() = default;

core::Result<size_t, core::Error> Supervisor::start() {
    return impl_->start();
}

void Supervisor::shutdown() {
    impl_->shutdown();
}

SupervisorState Supervisor::state() const {
    return impl_->state();
}

bool Supervisor::isRunning() const {
    return impl_->state() == SupervisorState::Running;
}

void Supervisor::registerArtifactProvider(const std::string& type,
                                          std::shared_ptr<supervisor::IArtifactProvider> provider) {
    impl_->registerArtifactProvider(type, std::move(provider));
}

supervisor::InstanceManager& Supervisor::instances() {
    return impl_->instances();
}

size_t Supervisor::checkScheduledBackups() {
    return impl_->instances().checkScheduledBackups();
}

const core::Configuration& Supervisor::config() const {
    return impl_->config();
}

std::shared_ptr<core::StructuredLogger> Supervisor::logger() const {
    return impl_->logger();
}

} // namespace api
} // namespace orexa
