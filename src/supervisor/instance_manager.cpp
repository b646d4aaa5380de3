// Orexa - Game Server Supervisor
// Instance manager implementation

#include "orexa/supervisor/instance_manager.hpp"

#include "orexa/console/console_parser.hpp"
#include "orexa/supervisor/metrics_loop.hpp"
#include "orexa/supervisor/server_flavor.hpp"

#include <openssl/rand.h>

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace orexa {
namespace supervisor {

namespace {

constexpr const char* CATEGORY = "Supervisor";
constexpr int32_t MAX_INSTANCE_PORT = 65535;
constexpr std::chrono::seconds KILL_REAP_TIMEOUT{5};
constexpr const char* SERVERS_DIR = "Servers";
constexpr const char* BACKUPS_DIR = "Backups";
constexpr const char* REGISTRY_FILE = "data/servers.json";
const char* const SAFE_MODE_DIRS[] = {"plugins", "mods"};

core::Error notFound(const core::InstanceId& id) {
    return core::Error(core::ErrorCode::NotFound, "server " + id + " not found", id);
}

std::string statusName(core::InstanceStatus status) {
    return core::instanceStatusToString(status);
}

std::optional<core::Error> launchRefusal(core::InstanceStatus status, const core::InstanceId& id) {
    if (status == core::InstanceStatus::Installing) {
        return core::Error(core::ErrorCode::StillInstalling,
            "server " + id + " is still installing, please wait", id);
    }
    if (core::isLiveStatus(status)) {
        return core::Error(core::ErrorCode::AlreadyRunning,
            "server " + id + " is already " + statusName(status), id);
    }
    return std::nullopt;
}

std::string describeExit(const pal::ProcessExitStatus& status) {
    if (status.exited) {
        return "exit code " + std::to_string(status.exitCode);
    }
    return "signal " + std::to_string(status.signal);
}

bool writeTextFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out << content;
    return static_cast<bool>(out);
}

std::string initialServerProperties(int32_t port, int32_t maxPlayers) {
    std::ostringstream props;
    props << "server-port=" << port << "\n"
          << "motd=A Minecraft Server\n"
          << "max-players=" << maxPlayers << "\n"
          << "online-mode=true\n"
          << "view-distance=10\n";
    return props.str();
}

} // anonymous namespace

// =============================================================================
// Helpers
// =============================================================================

core::Result<std::string, core::Error> generateInstanceId() {
    unsigned char bytes[4];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        return core::Result<std::string, core::Error>::error(
            core::Error(core::ErrorCode::Unknown, "failed to generate server id"));
    }
    static const char HEX[] = "0123456789abcdef";
    std::string id;
    for (unsigned char byte : bytes) {
        id.push_back(HEX[byte >> 4]);
        id.push_back(HEX[byte & 0x0F]);
    }
    return core::Result<std::string, core::Error>::success(std::move(id));
}

std::string rewriteServerProperties(const std::string& content, int32_t maxPlayers, int32_t port) {
    std::string normalized;
    normalized.reserve(content.size());
    for (size_t i = 0; i < content.size(); i++) {
        if (content[i] == '\r' && i + 1 < content.size() && content[i + 1] == '\n') {
            continue;
        }
        normalized.push_back(content[i]);
    }

    std::vector<std::string> lines = core::split(normalized, '\n');
    bool foundPlayers = false;
    bool foundPort = false;
    for (auto& line : lines) {
        std::string trimmed = line;
        while (!trimmed.empty() && (trimmed.back() == '\r' || trimmed.back() == ' ')) {
            trimmed.pop_back();
        }
        if (trimmed.rfind("max-players=", 0) == 0) {
            line = "max-players=" + std::to_string(maxPlayers);
            foundPlayers = true;
        } else if (trimmed.rfind("server-port=", 0) == 0) {
            line = "server-port=" + std::to_string(port);
            foundPort = true;
        }
    }

    // Keep a trailing newline after any appended keys
    bool trailingNewline = !lines.empty() && lines.back().empty();
    if (trailingNewline) {
        lines.pop_back();
    }
    if (!foundPlayers) {
        lines.push_back("max-players=" + std::to_string(maxPlayers));
    }
    if (!foundPort) {
        lines.push_back("server-port=" + std::to_string(port));
    }

    std::string result;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i > 0) {
            result += "\n";
        }
        result += lines[i];
    }
    if (trailingNewline) {
        result += "\n";
    }
    return result;
}

// =============================================================================
// Construction
// =============================================================================

InstanceManager::InstanceManager(InstanceManagerOptions options,
                                 std::shared_ptr<pal::IProcessPAL> processPal,
                                 std::shared_ptr<pal::ITimerPAL> timerPal,
                                 std::shared_ptr<pal::IThreadPAL> threadPal,
                                 pal::ThreadPoolHandle pool,
                                 ArtifactProviderRegistry& providers,
                                 std::shared_ptr<IArchiveService> archive,
                                 std::shared_ptr<core::StructuredLogger> logger)
    : options_(std::move(options))
    , processPal_(std::move(processPal))
    , timerPal_(std::move(timerPal))
    , threadPal_(std::move(threadPal))
    , pool_(pool)
    , logger_(std::move(logger))
    , registry_((fs::path(options_.baseDir) / REGISTRY_FILE).string())
    , backups_((fs::path(options_.baseDir) / BACKUPS_DIR).string(), std::move(archive))
    , installer_(providers)
    , tasks_(threadPal_)
{
    restarts_ = std::make_shared<RestartScheduler>(*this, timerPal_, tasks_, options_.restart, logger_);
    backupScheduler_ = std::make_shared<BackupScheduler>(*this, timerPal_, threadPal_, pool_, logger_);
}

InstanceManager::~InstanceManager() {
    backupScheduler_->stop();
    tasks_.requestStop();

    std::vector<std::shared_ptr<InstanceRuntime>> runtimes;
    {
        RegistryReadLock lock(registryMutex_);
        for (const auto& entry : runtimes_) {
            runtimes.push_back(entry.second);
        }
    }

    for (const auto& runtime : runtimes) {
        std::shared_ptr<MetricsLoop> metrics;
        std::shared_ptr<pal::IChildProcess> child;
        {
            InstanceLock lock(runtime->mutex);
            restarts_->cancelPending(*runtime, lock);
            metrics = runtime->metrics;
            child = runtime->child;
        }
        if (metrics) {
            metrics->stop();
        }
        if (child) {
            auto killed = child->kill();
            if (killed.isError() && logger_) {
                logger_->warning("Failed to kill server process during shutdown: " +
                                 killed.error().message, CATEGORY);
            }
        }
    }

    tasks_.joinAll();
}

// =============================================================================
// Internal Helpers
// =============================================================================

core::Result<InstanceManager::InstanceRef, core::Error> InstanceManager::lookup(
    const core::InstanceId& id) const
{
    RegistryReadLock lock(registryMutex_);
    auto config = configs_.find(id);
    auto runtime = runtimes_.find(id);
    if (config == configs_.end() || runtime == runtimes_.end()) {
        return core::Result<InstanceRef, core::Error>::error(notFound(id));
    }
    return core::Result<InstanceRef, core::Error>::success(InstanceRef{config->second, runtime->second});
}

std::shared_ptr<InstanceRuntime> InstanceManager::makeRuntime() const {
    return std::make_shared<InstanceRuntime>(options_.consoleCapacity,
                                             options_.consoleTrimBatch,
                                             options_.subscriberQueueCapacity);
}

std::string InstanceManager::backupFolderFor(const std::string& name,
                                             const core::InstanceId& id) const
{
    std::vector<std::string> taken;
    for (const auto& entry : configs_) {
        if (entry.first != id && !entry.second.backupDir.empty()) {
            taken.push_back(entry.second.backupDir);
        }
    }
    return backupFolderName(name, id, taken);
}

core::Result<void, core::Error> InstanceManager::persist(const RegistryWriteLock& /*lock*/) {
    std::vector<InstanceConfig> snapshot;
    snapshot.reserve(order_.size());
    for (const auto& id : order_) {
        auto it = configs_.find(id);
        if (it != configs_.end()) {
            snapshot.push_back(it->second);
        }
    }

    auto saved = registry_.save(snapshot);
    if (saved.isError() && logger_) {
        logger_->error("Failed to persist server registry: " + saved.error().toString(), "Registry");
    }
    return saved;
}

core::InstanceInfo InstanceManager::buildInfo(const InstanceConfig& config,
                                              InstanceRuntime& runtime) const
{
    core::InstanceInfo info;
    info.id = config.id;
    info.name = config.name;
    info.type = config.type;
    info.version = config.version;
    info.port = config.port;
    info.maxRam = config.maxRam;
    info.minRam = config.minRam;
    info.maxPlayers = config.maxPlayers;
    info.autoStart = config.autoStart;
    info.flags = config.flags;
    info.alwaysPreTouch = config.alwaysPreTouch;
    if (core::toLower(config.type) == "fabric") {
        info.fabricTpsAvailable = hasFabricTps((fs::path(config.dir) / "mods").string());
    }

    InstanceLock lock(runtime.mutex);
    info.status = runtime.status;
    info.cpu = runtime.cpu;
    info.ramMB = runtime.ramBytes / (1024 * 1024);
    info.tps = runtime.tps;
    info.installError = runtime.installError;
    return info;
}

core::Result<core::InstanceInfo, core::Error> InstanceManager::infoFor(const core::InstanceId& id) {
    auto ref = lookup(id);
    if (ref.isError()) {
        return core::Result<core::InstanceInfo, core::Error>::error(ref.error());
    }
    return core::Result<core::InstanceInfo, core::Error>::success(
        buildInfo(ref.value().config, *ref.value().runtime));
}

void InstanceManager::appendConsoleLine(InstanceRuntime& runtime, const std::string& line) {
    InstanceLock lock(runtime.mutex);
    core::ConsoleEntry entry = runtime.console.append(line);
    runtime.console.broadcast(entry);
}

// =============================================================================
// Supervisor Lifecycle
// =============================================================================

core::Result<size_t, core::Error> InstanceManager::load() {
    auto loaded = registry_.load();
    if (loaded.isError()) {
        return core::Result<size_t, core::Error>::error(loaded.error());
    }

    RegistryWriteLock lock(registryMutex_);
    size_t count = 0;
    std::vector<core::InstanceId> unassigned;
    for (auto& config : loaded.value()) {
        if (configs_.count(config.id) != 0) {
            continue;
        }
        core::InstanceId id = config.id;
        if (config.backupDir.empty()) {
            unassigned.push_back(id);
        }
        order_.push_back(id);
        runtimes_[id] = makeRuntime();
        configs_[id] = std::move(config);
        count++;
    }

    // Entries written before backup folders were recorded get one derived
    // from the name, suffixed when an earlier entry already holds it
    for (const auto& id : unassigned) {
        InstanceConfig& config = configs_.at(id);
        config.backupDir = backupFolderFor(config.name, id);
    }

    if (logger_) {
        logger_->info("Loaded " + std::to_string(count) + " server(s) from " + registry_.filePath(),
                      "Registry");
    }
    return core::Result<size_t, core::Error>::success(count);
}

void InstanceManager::autoStartAll() {
    std::vector<std::pair<core::InstanceId, std::string>> targets;
    {
        RegistryReadLock lock(registryMutex_);
        for (const auto& id : order_) {
            const InstanceConfig& config = configs_.at(id);
            if (config.autoStart) {
                targets.emplace_back(id, config.name);
            }
        }
    }
    if (targets.empty()) {
        return;
    }

    auto spawned = tasks_.spawn("autostart", [this, targets]() {
        if (!tasks_.sleepFor(options_.autoStartDelay)) {
            return;
        }
        for (const auto& target : targets) {
            if (logger_) {
                logger_->info("Auto-starting server: " + target.second, CATEGORY);
            }
            auto started = start(target.first);
            if (started.isError() && logger_) {
                logger_->warning("Failed to auto-start " + target.second + ": " +
                                 started.error().message, CATEGORY);
            }
        }
    });
    if (spawned.isError() && logger_) {
        logger_->warning("Auto-start skipped: " + spawned.error().message, CATEGORY);
    }
}

core::Result<void, core::Error> InstanceManager::startBackupScheduler(std::chrono::milliseconds interval) {
    auto started = backupScheduler_->start(interval);
    if (started.isSuccess() && logger_) {
        logger_->info("Backup scheduler started", "Backup");
    }
    return started;
}

void InstanceManager::stopAll() {
    backupScheduler_->stop();

    std::vector<core::InstanceId> live;
    {
        RegistryReadLock lock(registryMutex_);
        for (const auto& id : order_) {
            auto& runtime = runtimes_.at(id);
            InstanceLock instanceLock(runtime->mutex);
            if (core::isLiveStatus(runtime->status)) {
                live.push_back(id);
            }
        }
    }

    for (const auto& id : live) {
        if (logger_) {
            logger_->info("Stopping server " + id + "...", CATEGORY);
        }
        auto stopped = stop(id);
        if (stopped.isError() && logger_) {
            logger_->warning("Error stopping server " + id + ": " + stopped.error().message, CATEGORY);
        }
    }
}

// =============================================================================
// Process Lifecycle
// =============================================================================

core::Result<core::InstanceInfo, core::Error> InstanceManager::create(
    const CreateInstanceRequest& request)
{
    using R = core::Result<core::InstanceInfo, core::Error>;

    std::string name = core::trim(request.name);
    if (name.empty()) {
        return R::error(core::Error(core::ErrorCode::InvalidArgument, "server name cannot be empty"));
    }
    if (request.port < MIN_INSTANCE_PORT || request.port > MAX_INSTANCE_PORT) {
        return R::error(core::Error(core::ErrorCode::InvalidArgument,
                                    "port must be between 1024 and 65535"));
    }

    InstanceConfig config;
    std::shared_ptr<InstanceRuntime> runtime;
    {
        RegistryWriteLock lock(registryMutex_);

        for (const auto& entry : configs_) {
            if (entry.second.port == request.port) {
                return R::error(core::Error(core::ErrorCode::PortInUse,
                    "port " + std::to_string(request.port) + " is already in use by server " +
                    entry.second.name));
            }
        }

        core::InstanceId id;
        do {
            auto generated = generateInstanceId();
            if (generated.isError()) {
                return R::error(generated.error());
            }
            id = generated.value();
        } while (configs_.count(id) != 0);

        std::string dirName = core::sanitizeName(name);
        fs::path serversDir = fs::path(options_.baseDir) / SERVERS_DIR;
        fs::path serverDir = serversDir / dirName;
        std::error_code ec;
        if (fs::exists(serverDir, ec)) {
            serverDir = serversDir / (dirName + "_" + id);
        }

        fs::create_directories(serverDir, ec);
        if (ec) {
            return R::error(core::Error(core::ErrorCode::FileWriteError,
                "failed to create server directory: " + ec.message(), serverDir.string()));
        }
        if (!isModdedType(request.type)) {
            fs::create_directories(serverDir / "plugins", ec);
        }
        if (!writeTextFile(serverDir / "eula.txt", "eula=true\n")) {
            return R::error(core::Error(core::ErrorCode::FileWriteError,
                "failed to write eula.txt", serverDir.string()));
        }
        if (!writeTextFile(serverDir / "server.properties",
                           initialServerProperties(request.port, request.maxPlayers))) {
            return R::error(core::Error(core::ErrorCode::FileWriteError,
                "failed to write server.properties", serverDir.string()));
        }

        config.id = id;
        config.name = name;
        config.type = request.type;
        config.version = request.version;
        config.port = static_cast<uint16_t>(request.port);
        config.maxRam = request.maxRam;
        config.minRam = request.minRam;
        config.maxPlayers = request.maxPlayers;
        config.dir = serverDir.string();
        config.backupDir = backupFolderFor(name, id);
        config.flags = request.flags;
        config.alwaysPreTouch = request.alwaysPreTouch;

        runtime = makeRuntime();
        runtime->status = core::InstanceStatus::Installing;

        order_.push_back(id);
        configs_[id] = config;
        runtimes_[id] = runtime;

        auto saved = persist(lock);
        if (saved.isError()) {
            order_.pop_back();
            configs_.erase(id);
            runtimes_.erase(id);
            return R::error(core::Error(saved.error().code,
                "failed to persist config: " + saved.error().message, id));
        }
    }

    if (logger_) {
        logger_->logInstanceEvent(core::InstanceEventType::Created, config.id, config.name,
                                  config.type + " " + config.version);
    }

    beginInstall(config.id, config.type, config.version, config.dir, config.name);
    return R::success(buildInfo(config, *runtime));
}

core::Result<void, core::Error> InstanceManager::start(const core::InstanceId& id) {
    return launch(id, {});
}

core::Result<void, core::Error> InstanceManager::startSafeMode(const core::InstanceId& id) {
    auto ref = lookup(id);
    if (ref.isError()) {
        return core::Result<void, core::Error>::error(ref.error());
    }
    const InstanceConfig& config = ref.value().config;

    {
        InstanceLock lock(ref.value().runtime->mutex);
        if (auto refused = launchRefusal(ref.value().runtime->status, id)) {
            return core::Result<void, core::Error>::error(*refused);
        }
    }

    std::vector<std::string> disabled;
    for (const char* dirName : SAFE_MODE_DIRS) {
        fs::path original = fs::path(config.dir) / dirName;
        std::error_code ec;
        if (!fs::is_directory(original, ec)) {
            continue;
        }
        fs::rename(original, original.string() + DISABLED_DIR_SUFFIX, ec);
        if (ec) {
            restoreSafeModeDirs(disabled, config.name);
            return core::Result<void, core::Error>::error(core::Error(core::ErrorCode::FileWriteError,
                std::string("failed to disable ") + dirName + " for safe mode: " + ec.message(), id));
        }
        disabled.push_back(original.string());
        if (logger_) {
            logger_->info("[" + config.name + "] Safe mode: disabled " + dirName, CATEGORY);
        }
    }

    auto launched = launch(id, disabled);
    if (launched.isError()) {
        restoreSafeModeDirs(disabled, config.name);
    }
    return launched;
}

core::Result<void, core::Error> InstanceManager::launch(const core::InstanceId& id,
                                                        std::vector<std::string> safeModeDirs)
{
    using R = core::Result<void, core::Error>;

    auto ref = lookup(id);
    if (ref.isError()) {
        return R::error(ref.error());
    }
    const InstanceConfig& config = ref.value().config;
    std::shared_ptr<InstanceRuntime> runtime = ref.value().runtime;

    bool fabricTps = core::toLower(config.type) == "fabric" &&
                     hasFabricTps((fs::path(config.dir) / "mods").string());
    core::LatencySupport latency = detectLatencySupport(config.type, config.dir);

    PollingPlan plan;
    plan.tpsCommand = tpsCommandForType(config.type, fabricTps);
    plan.listCommand = listCommandForType(config.type);
    plan.rosterPolling = !isProxyType(config.type);

    {
        InstanceLock lock(runtime->mutex);
        if (auto refused = launchRefusal(runtime->status, id)) {
            return R::error(*refused);
        }
    }

    // Launch files are prepared without the instance lock; the status is
    // checked again before spawning
    pal::ProcessOptions options;
    options.workingDirectory = config.dir;
    if (!config.startCommand.empty()) {
        fs::path argsPath = fs::path(config.dir) / JVM_ARGS_FILE;
        auto written = writeManagedJvmArgs(argsPath.string(),
                                           buildJvmFlags(config.flags, config.alwaysPreTouch));
        if (written.isError() && logger_) {
            logger_->warning("[" + config.name + "] Failed to write " + JVM_ARGS_FILE + ": " +
                             written.error().message, CATEGORY);
        }
        options.argv = config.startCommand;
    } else {
        fs::path jarPath = fs::path(config.dir) / config.jarFile;
        std::error_code ec;
        if (!fs::exists(jarPath, ec)) {
            return R::error(core::Error(core::ErrorCode::ArtifactMissing,
                "server.jar not found at " + jarPath.string() +
                " - please place the server jar file in the server directory", id));
        }
        options.argv = buildLaunchCommand(config, options_.javaPath);
    }

    std::shared_ptr<pal::IChildProcess> child;
    std::shared_ptr<ExitSignal> exitSignal;
    std::shared_ptr<MetricsLoop> metrics;
    uint64_t generation = 0;
    {
        InstanceLock lock(runtime->mutex);
        if (auto refused = launchRefusal(runtime->status, id)) {
            return R::error(*refused);
        }

        auto spawned = processPal_->spawn(options);
        if (spawned.isError()) {
            return R::error(core::Error(core::ErrorCode::SpawnFailed,
                "failed to start server: " + spawned.error().message, id));
        }
        child = std::shared_ptr<pal::IChildProcess>(std::move(spawned.value()));
        exitSignal = std::make_shared<ExitSignal>();

        std::weak_ptr<pal::IChildProcess> weakChild = child;
        auto logger = logger_;
        std::string name = config.name;
        CommandSender sender = [weakChild, logger, name](const std::string& text) {
            auto target = weakChild.lock();
            if (!target) {
                return core::Result<void, core::Error>::error(
                    core::Error(core::ErrorCode::NotRunning, "server process has exited"));
            }
            auto written = target->writeInput(text + "\n");
            if (written.isError()) {
                if (logger) {
                    logger->debug("[" + name + "] Polling command not delivered: " +
                                  written.error().message, "Metrics");
                }
                return core::Result<void, core::Error>::error(
                    core::Error(core::ErrorCode::WriteFailed, written.error().message));
            }
            return core::Result<void, core::Error>::success();
        };
        metrics = std::make_shared<MetricsLoop>(runtime, processPal_, timerPal_, threadPal_,
                                                pool_, plan, std::move(sender));

        generation = ++runtime->generation;
        runtime->status = core::InstanceStatus::Booting;
        runtime->child = child;
        runtime->pid = child->pid();
        runtime->exitSignal = exitSignal;
        runtime->metrics = metrics;
        runtime->cpu = 0.0;
        runtime->ramBytes = 0;
        runtime->tps = 0.0;
        runtime->lastUsage.reset();
        runtime->console.clear();
        runtime->players.clear();
        runtime->pingBlocked.clear();
        runtime->lastPingPlayer.clear();
        runtime->lastTpsCommand = SteadyTime{};
        runtime->lastRosterCommand = SteadyTime{};
        runtime->lastPingCommand = SteadyTime{};
        runtime->pendingListRefresh = false;
        runtime->nextListRefreshAt = SteadyTime{};
        runtime->pingSupported = latency.supported;
        runtime->pingDisabledReason = latency.reason;
        runtime->safeModeDisabled = std::move(safeModeDirs);
    }

    if (logger_) {
        logger_->logInstanceEvent(core::InstanceEventType::Starting, id, config.name,
                                  "pid " + std::to_string(child->pid()) + " in " + config.dir);
    }

    std::string name = config.name;
    bool wired = true;
    for (pal::ProcessStream stream : {pal::ProcessStream::StdOut, pal::ProcessStream::StdErr}) {
        auto spawned = tasks_.spawn(stream == pal::ProcessStream::StdOut ? "out-" + id : "err-" + id,
            [this, runtime, child, stream, generation, id, name]() {
                readOutput(runtime, child, stream, generation, id, name);
            });
        if (spawned.isError()) {
            wired = false;
        }
    }

    auto waiter = tasks_.spawn("exit-" + id,
        [this, runtime, child, exitSignal, metrics, generation, id, name]() {
            awaitExit(runtime, child, exitSignal, metrics, generation, id, name);
        });

    if (!wired || waiter.isError()) {
        core::LogContext context;
        context.instanceId = id;
        context.instanceName = name;
        context.pid = child->pid();
        if (logger_) {
            logger_->errorWithContext("Could not attach output readers, killing process", context,
                                      CATEGORY);
        }
        (void)child->kill();
        if (waiter.isError()) {
            awaitExit(runtime, child, exitSignal, metrics, generation, id, name);
        }
        return R::error(core::Error(core::ErrorCode::SpawnFailed,
            "failed to start server: output readers unavailable", id));
    }

    auto metricsStarted = metrics->start(options_.metricsInterval);
    if (metricsStarted.isError() && logger_) {
        logger_->warning("[" + name + "] Metrics loop not started: " +
                         metricsStarted.error().message, "Metrics");
    }
    return R::success();
}

void InstanceManager::readOutput(std::shared_ptr<InstanceRuntime> runtime,
                                 std::shared_ptr<pal::IChildProcess> child,
                                 pal::ProcessStream stream,
                                 uint64_t generation,
                                 const core::InstanceId& id,
                                 const std::string& name)
{
    while (auto line = child->readLine(stream)) {
        console::ConsoleParseResult parsed = console::parseConsoleLine(*line);

        bool becameReady = false;
        {
            InstanceLock lock(runtime->mutex);
            if (runtime->generation != generation) {
                return;
            }
            ConsoleLineOutcome outcome = applyConsoleLine(*runtime, lock, parsed,
                                                          std::chrono::steady_clock::now(),
                                                          std::chrono::system_clock::now());
            core::ConsoleEntry entry = runtime->console.append(*line);
            if (!outcome.suppress) {
                runtime->console.broadcast(entry);
            }
            becameReady = outcome.becameReady;
        }

        if (becameReady && logger_) {
            logger_->logInstanceEvent(core::InstanceEventType::Ready, id, name);
        }
    }
}

void InstanceManager::awaitExit(std::shared_ptr<InstanceRuntime> runtime,
                                std::shared_ptr<pal::IChildProcess> child,
                                std::shared_ptr<ExitSignal> exitSignal,
                                std::shared_ptr<MetricsLoop> metrics,
                                uint64_t generation,
                                const core::InstanceId& id,
                                const std::string& name)
{
    auto waited = child->wait();
    if (metrics) {
        metrics->stop();
    }

    bool clean = waited.isSuccess() && waited.value().success();
    std::string detail = waited.isSuccess() ? describeExit(waited.value())
                                            : "wait failed: " + waited.error().message;

    bool transitioned = false;
    core::InstanceStatus finalStatus = core::InstanceStatus::Stopped;
    std::vector<std::string> disabledDirs;
    {
        InstanceLock lock(runtime->mutex);
        if (runtime->generation == generation) {
            if (core::isLiveStatus(runtime->status)) {
                finalStatus = clean ? core::InstanceStatus::Stopped : core::InstanceStatus::Crashed;
                runtime->status = finalStatus;
                transitioned = true;
            }
            clearProcessState(*runtime, lock);
            runtime->child.reset();
            runtime->metrics.reset();
            disabledDirs.swap(runtime->safeModeDisabled);
        }
    }

    // Restored before stop() is released by the exit signal
    restoreSafeModeDirs(std::move(disabledDirs), name);
    exitSignal->fire();

    if (transitioned && logger_) {
        logger_->logInstanceEvent(finalStatus == core::InstanceStatus::Crashed
                                      ? core::InstanceEventType::Crashed
                                      : core::InstanceEventType::Stopped,
                                  id, name, detail);
    }
}

void InstanceManager::restoreSafeModeDirs(std::vector<std::string> dirs, const std::string& name) {
    for (const auto& original : dirs) {
        std::error_code ec;
        if (!fs::exists(original + DISABLED_DIR_SUFFIX, ec)) {
            continue;
        }
        fs::rename(original + DISABLED_DIR_SUFFIX, original, ec);
        if (!logger_) {
            continue;
        }
        std::string base = fs::path(original).filename().string();
        if (ec) {
            logger_->warning("[" + name + "] Failed to restore " + base + " from safe mode: " +
                             ec.message(), CATEGORY);
        } else {
            logger_->info("[" + name + "] Restored " + base + " from safe mode", CATEGORY);
        }
    }
}

core::Result<void, core::Error> InstanceManager::stop(const core::InstanceId& id) {
    auto ref = lookup(id);
    if (ref.isError()) {
        return core::Result<void, core::Error>::error(ref.error());
    }
    const std::string& name = ref.value().config.name;
    std::shared_ptr<InstanceRuntime> runtime = ref.value().runtime;

    std::shared_ptr<pal::IChildProcess> child;
    std::shared_ptr<ExitSignal> exitSignal;
    uint64_t generation = 0;
    {
        InstanceLock lock(runtime->mutex);
        if (!core::isLiveStatus(runtime->status)) {
            return core::Result<void, core::Error>::error(core::Error(core::ErrorCode::NotRunning,
                "server " + id + " is not running (status: " + statusName(runtime->status) + ")", id));
        }
        child = runtime->child;
        exitSignal = runtime->exitSignal;
        generation = runtime->generation;
    }

    if (child) {
        auto written = child->writeInput("stop\n");
        if (written.isError() && logger_) {
            logger_->warning("[" + name + "] Failed to send stop command: " +
                             written.error().message, CATEGORY);
        }
    }

    if (exitSignal && !exitSignal->waitFor(options_.stopTimeout)) {
        if (logger_) {
            logger_->warning("[" + name + "] Stop timeout, killing process", CATEGORY);
        }
        if (child) {
            auto killed = child->kill();
            if (killed.isError()) {
                core::LogContext context;
                context.instanceId = id;
                context.instanceName = name;
                context.pid = child->pid();
                if (logger_) {
                    logger_->errorWithContext("Failed to kill process: " + killed.error().message,
                                              context, CATEGORY);
                }
            }
        }
        exitSignal->waitFor(KILL_REAP_TIMEOUT);
    }

    {
        InstanceLock lock(runtime->mutex);
        if (runtime->generation == generation) {
            runtime->status = core::InstanceStatus::Stopped;
            clearProcessState(*runtime, lock);
            restarts_->cancelPending(*runtime, lock);
        }
    }

    if (logger_) {
        logger_->info("[" + name + "] Server stopped", CATEGORY);
    }
    return core::Result<void, core::Error>::success();
}

core::Result<void, core::Error> InstanceManager::sendCommand(const core::InstanceId& id,
                                                             const std::string& text)
{
    auto ref = lookup(id);
    if (ref.isError()) {
        return core::Result<void, core::Error>::error(ref.error());
    }

    std::shared_ptr<pal::IChildProcess> child;
    {
        InstanceLock lock(ref.value().runtime->mutex);
        if (!core::isLiveStatus(ref.value().runtime->status)) {
            return core::Result<void, core::Error>::error(core::Error(core::ErrorCode::NotRunning,
                "server " + id + " is not running", id));
        }
        child = ref.value().runtime->child;
    }
    if (!child) {
        return core::Result<void, core::Error>::error(core::Error(core::ErrorCode::NoInputStream,
            "server " + id + " has no stdin pipe", id));
    }

    auto written = child->writeInput(text + "\n");
    if (written.isError()) {
        if (written.error().code == pal::ProcessErrorCode::InputClosed) {
            return core::Result<void, core::Error>::error(core::Error(core::ErrorCode::NoInputStream,
                "server " + id + " has no stdin pipe", id));
        }
        return core::Result<void, core::Error>::error(core::Error(core::ErrorCode::WriteFailed,
            written.error().message, id));
    }
    return core::Result<void, core::Error>::success();
}

core::Result<void, core::Error> InstanceManager::recordConsoleCommand(const core::InstanceId& id,
                                                                      const std::string& text)
{
    auto ref = lookup(id);
    if (ref.isError()) {
        return core::Result<void, core::Error>::error(ref.error());
    }
    std::string trimmed = core::trim(text);
    if (trimmed.empty()) {
        return core::Result<void, core::Error>::success();
    }
    appendConsoleLine(*ref.value().runtime, "> " + trimmed);
    return core::Result<void, core::Error>::success();
}

core::Result<core::InstanceInfo, core::Error> InstanceManager::getStatus(const core::InstanceId& id) {
    return infoFor(id);
}

std::vector<core::InstanceInfo> InstanceManager::list() {
    std::vector<InstanceRef> refs;
    {
        RegistryReadLock lock(registryMutex_);
        refs.reserve(order_.size());
        for (const auto& id : order_) {
            refs.push_back(InstanceRef{configs_.at(id), runtimes_.at(id)});
        }
    }

    std::vector<core::InstanceInfo> infos;
    infos.reserve(refs.size());
    for (const auto& ref : refs) {
        infos.push_back(buildInfo(ref.config, *ref.runtime));
    }
    return infos;
}

// =============================================================================
// Configuration
// =============================================================================

core::Result<core::InstanceInfo, core::Error> InstanceManager::rename(const core::InstanceId& id,
                                                                      const std::string& name)
{
    using R = core::Result<core::InstanceInfo, core::Error>;

    std::string trimmed = core::trim(name);
    InstanceConfig config;
    std::shared_ptr<InstanceRuntime> runtime;
    {
        RegistryWriteLock lock(registryMutex_);
        auto it = configs_.find(id);
        if (it == configs_.end()) {
            return R::error(notFound(id));
        }
        if (trimmed.empty()) {
            return R::error(core::Error(core::ErrorCode::InvalidArgument,
                                        "server name cannot be empty", id));
        }

        std::string folder = backupFolderFor(trimmed, id);
        auto migrated = backups_.migrate(it->second.backupDir, folder);
        if (migrated.isError()) {
            return R::error(migrated.error());
        }
        it->second.name = trimmed;
        it->second.backupDir = folder;

        auto saved = persist(lock);
        if (saved.isError()) {
            return R::error(saved.error());
        }
        config = it->second;
        runtime = runtimes_.at(id);
    }
    return R::success(buildInfo(config, *runtime));
}

core::Result<core::InstanceInfo, core::Error> InstanceManager::updateSettings(
    const core::InstanceId& id, const InstanceSettings& settings)
{
    using R = core::Result<core::InstanceInfo, core::Error>;

    InstanceConfig config;
    std::shared_ptr<InstanceRuntime> runtime;
    {
        RegistryWriteLock lock(registryMutex_);
        auto it = configs_.find(id);
        if (it == configs_.end()) {
            return R::error(notFound(id));
        }
        runtime = runtimes_.at(id);
        {
            InstanceLock instanceLock(runtime->mutex);
            if (core::isLiveStatus(runtime->status)) {
                return R::error(core::Error(core::ErrorCode::InvalidState,
                    "cannot change settings while server is running", id));
            }
        }

        if (settings.port < MIN_INSTANCE_PORT || settings.port > MAX_INSTANCE_PORT) {
            return R::error(core::Error(core::ErrorCode::InvalidArgument,
                "port must be between 1024 and 65535", id));
        }
        if (settings.port != it->second.port) {
            for (const auto& other : configs_) {
                if (other.first != id && other.second.port == settings.port) {
                    return R::error(core::Error(core::ErrorCode::PortInUse,
                        "port " + std::to_string(settings.port) + " is already in use by server " +
                        other.second.name, id));
                }
            }
        }

        it->second.minRam = settings.minRam;
        it->second.maxRam = settings.maxRam;
        it->second.maxPlayers = settings.maxPlayers;
        it->second.port = static_cast<uint16_t>(settings.port);
        auto saved = persist(lock);
        if (saved.isError()) {
            return R::error(saved.error());
        }
        config = it->second;
    }

    fs::path propsPath = fs::path(config.dir) / "server.properties";
    std::ifstream in(propsPath, std::ios::binary);
    if (in) {
        std::stringstream buffer;
        buffer << in.rdbuf();
        in.close();
        std::string updated = rewriteServerProperties(buffer.str(), settings.maxPlayers, settings.port);
        if (!writeTextFile(propsPath, updated) && logger_) {
            logger_->warning("[" + config.name + "] Failed to update server.properties", CATEGORY);
        }
    }

    return R::success(buildInfo(config, *runtime));
}

core::Result<core::InstanceInfo, core::Error> InstanceManager::setAutoStart(const core::InstanceId& id,
                                                                            bool enabled)
{
    using R = core::Result<core::InstanceInfo, core::Error>;

    InstanceConfig config;
    std::shared_ptr<InstanceRuntime> runtime;
    {
        RegistryWriteLock lock(registryMutex_);
        auto it = configs_.find(id);
        if (it == configs_.end()) {
            return R::error(notFound(id));
        }
        it->second.autoStart = enabled;
        auto saved = persist(lock);
        if (saved.isError()) {
            return R::error(saved.error());
        }
        config = it->second;
        runtime = runtimes_.at(id);
    }
    return R::success(buildInfo(config, *runtime));
}

core::Result<core::InstanceInfo, core::Error> InstanceManager::setFlags(const core::InstanceId& id,
                                                                        const std::string& flags,
                                                                        bool alwaysPreTouch)
{
    using R = core::Result<core::InstanceInfo, core::Error>;

    InstanceConfig config;
    std::shared_ptr<InstanceRuntime> runtime;
    {
        RegistryWriteLock lock(registryMutex_);
        auto it = configs_.find(id);
        if (it == configs_.end()) {
            return R::error(notFound(id));
        }
        it->second.flags = flags;
        it->second.alwaysPreTouch = alwaysPreTouch;
        auto saved = persist(lock);
        if (saved.isError()) {
            return R::error(saved.error());
        }
        config = it->second;
        runtime = runtimes_.at(id);
    }
    return R::success(buildInfo(config, *runtime));
}

core::Result<std::string, core::Error> InstanceManager::getServerDir(const core::InstanceId& id) {
    RegistryReadLock lock(registryMutex_);
    auto it = configs_.find(id);
    if (it == configs_.end()) {
        return core::Result<std::string, core::Error>::error(notFound(id));
    }
    return core::Result<std::string, core::Error>::success(it->second.dir);
}

core::Result<void, core::Error> InstanceManager::remove(const core::InstanceId& id) {
    InstanceConfig config;
    {
        RegistryWriteLock lock(registryMutex_);
        auto it = configs_.find(id);
        if (it == configs_.end()) {
            return core::Result<void, core::Error>::error(notFound(id));
        }
        auto& runtime = runtimes_.at(id);
        {
            InstanceLock instanceLock(runtime->mutex);
            if (!core::isTerminalStatus(runtime->status)) {
                return core::Result<void, core::Error>::error(core::Error(core::ErrorCode::InvalidState,
                    "cannot delete server " + id + " while it is " + statusName(runtime->status), id));
            }
            restarts_->cancelPending(*runtime, instanceLock);
        }

        config = it->second;
        configs_.erase(it);
        runtimes_.erase(id);
        order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());

        auto saved = persist(lock);
        if (saved.isError()) {
            return saved;
        }
    }

    if (!config.dir.empty()) {
        std::error_code ec;
        fs::remove_all(config.dir, ec);
        if (ec && logger_) {
            logger_->warning("Failed to delete server directory " + config.dir + ": " + ec.message(),
                             CATEGORY);
        }
    }
    auto removed = backups_.removeAll(config.backupDir);
    if (removed.isError() && logger_) {
        logger_->warning(removed.error().toString(), CATEGORY);
    }

    if (logger_) {
        logger_->logInstanceEvent(core::InstanceEventType::Deleted, id, config.name);
    }
    return core::Result<void, core::Error>::success();
}

// =============================================================================
// Restarts and Installs
// =============================================================================

core::Result<void, core::Error> InstanceManager::scheduleRestart(const core::InstanceId& id,
                                                                 std::chrono::seconds delay)
{
    auto ref = lookup(id);
    if (ref.isError()) {
        return core::Result<void, core::Error>::error(ref.error());
    }
    return restarts_->schedule(id, ref.value().config.name, ref.value().runtime, delay);
}

core::Result<void, core::Error> InstanceManager::cancelRestart(const core::InstanceId& id) {
    auto ref = lookup(id);
    if (ref.isError()) {
        return core::Result<void, core::Error>::error(ref.error());
    }
    return restarts_->cancel(id, ref.value().config.name, ref.value().runtime);
}

core::Result<void, core::Error> InstanceManager::retryInstall(const core::InstanceId& id) {
    auto ref = lookup(id);
    if (ref.isError()) {
        return core::Result<void, core::Error>::error(ref.error());
    }
    {
        InstanceLock lock(ref.value().runtime->mutex);
        if (ref.value().runtime->status != core::InstanceStatus::Error) {
            return core::Result<void, core::Error>::error(core::Error(core::ErrorCode::NotInErrorState,
                "server " + id + " is not in error state (status: " +
                statusName(ref.value().runtime->status) + ")", id));
        }
        ref.value().runtime->status = core::InstanceStatus::Installing;
        ref.value().runtime->installError.clear();
    }

    const InstanceConfig& config = ref.value().config;
    beginInstall(id, config.type, config.version, config.dir, config.name);
    return core::Result<void, core::Error>::success();
}

core::Result<core::InstanceInfo, core::Error> InstanceManager::updateVersion(
    const core::InstanceId& id, const std::string& version)
{
    using R = core::Result<core::InstanceInfo, core::Error>;

    std::string trimmed = core::trim(version);
    if (trimmed.empty()) {
        return R::error(core::Error(core::ErrorCode::InvalidArgument, "version is required", id));
    }

    auto ref = lookup(id);
    if (ref.isError()) {
        return R::error(ref.error());
    }
    {
        InstanceLock lock(ref.value().runtime->mutex);
        core::InstanceStatus status = ref.value().runtime->status;
        if (status == core::InstanceStatus::Running) {
            return R::error(core::Error(core::ErrorCode::AlreadyRunning,
                "Can't update while server is running.", id));
        }
        if (status == core::InstanceStatus::Booting || status == core::InstanceStatus::Installing) {
            return R::error(core::Error(core::ErrorCode::Busy, "server is busy", id));
        }
        ref.value().runtime->status = core::InstanceStatus::Installing;
        ref.value().runtime->installError.clear();
    }

    const InstanceConfig& config = ref.value().config;
    beginInstall(id, config.type, trimmed, config.dir, config.name);
    return infoFor(id);
}

core::Result<std::vector<core::VersionInfo>, core::Error> InstanceManager::getVersions(
    const std::string& type)
{
    return installer_.versions(type);
}

void InstanceManager::beginInstall(const core::InstanceId& id, const std::string& type,
                                   const std::string& version, const std::string& dir,
                                   const std::string& name)
{
    if (logger_) {
        logger_->logInstanceEvent(core::InstanceEventType::InstallStarted, id, name,
                                  type + " " + version);
    }

    auto spawned = tasks_.spawn("install-" + id, [this, id, type, version, dir, name]() {
        runInstall(id, type, version, dir, name);
    });
    if (spawned.isError()) {
        auto ref = lookup(id);
        if (ref.isSuccess()) {
            InstanceLock lock(ref.value().runtime->mutex);
            ref.value().runtime->status = core::InstanceStatus::Error;
            ref.value().runtime->installError = spawned.error().message;
        }
        if (logger_) {
            logger_->logInstanceEvent(core::InstanceEventType::InstallFailed, id, name,
                                      spawned.error().message);
        }
    }
}

void InstanceManager::runInstall(const core::InstanceId& id, const std::string& type,
                                 const std::string& version, const std::string& dir,
                                 const std::string& name)
{
    auto ref = lookup(id);
    if (ref.isError()) {
        return;
    }
    std::shared_ptr<InstanceRuntime> runtime = ref.value().runtime;

    ProgressCallback progress = [this, runtime, name](const std::string& message) {
        if (logger_) {
            logger_->info("[" + name + "] Install: " + message, "Install");
        }
        appendConsoleLine(*runtime, "[Installer] " + message);
    };

    InstallRequest request;
    request.type = type;
    request.version = version;
    request.dir = dir;

    auto outcome = installer_.run(request, progress);
    if (outcome.isError()) {
        {
            InstanceLock lock(runtime->mutex);
            runtime->status = core::InstanceStatus::Error;
            runtime->installError = outcome.error().message;
        }
        if (logger_) {
            logger_->logInstanceEvent(core::InstanceEventType::InstallFailed, id, name,
                                      outcome.error().message);
        }
        return;
    }

    {
        RegistryWriteLock lock(registryMutex_);
        auto it = configs_.find(id);
        if (it == configs_.end()) {
            return;
        }
        it->second.version = outcome.value().resolvedVersion;
        if (outcome.value().startCommand) {
            it->second.startCommand = *outcome.value().startCommand;
        }
        // A failed save is logged by persist(); the runtime state is still valid
        (void)persist(lock);
    }

    {
        InstanceLock lock(runtime->mutex);
        runtime->status = core::InstanceStatus::Stopped;
        runtime->installError.clear();
    }

    if (logger_) {
        logger_->logInstanceEvent(core::InstanceEventType::InstallCompleted, id, name,
                                  outcome.value().resolvedVersion);
    }
    progress("Installation complete! " + type + " " + outcome.value().resolvedVersion +
             " is ready to start.");
}

// =============================================================================
// Console and Players
// =============================================================================

core::Result<console::ConsoleSubscription, core::Error> InstanceManager::subscribeConsole(
    const core::InstanceId& id, core::SequenceNumber lastSeq)
{
    auto ref = lookup(id);
    if (ref.isError()) {
        return core::Result<console::ConsoleSubscription, core::Error>::error(ref.error());
    }
    InstanceLock lock(ref.value().runtime->mutex);
    return core::Result<console::ConsoleSubscription, core::Error>::success(
        ref.value().runtime->console.subscribe(lastSeq));
}

void InstanceManager::unsubscribeConsole(const core::InstanceId& id,
                                         console::SubscriberId subscriber)
{
    std::shared_ptr<InstanceRuntime> runtime;
    {
        RegistryReadLock lock(registryMutex_);
        auto it = runtimes_.find(id);
        if (it == runtimes_.end()) {
            return;
        }
        runtime = it->second;
    }
    InstanceLock lock(runtime->mutex);
    runtime->console.unsubscribe(subscriber);
}

core::Result<std::vector<core::PlayerInfo>, core::Error> InstanceManager::listPlayers(
    const core::InstanceId& id)
{
    using R = core::Result<std::vector<core::PlayerInfo>, core::Error>;

    auto ref = lookup(id);
    if (ref.isError()) {
        return R::error(ref.error());
    }
    InstanceLock lock(ref.value().runtime->mutex);
    if (ref.value().runtime->status != core::InstanceStatus::Running) {
        return R::success({});
    }
    return R::success(snapshotPlayers(*ref.value().runtime, lock, std::chrono::system_clock::now()));
}

core::Result<void, core::Error> InstanceManager::kickPlayer(const core::InstanceId& id,
                                                            const std::string& player,
                                                            const std::string& reason)
{
    if (reason.empty()) {
        return sendCommand(id, "kick " + player);
    }
    return sendCommand(id, "kick " + player + " " + reason);
}

core::Result<void, core::Error> InstanceManager::banPlayer(const core::InstanceId& id,
                                                           const std::string& player,
                                                           const std::string& reason)
{
    if (reason.empty()) {
        return sendCommand(id, "ban " + player);
    }
    return sendCommand(id, "ban " + player + " " + reason);
}

core::Result<void, core::Error> InstanceManager::killPlayer(const core::InstanceId& id,
                                                            const std::string& player)
{
    return sendCommand(id, "kill " + player);
}

core::Result<core::LatencySupport, core::Error> InstanceManager::getLatencySupport(
    const core::InstanceId& id)
{
    auto ref = lookup(id);
    if (ref.isError()) {
        return core::Result<core::LatencySupport, core::Error>::error(ref.error());
    }

    core::LatencySupport support = detectLatencySupport(ref.value().config.type,
                                                        ref.value().config.dir);
    {
        InstanceLock lock(ref.value().runtime->mutex);
        ref.value().runtime->pingSupported = support.supported;
        ref.value().runtime->pingDisabledReason = support.reason;
    }
    return core::Result<core::LatencySupport, core::Error>::success(std::move(support));
}

// =============================================================================
// Backups
// =============================================================================

core::Result<std::vector<core::BackupInfo>, core::Error> InstanceManager::listBackups(
    const core::InstanceId& id)
{
    auto ref = lookup(id);
    if (ref.isError()) {
        return core::Result<std::vector<core::BackupInfo>, core::Error>::error(ref.error());
    }
    return backups_.list(ref.value().config.backupDir);
}

core::Result<core::BackupInfo, core::Error> InstanceManager::createBackup(const core::InstanceId& id) {
    auto ref = lookup(id);
    if (ref.isError()) {
        return core::Result<core::BackupInfo, core::Error>::error(ref.error());
    }
    const InstanceConfig& config = ref.value().config;

    auto created = backups_.create(config.backupDir, config.dir);
    if (logger_) {
        if (created.isSuccess()) {
            logger_->logInstanceEvent(core::InstanceEventType::BackupCreated, id, config.name,
                                      created.value().name);
        } else {
            logger_->logInstanceEvent(core::InstanceEventType::BackupFailed, id, config.name,
                                      created.error().message);
        }
    }
    return created;
}

core::Result<void, core::Error> InstanceManager::deleteBackup(const core::InstanceId& id,
                                                              const std::string& fileName)
{
    auto ref = lookup(id);
    if (ref.isError()) {
        return core::Result<void, core::Error>::error(ref.error());
    }
    return backups_.remove(ref.value().config.backupDir, fileName);
}

core::Result<void, core::Error> InstanceManager::restoreBackup(const core::InstanceId& id,
                                                               const std::string& fileName)
{
    auto ref = lookup(id);
    if (ref.isError()) {
        return core::Result<void, core::Error>::error(ref.error());
    }
    {
        InstanceLock lock(ref.value().runtime->mutex);
        if (!core::isTerminalStatus(ref.value().runtime->status)) {
            return core::Result<void, core::Error>::error(core::Error(core::ErrorCode::InvalidState,
                "server must be stopped before restoring a backup", id));
        }
    }

    const InstanceConfig& config = ref.value().config;
    auto restored = backups_.restore(config.backupDir, fileName, config.dir);
    if (restored.isSuccess() && logger_) {
        logger_->info("Restored backup " + fileName + " for server " + config.name, "Backup");
    }
    return restored;
}

core::Result<void, core::Error> InstanceManager::setBackupSchedule(const core::InstanceId& id,
                                                                   const std::string& cadence)
{
    RegistryWriteLock lock(registryMutex_);
    auto it = configs_.find(id);
    if (it == configs_.end()) {
        return core::Result<void, core::Error>::error(notFound(id));
    }
    if (!isValidBackupCadence(cadence)) {
        return core::Result<void, core::Error>::error(core::Error(core::ErrorCode::InvalidSchedule,
            "invalid schedule: " + cadence, id));
    }

    it->second.backupSchedule = cadence;
    if (cadence.empty()) {
        it->second.lastScheduledBackup.clear();
    } else if (it->second.lastScheduledBackup.empty()) {
        it->second.lastScheduledBackup = formatRfc3339Utc(std::time(nullptr));
    }
    return persist(lock);
}

core::Result<core::BackupScheduleInfo, core::Error> InstanceManager::getBackupSchedule(
    const core::InstanceId& id)
{
    RegistryReadLock lock(registryMutex_);
    auto it = configs_.find(id);
    if (it == configs_.end()) {
        return core::Result<core::BackupScheduleInfo, core::Error>::error(notFound(id));
    }

    core::BackupScheduleInfo info;
    info.schedule = it->second.backupSchedule;
    info.lastBackup = it->second.lastScheduledBackup;
    if (!info.schedule.empty() && !info.lastBackup.empty()) {
        auto last = parseRfc3339(info.lastBackup);
        if (last) {
            auto next = nextScheduledBackupTime(*last, info.schedule);
            if (next) {
                info.nextBackup = formatRfc3339Utc(*next);
            }
        }
    }
    return core::Result<core::BackupScheduleInfo, core::Error>::success(std::move(info));
}

size_t InstanceManager::checkScheduledBackups() {
    return backupScheduler_->checkDue(std::time(nullptr));
}

std::vector<ScheduledBackupCandidate> InstanceManager::scheduledBackupCandidates() {
    RegistryReadLock lock(registryMutex_);
    std::vector<ScheduledBackupCandidate> candidates;
    for (const auto& id : order_) {
        const InstanceConfig& config = configs_.at(id);
        if (config.backupSchedule.empty()) {
            continue;
        }
        candidates.push_back(ScheduledBackupCandidate{id, config.name, config.backupSchedule,
                                                      config.lastScheduledBackup});
    }
    return candidates;
}

core::Result<core::BackupInfo, core::Error> InstanceManager::runScheduledBackup(
    const core::InstanceId& id)
{
    auto created = createBackup(id);
    if (created.isError()) {
        return created;
    }

    RegistryWriteLock lock(registryMutex_);
    auto it = configs_.find(id);
    if (it != configs_.end()) {
        it->second.lastScheduledBackup = formatRfc3339Utc(std::time(nullptr));
        // The archive exists either way; a failed save is logged by persist()
        (void)persist(lock);
    }
    return created;
}

} // namespace supervisor
} // namespace orexa
