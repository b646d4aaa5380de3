// Orexa - Game Server Supervisor
// Per-launch metrics sampling and status polling implementation

#include "orexa/supervisor/metrics_loop.hpp"

#include <vector>

namespace orexa {
namespace supervisor {

double cpuPercentBetween(const pal::ProcessUsage& previous, const pal::ProcessUsage& current) {
    if (current.cpuTicks < previous.cpuTicks || current.ticksPerSecond == 0) {
        return 0.0;
    }
    double wallSeconds = std::chrono::duration<double>(current.sampledAt - previous.sampledAt).count();
    if (wallSeconds <= 0.0) {
        return 0.0;
    }
    double cpuSeconds = static_cast<double>(current.cpuTicks - previous.cpuTicks) /
                        static_cast<double>(current.ticksPerSecond);
    return cpuSeconds / wallSeconds * 100.0;
}

MetricsLoop::MetricsLoop(std::shared_ptr<InstanceRuntime> runtime,
                         std::shared_ptr<pal::IProcessPAL> processPal,
                         std::shared_ptr<pal::ITimerPAL> timerPal,
                         std::shared_ptr<pal::IThreadPAL> threadPal,
                         pal::ThreadPoolHandle pool,
                         PollingPlan plan,
                         CommandSender sendCommand)
    : runtime_(std::move(runtime))
    , processPal_(std::move(processPal))
    , timerPal_(std::move(timerPal))
    , threadPal_(std::move(threadPal))
    , pool_(pool)
    , plan_(std::move(plan))
    , sendCommand_(std::move(sendCommand))
{
}

MetricsLoop::~MetricsLoop() {
    stop();
}

core::Result<void, core::Error> MetricsLoop::start(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(timerMutex_);
    if (stopped_.load()) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::InvalidState, "metrics loop already stopped"));
    }

    std::weak_ptr<MetricsLoop> weak = shared_from_this();
    auto scheduled = timerPal_->scheduleRepeating(interval, [weak]() {
        if (auto self = weak.lock()) {
            self->dispatchTick();
        }
    });
    if (scheduled.isError()) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::Unknown,
                        "failed to schedule metrics timer: " + scheduled.error().message));
    }
    timer_ = scheduled.value();
    return core::Result<void, core::Error>::success();
}

void MetricsLoop::stop() {
    stopped_.store(true);

    pal::TimerHandle timer;
    {
        std::lock_guard<std::mutex> lock(timerMutex_);
        timer = timer_;
        timer_ = pal::INVALID_TIMER_HANDLE;
    }
    if (timer != pal::INVALID_TIMER_HANDLE) {
        // AlreadyCancelled is the only expected failure and needs no action
        (void)timerPal_->cancelTimer(timer);
    }
}

void MetricsLoop::dispatchTick() {
    if (stopped_.load()) {
        return;
    }
    if (tickInFlight_.exchange(true)) {
        return;
    }

    auto self = shared_from_this();
    auto submitted = threadPal_->submitWork(pool_, [self]() {
        self->tick();
        self->tickInFlight_.store(false);
    });
    if (submitted.isError()) {
        tickInFlight_.store(false);
    }
}

void MetricsLoop::tick() {
    if (stopped_.load()) {
        return;
    }

    core::ProcessId pid;
    core::InstanceStatus status;
    {
        InstanceLock lock(runtime_->mutex);
        pid = runtime_->pid;
        status = runtime_->status;
    }
    if (pid == core::INVALID_PROCESS_ID) {
        return;
    }

    sampleUsage(pid);

    bool running = status == core::InstanceStatus::Running;

    tpsTicks_++;
    if (tpsTicks_ >= TPS_POLL_TICKS && running && plan_.tpsCommand) {
        tpsTicks_ = 0;
        {
            InstanceLock lock(runtime_->mutex);
            runtime_->lastTpsCommand = std::chrono::steady_clock::now();
        }
        if (sendCommand_(*plan_.tpsCommand).isError()) {
            return;
        }
    }

    if (plan_.rosterPolling && running) {
        rosterResyncTicks_++;
        bool sendList = false;
        {
            InstanceLock lock(runtime_->mutex);
            SteadyTime now = std::chrono::steady_clock::now();
            if (rosterResyncTicks_ >= ROSTER_RESYNC_TICKS) {
                rosterResyncTicks_ = 0;
                scheduleListRefresh(*runtime_, lock, now, std::chrono::milliseconds(0));
            }
            if (runtime_->pendingListRefresh &&
                (runtime_->nextListRefreshAt == SteadyTime{} || now >= runtime_->nextListRefreshAt)) {
                runtime_->pendingListRefresh = false;
                runtime_->nextListRefreshAt = SteadyTime{};
                runtime_->lastRosterCommand = now;
                sendList = true;
            }
        }
        if (sendList && sendCommand_(plan_.listCommand).isError()) {
            return;
        }
    } else if (!running) {
        rosterResyncTicks_ = 0;
    }

    latencyTicks_++;
    if (latencyTicks_ >= LATENCY_POLL_TICKS && running) {
        latencyTicks_ = 0;
        pollLatency();
    }
}

void MetricsLoop::sampleUsage(core::ProcessId pid) {
    auto sample = processPal_->sampleUsage(pid);
    if (sample.isError()) {
        // The process exited between the pid read and the sample
        return;
    }

    const pal::ProcessUsage& usage = sample.value();
    InstanceLock lock(runtime_->mutex);
    if (runtime_->pid != pid) {
        return;
    }
    if (runtime_->lastUsage) {
        runtime_->cpu = cpuPercentBetween(*runtime_->lastUsage, usage);
    }
    runtime_->ramBytes = usage.rssBytes;
    runtime_->lastUsage = usage;
}

void MetricsLoop::pollLatency() {
    std::vector<std::string> names;
    {
        InstanceLock lock(runtime_->mutex);
        if (!runtime_->pingSupported || runtime_->players.empty()) {
            return;
        }
        names.reserve(runtime_->players.size());
        for (const auto& entry : runtime_->players) {
            names.push_back(entry.first);
        }
        runtime_->lastPingCommand = std::chrono::steady_clock::now();
    }

    for (const auto& name : names) {
        if (stopped_.load()) {
            return;
        }
        {
            InstanceLock lock(runtime_->mutex);
            if (runtime_->pingBlocked.count(name) != 0) {
                continue;
            }
            runtime_->lastPingPlayer = name;
        }
        if (sendCommand_("ping " + name).isError()) {
            return;
        }
        threadPal_->sleepFor(LATENCY_QUERY_SPACING);
    }
}

} // namespace supervisor
} // namespace orexa
