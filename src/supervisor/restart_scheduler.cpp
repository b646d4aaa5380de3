// Orexa - Game Server Supervisor
// Delayed one-shot restarts implementation

#include "orexa/supervisor/restart_scheduler.hpp"

namespace orexa {
namespace supervisor {

namespace {

constexpr const char* CATEGORY = "Restart";

bool tokenCurrent(InstanceRuntime& runtime, uint64_t token) {
    InstanceLock lock(runtime.mutex);
    return runtime.restartPending && runtime.restartToken == token;
}

} // anonymous namespace

RestartScheduler::RestartScheduler(IRestartTarget& target,
                                   std::shared_ptr<pal::ITimerPAL> timerPal,
                                   BackgroundTasks& tasks,
                                   RestartTiming timing,
                                   std::shared_ptr<core::StructuredLogger> logger)
    : target_(target)
    , timerPal_(std::move(timerPal))
    , tasks_(tasks)
    , timing_(timing)
    , logger_(std::move(logger))
{
}

core::Result<void, core::Error> RestartScheduler::schedule(
    const core::InstanceId& id,
    const std::string& name,
    const std::shared_ptr<InstanceRuntime>& runtime,
    std::chrono::seconds delay)
{
    if (delay.count() < 0) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::InvalidArgument, "restart delay cannot be negative", id));
    }

    InstanceLock lock(runtime->mutex);
    if (runtime->status != core::InstanceStatus::Running) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::NotRunning, "server must be running to schedule a restart", id));
    }

    cancelPending(*runtime, lock);

    uint64_t token = ++runtime->restartToken;
    std::weak_ptr<RestartScheduler> weakSelf = shared_from_this();
    std::weak_ptr<InstanceRuntime> weakRuntime = runtime;

    auto timer = timerPal_->scheduleOnce(
        std::chrono::duration_cast<std::chrono::milliseconds>(delay),
        [weakSelf, weakRuntime, id, name, token]() {
            if (auto self = weakSelf.lock()) {
                self->fire(id, name, weakRuntime, token);
            }
        });
    if (timer.isError()) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::Unknown,
                        "failed to arm restart timer: " + timer.error().message, id));
    }

    runtime->restartPending = true;
    runtime->restartTimer = timer.value();
    runtime->restartAt = std::chrono::system_clock::now() + delay;

    if (logger_) {
        logger_->logInstanceEvent(core::InstanceEventType::RestartScheduled, id, name,
                                  "in " + std::to_string(delay.count()) + "s");
    }
    return core::Result<void, core::Error>::success();
}

core::Result<void, core::Error> RestartScheduler::cancel(
    const core::InstanceId& id,
    const std::string& name,
    const std::shared_ptr<InstanceRuntime>& runtime)
{
    {
        InstanceLock lock(runtime->mutex);
        if (!cancelPending(*runtime, lock)) {
            return core::Result<void, core::Error>::error(
                core::Error(core::ErrorCode::NoRestartScheduled,
                            "no restart scheduled for server " + id, id));
        }
    }
    if (logger_) {
        logger_->logInstanceEvent(core::InstanceEventType::RestartCancelled, id, name);
    }
    return core::Result<void, core::Error>::success();
}

bool RestartScheduler::cancelPending(InstanceRuntime& runtime, const InstanceLock& /*lock*/) {
    if (!runtime.restartPending) {
        return false;
    }
    if (runtime.restartTimer != pal::INVALID_TIMER_HANDLE) {
        // AlreadyCancelled once the timer fired; the token bump stops the sequence
        (void)timerPal_->cancelTimer(runtime.restartTimer);
    }
    runtime.restartPending = false;
    runtime.restartToken++;
    runtime.restartTimer = pal::INVALID_TIMER_HANDLE;
    runtime.restartAt = WallTime{};
    return true;
}

void RestartScheduler::fire(const core::InstanceId& id, const std::string& name,
                            std::weak_ptr<InstanceRuntime> runtime, uint64_t token) {
    auto self = shared_from_this();
    auto spawned = tasks_.spawn("restart", [self, id, name, runtime, token]() {
        self->run(id, name, runtime, token);
    });
    if (spawned.isError() && logger_) {
        logger_->warning("[" + name + "] Scheduled restart not run: " + spawned.error().message,
                         CATEGORY);
    }
}

void RestartScheduler::run(const core::InstanceId& id, const std::string& name,
                           const std::weak_ptr<InstanceRuntime>& weakRuntime, uint64_t token) {
    auto runtime = weakRuntime.lock();
    if (!runtime || !tokenCurrent(*runtime, token)) {
        return;
    }

    if (logger_) {
        logger_->info("[" + name + "] Scheduled restart executing", CATEGORY);
    }

    auto warned = target_.sendCommand(id, RESTART_WARNING_MESSAGE);
    if (warned.isError() && logger_) {
        logger_->debug("[" + name + "] Restart warning not sent: " + warned.error().message, CATEGORY);
    }
    if (!tasks_.sleepFor(timing_.warning) || !tokenCurrent(*runtime, token)) {
        return;
    }

    warned = target_.sendCommand(id, RESTART_NOW_MESSAGE);
    if (warned.isError() && logger_) {
        logger_->debug("[" + name + "] Restart warning not sent: " + warned.error().message, CATEGORY);
    }
    if (!tasks_.sleepFor(timing_.finalWarning)) {
        return;
    }

    // Past this point the restart is committed and can no longer be cancelled
    {
        InstanceLock lock(runtime->mutex);
        if (!runtime->restartPending || runtime->restartToken != token) {
            return;
        }
        runtime->restartPending = false;
        runtime->restartTimer = pal::INVALID_TIMER_HANDLE;
        runtime->restartAt = WallTime{};
    }

    auto stopped = target_.stop(id);
    if (stopped.isError()) {
        if (logger_) {
            logger_->warning("[" + name + "] Scheduled restart - stop failed: " +
                             stopped.error().message, CATEGORY);
        }
        return;
    }

    if (!tasks_.sleepFor(timing_.settle)) {
        return;
    }

    auto started = target_.start(id);
    if (!logger_) {
        return;
    }
    if (started.isError()) {
        logger_->warning("[" + name + "] Scheduled restart - start failed: " +
                         started.error().message, CATEGORY);
    } else {
        logger_->info("[" + name + "] Scheduled restart completed", CATEGORY);
    }
}

} // namespace supervisor
} // namespace orexa
