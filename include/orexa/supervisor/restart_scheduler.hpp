// Orexa - Game Server Supervisor
// Delayed one-shot restarts
//
// A scheduled restart warns the players, stops the instance, waits for the
// filesystem to settle and starts it again. Every schedule gets a fresh
// token; each step re-checks it, so a cancel or a newer schedule makes an
// already running sequence give up before its next step.

#ifndef OREXA_SUPERVISOR_RESTART_SCHEDULER_HPP
#define OREXA_SUPERVISOR_RESTART_SCHEDULER_HPP

#include "orexa/core/error_codes.hpp"
#include "orexa/core/result.hpp"
#include "orexa/core/structured_logger.hpp"
#include "orexa/core/types.hpp"
#include "orexa/pal/timer_pal.hpp"
#include "orexa/supervisor/background_tasks.hpp"
#include "orexa/supervisor/runtime_state.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace orexa {
namespace supervisor {

constexpr const char* RESTART_WARNING_MESSAGE = "say Server restarting in 10 seconds...";
constexpr const char* RESTART_NOW_MESSAGE = "say Server restarting now!";

struct RestartTiming {
    std::chrono::milliseconds warning{10000};       ///< Between the two warnings
    std::chrono::milliseconds finalWarning{1000};   ///< Between the last warning and stop
    std::chrono::milliseconds settle{3000};         ///< Between stop and start
};

/**
 * @brief The operations a restart sequence drives.
 */
class IRestartTarget {
public:
    virtual ~IRestartTarget() = default;

    virtual core::Result<void, core::Error> sendCommand(const core::InstanceId& id,
                                                        const std::string& text) = 0;
    virtual core::Result<void, core::Error> stop(const core::InstanceId& id) = 0;
    virtual core::Result<void, core::Error> start(const core::InstanceId& id) = 0;
};

class RestartScheduler : public std::enable_shared_from_this<RestartScheduler> {
public:
    RestartScheduler(IRestartTarget& target,
                     std::shared_ptr<pal::ITimerPAL> timerPal,
                     BackgroundTasks& tasks,
                     RestartTiming timing,
                     std::shared_ptr<core::StructuredLogger> logger);

    RestartScheduler(const RestartScheduler&) = delete;
    RestartScheduler& operator=(const RestartScheduler&) = delete;

    /**
     * @brief Arm a restart delay from now, replacing any pending one.
     *
     * @return NotRunning unless the instance is Running
     */
    core::Result<void, core::Error> schedule(const core::InstanceId& id,
                                             const std::string& name,
                                             const std::shared_ptr<InstanceRuntime>& runtime,
                                             std::chrono::seconds delay);

    /**
     * @return NoRestartScheduled when nothing is pending
     */
    core::Result<void, core::Error> cancel(const core::InstanceId& id,
                                           const std::string& name,
                                           const std::shared_ptr<InstanceRuntime>& runtime);

    /**
     * @brief Drop a pending restart, if any, with the runtime lock held.
     * @return true if one was pending
     */
    bool cancelPending(InstanceRuntime& runtime, const InstanceLock& lock);

private:
    void fire(const core::InstanceId& id, const std::string& name,
              std::weak_ptr<InstanceRuntime> runtime, uint64_t token);
    void run(const core::InstanceId& id, const std::string& name,
             const std::weak_ptr<InstanceRuntime>& runtime, uint64_t token);

    IRestartTarget& target_;
    std::shared_ptr<pal::ITimerPAL> timerPal_;
    BackgroundTasks& tasks_;
    RestartTiming timing_;
    std::shared_ptr<core::StructuredLogger> logger_;
};

} // namespace supervisor
} // namespace orexa

#endif // OREXA_SUPERVISOR_RESTART_SCHEDULER_HPP
