// Orexa - Game Server Supervisor
// Per-launch metrics sampling and status polling
//
// Every tick samples CPU and RAM of the child process and, on their own
// cadences, injects the flavor's TPS query, a pending or periodic roster
// query, and per-player latency queries. Issue times are recorded in the
// runtime state so the console pipeline can hide the echoes.

#ifndef OREXA_SUPERVISOR_METRICS_LOOP_HPP
#define OREXA_SUPERVISOR_METRICS_LOOP_HPP

#include "orexa/core/error_codes.hpp"
#include "orexa/core/result.hpp"
#include "orexa/pal/process_pal.hpp"
#include "orexa/pal/thread_pal.hpp"
#include "orexa/pal/timer_pal.hpp"
#include "orexa/supervisor/runtime_state.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace orexa {
namespace supervisor {

// Cadences in ticks (2s ticks: TPS ~30s, latency ~20s, roster resync ~120s)
constexpr uint32_t TPS_POLL_TICKS = 15;
constexpr uint32_t LATENCY_POLL_TICKS = 10;
constexpr uint32_t ROSTER_RESYNC_TICKS = 60;
constexpr std::chrono::milliseconds LATENCY_QUERY_SPACING{200};

/**
 * @brief What to poll for one launch, decided at start.
 */
struct PollingPlan {
    std::optional<std::string> tpsCommand;
    std::string listCommand = "list";
    bool rosterPolling = true;      ///< false for proxies
};

/**
 * @brief Sends one console command to the instance.
 */
using CommandSender = std::function<core::Result<void, core::Error>(const std::string&)>;

/**
 * @brief Metrics and polling task bound to one process lifetime.
 *
 * The timer only dispatches ticks to the worker pool; a tick that is still
 * running when the next one fires causes that next one to be skipped.
 *
 * ## Thread Safety
 * start() and stop() may be called from any thread. stop() is idempotent.
 */
class MetricsLoop : public std::enable_shared_from_this<MetricsLoop> {
public:
    MetricsLoop(std::shared_ptr<InstanceRuntime> runtime,
                std::shared_ptr<pal::IProcessPAL> processPal,
                std::shared_ptr<pal::ITimerPAL> timerPal,
                std::shared_ptr<pal::IThreadPAL> threadPal,
                pal::ThreadPoolHandle pool,
                PollingPlan plan,
                CommandSender sendCommand);

    ~MetricsLoop();

    MetricsLoop(const MetricsLoop&) = delete;
    MetricsLoop& operator=(const MetricsLoop&) = delete;

    core::Result<void, core::Error> start(std::chrono::milliseconds interval);

    void stop();

    bool isStopped() const { return stopped_.load(); }

    /**
     * @brief Run one tick on the calling thread.
     */
    void tick();

    const PollingPlan& plan() const { return plan_; }

private:
    void dispatchTick();
    void sampleUsage(core::ProcessId pid);
    void pollLatency();

    std::shared_ptr<InstanceRuntime> runtime_;
    std::shared_ptr<pal::IProcessPAL> processPal_;
    std::shared_ptr<pal::ITimerPAL> timerPal_;
    std::shared_ptr<pal::IThreadPAL> threadPal_;
    pal::ThreadPoolHandle pool_;
    PollingPlan plan_;
    CommandSender sendCommand_;

    std::mutex timerMutex_;
    pal::TimerHandle timer_ = pal::INVALID_TIMER_HANDLE;
    std::atomic<bool> stopped_{false};
    std::atomic<bool> tickInFlight_{false};

    // Touched only by tick(), which never overlaps itself
    uint32_t tpsTicks_ = 0;
    uint32_t latencyTicks_ = 0;
    uint32_t rosterResyncTicks_ = 0;
};

/**
 * @brief CPU percent of one core between two samples of the same process.
 */
double cpuPercentBetween(const pal::ProcessUsage& previous, const pal::ProcessUsage& current);

} // namespace supervisor
} // namespace orexa

#endif // OREXA_SUPERVISOR_METRICS_LOOP_HPP
