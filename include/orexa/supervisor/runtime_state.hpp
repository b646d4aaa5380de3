// Orexa - Game Server Supervisor
// Per-instance runtime state
//
// Everything about an instance that does not survive a supervisor restart:
// lifecycle status, the child process, sampled metrics, the player roster,
// the console buffer and the bookkeeping of polling commands and timers.

#ifndef OREXA_SUPERVISOR_RUNTIME_STATE_HPP
#define OREXA_SUPERVISOR_RUNTIME_STATE_HPP

#include "orexa/console/console_buffer.hpp"
#include "orexa/console/console_parser.hpp"
#include "orexa/core/types.hpp"
#include "orexa/pal/pal_types.hpp"
#include "orexa/pal/process_pal.hpp"
#include "orexa/supervisor/instance_lock.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace orexa {
namespace supervisor {

class MetricsLoop;

using SteadyTime = std::chrono::steady_clock::time_point;
using WallTime = std::chrono::system_clock::time_point;

// Echo suppression windows per polling command family
constexpr std::chrono::seconds TPS_ECHO_WINDOW{5};
constexpr std::chrono::seconds ROSTER_ECHO_WINDOW{10};
constexpr std::chrono::seconds LATENCY_ECHO_WINDOW{10};

// Roster refresh delays
constexpr std::chrono::milliseconds READY_LIST_REFRESH_DELAY{2000};
constexpr std::chrono::milliseconds JOIN_LEAVE_LIST_REFRESH_DELAY{200};

/**
 * @brief One-shot completion flag for a process lifetime.
 *
 * Fired exactly once by the exit waiter after reconciliation; stop() and
 * the metrics loop wait on it.
 */
class ExitSignal {
public:
    ExitSignal() = default;

    ExitSignal(const ExitSignal&) = delete;
    ExitSignal& operator=(const ExitSignal&) = delete;

    /**
     * @brief Mark the process as exited. Later calls are no-ops.
     * @return true for the call that fired the signal
     */
    bool fire();

    bool fired() const;

    /**
     * @brief Wait until fired or the timeout passes.
     * @return true if fired
     */
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool fired_ = false;
};

/**
 * @brief A connected player as tracked from console output.
 */
struct PlayerSession {
    std::string name;
    std::string ip;
    int32_t ping = -1;
    std::string world;
    WallTime joinedAt;
};

/**
 * @brief Volatile state of one instance.
 *
 * Every field below the mutex is read and written only while holding it.
 * Functions in this header that take an InstanceLock expect it to be held
 * on this runtime's mutex.
 */
struct InstanceRuntime {
    InstanceRuntime(size_t consoleCapacity, size_t trimBatch, size_t channelCapacity);

    InstanceRuntime(const InstanceRuntime&) = delete;
    InstanceRuntime& operator=(const InstanceRuntime&) = delete;

    InstanceMutex mutex;

    core::InstanceStatus status = core::InstanceStatus::Stopped;
    std::string installError;

    // Process
    std::shared_ptr<pal::IChildProcess> child;
    core::ProcessId pid = core::INVALID_PROCESS_ID;
    uint64_t generation = 0;                    ///< Incremented on every launch
    std::shared_ptr<ExitSignal> exitSignal;
    std::shared_ptr<MetricsLoop> metrics;

    // Sampled metrics
    double cpu = 0.0;
    uint64_t ramBytes = 0;
    double tps = 0.0;
    std::optional<pal::ProcessUsage> lastUsage;

    // Console
    console::ConsoleBuffer console;

    // Players
    std::map<std::string, PlayerSession> players;
    std::set<std::string> pingBlocked;
    std::string lastPingPlayer;

    // Polling bookkeeping
    SteadyTime lastTpsCommand{};
    SteadyTime lastRosterCommand{};
    SteadyTime lastPingCommand{};
    bool pendingListRefresh = false;
    SteadyTime nextListRefreshAt{};
    bool pingSupported = false;
    std::string pingDisabledReason;

    // Safe mode: original paths renamed to <path>_disabled
    std::vector<std::string> safeModeDisabled;

    // Restart
    bool restartPending = false;
    uint64_t restartToken = 0;
    pal::TimerHandle restartTimer = pal::INVALID_TIMER_HANDLE;
    WallTime restartAt{};
};

/**
 * @brief What the pipeline learned from one line.
 */
struct ConsoleLineOutcome {
    bool suppress = false;      ///< Echo of a recent polling command
    bool becameReady = false;   ///< Booting -> Running on this line
};

/**
 * @brief Arm a roster refresh unless an earlier one is already pending.
 */
void scheduleListRefresh(InstanceRuntime& runtime, const InstanceLock& lock,
                         SteadyTime now, std::chrono::milliseconds delay);

/**
 * @brief Apply the events parsed from one line to the runtime state.
 *
 * Does not touch the console buffer; the caller appends the raw line and
 * broadcasts it unless the outcome says to suppress it.
 */
ConsoleLineOutcome applyConsoleLine(InstanceRuntime& runtime, const InstanceLock& lock,
                                    const console::ConsoleParseResult& parsed,
                                    SteadyTime now, WallTime wallNow);

/**
 * @brief Zero sampled metrics, forget the pid and clear the roster.
 */
void clearProcessState(InstanceRuntime& runtime, const InstanceLock& lock);

/**
 * @brief Roster sorted by name with formatted online time.
 */
std::vector<core::PlayerInfo> snapshotPlayers(const InstanceRuntime& runtime,
                                              const InstanceLock& lock, WallTime wallNow);

/**
 * @brief "1h 5m" for an hour or more, otherwise "12m".
 */
std::string formatOnlineTime(std::chrono::seconds online);

} // namespace supervisor
} // namespace orexa

#endif // OREXA_SUPERVISOR_RUNTIME_STATE_HPP
