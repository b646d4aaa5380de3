// Orexa - Game Server Supervisor
// Platform Abstraction Layer - Timer Interface
//
// Schedules one-shot and repeating callbacks and exposes a monotonic clock.
// The Linux implementation uses timerfd with a single dispatch thread.

#ifndef OREXA_PAL_TIMER_PAL_HPP
#define OREXA_PAL_TIMER_PAL_HPP

#include "orexa/pal/pal_types.hpp"
#include "orexa/core/result.hpp"

#include <chrono>

namespace orexa {
namespace pal {

/**
 * @brief Abstract interface for timer operations.
 *
 * ## Thread Safety
 * - Scheduling and cancellation are thread-safe
 * - Callbacks run on the timer thread, one at a time
 * - Callbacks must only hand work off (submit to a pool, start a thread);
 *   anything that blocks delays every other timer
 *
 * ## Cancellation
 * A callback that has already been picked up for dispatch may still run
 * after cancelTimer() returns. Callers that need exactly-once semantics
 * must guard the callback body themselves.
 *
 * @invariant Timer handles are valid until cancelled or (for one-shot) fired
 * @invariant now() returns monotonically increasing values
 */
class ITimerPAL {
public:
    virtual ~ITimerPAL() = default;

    // =========================================================================
    // Timer Scheduling
    // =========================================================================

    /**
     * @brief Schedule a callback to run once after a delay.
     *
     * A zero delay fires as soon as the timer thread wakes.
     *
     * @return Handle for cancellation, or TimerError
     */
    virtual core::Result<TimerHandle, TimerError> scheduleOnce(
        std::chrono::milliseconds delay,
        TimerCallback callback
    ) = 0;

    /**
     * @brief Schedule a callback to run every interval until cancelled.
     *
     * The first invocation happens one interval after scheduling.
     */
    virtual core::Result<TimerHandle, TimerError> scheduleRepeating(
        std::chrono::milliseconds interval,
        TimerCallback callback
    ) = 0;

    /**
     * @brief Cancel a pending or repeating timer.
     *
     * @return InvalidHandle for INVALID_TIMER_HANDLE, AlreadyCancelled when
     *         the timer has fired (one-shot) or was cancelled before
     */
    virtual core::Result<void, TimerError> cancelTimer(TimerHandle handle) = 0;
};

} // namespace pal
} // namespace orexa

#endif // OREXA_PAL_TIMER_PAL_HPP
