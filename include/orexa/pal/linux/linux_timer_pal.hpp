// Orexa - Game Server Supervisor
// Linux Timer PAL Implementation
//
// One timerfd per timer, multiplexed with epoll on a single timer thread.

#ifndef OREXA_PAL_LINUX_LINUX_TIMER_PAL_HPP
#define OREXA_PAL_LINUX_LINUX_TIMER_PAL_HPP

#include "orexa/pal/timer_pal.hpp"
#include "orexa/pal/pal_types.hpp"
#include "orexa/core/result.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <thread>

#if defined(__linux__)

namespace orexa {
namespace pal {
namespace linux {

class LinuxTimerPAL : public ITimerPAL {
public:
    LinuxTimerPAL();

    /**
     * @brief Stops the timer thread and releases every timerfd.
     *
     * Pending callbacks are dropped.
     */
    ~LinuxTimerPAL() override;

    // Non-copyable, non-movable
    LinuxTimerPAL(const LinuxTimerPAL&) = delete;
    LinuxTimerPAL& operator=(const LinuxTimerPAL&) = delete;
    LinuxTimerPAL(LinuxTimerPAL&&) = delete;
    LinuxTimerPAL& operator=(LinuxTimerPAL&&) = delete;

    // =========================================================================
    // ITimerPAL Implementation
    // =========================================================================

    core::Result<TimerHandle, TimerError> scheduleOnce(
        std::chrono::milliseconds delay,
        TimerCallback callback
    ) override;

    core::Result<TimerHandle, TimerError> scheduleRepeating(
        std::chrono::milliseconds interval,
        TimerCallback callback
    ) override;

    core::Result<void, TimerError> cancelTimer(TimerHandle handle) override;

    /**
     * @brief Number of timers that are scheduled and not yet retired.
     */
    size_t activeTimerCount() const;

private:
    struct TimerInfo {
        int timerFd;
        TimerCallback callback;
        bool repeating;
    };

    core::Result<TimerHandle, TimerError> createTimer(
        std::chrono::milliseconds delay,
        std::chrono::milliseconds interval,
        TimerCallback callback,
        bool repeating
    );

    void timerThreadFunc();

    void dispatch(int fd);

    void retireLocked(uint64_t handleValue);

    void wakeTimerThread();

    std::atomic<uint64_t> nextHandle_{1};
    mutable std::mutex timersMutex_;
    std::unordered_map<uint64_t, std::unique_ptr<TimerInfo>> timers_;
    std::unordered_map<int, uint64_t> fdToHandle_;

    int epollFd_{-1};
    int wakeEventFd_{-1};

    std::thread timerThread_;
    std::atomic<bool> shutdown_{false};
};

} // namespace linux
} // namespace pal
} // namespace orexa

#endif // defined(__linux__)
#endif // OREXA_PAL_LINUX_LINUX_TIMER_PAL_HPP
