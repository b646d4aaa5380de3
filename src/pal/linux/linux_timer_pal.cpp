// Orexa - Game Server Supervisor
// Linux Timer PAL Implementation

#include "orexa/pal/linux/linux_timer_pal.hpp"

#if defined(__linux__)

#include <sys/timerfd.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/prctl.h>
#include <unistd.h>
#include <cstring>
#include <errno.h>

namespace orexa {
namespace pal {
namespace linux {

namespace {

void toTimespec(std::chrono::milliseconds ms, struct timespec& ts) {
    ts.tv_sec = static_cast<time_t>(ms.count() / 1000);
    ts.tv_nsec = static_cast<long>((ms.count() % 1000) * 1000000);
}

} // anonymous namespace

// =============================================================================
// Constructor / Destructor
// =============================================================================

LinuxTimerPAL::LinuxTimerPAL() {
    epollFd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epollFd_ < 0) {
        // scheduleOnce/scheduleRepeating report CreationFailed from here on
        return;
    }

    wakeEventFd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wakeEventFd_ < 0) {
        close(epollFd_);
        epollFd_ = -1;
        return;
    }

    struct epoll_event ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.events = EPOLLIN;
    ev.data.fd = wakeEventFd_;
    if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, wakeEventFd_, &ev) < 0) {
        close(wakeEventFd_);
        close(epollFd_);
        wakeEventFd_ = -1;
        epollFd_ = -1;
        return;
    }

    timerThread_ = std::thread(&LinuxTimerPAL::timerThreadFunc, this);
}

LinuxTimerPAL::~LinuxTimerPAL() {
    shutdown_ = true;
    wakeTimerThread();

    if (timerThread_.joinable()) {
        timerThread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(timersMutex_);
        for (auto& pair : timers_) {
            if (pair.second->timerFd >= 0) {
                close(pair.second->timerFd);
            }
        }
        timers_.clear();
        fdToHandle_.clear();
    }

    if (wakeEventFd_ >= 0) {
        close(wakeEventFd_);
        wakeEventFd_ = -1;
    }

    if (epollFd_ >= 0) {
        close(epollFd_);
        epollFd_ = -1;
    }
}

// =============================================================================
// Timer Thread
// =============================================================================

void LinuxTimerPAL::timerThreadFunc() {
    prctl(PR_SET_NAME, "orexa-timer", 0, 0, 0);

    const int maxEvents = 32;
    struct epoll_event events[maxEvents];

    while (!shutdown_) {
        int nfds = epoll_wait(epollFd_, events, maxEvents, -1);
        if (nfds < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }

        for (int i = 0; i < nfds && !shutdown_; ++i) {
            int fd = events[i].data.fd;

            if (fd == wakeEventFd_) {
                uint64_t val;
                while (read(wakeEventFd_, &val, sizeof(val)) > 0) {
                }
                continue;
            }

            dispatch(fd);
        }
    }
}

void LinuxTimerPAL::dispatch(int fd) {
    TimerCallback callback;
    uint64_t handleValue = 0;

    {
        std::lock_guard<std::mutex> lock(timersMutex_);
        auto handleIt = fdToHandle_.find(fd);
        if (handleIt == fdToHandle_.end()) {
            // Cancelled between epoll_wait and here; fd may already be closed
            return;
        }
        handleValue = handleIt->second;

        uint64_t expirations = 0;
        ssize_t bytesRead = read(fd, &expirations, sizeof(expirations));
        if (bytesRead != static_cast<ssize_t>(sizeof(expirations))) {
            return;
        }

        auto timerIt = timers_.find(handleValue);
        if (timerIt == timers_.end()) {
            return;
        }

        callback = timerIt->second->callback;

        // One-shot timers retire before the callback runs so that a cancel
        // issued from inside the callback reports AlreadyCancelled
        if (!timerIt->second->repeating) {
            retireLocked(handleValue);
        }
    }

    if (callback) {
        callback();
    }
}

void LinuxTimerPAL::retireLocked(uint64_t handleValue) {
    auto it = timers_.find(handleValue);
    if (it == timers_.end()) {
        return;
    }
    int fd = it->second->timerFd;
    epoll_ctl(epollFd_, EPOLL_CTL_DEL, fd, nullptr);
    close(fd);
    fdToHandle_.erase(fd);
    timers_.erase(it);
}

void LinuxTimerPAL::wakeTimerThread() {
    if (wakeEventFd_ >= 0) {
        uint64_t val = 1;
        ssize_t result = write(wakeEventFd_, &val, sizeof(val));
        (void)result;  // eventfd counter overflow is the only failure; wake already pending
    }
}

// =============================================================================
// Timer Scheduling
// =============================================================================

core::Result<TimerHandle, TimerError> LinuxTimerPAL::createTimer(
    std::chrono::milliseconds delay,
    std::chrono::milliseconds interval,
    TimerCallback callback,
    bool repeating
) {
    if (epollFd_ < 0) {
        return core::Result<TimerHandle, TimerError>::error(
            TimerError{TimerErrorCode::CreationFailed, "Timer subsystem not initialized"}
        );
    }
    if (!callback) {
        return core::Result<TimerHandle, TimerError>::error(
            TimerError{TimerErrorCode::CreationFailed, "Timer callback is empty"}
        );
    }
    if (delay.count() < 0 || (repeating && interval.count() <= 0)) {
        return core::Result<TimerHandle, TimerError>::error(
            TimerError{TimerErrorCode::CreationFailed, "Invalid timer duration"}
        );
    }

    int timerFd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timerFd < 0) {
        return core::Result<TimerHandle, TimerError>::error(
            TimerError{TimerErrorCode::CreationFailed, "timerfd_create failed: " + std::string(strerror(errno))}
        );
    }

    struct itimerspec its;
    std::memset(&its, 0, sizeof(its));
    toTimespec(delay, its.it_value);

    // An all-zero it_value disarms the timer; use the smallest positive delay
    if (its.it_value.tv_sec == 0 && its.it_value.tv_nsec == 0) {
        its.it_value.tv_nsec = 1;
    }

    if (repeating) {
        toTimespec(interval, its.it_interval);
    }

    TimerHandle handle{nextHandle_.fetch_add(1, std::memory_order_relaxed)};

    // Register before arming so a short timer cannot fire unregistered
    std::lock_guard<std::mutex> lock(timersMutex_);

    auto timerInfo = std::make_unique<TimerInfo>();
    timerInfo->timerFd = timerFd;
    timerInfo->callback = std::move(callback);
    timerInfo->repeating = repeating;

    struct epoll_event ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.events = EPOLLIN;
    ev.data.fd = timerFd;
    if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, timerFd, &ev) < 0) {
        int err = errno;
        close(timerFd);
        return core::Result<TimerHandle, TimerError>::error(
            TimerError{TimerErrorCode::CreationFailed, "epoll_ctl failed: " + std::string(strerror(err))}
        );
    }

    if (timerfd_settime(timerFd, 0, &its, nullptr) < 0) {
        int err = errno;
        epoll_ctl(epollFd_, EPOLL_CTL_DEL, timerFd, nullptr);
        close(timerFd);
        return core::Result<TimerHandle, TimerError>::error(
            TimerError{TimerErrorCode::CreationFailed, "timerfd_settime failed: " + std::string(strerror(err))}
        );
    }

    fdToHandle_[timerFd] = handle.value;
    timers_[handle.value] = std::move(timerInfo);

    return core::Result<TimerHandle, TimerError>::success(handle);
}

core::Result<TimerHandle, TimerError> LinuxTimerPAL::scheduleOnce(
    std::chrono::milliseconds delay,
    TimerCallback callback
) {
    return createTimer(delay, std::chrono::milliseconds{0}, std::move(callback), false);
}

core::Result<TimerHandle, TimerError> LinuxTimerPAL::scheduleRepeating(
    std::chrono::milliseconds interval,
    TimerCallback callback
) {
    return createTimer(interval, interval, std::move(callback), true);
}

core::Result<void, TimerError> LinuxTimerPAL::cancelTimer(TimerHandle handle) {
    if (handle == INVALID_TIMER_HANDLE) {
        return core::Result<void, TimerError>::error(
            TimerError{TimerErrorCode::InvalidHandle, "Invalid timer handle"}
        );
    }

    std::lock_guard<std::mutex> lock(timersMutex_);

    if (timers_.find(handle.value) == timers_.end()) {
        return core::Result<void, TimerError>::error(
            TimerError{TimerErrorCode::AlreadyCancelled, "Timer not found or already cancelled"}
        );
    }

    retireLocked(handle.value);
    return core::Result<void, TimerError>::success();
}

size_t LinuxTimerPAL::activeTimerCount() const {
    std::lock_guard<std::mutex> lock(timersMutex_);
    return timers_.size();
}

} // namespace linux
} // namespace pal
} // namespace orexa

#endif // defined(__linux__)
