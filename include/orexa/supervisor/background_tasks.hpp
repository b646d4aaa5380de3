// Orexa - Game Server Supervisor
// Owned background threads
//
// Long-running supervisor work (output readers, exit waiters, installs,
// backups, restart sequences) runs on dedicated named threads created
// through the thread PAL. This class owns them, reaps finished ones and
// joins the rest at shutdown.

#ifndef OREXA_SUPERVISOR_BACKGROUND_TASKS_HPP
#define OREXA_SUPERVISOR_BACKGROUND_TASKS_HPP

#include "orexa/core/error_codes.hpp"
#include "orexa/core/result.hpp"
#include "orexa/pal/thread_pal.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace orexa {
namespace supervisor {

/**
 * @brief Set of joinable worker threads with cooperative shutdown.
 *
 * ## Thread Safety
 * All methods are thread-safe. A task must not call joinAll() on the set
 * that owns it.
 */
class BackgroundTasks {
public:
    explicit BackgroundTasks(std::shared_ptr<pal::IThreadPAL> threadPal);

    /**
     * @brief Requests stop and joins every task.
     */
    ~BackgroundTasks();

    // Non-copyable, non-movable
    BackgroundTasks(const BackgroundTasks&) = delete;
    BackgroundTasks& operator=(const BackgroundTasks&) = delete;
    BackgroundTasks(BackgroundTasks&&) = delete;
    BackgroundTasks& operator=(BackgroundTasks&&) = delete;

    /**
     * @brief Run task on a new thread.
     *
     * @param name Thread name (truncated to 15 characters by the PAL)
     * @return Cancelled after requestStop(), SpawnFailed if the thread
     *         could not be created
     */
    core::Result<void, core::Error> spawn(const std::string& name, std::function<void()> task);

    /**
     * @brief Sleep unless stop is requested first.
     * @return false if woken by requestStop()
     */
    bool sleepFor(std::chrono::milliseconds duration);

    /**
     * @brief Reject new tasks and wake every sleeper.
     */
    void requestStop();

    bool stopRequested() const;

    /**
     * @brief Join the threads of tasks that have returned.
     */
    void reap();

    /**
     * @brief Request stop and join all threads.
     */
    void joinAll();

    size_t activeCount() const;

private:
    struct Task {
        pal::ThreadHandle handle;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    std::shared_ptr<pal::IThreadPAL> threadPal_;

    mutable std::mutex mutex_;
    std::condition_variable stopCv_;
    bool stopping_ = false;
    std::vector<Task> tasks_;
};

} // namespace supervisor
} // namespace orexa

#endif // OREXA_SUPERVISOR_BACKGROUND_TASKS_HPP
