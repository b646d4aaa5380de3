// Orexa - Game Server Supervisor
// Linux Thread PAL Implementation
//
// pthreads for dedicated threads, std::mutex/condition_variable queues for
// pools, prctl(PR_SET_NAME) for thread names.

#ifndef OREXA_PAL_LINUX_LINUX_THREAD_PAL_HPP
#define OREXA_PAL_LINUX_LINUX_THREAD_PAL_HPP

#include "orexa/pal/thread_pal.hpp"
#include "orexa/pal/pal_types.hpp"
#include "orexa/core/result.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <unordered_map>
#include <vector>

#if defined(__linux__)
#include <pthread.h>

namespace orexa {
namespace pal {
namespace linux {

class LinuxThreadPAL : public IThreadPAL {
public:
    LinuxThreadPAL();

    /**
     * @brief Destroys any pools still alive. Threads that were never joined
     * are detached.
     */
    ~LinuxThreadPAL() override;

    // Non-copyable, non-movable
    LinuxThreadPAL(const LinuxThreadPAL&) = delete;
    LinuxThreadPAL& operator=(const LinuxThreadPAL&) = delete;
    LinuxThreadPAL(LinuxThreadPAL&&) = delete;
    LinuxThreadPAL& operator=(LinuxThreadPAL&&) = delete;

    // =========================================================================
    // Thread Creation and Management
    // =========================================================================

    core::Result<ThreadHandle, ThreadError> createThread(
        ThreadFunction func,
        void* arg,
        const ThreadOptions& options
    ) override;

    core::Result<void, ThreadError> joinThread(ThreadHandle handle) override;

    // =========================================================================
    // Thread Pool Operations
    // =========================================================================

    core::Result<ThreadPoolHandle, ThreadError> createThreadPool(
        size_t minThreads,
        size_t maxThreads,
        const ThreadPoolOptions& options
    ) override;

    core::Result<void, ThreadError> submitWork(
        ThreadPoolHandle pool,
        WorkItem work
    ) override;

    core::Result<void, ThreadError> destroyThreadPool(
        ThreadPoolHandle pool
    ) override;

    // =========================================================================
    // Current Thread Operations
    // =========================================================================

    void sleepFor(std::chrono::milliseconds duration) override;

private:
    struct ThreadData {
        pthread_t thread;
        std::string name;
        bool joining;
        bool detached;
    };

    struct ThreadPoolData {
        std::vector<pthread_t> workers;
        std::queue<WorkItem> workQueue;
        std::mutex queueMutex;
        std::condition_variable workCondition;
        std::atomic<bool> shutdown{false};
        std::string name;
        size_t queueLimit = 0;
    };

    uint64_t generateHandle();

    static void* threadEntryPoint(void* arg);

    static void* poolWorkerFunction(void* arg);

    static void applyThreadName(const std::string& name);

    static void shutdownPool(ThreadPoolData& pool);

    std::atomic<uint64_t> nextHandle_{1};

    mutable std::mutex threadsMutex_;
    std::unordered_map<uint64_t, std::unique_ptr<ThreadData>> threads_;

    mutable std::mutex poolsMutex_;
    std::unordered_map<uint64_t, std::unique_ptr<ThreadPoolData>> pools_;
};

} // namespace linux
} // namespace pal
} // namespace orexa

#endif // defined(__linux__)
#endif // OREXA_PAL_LINUX_LINUX_THREAD_PAL_HPP
