// Orexa - Game Server Supervisor
// Platform Abstraction Layer - Threading Interface
//
// Dedicated threads for long-lived blocking work (output readers, exit
// waiters, installs) and fixed-size pools for short periodic work.

#ifndef OREXA_PAL_THREAD_PAL_HPP
#define OREXA_PAL_THREAD_PAL_HPP

#include "orexa/pal/pal_types.hpp"
#include "orexa/core/result.hpp"

#include <chrono>
#include <string>

namespace orexa {
namespace pal {

/**
 * @brief Abstract interface for thread and thread pool management.
 *
 * ## Thread Safety
 * All methods are thread-safe.
 *
 * ## Lifetime
 * Every non-detached thread must be joined exactly once. A pool must be
 * destroyed before the PAL that created it.
 */
class IThreadPAL {
public:
    virtual ~IThreadPAL() = default;

    // =========================================================================
    // Thread Creation and Management
    // =========================================================================

    /**
     * @brief Start a thread running func(arg).
     *
     * @param options Name (truncated to 15 characters), stack size, detached
     * @return Thread handle or ThreadError
     */
    virtual core::Result<ThreadHandle, ThreadError> createThread(
        ThreadFunction func,
        void* arg,
        const ThreadOptions& options
    ) = 0;

    /**
     * @brief Block until the thread exits and release its handle.
     */
    virtual core::Result<void, ThreadError> joinThread(ThreadHandle handle) = 0;

    // =========================================================================
    // Thread Pool Operations
    // =========================================================================

    /**
     * @brief Create a pool of worker threads.
     *
     * @param minThreads Workers started immediately (must be > 0)
     * @param maxThreads Upper bound (must be >= minThreads)
     */
    virtual core::Result<ThreadPoolHandle, ThreadError> createThreadPool(
        size_t minThreads,
        size_t maxThreads,
        const ThreadPoolOptions& options
    ) = 0;

    /**
     * @brief Queue a work item on the pool.
     *
     * @return WorkQueueFull when the queue limit is reached, PoolShutdown
     *         while the pool is being destroyed
     */
    virtual core::Result<void, ThreadError> submitWork(
        ThreadPoolHandle pool,
        WorkItem work
    ) = 0;

    /**
     * @brief Drain the queue, stop the workers and join them.
     */
    virtual core::Result<void, ThreadError> destroyThreadPool(
        ThreadPoolHandle pool
    ) = 0;

    // =========================================================================
    // Current Thread Operations
    // =========================================================================

    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

} // namespace pal
} // namespace orexa

#endif // OREXA_PAL_THREAD_PAL_HPP
