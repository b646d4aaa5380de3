// Orexa - Game Server Supervisor
// Linux Thread PAL Implementation

#include "orexa/pal/linux/linux_thread_pal.hpp"

#if defined(__linux__)

#include <pthread.h>
#include <unistd.h>
#include <cstring>
#include <sys/prctl.h>
#include <errno.h>
#include <time.h>

namespace orexa {
namespace pal {
namespace linux {

// =============================================================================
// Thread Entry Point Wrapper
// =============================================================================

namespace {

struct ThreadStartData {
    ThreadFunction func;
    void* arg;
    std::string name;
};

} // anonymous namespace

void LinuxThreadPAL::applyThreadName(const std::string& name) {
    if (name.empty()) {
        return;
    }
    // Linux limits thread names to 16 characters including null terminator
    std::string truncatedName = name.substr(0, 15);
    prctl(PR_SET_NAME, truncatedName.c_str(), 0, 0, 0);
}

void* LinuxThreadPAL::threadEntryPoint(void* arg) {
    std::unique_ptr<ThreadStartData> startData(static_cast<ThreadStartData*>(arg));

    applyThreadName(startData->name);

    ThreadFunction func = std::move(startData->func);
    void* userArg = startData->arg;
    startData.reset();

    func(userArg);

    return nullptr;
}

// =============================================================================
// Thread Pool Worker Function
// =============================================================================

void* LinuxThreadPAL::poolWorkerFunction(void* arg) {
    auto* pool = static_cast<ThreadPoolData*>(arg);
    applyThreadName(pool->name);

    while (true) {
        WorkItem work;

        {
            std::unique_lock<std::mutex> lock(pool->queueMutex);
            pool->workCondition.wait(lock, [pool]() {
                return pool->shutdown.load() || !pool->workQueue.empty();
            });

            if (pool->workQueue.empty()) {
                // Shutdown with nothing left to drain
                break;
            }

            work = std::move(pool->workQueue.front());
            pool->workQueue.pop();
        }

        if (work) {
            work();
        }
    }

    return nullptr;
}

void LinuxThreadPAL::shutdownPool(ThreadPoolData& pool) {
    {
        std::lock_guard<std::mutex> lock(pool.queueMutex);
        pool.shutdown = true;
    }
    pool.workCondition.notify_all();

    for (auto& worker : pool.workers) {
        pthread_join(worker, nullptr);
    }
    pool.workers.clear();
}

// =============================================================================
// Constructor / Destructor
// =============================================================================

LinuxThreadPAL::LinuxThreadPAL() = default;

LinuxThreadPAL::~LinuxThreadPAL() {
    std::unordered_map<uint64_t, std::unique_ptr<ThreadPoolData>> pools;
    {
        std::lock_guard<std::mutex> lock(poolsMutex_);
        pools.swap(pools_);
    }
    for (auto& pair : pools) {
        shutdownPool(*pair.second);
    }

    std::lock_guard<std::mutex> lock(threadsMutex_);
    for (auto& pair : threads_) {
        if (!pair.second->detached && !pair.second->joining) {
            pthread_detach(pair.second->thread);
        }
    }
    threads_.clear();
}

// =============================================================================
// Thread Creation and Management
// =============================================================================

uint64_t LinuxThreadPAL::generateHandle() {
    return nextHandle_.fetch_add(1, std::memory_order_relaxed);
}

core::Result<ThreadHandle, ThreadError> LinuxThreadPAL::createThread(
    ThreadFunction func,
    void* arg,
    const ThreadOptions& options
) {
    if (!func) {
        return core::Result<ThreadHandle, ThreadError>::error(
            ThreadError{ThreadErrorCode::CreationFailed, "Thread function is null"}
        );
    }

    auto startData = std::make_unique<ThreadStartData>(
        ThreadStartData{std::move(func), arg, options.name});

    pthread_attr_t attr;
    pthread_attr_init(&attr);

    if (options.stackSize > 0) {
        pthread_attr_setstacksize(&attr, options.stackSize);
    }

    if (options.detached) {
        pthread_attr_setdetachstate(&attr, PTHREAD_CREATE_DETACHED);
    }

    pthread_t thread;
    int result = pthread_create(&thread, &attr, threadEntryPoint, startData.get());
    pthread_attr_destroy(&attr);

    if (result != 0) {
        return core::Result<ThreadHandle, ThreadError>::error(
            ThreadError{ThreadErrorCode::CreationFailed, "pthread_create failed: " + std::string(strerror(result))}
        );
    }
    // Ownership passed to threadEntryPoint
    startData.release();

    uint64_t handleValue = generateHandle();

    if (!options.detached) {
        std::lock_guard<std::mutex> lock(threadsMutex_);
        auto threadData = std::make_unique<ThreadData>();
        threadData->thread = thread;
        threadData->name = options.name;
        threadData->joining = false;
        threadData->detached = false;
        threads_[handleValue] = std::move(threadData);
    }

    return core::Result<ThreadHandle, ThreadError>::success(ThreadHandle{handleValue});
}

core::Result<void, ThreadError> LinuxThreadPAL::joinThread(ThreadHandle handle) {
    pthread_t thread;

    {
        std::lock_guard<std::mutex> lock(threadsMutex_);
        auto it = threads_.find(handle.value);
        if (it == threads_.end()) {
            return core::Result<void, ThreadError>::error(
                ThreadError{ThreadErrorCode::InvalidHandle, "Invalid thread handle"}
            );
        }

        if (it->second->joining) {
            return core::Result<void, ThreadError>::error(
                ThreadError{ThreadErrorCode::JoinFailed, "Thread already being joined"}
            );
        }

        if (pthread_equal(it->second->thread, pthread_self())) {
            return core::Result<void, ThreadError>::error(
                ThreadError{ThreadErrorCode::JoinFailed, "Thread cannot join itself"}
            );
        }

        thread = it->second->thread;
        it->second->joining = true;
    }

    int result = pthread_join(thread, nullptr);

    {
        std::lock_guard<std::mutex> lock(threadsMutex_);
        threads_.erase(handle.value);
    }

    if (result != 0) {
        return core::Result<void, ThreadError>::error(
            ThreadError{ThreadErrorCode::JoinFailed, "pthread_join failed: " + std::string(strerror(result))}
        );
    }

    return core::Result<void, ThreadError>::success();
}

// =============================================================================
// Thread Pool Operations
// =============================================================================

core::Result<ThreadPoolHandle, ThreadError> LinuxThreadPAL::createThreadPool(
    size_t minThreads,
    size_t maxThreads,
    const ThreadPoolOptions& options
) {
    if (minThreads == 0 || maxThreads < minThreads) {
        return core::Result<ThreadPoolHandle, ThreadError>::error(
            ThreadError{ThreadErrorCode::PoolCreationFailed, "Invalid thread count"}
        );
    }

    uint64_t handleValue = generateHandle();
    auto poolData = std::make_unique<ThreadPoolData>();
    poolData->name = options.name;
    poolData->queueLimit = options.queueSize;

    // Workers are started eagerly; the pool does not grow past minThreads
    for (size_t i = 0; i < minThreads; ++i) {
        pthread_t worker;
        int result = pthread_create(&worker, nullptr, poolWorkerFunction, poolData.get());
        if (result != 0) {
            shutdownPool(*poolData);
            return core::Result<ThreadPoolHandle, ThreadError>::error(
                ThreadError{ThreadErrorCode::PoolCreationFailed,
                            "Failed to create worker thread: " + std::string(strerror(result))}
            );
        }
        poolData->workers.push_back(worker);
    }

    {
        std::lock_guard<std::mutex> lock(poolsMutex_);
        pools_[handleValue] = std::move(poolData);
    }

    return core::Result<ThreadPoolHandle, ThreadError>::success(ThreadPoolHandle{handleValue});
}

core::Result<void, ThreadError> LinuxThreadPAL::submitWork(
    ThreadPoolHandle pool,
    WorkItem work
) {
    if (!work) {
        return core::Result<void, ThreadError>::error(
            ThreadError{ThreadErrorCode::Unknown, "Work item is null"}
        );
    }

    std::lock_guard<std::mutex> poolsLock(poolsMutex_);
    auto it = pools_.find(pool.value);
    if (it == pools_.end()) {
        return core::Result<void, ThreadError>::error(
            ThreadError{ThreadErrorCode::InvalidHandle, "Invalid thread pool handle"}
        );
    }
    ThreadPoolData* poolData = it->second.get();

    {
        std::lock_guard<std::mutex> lock(poolData->queueMutex);
        if (poolData->shutdown.load()) {
            return core::Result<void, ThreadError>::error(
                ThreadError{ThreadErrorCode::PoolShutdown, "Thread pool is shutting down"}
            );
        }
        if (poolData->queueLimit > 0 && poolData->workQueue.size() >= poolData->queueLimit) {
            return core::Result<void, ThreadError>::error(
                ThreadError{ThreadErrorCode::WorkQueueFull, "Thread pool queue is full"}
            );
        }
        poolData->workQueue.push(std::move(work));
    }
    poolData->workCondition.notify_one();

    return core::Result<void, ThreadError>::success();
}

core::Result<void, ThreadError> LinuxThreadPAL::destroyThreadPool(
    ThreadPoolHandle pool
) {
    std::unique_ptr<ThreadPoolData> poolData;

    {
        std::lock_guard<std::mutex> lock(poolsMutex_);
        auto it = pools_.find(pool.value);
        if (it == pools_.end()) {
            return core::Result<void, ThreadError>::error(
                ThreadError{ThreadErrorCode::InvalidHandle, "Invalid thread pool handle"}
            );
        }
        poolData = std::move(it->second);
        pools_.erase(it);
    }

    shutdownPool(*poolData);

    return core::Result<void, ThreadError>::success();
}

// =============================================================================
// Current Thread Operations
// =============================================================================

void LinuxThreadPAL::sleepFor(std::chrono::milliseconds duration) {
    struct timespec ts;
    ts.tv_sec = static_cast<time_t>(duration.count() / 1000);
    ts.tv_nsec = static_cast<long>((duration.count() % 1000) * 1000000);
    while (nanosleep(&ts, &ts) != 0 && errno == EINTR) {
    }
}

} // namespace linux
} // namespace pal
} // namespace orexa

#endif // defined(__linux__)
