// Orexa - Game Server Supervisor
// Tests for the Linux Thread PAL implementation

#include <gtest/gtest.h>
#include "orexa/pal/thread_pal.hpp"
#include "orexa/pal/pal_types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <thread>

#if defined(__linux__)
#include "orexa/pal/linux/linux_thread_pal.hpp"
#include <pthread.h>
#endif

namespace orexa {
namespace pal {
namespace test {

#if defined(__linux__)

class LinuxThreadPALTest : public ::testing::Test {
protected:
    void SetUp() override {
        threadPal_ = std::make_unique<linux::LinuxThreadPAL>();
    }

    void TearDown() override {
        threadPal_.reset();
    }

    std::unique_ptr<linux::LinuxThreadPAL> threadPal_;
};

// =============================================================================
// Threads
// =============================================================================

TEST_F(LinuxThreadPALTest, CreateAndJoinThread) {
    std::atomic<int> value{0};

    auto handle = threadPal_->createThread(
        [](void* arg) { static_cast<std::atomic<int>*>(arg)->store(42); },
        &value, ThreadOptions{});
    ASSERT_TRUE(handle.isSuccess());
    EXPECT_NE(handle.value(), INVALID_THREAD_HANDLE);

    ASSERT_TRUE(threadPal_->joinThread(handle.value()).isSuccess());
    EXPECT_EQ(value.load(), 42);
}

TEST_F(LinuxThreadPALTest, ThreadNameIsApplied) {
    std::string observed;
    ThreadOptions options;
    options.name = "out-a1b2c3d4";

    auto handle = threadPal_->createThread([&observed](void*) {
        char name[16] = {};
        pthread_getname_np(pthread_self(), name, sizeof(name));
        observed = name;
    }, nullptr, options);
    ASSERT_TRUE(handle.isSuccess());
    ASSERT_TRUE(threadPal_->joinThread(handle.value()).isSuccess());

    EXPECT_EQ(observed, "out-a1b2c3d4");
}

TEST_F(LinuxThreadPALTest, NullFunctionIsRejected) {
    auto handle = threadPal_->createThread(ThreadFunction{}, nullptr, ThreadOptions{});

    ASSERT_TRUE(handle.isError());
    EXPECT_EQ(handle.error().code, ThreadErrorCode::CreationFailed);
}

TEST_F(LinuxThreadPALTest, JoinTwiceFails) {
    auto handle = threadPal_->createThread([](void*) {}, nullptr, ThreadOptions{});
    ASSERT_TRUE(handle.isSuccess());

    ASSERT_TRUE(threadPal_->joinThread(handle.value()).isSuccess());
    auto second = threadPal_->joinThread(handle.value());
    ASSERT_TRUE(second.isError());
    EXPECT_EQ(second.error().code, ThreadErrorCode::InvalidHandle);
}

// =============================================================================
// Thread Pools
// =============================================================================

TEST_F(LinuxThreadPALTest, PoolRunsWorkOnSeveralWorkers) {
    ThreadPoolOptions options;
    options.name = "orexa-worker";
    auto pool = threadPal_->createThreadPool(4, 4, options);
    ASSERT_TRUE(pool.isSuccess());

    std::mutex mutex;
    std::set<std::thread::id> threadIds;
    std::atomic<int> completed{0};

    for (int i = 0; i < 40; i++) {
        auto submitted = threadPal_->submitWork(pool.value(), [&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            std::lock_guard<std::mutex> lock(mutex);
            threadIds.insert(std::this_thread::get_id());
            completed++;
        });
        ASSERT_TRUE(submitted.isSuccess());
    }

    ASSERT_TRUE(threadPal_->destroyThreadPool(pool.value()).isSuccess());
    EXPECT_EQ(completed.load(), 40);
    EXPECT_GT(threadIds.size(), 1u);
}

TEST_F(LinuxThreadPALTest, DestroyDrainsQueuedWork) {
    auto pool = threadPal_->createThreadPool(1, 1, ThreadPoolOptions{});
    ASSERT_TRUE(pool.isSuccess());

    std::atomic<int> completed{0};
    for (int i = 0; i < 10; i++) {
        ASSERT_TRUE(threadPal_->submitWork(pool.value(), [&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            completed++;
        }).isSuccess());
    }

    ASSERT_TRUE(threadPal_->destroyThreadPool(pool.value()).isSuccess());
    EXPECT_EQ(completed.load(), 10);
}

TEST_F(LinuxThreadPALTest, FullQueueRejectsWork) {
    ThreadPoolOptions options;
    options.queueSize = 1;
    auto pool = threadPal_->createThreadPool(1, 1, options);
    ASSERT_TRUE(pool.isSuccess());

    std::mutex gate;
    std::unique_lock<std::mutex> hold(gate);
    std::atomic<bool> started{false};

    ASSERT_TRUE(threadPal_->submitWork(pool.value(), [&]() {
        started = true;
        std::lock_guard<std::mutex> wait(gate);
    }).isSuccess());
    while (!started.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    ASSERT_TRUE(threadPal_->submitWork(pool.value(), []() {}).isSuccess());
    auto rejected = threadPal_->submitWork(pool.value(), []() {});
    ASSERT_TRUE(rejected.isError());
    EXPECT_EQ(rejected.error().code, ThreadErrorCode::WorkQueueFull);

    hold.unlock();
    ASSERT_TRUE(threadPal_->destroyThreadPool(pool.value()).isSuccess());
}

TEST_F(LinuxThreadPALTest, InvalidPoolArguments) {
    auto zero = threadPal_->createThreadPool(0, 1, ThreadPoolOptions{});
    ASSERT_TRUE(zero.isError());
    EXPECT_EQ(zero.error().code, ThreadErrorCode::PoolCreationFailed);

    auto unknown = threadPal_->submitWork(ThreadPoolHandle{9999}, []() {});
    ASSERT_TRUE(unknown.isError());
    EXPECT_EQ(unknown.error().code, ThreadErrorCode::InvalidHandle);

    EXPECT_TRUE(threadPal_->destroyThreadPool(ThreadPoolHandle{9999}).isError());
}

TEST_F(LinuxThreadPALTest, SleepForWaitsAtLeastDuration) {
    auto start = std::chrono::steady_clock::now();
    threadPal_->sleepFor(std::chrono::milliseconds(30));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, std::chrono::milliseconds(30));
}

#endif // __linux__

} // namespace test
} // namespace pal
} // namespace orexa
