// Orexa - Game Server Supervisor
// Tests for the Linux Timer PAL implementation

#include <gtest/gtest.h>
#include "orexa/pal/timer_pal.hpp"
#include "orexa/pal/pal_types.hpp"

#include <atomic>
#include <chrono>
#include <thread>

#if defined(__linux__)
#include "orexa/pal/linux/linux_timer_pal.hpp"
#endif

namespace orexa {
namespace pal {
namespace test {

#if defined(__linux__)

class LinuxTimerPALTest : public ::testing::Test {
protected:
    void SetUp() override {
        timerPal_ = std::make_unique<linux::LinuxTimerPAL>();
    }

    void TearDown() override {
        timerPal_.reset();
    }

    template<typename Predicate>
    static bool waitUntil(Predicate predicate, std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return predicate();
    }

    std::unique_ptr<linux::LinuxTimerPAL> timerPal_;
};

// =============================================================================
// One-Shot Timers
// =============================================================================

TEST_F(LinuxTimerPALTest, ScheduleOnceFiresAfterDelay) {
    std::atomic<bool> fired{false};
    auto start = std::chrono::steady_clock::now();
    std::atomic<int64_t> elapsedMs{0};

    auto result = timerPal_->scheduleOnce(std::chrono::milliseconds{100}, [&]() {
        elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        fired = true;
    });
    ASSERT_TRUE(result.isSuccess());
    EXPECT_NE(result.value(), INVALID_TIMER_HANDLE);

    ASSERT_TRUE(waitUntil([&]() { return fired.load(); }, std::chrono::seconds(2)));
    EXPECT_GE(elapsedMs.load(), 95);
}

TEST_F(LinuxTimerPALTest, ZeroDelayStillFires) {
    std::atomic<bool> fired{false};
    ASSERT_TRUE(timerPal_->scheduleOnce(std::chrono::milliseconds{0},
                                        [&]() { fired = true; }).isSuccess());

    EXPECT_TRUE(waitUntil([&]() { return fired.load(); }, std::chrono::seconds(1)));
}

TEST_F(LinuxTimerPALTest, CancelledOneShotNeverFires) {
    std::atomic<bool> fired{false};
    auto handle = timerPal_->scheduleOnce(std::chrono::milliseconds{100}, [&]() { fired = true; });
    ASSERT_TRUE(handle.isSuccess());

    EXPECT_TRUE(timerPal_->cancelTimer(handle.value()).isSuccess());
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_FALSE(fired.load());
}

TEST_F(LinuxTimerPALTest, CancelAfterFireReportsAlreadyCancelled) {
    std::atomic<bool> fired{false};
    auto handle = timerPal_->scheduleOnce(std::chrono::milliseconds{10}, [&]() { fired = true; });
    ASSERT_TRUE(handle.isSuccess());
    ASSERT_TRUE(waitUntil([&]() { return fired.load(); }, std::chrono::seconds(1)));

    auto cancelled = timerPal_->cancelTimer(handle.value());
    ASSERT_TRUE(cancelled.isError());
    EXPECT_EQ(cancelled.error().code, TimerErrorCode::AlreadyCancelled);
    EXPECT_EQ(timerPal_->activeTimerCount(), 0u);
}

TEST_F(LinuxTimerPALTest, RejectsInvalidArguments) {
    auto noCallback = timerPal_->scheduleOnce(std::chrono::milliseconds{10}, TimerCallback{});
    ASSERT_TRUE(noCallback.isError());
    EXPECT_EQ(noCallback.error().code, TimerErrorCode::CreationFailed);

    auto negative = timerPal_->scheduleOnce(std::chrono::milliseconds{-1}, []() {});
    EXPECT_TRUE(negative.isError());

    auto invalid = timerPal_->cancelTimer(INVALID_TIMER_HANDLE);
    ASSERT_TRUE(invalid.isError());
    EXPECT_EQ(invalid.error().code, TimerErrorCode::InvalidHandle);
}

// =============================================================================
// Repeating Timers
// =============================================================================

TEST_F(LinuxTimerPALTest, RepeatingTimerFiresUntilCancelled) {
    std::atomic<int> count{0};
    auto handle = timerPal_->scheduleRepeating(std::chrono::milliseconds{20}, [&]() { count++; });
    ASSERT_TRUE(handle.isSuccess());

    ASSERT_TRUE(waitUntil([&]() { return count.load() >= 3; }, std::chrono::seconds(2)));
    ASSERT_TRUE(timerPal_->cancelTimer(handle.value()).isSuccess());

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    int afterCancel = count.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(count.load(), afterCancel);
}

TEST_F(LinuxTimerPALTest, RepeatingTimerRequiresPositiveInterval) {
    auto result = timerPal_->scheduleRepeating(std::chrono::milliseconds{0}, []() {});
    EXPECT_TRUE(result.isError());
}

TEST_F(LinuxTimerPALTest, CallbackMayCancelItsOwnRepeatingTimer) {
    std::atomic<int> count{0};
    std::atomic<uint64_t> handleValue{0};

    auto handle = timerPal_->scheduleRepeating(std::chrono::milliseconds{10}, [&]() {
        if (++count == 2) {
            (void)timerPal_->cancelTimer(TimerHandle{handleValue.load()});
        }
    });
    ASSERT_TRUE(handle.isSuccess());
    handleValue = handle.value().value;

    ASSERT_TRUE(waitUntil([&]() { return count.load() >= 2; }, std::chrono::seconds(2)));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(count.load(), 2);
}

#endif // __linux__

} // namespace test
} // namespace pal
} // namespace orexa
