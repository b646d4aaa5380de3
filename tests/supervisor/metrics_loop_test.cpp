// Orexa - Game Server Supervisor
// Tests for metrics sampling and status polling

#include <gtest/gtest.h>
#include "orexa/supervisor/metrics_loop.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#if defined(__linux__)
#include "orexa/pal/linux/linux_thread_pal.hpp"
#include "orexa/pal/linux/linux_timer_pal.hpp"
#endif

namespace orexa {
namespace supervisor {
namespace test {

using namespace std::chrono_literals;

namespace {

// Each sample adds half a second of CPU over one second of wall time.
class FakeProcessPAL : public pal::IProcessPAL {
public:
    core::Result<std::unique_ptr<pal::IChildProcess>, pal::ProcessError> spawn(
        const pal::ProcessOptions&) override
    {
        return core::Result<std::unique_ptr<pal::IChildProcess>, pal::ProcessError>::error(
            pal::ProcessError{pal::ProcessErrorCode::ExecFailed, "not supported"});
    }

    core::Result<pal::ProcessUsage, pal::ProcessError> sampleUsage(int32_t pid) override {
        int n = samples.fetch_add(1);
        if (gone) {
            return core::Result<pal::ProcessUsage, pal::ProcessError>::error(
                pal::ProcessError{pal::ProcessErrorCode::NotFound,
                                  "no such process: " + std::to_string(pid)});
        }
        pal::ProcessUsage usage;
        usage.cpuTicks = 100 + 50 * static_cast<uint64_t>(n);
        usage.ticksPerSecond = 100;
        usage.rssBytes = 256ull * 1024 * 1024;
        usage.sampledAt = base + std::chrono::seconds(n);
        return core::Result<pal::ProcessUsage, pal::ProcessError>::success(usage);
    }

    core::Result<pal::CommandOutput, pal::ProcessError> runAndCapture(
        const std::vector<std::string>&, const std::string&) override
    {
        return core::Result<pal::CommandOutput, pal::ProcessError>::error(
            pal::ProcessError{pal::ProcessErrorCode::ExecFailed, "not supported"});
    }

    std::atomic<int> samples{0};
    bool gone = false;
    std::chrono::steady_clock::time_point base = std::chrono::steady_clock::now();
};

class CommandRecorder {
public:
    CommandSender sender() {
        return [this](const std::string& command) {
            std::lock_guard<std::mutex> lock(mutex_);
            commands_.push_back(command);
            return core::Result<void, core::Error>::success();
        };
    }

    std::vector<std::string> commands() {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands_;
    }

    size_t count(const std::string& command) {
        auto all = commands();
        return static_cast<size_t>(std::count(all.begin(), all.end(), command));
    }

private:
    std::mutex mutex_;
    std::vector<std::string> commands_;
};

} // anonymous namespace

TEST(CpuPercentTest, OneCoreFraction) {
    pal::ProcessUsage previous;
    previous.cpuTicks = 100;
    previous.ticksPerSecond = 100;
    previous.sampledAt = std::chrono::steady_clock::now();

    pal::ProcessUsage current = previous;
    current.cpuTicks = 150;
    current.sampledAt = previous.sampledAt + 1s;
    EXPECT_DOUBLE_EQ(cpuPercentBetween(previous, current), 50.0);

    current.cpuTicks = 400;
    current.sampledAt = previous.sampledAt + 2s;
    EXPECT_DOUBLE_EQ(cpuPercentBetween(previous, current), 150.0);
}

TEST(CpuPercentTest, DegenerateSamplesGiveZero) {
    pal::ProcessUsage previous;
    previous.cpuTicks = 100;
    previous.sampledAt = std::chrono::steady_clock::now();

    pal::ProcessUsage sameInstant = previous;
    sameInstant.cpuTicks = 200;
    EXPECT_DOUBLE_EQ(cpuPercentBetween(previous, sameInstant), 0.0);

    pal::ProcessUsage wentBackwards = previous;
    wentBackwards.cpuTicks = 50;
    wentBackwards.sampledAt = previous.sampledAt + 1s;
    EXPECT_DOUBLE_EQ(cpuPercentBetween(previous, wentBackwards), 0.0);
}

#if defined(__linux__)

class MetricsLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        runtime_ = std::make_shared<InstanceRuntime>(100, 10, 10);
        runtime_->pid = 4242;
        runtime_->status = core::InstanceStatus::Running;
        processPal_ = std::make_shared<FakeProcessPAL>();
        threadPal_ = std::make_shared<pal::linux::LinuxThreadPAL>();
        timerPal_ = std::make_shared<pal::linux::LinuxTimerPAL>();
    }

    std::shared_ptr<MetricsLoop> makeLoop(PollingPlan plan) {
        return std::make_shared<MetricsLoop>(runtime_, processPal_, timerPal_, threadPal_,
                                             pal::INVALID_THREAD_POOL_HANDLE, std::move(plan),
                                             recorder_.sender());
    }

    static PollingPlan paperPlan() {
        PollingPlan plan;
        plan.tpsCommand = std::string("tps");
        plan.listCommand = "minecraft:list";
        return plan;
    }

    void tick(MetricsLoop& loop, int times) {
        for (int i = 0; i < times; i++) {
            loop.tick();
        }
    }

    std::shared_ptr<InstanceRuntime> runtime_;
    std::shared_ptr<FakeProcessPAL> processPal_;
    std::shared_ptr<pal::linux::LinuxThreadPAL> threadPal_;
    std::shared_ptr<pal::linux::LinuxTimerPAL> timerPal_;
    CommandRecorder recorder_;
};

// =============================================================================
// Sampling
// =============================================================================

TEST_F(MetricsLoopTest, FirstSampleSetsRamSecondSetsCpu) {
    auto loop = makeLoop(paperPlan());

    loop->tick();
    {
        InstanceLock lock(runtime_->mutex);
        EXPECT_EQ(runtime_->ramBytes, 256ull * 1024 * 1024);
        EXPECT_DOUBLE_EQ(runtime_->cpu, 0.0);
    }

    loop->tick();
    InstanceLock lock(runtime_->mutex);
    EXPECT_DOUBLE_EQ(runtime_->cpu, 50.0);
}

TEST_F(MetricsLoopTest, NoProcessMeansNoSample) {
    runtime_->pid = core::INVALID_PROCESS_ID;
    auto loop = makeLoop(paperPlan());

    tick(*loop, 20);

    EXPECT_EQ(processPal_->samples.load(), 0);
    EXPECT_TRUE(recorder_.commands().empty());
}

TEST_F(MetricsLoopTest, VanishedProcessKeepsLastValues) {
    auto loop = makeLoop(PollingPlan{});
    loop->tick();

    processPal_->gone = true;
    loop->tick();

    InstanceLock lock(runtime_->mutex);
    EXPECT_EQ(runtime_->ramBytes, 256ull * 1024 * 1024);
}

// =============================================================================
// Polling Cadences
// =============================================================================

TEST_F(MetricsLoopTest, TpsQueryEveryFifteenTicksWhileRunning) {
    auto loop = makeLoop(paperPlan());

    tick(*loop, TPS_POLL_TICKS - 1);
    EXPECT_EQ(recorder_.count("tps"), 0u);

    loop->tick();
    EXPECT_EQ(recorder_.count("tps"), 1u);
    InstanceLock lock(runtime_->mutex);
    EXPECT_NE(runtime_->lastTpsCommand, SteadyTime{});
}

TEST_F(MetricsLoopTest, NothingPolledWhileBooting) {
    runtime_->status = core::InstanceStatus::Booting;
    runtime_->pendingListRefresh = true;
    runtime_->pingSupported = true;
    runtime_->players["Steve"].name = "Steve";
    auto loop = makeLoop(paperPlan());

    tick(*loop, 20);

    EXPECT_TRUE(recorder_.commands().empty());
    EXPECT_EQ(processPal_->samples.load(), 20);
}

TEST_F(MetricsLoopTest, FlavorWithoutTpsCommandNeverAsks) {
    PollingPlan plan;
    plan.listCommand = "list";
    auto loop = makeLoop(plan);

    tick(*loop, 2 * TPS_POLL_TICKS);

    for (const auto& command : recorder_.commands()) {
        EXPECT_EQ(command.find("tps"), std::string::npos) << command;
    }
}

TEST_F(MetricsLoopTest, DuePendingRefreshSendsListOnce) {
    {
        InstanceLock lock(runtime_->mutex);
        runtime_->pendingListRefresh = true;
        runtime_->nextListRefreshAt = std::chrono::steady_clock::now() - 1ms;
    }
    auto loop = makeLoop(paperPlan());

    tick(*loop, 3);

    EXPECT_EQ(recorder_.count("minecraft:list"), 1u);
    InstanceLock lock(runtime_->mutex);
    EXPECT_FALSE(runtime_->pendingListRefresh);
    EXPECT_NE(runtime_->lastRosterCommand, SteadyTime{});
}

TEST_F(MetricsLoopTest, FutureRefreshWaits) {
    {
        InstanceLock lock(runtime_->mutex);
        runtime_->pendingListRefresh = true;
        runtime_->nextListRefreshAt = std::chrono::steady_clock::now() + 1h;
    }
    auto loop = makeLoop(paperPlan());

    tick(*loop, 3);

    EXPECT_EQ(recorder_.count("minecraft:list"), 0u);
    InstanceLock lock(runtime_->mutex);
    EXPECT_TRUE(runtime_->pendingListRefresh);
}

TEST_F(MetricsLoopTest, PeriodicRosterResync) {
    auto loop = makeLoop(paperPlan());

    tick(*loop, ROSTER_RESYNC_TICKS);

    EXPECT_EQ(recorder_.count("minecraft:list"), 1u);
}

TEST_F(MetricsLoopTest, ProxyNeverListsPlayers) {
    runtime_->pendingListRefresh = true;
    PollingPlan plan;
    plan.rosterPolling = false;
    auto loop = makeLoop(plan);

    tick(*loop, ROSTER_RESYNC_TICKS);

    EXPECT_EQ(recorder_.count("list"), 0u);
}

TEST_F(MetricsLoopTest, LatencyPollSkipsBlockedPlayers) {
    {
        InstanceLock lock(runtime_->mutex);
        runtime_->pingSupported = true;
        runtime_->players["Alex"].name = "Alex";
        runtime_->players["Steve"].name = "Steve";
        runtime_->pingBlocked.insert("Steve");
    }
    auto loop = makeLoop(PollingPlan{});

    tick(*loop, LATENCY_POLL_TICKS);

    EXPECT_EQ(recorder_.count("ping Alex"), 1u);
    EXPECT_EQ(recorder_.count("ping Steve"), 0u);
    InstanceLock lock(runtime_->mutex);
    EXPECT_EQ(runtime_->lastPingPlayer, "Alex");
    EXPECT_NE(runtime_->lastPingCommand, SteadyTime{});
}

TEST_F(MetricsLoopTest, LatencyPollNeedsSupport) {
    runtime_->players["Alex"].name = "Alex";
    auto loop = makeLoop(PollingPlan{});

    tick(*loop, LATENCY_POLL_TICKS);

    EXPECT_EQ(recorder_.count("ping Alex"), 0u);
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(MetricsLoopTest, StoppedLoopDoesNothing) {
    auto loop = makeLoop(paperPlan());
    loop->stop();
    loop->stop();

    loop->tick();

    EXPECT_TRUE(loop->isStopped());
    EXPECT_EQ(processPal_->samples.load(), 0);
    EXPECT_TRUE(loop->start(10ms).isError());
}

TEST_F(MetricsLoopTest, TimerDispatchesTicksToPool) {
    auto pool = threadPal_->createThreadPool(1, 1, pal::ThreadPoolOptions{});
    ASSERT_TRUE(pool.isSuccess());
    auto loop = std::make_shared<MetricsLoop>(runtime_, processPal_, timerPal_, threadPal_,
                                              pool.value(), PollingPlan{}, recorder_.sender());

    ASSERT_TRUE(loop->start(10ms).isSuccess());
    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (processPal_->samples.load() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    loop->stop();
    ASSERT_TRUE(threadPal_->destroyThreadPool(pool.value()).isSuccess());

    EXPECT_GE(processPal_->samples.load(), 3);
    int afterStop = processPal_->samples.load();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(processPal_->samples.load(), afterStop);
}

#endif // __linux__

} // namespace test
} // namespace supervisor
} // namespace orexa
