// Orexa - Game Server Supervisor
// Tests for the Linux Log PAL

#include <gtest/gtest.h>
#include "orexa/pal/log_pal.hpp"
#include "orexa/pal/pal_types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#if defined(__linux__)
#include "orexa/pal/linux/linux_log_pal.hpp"
#endif

namespace orexa {
namespace pal {
namespace test {

#if defined(__linux__)

// =============================================================================
// Recording Sink
// =============================================================================

class RecordingSink : public ILogSink {
public:
    struct Entry {
        LogLevel level;
        std::string message;
        std::string category;
        std::string threadName;
    };

    void write(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back({level, message, category, context.threadName});
    }

    void flush() override {
        flushes_++;
    }

    std::string getName() const override {
        return "RecordingSink";
    }

    std::vector<Entry> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    int flushCount() const { return flushes_.load(); }

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    std::atomic<int> flushes_{0};
};

// =============================================================================
// Linux Log PAL Tests
// =============================================================================

class LinuxLogPALTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Sinks only; keep test output free of syslog and stderr noise
        logPal_ = std::make_unique<linux::LinuxLogPAL>(false, false);
        sink_ = std::make_shared<RecordingSink>();
        logPal_->addSink(sink_);
    }

    std::unique_ptr<linux::LinuxLogPAL> logPal_;
    std::shared_ptr<RecordingSink> sink_;
    LogContext ctx_{"supervisor.cpp", 42, "start", "out-a1b2c3d4"};
};

TEST_F(LinuxLogPALTest, MessageReachesSinkWithContext) {
    logPal_->log(LogLevel::Info, "[Survival] Server is ready", "Supervisor", ctx_);

    auto entries = sink_->entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::Info);
    EXPECT_EQ(entries[0].message, "[Survival] Server is ready");
    EXPECT_EQ(entries[0].category, "Supervisor");
    EXPECT_EQ(entries[0].threadName, "out-a1b2c3d4");
}

TEST_F(LinuxLogPALTest, DefaultMinLevelIsInfo) {
    linux::LinuxLogPAL fresh(false, false);
    EXPECT_EQ(fresh.getMinLevel(), LogLevel::Info);
}

TEST_F(LinuxLogPALTest, MinLevelFiltersLowerLevels) {
    logPal_->setMinLevel(LogLevel::Warning);
    EXPECT_EQ(logPal_->getMinLevel(), LogLevel::Warning);

    logPal_->log(LogLevel::Trace, "poll tick", "Metrics", ctx_);
    logPal_->log(LogLevel::Debug, "sampled usage", "Metrics", ctx_);
    logPal_->log(LogLevel::Info, "started", "Supervisor", ctx_);
    logPal_->log(LogLevel::Warning, "stop timeout", "Supervisor", ctx_);
    logPal_->log(LogLevel::Error, "backup failed", "Backup", ctx_);
    logPal_->log(LogLevel::Critical, "registry corrupt", "Supervisor", ctx_);

    auto entries = sink_->entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].level, LogLevel::Warning);
    EXPECT_EQ(entries[2].level, LogLevel::Critical);
}

TEST_F(LinuxLogPALTest, OffLevelMessagesAreNeverWritten) {
    logPal_->setMinLevel(LogLevel::Trace);
    logPal_->log(LogLevel::Off, "never", "Supervisor", ctx_);
    EXPECT_EQ(sink_->count(), 0u);

    logPal_->setMinLevel(LogLevel::Off);
    logPal_->log(LogLevel::Critical, "muted", "Supervisor", ctx_);
    EXPECT_EQ(sink_->count(), 0u);
}

// =============================================================================
// Sink Management
// =============================================================================

TEST_F(LinuxLogPALTest, EverySinkReceivesMessage) {
    auto second = std::make_shared<RecordingSink>();
    logPal_->addSink(second);

    logPal_->log(LogLevel::Info, "fan out", "Supervisor", ctx_);

    EXPECT_EQ(sink_->count(), 1u);
    EXPECT_EQ(second->count(), 1u);
}

TEST_F(LinuxLogPALTest, RemovedSinkStopsReceiving) {
    logPal_->log(LogLevel::Info, "before", "Supervisor", ctx_);
    logPal_->removeSink(sink_);
    logPal_->log(LogLevel::Info, "after", "Supervisor", ctx_);

    EXPECT_EQ(sink_->count(), 1u);
}

TEST_F(LinuxLogPALTest, NullAndUnknownSinksAreIgnored) {
    logPal_->addSink(nullptr);
    logPal_->removeSink(nullptr);
    logPal_->removeSink(std::make_shared<RecordingSink>());

    logPal_->log(LogLevel::Info, "still delivered", "Supervisor", ctx_);
    EXPECT_EQ(sink_->count(), 1u);
}

TEST_F(LinuxLogPALTest, FlushReachesSinks) {
    logPal_->flush();
    EXPECT_EQ(sink_->flushCount(), 1);
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_F(LinuxLogPALTest, ConcurrentWritersLoseNothing) {
    const int threadCount = 8;
    const int perThread = 200;
    std::vector<std::thread> threads;

    for (int i = 0; i < threadCount; ++i) {
        threads.emplace_back([this, i, perThread]() {
            for (int j = 0; j < perThread; ++j) {
                logPal_->log(LogLevel::Info,
                             "instance " + std::to_string(i) + " line " + std::to_string(j),
                             "Console", ctx_);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(sink_->count(), static_cast<size_t>(threadCount * perThread));
}

#endif // defined(__linux__)

} // namespace test
} // namespace pal
} // namespace orexa
