// Orexa - Game Server Supervisor
// Tests for Structured Logging Component

#include <gtest/gtest.h>
#include "orexa/core/json.hpp"
#include "orexa/core/structured_logger.hpp"
#include "orexa/pal/log_pal.hpp"
#include "orexa/pal/pal_types.hpp"

#include <mutex>
#include <regex>
#include <thread>
#include <vector>

namespace orexa {
namespace core {
namespace test {

// =============================================================================
// Test Sink for Capturing Log Output
// =============================================================================

class TestLogSink : public pal::ILogSink {
public:
    struct Entry {
        pal::LogLevel level;
        std::string message;
        std::string category;
    };

    void write(pal::LogLevel level, const std::string& message,
               const std::string& category, const pal::LogContext&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(Entry{level, message, category});
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        flushCount_++;
    }

    std::string getName() const override {
        return "TestLogSink";
    }

    std::vector<Entry> getEntries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    int getFlushCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return flushCount_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    int flushCount_ = 0;
};

class StructuredLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        testSink_ = std::make_shared<TestLogSink>();
        logger_ = std::make_unique<StructuredLogger>();
        logger_->addSink(testSink_);
    }

    std::unique_ptr<StructuredLogger> logger_;
    std::shared_ptr<TestLogSink> testSink_;
};

// =============================================================================
// Levels
// =============================================================================

TEST_F(StructuredLoggerTest, FiltersMessagesBelowConfiguredLevel) {
    logger_->setLevel(LogLevelConfig::Warning);

    logger_->debug("debug line");
    logger_->info("info line");
    logger_->warning("warning line");
    logger_->error("error line");

    auto entries = testSink_->getEntries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].level, pal::LogLevel::Warning);
    EXPECT_EQ(entries[1].level, pal::LogLevel::Error);
}

TEST_F(StructuredLoggerTest, LevelNamesParseCaseInsensitively) {
    EXPECT_EQ(stringToLogLevel("DEBUG"), LogLevelConfig::Debug);
    EXPECT_EQ(stringToLogLevel("warn"), LogLevelConfig::Warning);
    EXPECT_EQ(stringToLogLevel("Error"), LogLevelConfig::Error);
    EXPECT_EQ(stringToLogLevel("chatty"), LogLevelConfig::Info);
    EXPECT_EQ(logLevelToString(LogLevelConfig::Warning), "warning");
}

// =============================================================================
// Formats
// =============================================================================

TEST_F(StructuredLoggerTest, PlainTextLineHasTimestampLevelAndCategory) {
    logger_->info("Supervisor started", "Supervisor");

    auto entries = testSink_->getEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].category, "Supervisor");

    std::regex pattern(R"(^\[\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z\] \[info\] \[Supervisor\] Supervisor started$)");
    EXPECT_TRUE(std::regex_match(entries[0].message, pattern)) << entries[0].message;
}

TEST_F(StructuredLoggerTest, JsonLineIsAParseableObject) {
    logger_->setJsonFormat(true);
    logger_->warning("Disk \"almost\" full", "Backup");

    auto entries = testSink_->getEntries();
    ASSERT_EQ(entries.size(), 1u);

    auto parsed = parseJson(entries[0].message);
    ASSERT_TRUE(parsed.isSuccess()) << entries[0].message;
    EXPECT_EQ(parsed.value()["level"].getString(), "warning");
    EXPECT_EQ(parsed.value()["category"].getString(), "Backup");
    EXPECT_EQ(parsed.value()["message"].getString(), "Disk \"almost\" full");
    EXPECT_TRUE(parsed.value()["timestamp"].isString());
}

// =============================================================================
// Instance Context
// =============================================================================

TEST_F(StructuredLoggerTest, ErrorWithContextIncludesInstanceFields) {
    LogContext ctx;
    ctx.instanceId = "a1b2c3d4";
    ctx.instanceName = "Survival";
    ctx.pid = 4242;
    ctx.errorCode = 204;

    logger_->errorWithContext("Failed to write command", ctx, "Console");

    auto entries = testSink_->getEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, pal::LogLevel::Error);
    EXPECT_NE(entries[0].message.find("instance=a1b2c3d4 name=Survival pid=4242 code=204"),
              std::string::npos);
}

TEST_F(StructuredLoggerTest, ErrorWithContextJsonFields) {
    logger_->setJsonFormat(true);
    LogContext ctx;
    ctx.instanceId = "a1b2c3d4";
    ctx.pid = 77;

    logger_->errorWithContext("Kill failed", ctx, "Supervisor");

    auto parsed = parseJson(testSink_->getEntries().at(0).message);
    ASSERT_TRUE(parsed.isSuccess());
    EXPECT_EQ(parsed.value()["instance_id"].getString(), "a1b2c3d4");
    EXPECT_EQ(parsed.value()["pid"].getInt(), 77);
    EXPECT_FALSE(parsed.value().contains("error_code"));
}

TEST_F(StructuredLoggerTest, FailureEventsLogAtWarning) {
    logger_->logInstanceEvent(InstanceEventType::Ready, "a1b2c3d4", "Survival");
    logger_->logInstanceEvent(InstanceEventType::Crashed, "a1b2c3d4", "Survival", "exit code 1");

    auto entries = testSink_->getEntries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].level, pal::LogLevel::Info);
    EXPECT_NE(entries[0].message.find("Event: ready, Instance: a1b2c3d4 (Survival)"),
              std::string::npos);
    EXPECT_EQ(entries[1].level, pal::LogLevel::Warning);
    EXPECT_NE(entries[1].message.find("exit code 1"), std::string::npos);
}

TEST_F(StructuredLoggerTest, InstanceEventJson) {
    logger_->setJsonFormat(true);
    logger_->logInstanceEvent(InstanceEventType::RestartScheduled, "a1b2c3d4", "", "in 60s");

    auto parsed = parseJson(testSink_->getEntries().at(0).message);
    ASSERT_TRUE(parsed.isSuccess());
    EXPECT_EQ(parsed.value()["event"].getString(), "restart_scheduled");
    EXPECT_EQ(parsed.value()["detail"].getString(), "in 60s");
    EXPECT_FALSE(parsed.value().contains("instance_name"));
}

// =============================================================================
// Sinks
// =============================================================================

TEST_F(StructuredLoggerTest, RemovedSinkStopsReceiving) {
    logger_->info("first");
    logger_->removeSink(testSink_);
    logger_->info("second");

    EXPECT_EQ(testSink_->size(), 1u);
}

TEST_F(StructuredLoggerTest, FlushReachesEverySink) {
    auto second = std::make_shared<TestLogSink>();
    logger_->addSink(second);

    logger_->flush();

    EXPECT_EQ(testSink_->getFlushCount(), 1);
    EXPECT_EQ(second->getFlushCount(), 1);
}

TEST_F(StructuredLoggerTest, ConcurrentWritersLoseNothing) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < 250; i++) {
                logger_->info("thread " + std::to_string(t) + " line " + std::to_string(i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(testSink_->size(), 1000u);
}

} // namespace test
} // namespace core
} // namespace orexa
