// Orexa - Game Server Supervisor
// Tests for the Linux Process PAL implementation

#include <gtest/gtest.h>
#include "orexa/pal/process_pal.hpp"
#include "orexa/pal/pal_types.hpp"

#include <csignal>
#include <string>
#include <vector>

#include <unistd.h>

#if defined(__linux__)
#include "orexa/pal/linux/linux_process_pal.hpp"
#endif

namespace orexa {
namespace pal {
namespace test {

#if defined(__linux__)

class LinuxProcessPALTest : public ::testing::Test {
protected:
    void SetUp() override {
        processPal_ = std::make_unique<linux::LinuxProcessPAL>();
    }

    std::unique_ptr<IChildProcess> spawnShell(const std::string& script) {
        ProcessOptions options;
        options.argv = {"sh", "-c", script};
        auto result = processPal_->spawn(options);
        if (result.isError()) {
            ADD_FAILURE() << result.error().message;
            return nullptr;
        }
        return std::move(result.value());
    }

    std::unique_ptr<linux::LinuxProcessPAL> processPal_;
};

// =============================================================================
// Spawn and Streams
// =============================================================================

TEST_F(LinuxProcessPALTest, ReadsStdoutAndStderrSeparately) {
    auto child = spawnShell("echo out-line; echo err-line 1>&2");
    ASSERT_NE(child, nullptr);
    EXPECT_GT(child->pid(), 0);

    auto out = child->readLine(ProcessStream::StdOut);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, "out-line");
    EXPECT_FALSE(child->readLine(ProcessStream::StdOut).has_value());

    auto err = child->readLine(ProcessStream::StdErr);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(*err, "err-line");

    auto status = child->wait();
    ASSERT_TRUE(status.isSuccess());
    EXPECT_TRUE(status.value().success());
}

TEST_F(LinuxProcessPALTest, CarriageReturnIsStripped) {
    auto child = spawnShell("printf 'Done (3.2s)!\\r\\n'");
    ASSERT_NE(child, nullptr);

    auto line = child->readLine(ProcessStream::StdOut);
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "Done (3.2s)!");
    ASSERT_TRUE(child->wait().isSuccess());
}

TEST_F(LinuxProcessPALTest, OverlongLineIsCut) {
    // 1.5 MiB without a newline, then a normal line
    auto child = spawnShell("head -c 1572864 /dev/zero | tr '\\0' x; echo; echo next");
    ASSERT_NE(child, nullptr);

    auto cut = child->readLine(ProcessStream::StdOut);
    ASSERT_TRUE(cut.has_value());
    EXPECT_EQ(cut->size(), MAX_OUTPUT_LINE_BYTES);
    EXPECT_EQ(cut->find_first_not_of('x'), std::string::npos);

    auto next = child->readLine(ProcessStream::StdOut);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, "next");
    EXPECT_FALSE(child->readLine(ProcessStream::StdOut).has_value());
    ASSERT_TRUE(child->wait().isSuccess());
}

TEST_F(LinuxProcessPALTest, InputReachesChild) {
    ProcessOptions options;
    options.argv = {"cat"};
    auto spawned = processPal_->spawn(options);
    ASSERT_TRUE(spawned.isSuccess());
    auto child = std::move(spawned.value());

    ASSERT_TRUE(child->writeInput("list\n").isSuccess());
    auto echoed = child->readLine(ProcessStream::StdOut);
    ASSERT_TRUE(echoed.has_value());
    EXPECT_EQ(*echoed, "list");

    child->closeInput();
    auto closed = child->writeInput("stop\n");
    ASSERT_TRUE(closed.isError());
    EXPECT_EQ(closed.error().code, ProcessErrorCode::InputClosed);

    auto status = child->wait();
    ASSERT_TRUE(status.isSuccess());
    EXPECT_TRUE(status.value().success());
}

// =============================================================================
// Exit Status
// =============================================================================

TEST_F(LinuxProcessPALTest, NonZeroExitCodeIsReported) {
    auto child = spawnShell("exit 3");
    ASSERT_NE(child, nullptr);

    auto status = child->wait();
    ASSERT_TRUE(status.isSuccess());
    EXPECT_TRUE(status.value().exited);
    EXPECT_EQ(status.value().exitCode, 3);
    EXPECT_FALSE(status.value().success());

    auto again = child->wait();
    ASSERT_TRUE(again.isSuccess());
    EXPECT_EQ(again.value().exitCode, 3);
}

TEST_F(LinuxProcessPALTest, KillEndsChildWithSignal) {
    auto child = spawnShell("sleep 30");
    ASSERT_NE(child, nullptr);

    ASSERT_TRUE(child->kill().isSuccess());
    auto status = child->wait();
    ASSERT_TRUE(status.isSuccess());
    EXPECT_FALSE(status.value().exited);
    EXPECT_EQ(status.value().signal, SIGKILL);

    EXPECT_TRUE(child->kill().isSuccess());
}

// =============================================================================
// Launch Failures
// =============================================================================

TEST_F(LinuxProcessPALTest, EmptyCommandIsRejected) {
    auto result = processPal_->spawn(ProcessOptions{});

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ProcessErrorCode::InvalidCommand);
}

TEST_F(LinuxProcessPALTest, MissingProgramReportsExecFailed) {
    ProcessOptions options;
    options.argv = {"orexa-no-such-program-7f3a"};
    auto result = processPal_->spawn(options);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ProcessErrorCode::ExecFailed);
}

TEST_F(LinuxProcessPALTest, MissingWorkingDirectoryIsReported) {
    ProcessOptions options;
    options.argv = {"true"};
    options.workingDirectory = "/nonexistent/orexa/server";
    auto result = processPal_->spawn(options);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ProcessErrorCode::WorkingDirectory);
}

TEST_F(LinuxProcessPALTest, ChildStartsInWorkingDirectory) {
    ProcessOptions options;
    options.argv = {"pwd"};
    options.workingDirectory = "/tmp";
    auto spawned = processPal_->spawn(options);
    ASSERT_TRUE(spawned.isSuccess());

    auto line = spawned.value()->readLine(ProcessStream::StdOut);
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "/tmp");
    ASSERT_TRUE(spawned.value()->wait().isSuccess());
}

// =============================================================================
// Run and Capture
// =============================================================================

TEST_F(LinuxProcessPALTest, RunAndCaptureCombinesOutput) {
    auto result = processPal_->runAndCapture({"sh", "-c", "echo one; echo two 1>&2; exit 4"}, "");

    ASSERT_TRUE(result.isSuccess());
    EXPECT_NE(result.value().output.find("one"), std::string::npos);
    EXPECT_NE(result.value().output.find("two"), std::string::npos);
    EXPECT_EQ(result.value().status.exitCode, 4);
}

TEST_F(LinuxProcessPALTest, RunAndCaptureHasNoInput) {
    auto result = processPal_->runAndCapture({"cat"}, "");

    ASSERT_TRUE(result.isSuccess());
    EXPECT_TRUE(result.value().output.empty());
    EXPECT_TRUE(result.value().status.success());
}

// =============================================================================
// Usage Sampling
// =============================================================================

TEST_F(LinuxProcessPALTest, SamplesOwnUsage) {
    auto usage = processPal_->sampleUsage(static_cast<int32_t>(getpid()));

    ASSERT_TRUE(usage.isSuccess());
    EXPECT_GT(usage.value().rssBytes, 0u);
    EXPECT_GT(usage.value().ticksPerSecond, 0u);
}

TEST_F(LinuxProcessPALTest, ReapedProcessIsNotFound) {
    auto child = spawnShell("exit 0");
    ASSERT_NE(child, nullptr);
    int32_t pid = child->pid();
    ASSERT_TRUE(child->wait().isSuccess());

    auto usage = processPal_->sampleUsage(pid);
    ASSERT_TRUE(usage.isError());
    EXPECT_EQ(usage.error().code, ProcessErrorCode::NotFound);
}

#endif // __linux__

} // namespace test
} // namespace pal
} // namespace orexa
