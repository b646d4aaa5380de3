// Orexa - Game Server Supervisor
// Linux Process PAL Implementation
//
// fork/execvp with pipe2() standard streams, waitid()/waitpid() reaping and
// /proc sampling.

#ifndef OREXA_PAL_LINUX_LINUX_PROCESS_PAL_HPP
#define OREXA_PAL_LINUX_LINUX_PROCESS_PAL_HPP

#include "orexa/pal/process_pal.hpp"
#include "orexa/pal/pal_types.hpp"
#include "orexa/core/result.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#if defined(__linux__)
#include <sys/types.h>

namespace orexa {
namespace pal {
namespace linux {

/**
 * @brief Child process launched by LinuxProcessPAL.
 */
class LinuxChildProcess : public IChildProcess {
public:
    LinuxChildProcess(pid_t pid, int stdinFd, int stdoutFd, int stderrFd);
    ~LinuxChildProcess() override;

    // Non-copyable, non-movable
    LinuxChildProcess(const LinuxChildProcess&) = delete;
    LinuxChildProcess& operator=(const LinuxChildProcess&) = delete;
    LinuxChildProcess(LinuxChildProcess&&) = delete;
    LinuxChildProcess& operator=(LinuxChildProcess&&) = delete;

    int32_t pid() const override { return static_cast<int32_t>(pid_); }

    core::Result<void, ProcessError> writeInput(const std::string& data) override;

    void closeInput() override;

    std::optional<std::string> readLine(ProcessStream stream) override;

    core::Result<ProcessExitStatus, ProcessError> wait() override;

    core::Result<void, ProcessError> kill() override;

private:
    struct OutputPipe {
        int fd = -1;
        std::string buffer;
        bool eof = false;
        bool skipping = false;      ///< Dropping the tail of an overlong line
    };

    const pid_t pid_;

    std::mutex inputMutex_;
    int stdinFd_;

    OutputPipe stdout_;
    OutputPipe stderr_;

    std::mutex stateMutex_;
    bool reaped_ = false;
    ProcessExitStatus exitStatus_;
};

/**
 * @brief Linux implementation of IProcessPAL.
 *
 * Constructing the PAL sets SIGPIPE to ignored for the whole process so that
 * writes to a dead child's stdin fail with EPIPE instead of terminating the
 * supervisor. Children get the default disposition back before exec.
 */
class LinuxProcessPAL : public IProcessPAL {
public:
    LinuxProcessPAL();
    ~LinuxProcessPAL() override = default;

    // Non-copyable, non-movable
    LinuxProcessPAL(const LinuxProcessPAL&) = delete;
    LinuxProcessPAL& operator=(const LinuxProcessPAL&) = delete;
    LinuxProcessPAL(LinuxProcessPAL&&) = delete;
    LinuxProcessPAL& operator=(LinuxProcessPAL&&) = delete;

    core::Result<std::unique_ptr<IChildProcess>, ProcessError> spawn(
        const ProcessOptions& options
    ) override;

    core::Result<ProcessUsage, ProcessError> sampleUsage(int32_t pid) override;

    core::Result<CommandOutput, ProcessError> runAndCapture(
        const std::vector<std::string>& argv,
        const std::string& workingDirectory
    ) override;

private:
    struct LaunchedChild {
        pid_t pid = -1;
        int stdinFd = -1;
        int stdoutFd = -1;
        int stderrFd = -1;
    };

    /**
     * @brief Fork and exec.
     *
     * @param mergeStderr Route stderr into the stdout pipe
     */
    static core::Result<LaunchedChild, ProcessError> launch(
        const std::vector<std::string>& argv,
        const std::string& workingDirectory,
        bool pipeInput,
        bool captureOutput,
        bool mergeStderr
    );
};

} // namespace linux
} // namespace pal
} // namespace orexa

#endif // defined(__linux__)
#endif // OREXA_PAL_LINUX_LINUX_PROCESS_PAL_HPP
