// Orexa - Game Server Supervisor
// Linux Process PAL Implementation

#include "orexa/pal/linux/linux_process_pal.hpp"

#if defined(__linux__)

#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <errno.h>
#include <algorithm>
#include <cstring>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace orexa {
namespace pal {
namespace linux {

namespace {

// Reported by the child over the status pipe when it cannot reach exec
struct ChildFailure {
    int stage;   // 1 = chdir, 2 = exec
    int error;
};

constexpr int CHILD_STAGE_CHDIR = 1;
constexpr int CHILD_STAGE_EXEC = 2;

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

ProcessExitStatus decodeWaitStatus(int status) {
    ProcessExitStatus result;
    if (WIFEXITED(status)) {
        result.exited = true;
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exited = false;
        result.signal = WTERMSIG(status);
    }
    return result;
}

pid_t waitpidRetry(pid_t pid, int* status) {
    pid_t result;
    do {
        result = ::waitpid(pid, status, 0);
    } while (result == -1 && errno == EINTR);
    return result;
}

void stripCarriageReturn(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

} // anonymous namespace

// =============================================================================
// LinuxChildProcess
// =============================================================================

LinuxChildProcess::LinuxChildProcess(pid_t pid, int stdinFd, int stdoutFd, int stderrFd)
    : pid_(pid)
    , stdinFd_(stdinFd)
{
    stdout_.fd = stdoutFd;
    stderr_.fd = stderrFd;
}

LinuxChildProcess::~LinuxChildProcess() {
    {
        std::lock_guard<std::mutex> lock(inputMutex_);
        closeFd(stdinFd_);
    }
    closeFd(stdout_.fd);
    closeFd(stderr_.fd);

    std::lock_guard<std::mutex> lock(stateMutex_);
    if (!reaped_) {
        if (::kill(-pid_, SIGKILL) == -1) {
            ::kill(pid_, SIGKILL);
        }
        int status = 0;
        waitpidRetry(pid_, &status);
        reaped_ = true;
    }
}

core::Result<void, ProcessError> LinuxChildProcess::writeInput(const std::string& data) {
    std::lock_guard<std::mutex> lock(inputMutex_);
    if (stdinFd_ < 0) {
        return core::Result<void, ProcessError>::error(
            ProcessError{ProcessErrorCode::InputClosed, "stdin pipe is not open"}
        );
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(stdinFd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            return core::Result<void, ProcessError>::error(
                ProcessError{ProcessErrorCode::WriteFailed,
                             "write to stdin failed: " + std::string(strerror(err)), err}
            );
        }
        written += static_cast<size_t>(n);
    }

    return core::Result<void, ProcessError>::success();
}

void LinuxChildProcess::closeInput() {
    std::lock_guard<std::mutex> lock(inputMutex_);
    closeFd(stdinFd_);
}

std::optional<std::string> LinuxChildProcess::readLine(ProcessStream stream) {
    OutputPipe& pipe = (stream == ProcessStream::StdOut) ? stdout_ : stderr_;

    while (true) {
        size_t newline = pipe.buffer.find('\n');
        if (newline != std::string::npos) {
            if (pipe.skipping) {
                pipe.buffer.erase(0, newline + 1);
                pipe.skipping = false;
                continue;
            }
            std::string line = pipe.buffer.substr(0, std::min(newline, MAX_OUTPUT_LINE_BYTES));
            pipe.buffer.erase(0, newline + 1);
            stripCarriageReturn(line);
            return line;
        }

        if (pipe.skipping) {
            pipe.buffer.clear();
        } else if (pipe.buffer.size() >= MAX_OUTPUT_LINE_BYTES) {
            std::string line = pipe.buffer.substr(0, MAX_OUTPUT_LINE_BYTES);
            pipe.buffer.clear();
            pipe.skipping = true;
            return line;
        }

        if (pipe.eof || pipe.fd < 0) {
            if (pipe.buffer.empty()) {
                return std::nullopt;
            }
            std::string line;
            line.swap(pipe.buffer);
            stripCarriageReturn(line);
            return line;
        }

        char chunk[4096];
        ssize_t n = ::read(pipe.fd, chunk, sizeof(chunk));
        if (n > 0) {
            pipe.buffer.append(chunk, static_cast<size_t>(n));
        } else if (n == 0) {
            pipe.eof = true;
        } else if (errno != EINTR) {
            pipe.eof = true;
        }
    }
}

core::Result<ProcessExitStatus, ProcessError> LinuxChildProcess::wait() {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (reaped_) {
            return core::Result<ProcessExitStatus, ProcessError>::success(exitStatus_);
        }
    }

    // Wait without reaping so kill() never signals a recycled pid
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) == -1) {
        if (errno == EINTR) {
            continue;
        }
        if (errno == ECHILD) {
            break;
        }
        int err = errno;
        return core::Result<ProcessExitStatus, ProcessError>::error(
            ProcessError{ProcessErrorCode::WaitFailed,
                         "waitid failed: " + std::string(strerror(err)), err}
        );
    }

    std::lock_guard<std::mutex> lock(stateMutex_);
    if (!reaped_) {
        int status = 0;
        if (waitpidRetry(pid_, &status) == -1) {
            int err = errno;
            return core::Result<ProcessExitStatus, ProcessError>::error(
                ProcessError{ProcessErrorCode::WaitFailed,
                             "waitpid failed: " + std::string(strerror(err)), err}
            );
        }
        exitStatus_ = decodeWaitStatus(status);
        reaped_ = true;
    }
    return core::Result<ProcessExitStatus, ProcessError>::success(exitStatus_);
}

core::Result<void, ProcessError> LinuxChildProcess::kill() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (reaped_) {
        return core::Result<void, ProcessError>::success();
    }

    // The child leads its own process group; take wrapper scripts' children too
    if (::kill(-pid_, SIGKILL) == 0) {
        return core::Result<void, ProcessError>::success();
    }
    if (::kill(pid_, SIGKILL) == -1 && errno != ESRCH) {
        int err = errno;
        return core::Result<void, ProcessError>::error(
            ProcessError{ProcessErrorCode::SignalFailed,
                         "kill failed: " + std::string(strerror(err)), err}
        );
    }
    return core::Result<void, ProcessError>::success();
}

// =============================================================================
// LinuxProcessPAL
// =============================================================================

LinuxProcessPAL::LinuxProcessPAL() {
    ::signal(SIGPIPE, SIG_IGN);
}

core::Result<LinuxProcessPAL::LaunchedChild, ProcessError> LinuxProcessPAL::launch(
    const std::vector<std::string>& argv,
    const std::string& workingDirectory,
    bool pipeInput,
    bool captureOutput,
    bool mergeStderr
) {
    using LaunchResult = core::Result<LaunchedChild, ProcessError>;

    if (argv.empty() || argv[0].empty()) {
        return LaunchResult::error(
            ProcessError{ProcessErrorCode::InvalidCommand, "empty command line"}
        );
    }

    // Everything the child touches between fork and exec is prepared here
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};

    auto closeAll = [&]() {
        closeFd(inPipe[0]); closeFd(inPipe[1]);
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        closeFd(statusPipe[0]); closeFd(statusPipe[1]);
    };

    bool pipesOk = ::pipe2(statusPipe, O_CLOEXEC) == 0;
    if (pipesOk && pipeInput) {
        pipesOk = ::pipe2(inPipe, O_CLOEXEC) == 0;
    }
    if (pipesOk && captureOutput) {
        pipesOk = ::pipe2(outPipe, O_CLOEXEC) == 0;
    }
    if (pipesOk && captureOutput && !mergeStderr) {
        pipesOk = ::pipe2(errPipe, O_CLOEXEC) == 0;
    }
    if (!pipesOk) {
        int err = errno;
        closeAll();
        return LaunchResult::error(
            ProcessError{ProcessErrorCode::PipeFailed,
                         "pipe2 failed: " + std::string(strerror(err)), err}
        );
    }

    const char* cwd = workingDirectory.empty() ? nullptr : workingDirectory.c_str();
    long maxFd = ::sysconf(_SC_OPEN_MAX);
    if (maxFd < 0 || maxFd > 65536) {
        maxFd = 65536;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        closeAll();
        return LaunchResult::error(
            ProcessError{ProcessErrorCode::ForkFailed,
                         "fork failed: " + std::string(strerror(err)), err}
        );
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        ::setpgid(0, 0);
        ::signal(SIGPIPE, SIG_DFL);
        sigset_t emptyMask;
        sigemptyset(&emptyMask);
        ::sigprocmask(SIG_SETMASK, &emptyMask, nullptr);

        int devNull = ::open("/dev/null", O_RDWR);
        int childIn = pipeInput ? inPipe[0] : devNull;
        int childOut = captureOutput ? outPipe[1] : devNull;
        int childErr = captureOutput ? (mergeStderr ? outPipe[1] : errPipe[1]) : devNull;
        ::dup2(childIn, STDIN_FILENO);
        ::dup2(childOut, STDOUT_FILENO);
        ::dup2(childErr, STDERR_FILENO);

        for (int fd = 3; fd < maxFd; ++fd) {
            if (fd != statusPipe[1]) {
                ::close(fd);
            }
        }

        ChildFailure failure{0, 0};
        if (cwd != nullptr && ::chdir(cwd) != 0) {
            failure = ChildFailure{CHILD_STAGE_CHDIR, errno};
        } else {
            ::execvp(args[0], args.data());
            failure = ChildFailure{CHILD_STAGE_EXEC, errno};
        }
        ssize_t ignored = ::write(statusPipe[1], &failure, sizeof(failure));
        (void)ignored;
        ::_exit(127);
    }

    // Parent
    closeFd(statusPipe[1]);
    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    ChildFailure failure{0, 0};
    ssize_t n;
    do {
        n = ::read(statusPipe[0], &failure, sizeof(failure));
    } while (n == -1 && errno == EINTR);
    closeFd(statusPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        waitpidRetry(pid, &status);
        closeAll();
        if (failure.stage == CHILD_STAGE_CHDIR) {
            return LaunchResult::error(
                ProcessError{ProcessErrorCode::WorkingDirectory,
                             "cannot enter " + workingDirectory + ": " + std::string(strerror(failure.error)),
                             failure.error}
            );
        }
        return LaunchResult::error(
            ProcessError{ProcessErrorCode::ExecFailed,
                         "cannot execute " + argv[0] + ": " + std::string(strerror(failure.error)),
                         failure.error}
        );
    }

    LaunchedChild child;
    child.pid = pid;
    child.stdinFd = inPipe[1];
    child.stdoutFd = outPipe[0];
    child.stderrFd = errPipe[0];
    return LaunchResult::success(child);
}

core::Result<std::unique_ptr<IChildProcess>, ProcessError> LinuxProcessPAL::spawn(
    const ProcessOptions& options
) {
    using SpawnResult = core::Result<std::unique_ptr<IChildProcess>, ProcessError>;

    auto launched = launch(options.argv, options.workingDirectory,
                           options.pipeInput, options.captureOutput, false);
    if (launched.isError()) {
        return SpawnResult::error(launched.error());
    }

    const LaunchedChild& child = launched.value();
    return SpawnResult::success(std::make_unique<LinuxChildProcess>(
        child.pid, child.stdinFd, child.stdoutFd, child.stderrFd));
}

core::Result<ProcessUsage, ProcessError> LinuxProcessPAL::sampleUsage(int32_t pid) {
    using UsageResult = core::Result<ProcessUsage, ProcessError>;

    std::string procDir = "/proc/" + std::to_string(pid);
    std::ifstream statFile(procDir + "/stat");
    std::string statLine;
    if (!statFile || !std::getline(statFile, statLine)) {
        return UsageResult::error(
            ProcessError{ProcessErrorCode::NotFound, "no such process: " + std::to_string(pid), ESRCH}
        );
    }

    // The command name may contain spaces; fields resume after the last ')'
    size_t commEnd = statLine.rfind(')');
    if (commEnd == std::string::npos) {
        return UsageResult::error(
            ProcessError{ProcessErrorCode::Unknown, "malformed " + procDir + "/stat"}
        );
    }

    std::istringstream fields(statLine.substr(commEnd + 1));
    std::vector<std::string> tokens;
    std::string token;
    while (fields >> token) {
        tokens.push_back(token);
    }
    // tokens[0] is field 3 (state); utime and stime are fields 14 and 15
    if (tokens.size() < 13) {
        return UsageResult::error(
            ProcessError{ProcessErrorCode::Unknown, "malformed " + procDir + "/stat"}
        );
    }

    ProcessUsage usage;
    usage.cpuTicks = std::stoull(tokens[11]) + std::stoull(tokens[12]);
    long ticks = ::sysconf(_SC_CLK_TCK);
    usage.ticksPerSecond = ticks > 0 ? static_cast<uint64_t>(ticks) : 100;
    usage.sampledAt = std::chrono::steady_clock::now();

    std::ifstream statmFile(procDir + "/statm");
    uint64_t sizePages = 0;
    uint64_t residentPages = 0;
    if (statmFile >> sizePages >> residentPages) {
        long pageSize = ::sysconf(_SC_PAGESIZE);
        usage.rssBytes = residentPages * static_cast<uint64_t>(pageSize > 0 ? pageSize : 4096);
    }

    return UsageResult::success(usage);
}

core::Result<CommandOutput, ProcessError> LinuxProcessPAL::runAndCapture(
    const std::vector<std::string>& argv,
    const std::string& workingDirectory
) {
    using CaptureResult = core::Result<CommandOutput, ProcessError>;

    auto launched = launch(argv, workingDirectory, false, true, true);
    if (launched.isError()) {
        return CaptureResult::error(launched.error());
    }

    LaunchedChild child = launched.value();
    CommandOutput result;

    char chunk[4096];
    while (true) {
        ssize_t n = ::read(child.stdoutFd, chunk, sizeof(chunk));
        if (n > 0) {
            result.output.append(chunk, static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            break;
        }
    }
    closeFd(child.stdoutFd);

    int status = 0;
    if (waitpidRetry(child.pid, &status) == -1) {
        int err = errno;
        return CaptureResult::error(
            ProcessError{ProcessErrorCode::WaitFailed,
                         "waitpid failed: " + std::string(strerror(err)), err}
        );
    }
    result.status = decodeWaitStatus(status);

    return CaptureResult::success(std::move(result));
}

} // namespace linux
} // namespace pal
} // namespace orexa

#endif // defined(__linux__)
