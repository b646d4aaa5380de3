// Orexa - Game Server Supervisor
// Platform Abstraction Layer - Common Types
//
// This file defines common types, handles, errors, and callbacks used across
// all PAL interfaces. It provides platform-independent abstractions for
// operating system resources.

#ifndef OREXA_PAL_PAL_TYPES_HPP
#define OREXA_PAL_PAL_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include <functional>
#include <memory>

namespace orexa {

// Forward declarations
namespace core {
template<typename T, typename E> class Result;
}

namespace pal {

// =============================================================================
// Handle Types
// =============================================================================

/**
 * @brief Platform-independent thread handle.
 */
struct ThreadHandle {
    uint64_t value;

    bool operator==(const ThreadHandle& other) const { return value == other.value; }
    bool operator!=(const ThreadHandle& other) const { return value != other.value; }
};

/**
 * @brief Platform-independent thread pool handle.
 */
struct ThreadPoolHandle {
    uint64_t value;

    bool operator==(const ThreadPoolHandle& other) const { return value == other.value; }
    bool operator!=(const ThreadPoolHandle& other) const { return value != other.value; }
};

/**
 * @brief Platform-independent timer handle.
 */
struct TimerHandle {
    uint64_t value;

    bool operator==(const TimerHandle& other) const { return value == other.value; }
    bool operator!=(const TimerHandle& other) const { return value != other.value; }
};

// =============================================================================
// Invalid Handle Constants
// =============================================================================

constexpr ThreadHandle INVALID_THREAD_HANDLE{0};
constexpr ThreadPoolHandle INVALID_THREAD_POOL_HANDLE{0};
constexpr TimerHandle INVALID_TIMER_HANDLE{0};

// =============================================================================
// Error Codes
// =============================================================================

/**
 * @brief Thread operation error codes.
 */
enum class ThreadErrorCode : uint32_t {
    Success = 0,
    Unknown = 1,

    // Creation errors
    CreationFailed = 100,
    InvalidHandle = 101,

    // Operation errors
    JoinFailed = 300,

    // Thread pool errors
    PoolCreationFailed = 500,
    PoolShutdown = 501,
    WorkQueueFull = 502,
};

/**
 * @brief Timer operation error codes.
 */
enum class TimerErrorCode : uint32_t {
    Success = 0,
    Unknown = 1,
    CreationFailed = 100,
    InvalidHandle = 101,
    CancellationFailed = 102,
    AlreadyCancelled = 103,
};

/**
 * @brief Child process operation error codes.
 */
enum class ProcessErrorCode : uint32_t {
    Success = 0,
    Unknown = 1,

    // Launch errors
    PipeFailed = 100,
    ForkFailed = 101,
    ExecFailed = 102,
    InvalidCommand = 103,
    WorkingDirectory = 104,

    // I/O errors
    WriteFailed = 200,
    InputClosed = 201,

    // Control errors
    WaitFailed = 300,
    SignalFailed = 301,
    NotFound = 302,
};

/**
 * @brief Log levels for the logging PAL.
 *
 * Levels are ordered from most verbose (Trace) to least verbose (Critical).
 */
enum class LogLevel : uint32_t {
    Trace = 0,      ///< Extremely detailed tracing information
    Debug = 1,      ///< Debug-level messages for development
    Info = 2,       ///< Informational messages about normal operation
    Warning = 3,    ///< Warning conditions that should be addressed
    Error = 4,      ///< Error conditions that affect operation
    Critical = 5,   ///< Critical conditions requiring immediate attention
    Off = 6         ///< Disable all logging
};

// =============================================================================
// Error Structures
// =============================================================================

/**
 * @brief Detailed thread error information.
 */
struct ThreadError {
    ThreadErrorCode code;
    std::string message;

    ThreadError(ThreadErrorCode c = ThreadErrorCode::Unknown,
                std::string msg = "")
        : code(c)
        , message(std::move(msg)) {}
};

/**
 * @brief Detailed timer error information.
 */
struct TimerError {
    TimerErrorCode code;
    std::string message;

    TimerError(TimerErrorCode c = TimerErrorCode::Unknown,
               std::string msg = "")
        : code(c)
        , message(std::move(msg)) {}
};

/**
 * @brief Detailed child process error information.
 */
struct ProcessError {
    ProcessErrorCode code;
    std::string message;
    int32_t systemErrorCode;  ///< errno at the point of failure

    ProcessError(ProcessErrorCode c = ProcessErrorCode::Unknown,
                 std::string msg = "",
                 int32_t sysErr = 0)
        : code(c)
        , message(std::move(msg))
        , systemErrorCode(sysErr) {}
};

// =============================================================================
// Configuration Structures
// =============================================================================

/**
 * @brief Options for creating a thread.
 */
struct ThreadOptions {
    size_t stackSize = 0;        ///< Stack size in bytes (0 = system default)
    std::string name;            ///< Optional thread name for debugging
    bool detached = false;       ///< Create as detached thread
};

/**
 * @brief Options for creating a thread pool.
 */
struct ThreadPoolOptions {
    std::string name;                          ///< Pool name, applied to worker threads
    size_t queueSize = 1024;                   ///< Maximum queued work items
};

/**
 * @brief Options for launching a child process.
 */
struct ProcessOptions {
    std::vector<std::string> argv;   ///< argv[0] is resolved through PATH
    std::string workingDirectory;    ///< Empty keeps the parent's cwd
    bool captureOutput = true;       ///< Pipe stdout/stderr back to the parent
    bool pipeInput = true;           ///< Pipe stdin from the parent
};

/**
 * @brief Output stream of a child process.
 */
enum class ProcessStream {
    StdOut,
    StdErr
};

/**
 * @brief How a child process ended.
 */
struct ProcessExitStatus {
    bool exited = false;         ///< Exited normally (as opposed to a signal)
    int exitCode = 0;            ///< Valid when exited
    int signal = 0;              ///< Valid when !exited

    /**
     * @brief True for a zero exit code.
     */
    bool success() const { return exited && exitCode == 0; }
};

/**
 * @brief Resource usage sample for a running process.
 */
struct ProcessUsage {
    uint64_t cpuTicks = 0;       ///< utime + stime in clock ticks
    uint64_t ticksPerSecond = 100;
    uint64_t rssBytes = 0;       ///< Resident set size
    std::chrono::steady_clock::time_point sampledAt;
};

/**
 * @brief Captured result of a run-to-completion command.
 */
struct CommandOutput {
    ProcessExitStatus status;
    std::string output;          ///< Combined stdout and stderr
};

// =============================================================================
// Callback Types
// =============================================================================

/**
 * @brief Callback for timer expiration.
 */
using TimerCallback = std::function<void()>;

/**
 * @brief Function signature for thread entry point.
 * @param arg User-provided argument passed to the thread
 */
using ThreadFunction = std::function<void(void*)>;

/**
 * @brief Work item for thread pool execution.
 */
using WorkItem = std::function<void()>;

/**
 * @brief Logging context for structured logging.
 */
struct LogContext {
    const char* file = nullptr;   ///< Source file name
    int line = 0;                 ///< Source line number
    const char* function = nullptr; ///< Function name
    std::string threadName;       ///< Current thread name
};

class ILogSink;  // Forward declaration for log sink interface

} // namespace pal
} // namespace orexa

#endif // OREXA_PAL_PAL_TYPES_HPP
