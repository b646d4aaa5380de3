// Orexa - Game Server Supervisor
// Platform Abstraction Layer - Child Process Interface
//
// Launching game-server processes with piped standard streams, reaping them,
// sampling their resource usage and running short helper commands.

#ifndef OREXA_PAL_PROCESS_PAL_HPP
#define OREXA_PAL_PROCESS_PAL_HPP

#include "orexa/pal/pal_types.hpp"
#include "orexa/core/result.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace orexa {
namespace pal {

/**
 * @brief Longest line readLine returns; the rest of a longer line is dropped.
 */
constexpr size_t MAX_OUTPUT_LINE_BYTES = 1024 * 1024;

/**
 * @brief A launched child process and its pipes.
 *
 * ## Thread Safety
 * - writeInput/closeInput may be called from any thread.
 * - Each output stream must have at most one reader thread.
 * - wait() may block on one thread while kill() is called from another.
 *
 * ## Lifetime
 * Destroying an unreaped child kills and reaps it.
 */
class IChildProcess {
public:
    virtual ~IChildProcess() = default;

    /**
     * @brief OS process identifier.
     */
    virtual int32_t pid() const = 0;

    /**
     * @brief Write raw bytes to the child's standard input.
     *
     * @return InputClosed when the pipe was never opened or already closed,
     *         WriteFailed when the child went away
     */
    virtual core::Result<void, ProcessError> writeInput(const std::string& data) = 0;

    /**
     * @brief Close the write end of the standard input pipe.
     */
    virtual void closeInput() = 0;

    /**
     * @brief Block until the next full line is available on a stream.
     *
     * The line terminator (and a trailing carriage return) is stripped.
     * A final unterminated line is returned before end of stream. Lines
     * are cut at MAX_OUTPUT_LINE_BYTES.
     *
     * @return The line, or std::nullopt at end of stream
     */
    virtual std::optional<std::string> readLine(ProcessStream stream) = 0;

    /**
     * @brief Block until the child exits and reap it.
     *
     * Calling wait() again after the child was reaped returns the same status.
     */
    virtual core::Result<ProcessExitStatus, ProcessError> wait() = 0;

    /**
     * @brief Forcibly terminate the child (SIGKILL).
     *
     * A no-op once the child has been reaped.
     */
    virtual core::Result<void, ProcessError> kill() = 0;
};

/**
 * @brief Abstract interface for child process management.
 *
 * @code
 * ProcessOptions options;
 * options.argv = {"java", "-Xmx2G", "-jar", "server.jar", "nogui"};
 * options.workingDirectory = "/srv/Servers/survival";
 *
 * auto result = processPal->spawn(options);
 * if (result.isSuccess()) {
 *     auto child = std::move(result.value());
 *     while (auto line = child->readLine(ProcessStream::StdOut)) {
 *         handle(*line);
 *     }
 * }
 * @endcode
 */
class IProcessPAL {
public:
    virtual ~IProcessPAL() = default;

    /**
     * @brief Launch a child process.
     *
     * argv[0] is resolved through PATH. The child runs in its own process
     * group with every inherited descriptor above stderr closed.
     *
     * @return The child, or ProcessError with ExecFailed when the program
     *         could not be executed
     */
    virtual core::Result<std::unique_ptr<IChildProcess>, ProcessError> spawn(
        const ProcessOptions& options
    ) = 0;

    /**
     * @brief Read cumulative CPU time and resident memory of a process.
     */
    virtual core::Result<ProcessUsage, ProcessError> sampleUsage(int32_t pid) = 0;

    /**
     * @brief Run a command to completion and capture its combined output.
     *
     * Standard input is connected to /dev/null.
     */
    virtual core::Result<CommandOutput, ProcessError> runAndCapture(
        const std::vector<std::string>& argv,
        const std::string& workingDirectory
    ) = 0;
};

} // namespace pal
} // namespace orexa

#endif // OREXA_PAL_PROCESS_PAL_HPP
