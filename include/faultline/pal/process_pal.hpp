// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Platform Abstraction Layer - Child Process Interface
//
// Used to drive the container runtime CLI and the packet capture process.

#ifndef FAULTLINE_PAL_PROCESS_PAL_HPP
#define FAULTLINE_PAL_PROCESS_PAL_HPP

#include "faultline/core/result.hpp"
#include "faultline/pal/pal_types.hpp"

#include <chrono>

namespace faultline {
namespace pal {

/**
 * @brief Abstract interface for running child processes.
 *
 * Two modes are supported: run() executes a command to completion and
 * captures its output; spawn() starts a long-lived process (e.g. tcpdump)
 * that is later signalled and reaped with wait().
 */
class IProcessPAL {
public:
    virtual ~IProcessPAL() = default;

    /**
     * @brief Run a command to completion.
     *
     * A non-zero exit status is not an error here; it is reported in
     * ProcessResult::exitCode. If spec.timeout is non-zero and expires,
     * the child is killed and ProcessErrorCode::Timeout is returned.
     */
    virtual core::Result<ProcessResult, ProcessError> run(const ProcessSpec& spec) = 0;

    /**
     * @brief Start a command without waiting for it.
     *
     * stdout and stderr go to spec.stdoutPath, or /dev/null when empty.
     */
    virtual core::Result<ProcessHandle, ProcessError> spawn(const ProcessSpec& spec) = 0;

    /**
     * @brief Deliver a signal (e.g. SIGINT) to a spawned process.
     */
    virtual core::Result<void, ProcessError> signal(ProcessHandle handle, int signo) = 0;

    /**
     * @brief Wait for a spawned process to exit.
     *
     * A zero timeout blocks until the process exits.
     *
     * @return Exit status (128 + signal for signalled children), or
     *         ProcessErrorCode::Timeout if it is still running at the deadline
     */
    virtual core::Result<int, ProcessError> wait(
        ProcessHandle handle,
        std::chrono::milliseconds timeout
    ) = 0;
};

} // namespace pal
} // namespace faultline

#endif // FAULTLINE_PAL_PROCESS_PAL_HPP
