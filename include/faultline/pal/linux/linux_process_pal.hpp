// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Linux Process PAL Implementation (fork/exec)

#ifndef FAULTLINE_PAL_LINUX_LINUX_PROCESS_PAL_HPP
#define FAULTLINE_PAL_LINUX_LINUX_PROCESS_PAL_HPP

#include "faultline/pal/process_pal.hpp"

namespace faultline {
namespace pal {
namespace linux {

/**
 * @brief fork/execvpe based IProcessPAL.
 *
 * Argument and environment arrays are built before fork so the child only
 * performs async-signal-safe calls. Exec failures are reported back to the
 * parent through a close-on-exec pipe and surface as ExecFailed.
 */
class LinuxProcessPAL : public IProcessPAL {
public:
    core::Result<ProcessResult, ProcessError> run(const ProcessSpec& spec) override;

    core::Result<ProcessHandle, ProcessError> spawn(const ProcessSpec& spec) override;

    core::Result<void, ProcessError> signal(ProcessHandle handle, int signo) override;

    core::Result<int, ProcessError> wait(
        ProcessHandle handle,
        std::chrono::milliseconds timeout
    ) override;
};

} // namespace linux
} // namespace pal
} // namespace faultline

#endif // FAULTLINE_PAL_LINUX_LINUX_PROCESS_PAL_HPP
