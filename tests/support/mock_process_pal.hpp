// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// GoogleMock IProcessPAL

#ifndef FAULTLINE_TESTS_SUPPORT_MOCK_PROCESS_PAL_HPP
#define FAULTLINE_TESTS_SUPPORT_MOCK_PROCESS_PAL_HPP

#include "faultline/pal/process_pal.hpp"

#include <gmock/gmock.h>

#include <string>
#include <vector>

namespace faultline {
namespace pal {
namespace test {

class MockProcessPAL : public IProcessPAL {
public:
    MOCK_METHOD((core::Result<ProcessResult, ProcessError>), run, (const ProcessSpec& spec), (override));
    MOCK_METHOD((core::Result<ProcessHandle, ProcessError>), spawn, (const ProcessSpec& spec), (override));
    MOCK_METHOD((core::Result<void, ProcessError>), signal, (ProcessHandle handle, int signo), (override));
    MOCK_METHOD((core::Result<int, ProcessError>), wait,
                (ProcessHandle handle, std::chrono::milliseconds timeout), (override));
};

inline core::Result<ProcessResult, ProcessError> exited(int code,
                                                        const std::string& out = "",
                                                        const std::string& err = "") {
    ProcessResult result;
    result.exitCode = code;
    result.stdoutText = out;
    result.stderrText = err;
    return core::Result<ProcessResult, ProcessError>::success(result);
}

/**
 * @brief Matches a ProcessSpec by its argument vector.
 */
inline ::testing::Matcher<const ProcessSpec&> withArgs(const std::vector<std::string>& args) {
    return ::testing::Field(&ProcessSpec::args, args);
}

} // namespace test
} // namespace pal
} // namespace faultline

#endif // FAULTLINE_TESTS_SUPPORT_MOCK_PROCESS_PAL_HPP
