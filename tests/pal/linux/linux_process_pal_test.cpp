// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Tests for Linux Process PAL

#include <gtest/gtest.h>
#include "faultline/pal/linux/linux_process_pal.hpp"

#include <csignal>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace faultline {
namespace pal {
namespace linux {
namespace test {

class LinuxProcessPALTest : public ::testing::Test {
protected:
    static ProcessSpec shell(const std::string& script) {
        ProcessSpec spec;
        spec.executable = "/bin/sh";
        spec.args = {"-c", script};
        spec.timeout = std::chrono::seconds(10);
        return spec;
    }

    LinuxProcessPAL pal_;
};

// =============================================================================
// run
// =============================================================================

TEST_F(LinuxProcessPALTest, RunCapturesStdoutAndStderr) {
    auto result = pal_.run(shell("echo out; echo err 1>&2; exit 3"));

    ASSERT_TRUE(result.isSuccess()) << result.error().message;
    EXPECT_EQ(result.value().stdoutText, "out\n");
    EXPECT_EQ(result.value().stderrText, "err\n");
    EXPECT_EQ(result.value().exitCode, 3);
}

TEST_F(LinuxProcessPALTest, RunSearchesPath) {
    ProcessSpec spec;
    spec.executable = "echo";
    spec.args = {"hello", "world"};

    auto result = pal_.run(spec);

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value().stdoutText, "hello world\n");
    EXPECT_EQ(result.value().exitCode, 0);
}

TEST_F(LinuxProcessPALTest, RunPassesEnvironment) {
    ProcessSpec spec = shell("printf '%s' \"$FAULTLINE_TEST_VALUE\"");
    spec.env["FAULTLINE_TEST_VALUE"] = "a b=c";

    auto result = pal_.run(spec);

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value().stdoutText, "a b=c");
}

TEST_F(LinuxProcessPALTest, RunLargeOutput) {
    auto result = pal_.run(shell("i=0; while [ $i -lt 20000 ]; do echo line-$i; i=$((i+1)); done"));

    ASSERT_TRUE(result.isSuccess());
    EXPECT_GT(result.value().stdoutText.size(), 100000u);
    EXPECT_NE(result.value().stdoutText.find("line-19999\n"), std::string::npos);
}

TEST_F(LinuxProcessPALTest, RunMissingExecutable) {
    ProcessSpec spec;
    spec.executable = "/nonexistent/faultline-binary";

    auto result = pal_.run(spec);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ProcessErrorCode::ExecFailed);
    EXPECT_NE(result.error().systemErrorCode, 0);
}

TEST_F(LinuxProcessPALTest, RunTimesOut) {
    ProcessSpec spec = shell("sleep 10");
    spec.timeout = std::chrono::milliseconds(100);

    auto start = std::chrono::steady_clock::now();
    auto result = pal_.run(spec);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ProcessErrorCode::Timeout);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(LinuxProcessPALTest, SignalledChildReports128PlusSignal) {
    auto result = pal_.run(shell("kill -TERM $$"));

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value().exitCode, 128 + SIGTERM);
}

// =============================================================================
// spawn / signal / wait
// =============================================================================

TEST_F(LinuxProcessPALTest, SpawnSignalWait) {
    ProcessSpec spec;
    spec.executable = "sleep";
    spec.args = {"30"};

    auto handle = pal_.spawn(spec);
    ASSERT_TRUE(handle.isSuccess()) << handle.error().message;

    auto running = pal_.wait(handle.value(), std::chrono::milliseconds(50));
    ASSERT_TRUE(running.isError());
    EXPECT_EQ(running.error().code, ProcessErrorCode::Timeout);

    ASSERT_TRUE(pal_.signal(handle.value(), SIGINT).isSuccess());
    auto status = pal_.wait(handle.value(), std::chrono::seconds(5));
    ASSERT_TRUE(status.isSuccess());
    EXPECT_EQ(status.value(), 128 + SIGINT);

    // Reaped; the pid is gone.
    EXPECT_TRUE(pal_.wait(handle.value(), std::chrono::milliseconds(10)).isError());
}

TEST_F(LinuxProcessPALTest, SpawnRedirectsOutput) {
    char path[] = "/tmp/faultline-spawn-XXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    close(fd);

    ProcessSpec spec = shell("echo captured; echo also 1>&2");
    spec.stdoutPath = path;

    auto handle = pal_.spawn(spec);
    ASSERT_TRUE(handle.isSuccess());
    auto status = pal_.wait(handle.value(), std::chrono::milliseconds(0));
    ASSERT_TRUE(status.isSuccess());
    EXPECT_EQ(status.value(), 0);

    std::ifstream file(path);
    std::stringstream ss;
    ss << file.rdbuf();
    EXPECT_EQ(ss.str(), "captured\nalso\n");
    std::remove(path);
}

TEST_F(LinuxProcessPALTest, SpawnMissingExecutable) {
    ProcessSpec spec;
    spec.executable = "faultline-no-such-tool";

    auto handle = pal_.spawn(spec);

    ASSERT_TRUE(handle.isError());
    EXPECT_EQ(handle.error().code, ProcessErrorCode::ExecFailed);
}

TEST_F(LinuxProcessPALTest, InvalidHandles) {
    EXPECT_EQ(pal_.signal(INVALID_PROCESS_HANDLE, SIGINT).error().code, ProcessErrorCode::InvalidHandle);
    EXPECT_EQ(pal_.wait(INVALID_PROCESS_HANDLE, std::chrono::milliseconds(10)).error().code,
              ProcessErrorCode::InvalidHandle);
    EXPECT_EQ(pal_.signal(ProcessHandle{0}, SIGINT).error().code, ProcessErrorCode::InvalidHandle);
}

} // namespace test
} // namespace linux
} // namespace pal
} // namespace faultline
