// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// tcpdump-based packet capture of host-side traffic

#include "faultline/topology/packet_capture.hpp"

#include <csignal>

namespace faultline {
namespace topology {

namespace {
const char* const CATEGORY = "PacketCapture";
}

PacketCapture::PacketCapture(std::shared_ptr<pal::IProcessPAL> process,
                             std::shared_ptr<core::StructuredLogger> logger)
    : process_(std::move(process))
    , logger_(logger ? std::move(logger) : core::defaultLogger()) {}

std::string PacketCapture::buildFilter(const std::vector<uint16_t>& ports) {
    std::string filter;
    for (uint16_t port : ports) {
        filter += filter.empty() ? "tcp port " : " or port ";
        filter += std::to_string(port);
    }
    return filter;
}

bool PacketCapture::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_ != pal::INVALID_PROCESS_HANDLE;
}

core::Result<void, core::Error> PacketCapture::start(const std::vector<uint16_t>& ports,
                                                     const std::string& outputFile) {
    using Res = core::Result<void, core::Error>;

    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_ != pal::INVALID_PROCESS_HANDLE) {
        return Res::error(core::Error(core::ErrorCode::InvalidState, "capture already running", CATEGORY));
    }
    if (ports.empty()) {
        return Res::error(core::Error(core::ErrorCode::InvalidArgument, "no ports to capture", CATEGORY));
    }

    pal::ProcessSpec spec;
    spec.executable = "tcpdump";
    spec.args = {"-i", "any", "-s", "0", buildFilter(ports), "-w", outputFile};

    auto spawned = process_->spawn(spec);
    if (spawned.isError()) {
        return Res::error(core::Error(core::ErrorCode::ProcessSpawnFailed,
                                      spawned.error().message, "tcpdump"));
    }

    handle_ = spawned.value();
    logger_->info("tcpdump (pid " + std::to_string(handle_.pid) + ") capturing '" +
                  buildFilter(ports) + "' to " + outputFile, CATEGORY);
    return Res::success();
}

core::Result<void, core::Error> PacketCapture::stop(std::chrono::milliseconds timeout) {
    using Res = core::Result<void, core::Error>;

    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_ == pal::INVALID_PROCESS_HANDLE) {
        return Res::success();
    }

    pal::ProcessHandle handle = handle_;
    handle_ = pal::INVALID_PROCESS_HANDLE;

    auto signalled = process_->signal(handle, SIGINT);
    if (signalled.isError()) {
        // Already exited (e.g. missing privileges); still reap it below.
        logger_->warning("SIGINT to tcpdump failed: " + signalled.error().message, CATEGORY);
    }

    auto exited = process_->wait(handle, timeout);
    if (exited.isError()) {
        if (exited.error().code == pal::ProcessErrorCode::Timeout) {
            auto killed = process_->signal(handle, SIGKILL);
            auto reaped = process_->wait(handle, std::chrono::seconds(1));
            if (killed.isError() || reaped.isError()) {
                logger_->warning("tcpdump not reaped after SIGKILL", CATEGORY);
            }
        }
        return Res::error(core::Error(core::ErrorCode::TeardownFailed,
                                      "tcpdump did not exit: " + exited.error().message, CATEGORY));
    }

    logger_->info("tcpdump finished with status " + std::to_string(exited.value()), CATEGORY);
    if (exited.value() != 0 && exited.value() != 128 + SIGINT) {
        return Res::error(core::Error(core::ErrorCode::ProcessExitedNonZero,
            "tcpdump exited with status " + std::to_string(exited.value()), CATEGORY));
    }
    return Res::success();
}

} // namespace topology
} // namespace faultline
