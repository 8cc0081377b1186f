// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// tcpdump-based packet capture of host-side traffic

#ifndef FAULTLINE_TOPOLOGY_PACKET_CAPTURE_HPP
#define FAULTLINE_TOPOLOGY_PACKET_CAPTURE_HPP

#include "faultline/core/error_codes.hpp"
#include "faultline/core/result.hpp"
#include "faultline/core/structured_logger.hpp"
#include "faultline/pal/process_pal.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace faultline {
namespace topology {

/**
 * @brief Runs tcpdump on all interfaces for a set of TCP ports.
 *
 * tcpdump usually needs elevated privileges; when it cannot capture it
 * exits early, which is reported by stop().
 */
class PacketCapture {
public:
    explicit PacketCapture(std::shared_ptr<pal::IProcessPAL> process,
                           std::shared_ptr<core::StructuredLogger> logger = nullptr);

    /**
     * @brief Capture filter, e.g. "tcp port 3000 or port 3001".
     */
    static std::string buildFilter(const std::vector<uint16_t>& ports);

    core::Result<void, core::Error> start(const std::vector<uint16_t>& ports, const std::string& outputFile);

    /**
     * @brief SIGINT, then wait for tcpdump to flush and exit. Idempotent.
     */
    core::Result<void, core::Error> stop(std::chrono::milliseconds timeout = std::chrono::seconds(10));

    bool isRunning() const;

private:
    std::shared_ptr<pal::IProcessPAL> process_;
    std::shared_ptr<core::StructuredLogger> logger_;

    mutable std::mutex mutex_;
    pal::ProcessHandle handle_ = pal::INVALID_PROCESS_HANDLE;
};

} // namespace topology
} // namespace faultline

#endif // FAULTLINE_TOPOLOGY_PACKET_CAPTURE_HPP
