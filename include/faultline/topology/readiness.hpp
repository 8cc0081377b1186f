// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Container readiness strategies

#ifndef FAULTLINE_TOPOLOGY_READINESS_HPP
#define FAULTLINE_TOPOLOGY_READINESS_HPP

#include "faultline/core/error_codes.hpp"
#include "faultline/core/result.hpp"
#include "faultline/core/structured_logger.hpp"
#include "faultline/http/http_client.hpp"
#include "faultline/topology/container_runtime.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace faultline {
namespace topology {

/**
 * @brief How to tell that a started container is serving.
 */
class WaitStrategy {
public:
    enum class Kind {
        None,   ///< Ready once started
        Log,    ///< Output contains a substring
        Exec,   ///< A command inside the container exits zero
        Http    ///< GET on a published port answers 2xx
    };

    WaitStrategy() = default;

    static WaitStrategy forLog(std::string substring);
    static WaitStrategy forExec(std::vector<std::string> argv);
    static WaitStrategy forHttp(uint16_t containerPort, std::string path);

    Kind kind() const { return kind_; }
    const std::string& logSubstring() const { return text_; }
    const std::vector<std::string>& execArgv() const { return argv_; }
    uint16_t httpPort() const { return port_; }
    const std::string& httpPath() const { return text_; }

    std::string describe() const;

    /**
     * @brief Probe once.
     *
     * @return true when ready, false when not yet; an error when the probe
     *         itself could not be carried out
     */
    core::Result<bool, core::Error> probe(IContainerRuntime& runtime,
                                          http::IHttpClient& client,
                                          const std::string& containerId,
                                          std::chrono::milliseconds probeTimeout) const;

private:
    Kind kind_ = Kind::None;
    std::string text_;
    std::vector<std::string> argv_;
    uint16_t port_ = 0;
};

/**
 * @brief Probe every pollInterval until ready or timeout elapses.
 *
 * Probe errors count as "not ready yet"; the last one is included in the
 * ErrorCode::ReadinessTimeout error.
 */
core::Result<void, core::Error> waitUntilReady(const WaitStrategy& strategy,
                                               IContainerRuntime& runtime,
                                               http::IHttpClient& client,
                                               const std::string& containerId,
                                               const std::string& name,
                                               std::chrono::milliseconds timeout,
                                               std::chrono::milliseconds pollInterval,
                                               core::StructuredLogger& logger);

} // namespace topology
} // namespace faultline

#endif // FAULTLINE_TOPOLOGY_READINESS_HPP
