// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Network Topology Builder and Lifecycle Manager
//
// Provisions the chat servers, the datastore, the fault-injection reverse
// proxy and the sync-aggregation proxy into one container network, and
// tears them down again exactly once.

#ifndef FAULTLINE_TOPOLOGY_DEPLOYMENT_HPP
#define FAULTLINE_TOPOLOGY_DEPLOYMENT_HPP

#include "faultline/core/config_manager.hpp"
#include "faultline/core/error_codes.hpp"
#include "faultline/core/result.hpp"
#include "faultline/core/structured_logger.hpp"
#include "faultline/harness/proxy_controller.hpp"
#include "faultline/http/http_client.hpp"
#include "faultline/pal/process_pal.hpp"
#include "faultline/topology/container_runtime.hpp"
#include "faultline/topology/packet_capture.hpp"
#include "faultline/topology/readiness.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace faultline {
namespace topology {

// =============================================================================
// Well-known container settings
// =============================================================================

constexpr const char* DATASTORE_ALIAS = "postgres";
constexpr uint16_t DATASTORE_PORT = 5432;
constexpr const char* REVERSE_PROXY_ALIAS = "reverseproxy";
constexpr const char* REVERSE_PROXY_HEALTH_PATH = "/healthz";
constexpr const char* SYNC_PROXY_ALIAS = "ssproxy";
constexpr uint16_t SYNC_PROXY_PORT = 6789;

/**
 * @brief A provisioned topology.
 *
 * Produced by DeploymentBuilder and not modified afterwards, except by
 * teardown().
 */
class Deployment {
public:
    Deployment(std::shared_ptr<IContainerRuntime> runtime,
               core::CaptureConfig capture,
               std::shared_ptr<core::StructuredLogger> logger = nullptr);

    /**
     * @brief Calls teardown(false) if it has not run yet.
     */
    ~Deployment();

    Deployment(const Deployment&) = delete;
    Deployment& operator=(const Deployment&) = delete;

    /**
     * @brief Host URL of a chat server, bypassing the reverse proxy.
     */
    core::Result<std::string, core::Error> chatServerUrl(const std::string& name) const;

    /**
     * @brief Host URL of the reverse proxy front listener for a chat server.
     */
    core::Result<std::string, core::Error> proxiedChatServerUrl(const std::string& name) const;

    const std::string& syncProxyUrl() const { return syncProxyUrl_; }
    const std::string& reverseProxyAdminUrl() const { return adminUrl_; }

    /**
     * @brief host:port of the datastore inside the container network.
     */
    const std::string& datastoreAddress() const { return datastoreAddress_; }

    const std::string& networkName() const { return networkName_; }

    std::vector<std::string> chatServerNames() const;

    /**
     * @brief Controller bound to the reverse proxy admin URL.
     *
     * NotInitialized if the reverse proxy was never provisioned. The pointer
     * stays valid for the lifetime of the Deployment.
     */
    core::Result<harness::ProxyController*, core::Error> controller();

    /**
     * @brief Stop everything in reverse dependency order.
     *
     * Runs once; later calls return immediately. When writeLogs is set the
     * output of each container is saved before it is stopped. Failures are
     * logged and do not stop the remaining steps.
     */
    void teardown(bool writeLogs);

    bool isTornDown() const { return tornDown_.load(); }

private:
    friend class DeploymentBuilder;

    struct Member {
        std::string name;         ///< Logical name, used for log files
        std::string containerId;
        bool isReverseProxy = false;
    };

    std::shared_ptr<IContainerRuntime> runtime_;
    core::CaptureConfig capture_;
    std::shared_ptr<core::StructuredLogger> logger_;

    std::string networkName_;
    std::string networkId_;
    std::vector<Member> members_;  ///< In start order
    std::vector<std::string> chatServerNames_;
    std::map<std::string, std::string> chatServerUrls_;
    std::map<std::string, std::string> proxiedUrls_;
    std::string syncProxyUrl_;
    std::string adminUrl_;
    std::string datastoreAddress_;
    std::unique_ptr<harness::ProxyController> controller_;
    std::unique_ptr<PacketCapture> packetCapture_;

    std::atomic<bool> tornDown_{false};
};

/**
 * @brief Provisions a Deployment in dependency order.
 *
 * Order: network, chat servers, datastore, reverse proxy, sync proxy, then
 * the optional packet capture. The first failure tears down whatever was
 * created and is returned.
 */
class DeploymentBuilder {
public:
    DeploymentBuilder(core::HarnessConfig config,
                      std::shared_ptr<IContainerRuntime> runtime,
                      std::shared_ptr<pal::IProcessPAL> process,
                      std::shared_ptr<http::IHttpClient> httpClient,
                      std::shared_ptr<core::StructuredLogger> logger = nullptr);

    core::Result<std::shared_ptr<Deployment>, core::Error> deploy();

    /**
     * @brief Routes of the reverse proxy: chat server i is reachable on
     *        front port reverseProxyFirstPort + i.
     */
    static std::vector<core::UpstreamRoute> reverseProxyRoutes(const core::DeploymentConfig& config);

private:
    core::Result<std::string, core::Error> startMember(Deployment& deployment,
                                                       const std::string& name,
                                                       ContainerSpec spec,
                                                       const WaitStrategy& readiness,
                                                       bool isReverseProxy);

    core::Result<std::string, core::Error> hostUrl(const std::string& containerId, uint16_t port);

    std::string makeNetworkName() const;

    core::HarnessConfig config_;
    std::shared_ptr<IContainerRuntime> runtime_;
    std::shared_ptr<pal::IProcessPAL> process_;
    std::shared_ptr<http::IHttpClient> httpClient_;
    std::shared_ptr<core::StructuredLogger> logger_;
};

} // namespace topology
} // namespace faultline

#endif // FAULTLINE_TOPOLOGY_DEPLOYMENT_HPP
