// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Fault-injecting reverse proxy with its admin API

#ifndef FAULTLINE_PROXY_REVERSE_PROXY_HPP
#define FAULTLINE_PROXY_REVERSE_PROXY_HPP

#include "faultline/core/config_manager.hpp"
#include "faultline/core/error_codes.hpp"
#include "faultline/core/result.hpp"
#include "faultline/core/structured_logger.hpp"
#include "faultline/http/http_client.hpp"
#include "faultline/http/http_server.hpp"
#include "faultline/proxy/notifier.hpp"
#include "faultline/proxy/rule_engine.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace faultline {
namespace proxy {

struct ReverseProxyOptions {
    std::vector<core::UpstreamRoute> routes;
    std::string bindAddress = "0.0.0.0";
    uint16_t adminPort = 9000;                          ///< 0 = ephemeral
    std::chrono::milliseconds upstreamTimeout{30000};
    std::chrono::milliseconds notifyTimeout{5000};
};

/**
 * @brief The reverse proxy placed in front of each chat server.
 *
 * One front listener per route forwards to its upstream. The rule engine
 * decides per request whether to block, rewrite the status, or pass the
 * exchange through; matching callback rules and sniffers are notified once
 * the response is known. The admin listener accepts rule pushes and sniffer
 * registrations.
 *
 * Admin routes:
 * | Route                    | Effect                                    |
 * |--------------------------|-------------------------------------------|
 * | POST /rules              | Replace the rule set with the body        |
 * | DELETE /rules            | Clear all rules                           |
 * | GET /rules               | Current rules, budgets and sniffer count  |
 * | POST /sniffers           | Register {"filter","callback_url"}        |
 * | DELETE /sniffers/{id}    | Remove a sniffer                          |
 * | GET /healthz             | Liveness                                  |
 */
class ReverseProxy {
public:
    ReverseProxy(std::shared_ptr<http::IHttpClient> client,
                 std::shared_ptr<core::StructuredLogger> logger = nullptr);

    ~ReverseProxy();

    ReverseProxy(const ReverseProxy&) = delete;
    ReverseProxy& operator=(const ReverseProxy&) = delete;

    /**
     * @brief Bind every listener, then log the readiness line.
     *
     * If any listener fails to bind, the ones already started are stopped.
     */
    core::Result<void, core::Error> start(const ReverseProxyOptions& options);

    /**
     * @brief Stop listeners and wait for outstanding notifications. Idempotent.
     */
    void stop();

    uint16_t adminPort() const { return adminPort_; }

    /**
     * @brief Bound front ports, in route order.
     */
    std::vector<uint16_t> frontPorts() const { return frontPorts_; }

    RuleEngine& rules() { return engine_; }

    /**
     * @brief Proxy one request received on the given route.
     */
    http::HttpResponse handleProxied(size_t routeIndex, const http::HttpRequest& request);

    http::HttpResponse handleAdmin(const http::HttpRequest& request);

private:
    http::HttpResponse forward(size_t routeIndex, const http::HttpRequest& request, bool& upstreamFailed);

    void notifyObservers(const std::vector<std::string>& urls,
                         size_t routeIndex,
                         const http::HttpRequest& request,
                         const http::HttpResponse& response);

    std::shared_ptr<http::IHttpClient> client_;
    std::shared_ptr<core::StructuredLogger> logger_;
    RuleEngine engine_;
    std::unique_ptr<Notifier> notifier_;

    ReverseProxyOptions options_;
    std::vector<std::unique_ptr<http::HttpServer>> frontServers_;
    std::unique_ptr<http::HttpServer> adminServer_;
    std::vector<uint16_t> frontPorts_;
    uint16_t adminPort_ = 0;

    std::mutex lifecycleMutex_;
    bool running_ = false;
};

/**
 * @brief Access token of a request: the Authorization bearer token, or
 *        the access_token query parameter.
 */
std::string extractAccessToken(const http::HttpRequest& request);

} // namespace proxy
} // namespace faultline

#endif // FAULTLINE_PROXY_REVERSE_PROXY_HPP
