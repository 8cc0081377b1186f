// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Test-side client of the reverse proxy admin API

#ifndef FAULTLINE_HARNESS_PROXY_CONTROLLER_HPP
#define FAULTLINE_HARNESS_PROXY_CONTROLLER_HPP

#include "faultline/core/error_codes.hpp"
#include "faultline/core/result.hpp"
#include "faultline/core/structured_logger.hpp"
#include "faultline/harness/test_reporter.hpp"
#include "faultline/http/http_client.hpp"
#include "faultline/proxy/rule.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace faultline {
namespace harness {

/**
 * @brief Reprograms a running reverse proxy.
 *
 * Every push replaces the proxy's whole rule set. Calls from one controller
 * are serialized. A non-2xx answer yields ErrorCode::RulePushRejected, an
 * unreachable proxy ErrorCode::RulePushFailed. Nothing is retried.
 *
 * After terminate() every call fails with ErrorCode::InvalidState.
 */
class ProxyController {
public:
    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{10000};

    ProxyController(std::string adminUrl,
                    std::shared_ptr<http::IHttpClient> client,
                    std::shared_ptr<core::StructuredLogger> logger = nullptr,
                    std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);

    ProxyController(const ProxyController&) = delete;
    ProxyController& operator=(const ProxyController&) = delete;

    core::Result<void, core::Error> setRules(const proxy::RuleSet& rules);

    core::Result<void, core::Error> clearRules();

    /**
     * @return Id of the new sniffer, to pass to removeSniffer()
     */
    core::Result<uint64_t, core::Error> addSniffer(const std::string& filter, const std::string& callbackUrl);

    core::Result<void, core::Error> removeSniffer(uint64_t id);

    /**
     * @brief Clear rules, remove this controller's sniffers and release it.
     *
     * Every step is attempted; the first failure is returned. Calling it
     * again is a no-op.
     */
    core::Result<void, core::Error> terminate();

    bool isTerminated() const;

    const std::string& adminUrl() const { return adminUrl_; }

private:
    core::Result<std::string, core::Error> callLocked(const std::string& method,
                                                      const std::string& path,
                                                      const std::string& body);

    core::Result<void, core::Error> checkUsableLocked() const;

    std::string adminUrl_;
    std::shared_ptr<http::IHttpClient> client_;
    std::shared_ptr<core::StructuredLogger> logger_;
    std::chrono::milliseconds timeout_;

    mutable std::mutex mutex_;
    std::set<uint64_t> sniffers_;
    bool terminated_ = false;
};

/**
 * @brief Run action with rules active on the proxy.
 *
 * A failed push is reported fatally. The rules are cleared when action
 * returns or throws; a failed clear is reported as a non-fatal error.
 */
void withRules(ProxyController& controller,
               ITestReporter& reporter,
               const proxy::RuleSet& rules,
               const std::function<void()>& action);

} // namespace harness
} // namespace faultline

#endif // FAULTLINE_HARNESS_PROXY_CONTROLLER_HPP
