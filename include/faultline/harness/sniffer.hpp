// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Scoped observation of proxied traffic

#ifndef FAULTLINE_HARNESS_SNIFFER_HPP
#define FAULTLINE_HARNESS_SNIFFER_HPP

#include "faultline/core/config_manager.hpp"
#include "faultline/core/structured_logger.hpp"
#include "faultline/core/types.hpp"
#include "faultline/harness/callback_server.hpp"
#include "faultline/harness/proxy_controller.hpp"
#include "faultline/harness/test_reporter.hpp"
#include "faultline/proxy/filter_expression.hpp"

#include <functional>
#include <memory>
#include <string>

namespace faultline {
namespace harness {

using proxy::endpointFilter;

/**
 * @brief Observe traffic matching routeFilter while action runs.
 *
 * Opens a CallbackServer, registers it as a sniffer on the proxy and runs
 * action. When action returns or throws, the sniffer is removed and the
 * server stopped; onEvent is not invoked after this function returns.
 *
 * Failing to open the server or register the sniffer is reported fatally.
 *
 * @code
 * withSniffedEndpoint(controller, config.callback, reporter, endpointFilter("/sync"),
 *     [&](const core::CallbackEvent& event) { ... },
 *     [&]() { client.sendMessage(roomId, "hello"); });
 * @endcode
 */
void withSniffedEndpoint(ProxyController& controller,
                         const core::CallbackConfig& callbackConfig,
                         ITestReporter& reporter,
                         const std::string& routeFilter,
                         const CallbackHandler& onEvent,
                         const std::function<void()>& action,
                         std::shared_ptr<core::StructuredLogger> logger = nullptr);

} // namespace harness
} // namespace faultline

#endif // FAULTLINE_HARNESS_SNIFFER_HPP
