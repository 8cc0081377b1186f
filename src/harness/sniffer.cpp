// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Scoped observation of proxied traffic

#include "faultline/harness/sniffer.hpp"

#include <atomic>
#include <cstdint>
#include <optional>

namespace faultline {
namespace harness {

namespace {

const char* const CATEGORY = "Sniffer";

/**
 * @brief Tears down the subscription in the order that keeps onEvent quiet:
 *        gate closed, sniffer removed, server stopped.
 */
class SnifferScope {
public:
    SnifferScope(ProxyController& controller,
                 ITestReporter& reporter,
                 CallbackServer& server,
                 std::shared_ptr<std::atomic<bool>> active,
                 std::shared_ptr<core::StructuredLogger> logger)
        : controller_(controller)
        , reporter_(reporter)
        , server_(server)
        , active_(std::move(active))
        , logger_(std::move(logger)) {}

    ~SnifferScope() {
        active_->store(false);
        if (id_) {
            auto removed = controller_.removeSniffer(*id_);
            if (removed.isError()) {
                reporter_.error("failed to remove sniffer: " + removed.error().toString());
            }
        }
        server_.stop();
        logger_->debug("sniffer scope closed after " +
                       std::to_string(server_.receivedCount()) + " notification(s)", CATEGORY);
    }

    void setId(uint64_t id) { id_ = id; }

private:
    ProxyController& controller_;
    ITestReporter& reporter_;
    CallbackServer& server_;
    std::shared_ptr<std::atomic<bool>> active_;
    std::shared_ptr<core::StructuredLogger> logger_;
    std::optional<uint64_t> id_;
};

} // namespace

void withSniffedEndpoint(ProxyController& controller,
                         const core::CallbackConfig& callbackConfig,
                         ITestReporter& reporter,
                         const std::string& routeFilter,
                         const CallbackHandler& onEvent,
                         const std::function<void()>& action,
                         std::shared_ptr<core::StructuredLogger> logger) {
    if (!logger) {
        logger = core::defaultLogger();
    }

    auto active = std::make_shared<std::atomic<bool>>(true);
    CallbackServer server(callbackConfig, logger);

    auto url = server.start([active, onEvent](const core::CallbackEvent& event) {
        if (active->load()) {
            onEvent(event);
        }
    });
    if (url.isError()) {
        reporter.fatal("failed to start sniffer callback server: " + url.error().toString());
    }

    SnifferScope scope(controller, reporter, server, active, logger);

    auto id = controller.addSniffer(routeFilter, url.value());
    if (id.isError()) {
        reporter.fatal("failed to register sniffer for '" + routeFilter + "': " + id.error().toString());
    }
    scope.setId(id.value());

    action();
}

} // namespace harness
} // namespace faultline
