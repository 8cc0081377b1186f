// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Callback relay server receiving proxy notifications in the test process

#ifndef FAULTLINE_HARNESS_CALLBACK_SERVER_HPP
#define FAULTLINE_HARNESS_CALLBACK_SERVER_HPP

#include "faultline/core/config_manager.hpp"
#include "faultline/core/error_codes.hpp"
#include "faultline/core/result.hpp"
#include "faultline/core/structured_logger.hpp"
#include "faultline/core/task_group.hpp"
#include "faultline/core/types.hpp"
#include "faultline/http/http_server.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace faultline {
namespace harness {

using CallbackHandler = std::function<void(const core::CallbackEvent&)>;

/**
 * @brief Ephemeral HTTP listener that turns proxy notifications into
 *        CallbackEvent handler calls.
 *
 * Every notification is acknowledged with 200 before the handler runs; the
 * handler is invoked on its own task, so a slow handler neither delays the
 * proxy nor other deliveries.
 */
class CallbackServer {
public:
    explicit CallbackServer(core::CallbackConfig config = core::CallbackConfig(),
                            std::shared_ptr<core::StructuredLogger> logger = nullptr);

    /**
     * @brief Calls stop().
     */
    ~CallbackServer();

    CallbackServer(const CallbackServer&) = delete;
    CallbackServer& operator=(const CallbackServer&) = delete;

    /**
     * @brief Start listening on an ephemeral port.
     *
     * @return The URL under which the proxy reaches this server,
     *         http://<advertiseHost>:<port>
     */
    core::Result<std::string, core::Error> start(CallbackHandler handler);

    /**
     * @brief Close the listener and wait for running handlers. Idempotent.
     */
    void stop();

    const std::string& url() const { return url_; }

    uint16_t port() const { return server_.port(); }

    uint64_t receivedCount() const { return received_.load(); }

private:
    http::HttpResponse onNotification(const http::HttpRequest& request);

    core::CallbackConfig config_;
    std::shared_ptr<core::StructuredLogger> logger_;
    http::HttpServer server_;
    std::unique_ptr<core::TaskGroup> handlers_;
    CallbackHandler handler_;
    std::string url_;
    std::atomic<uint64_t> received_{0};
    std::mutex lifecycleMutex_;
};

} // namespace harness
} // namespace faultline

#endif // FAULTLINE_HARNESS_CALLBACK_SERVER_HPP
