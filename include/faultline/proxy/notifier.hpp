// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Asynchronous delivery of callback events

#ifndef FAULTLINE_PROXY_NOTIFIER_HPP
#define FAULTLINE_PROXY_NOTIFIER_HPP

#include "faultline/core/structured_logger.hpp"
#include "faultline/core/task_group.hpp"
#include "faultline/core/types.hpp"
#include "faultline/http/http_client.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace faultline {
namespace proxy {

/**
 * @brief POSTs callback events to observers.
 *
 * Each notification is delivered on its own task; notify() returns at once.
 * Delivery failures and non-2xx answers are logged, never retried.
 */
class Notifier {
public:
    Notifier(std::shared_ptr<http::IHttpClient> client,
             std::shared_ptr<core::StructuredLogger> logger,
             std::chrono::milliseconds timeout);

    ~Notifier();

    Notifier(const Notifier&) = delete;
    Notifier& operator=(const Notifier&) = delete;

    void notify(const std::string& url, const core::CallbackEvent& event);

    /**
     * @brief Wait for in-flight deliveries; later notify() calls are dropped.
     */
    void shutdown();

    uint64_t deliveredCount() const { return delivered_.load(); }

    uint64_t failedCount() const { return failed_.load(); }

private:
    void deliver(const std::string& url, const std::string& body, const std::string& path);

    std::shared_ptr<http::IHttpClient> client_;
    std::shared_ptr<core::StructuredLogger> logger_;
    std::chrono::milliseconds timeout_;
    core::TaskGroup tasks_;
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace proxy
} // namespace faultline

#endif // FAULTLINE_PROXY_NOTIFIER_HPP
