// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// One-shot completion flag for waiting on asynchronous network events

#ifndef FAULTLINE_HARNESS_WAITER_HPP
#define FAULTLINE_HARNESS_WAITER_HPP

#include "faultline/harness/test_reporter.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace faultline {
namespace harness {

/**
 * @brief Binary completion flag shared between producers and waiters.
 *
 * finish() may be called any number of times from any thread; only the
 * first call has an effect. Any number of threads may wait concurrently.
 *
 * @code
 * auto waiter = Waiter::create();
 * server.start([waiter](const core::CallbackEvent&) { waiter->finish(); });
 * waiter->wait(reporter, std::chrono::seconds(5), "did not see /keys/query");
 * @endcode
 */
class Waiter {
public:
    static std::shared_ptr<Waiter> create() {
        return std::make_shared<Waiter>();
    }

    void finish();

    bool isFinished() const;

    /**
     * @return true if finished before the timeout
     */
    bool wait(std::chrono::milliseconds timeout);

    /**
     * @brief Wait, reporting failureMessage through the reporter on timeout.
     */
    bool wait(ITestReporter& reporter,
              std::chrono::milliseconds timeout,
              const std::string& failureMessage);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool finished_ = false;
};

} // namespace harness
} // namespace faultline

#endif // FAULTLINE_HARNESS_WAITER_HPP
