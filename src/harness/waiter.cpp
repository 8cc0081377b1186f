// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// One-shot completion flag for waiting on asynchronous network events

#include "faultline/harness/waiter.hpp"

namespace faultline {
namespace harness {

void Waiter::finish() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_) {
            return;
        }
        finished_ = true;
    }
    cv_.notify_all();
}

bool Waiter::isFinished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

bool Waiter::wait(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return finished_; });
}

bool Waiter::wait(ITestReporter& reporter,
                  std::chrono::milliseconds timeout,
                  const std::string& failureMessage) {
    if (wait(timeout)) {
        return true;
    }
    reporter.error("timed out after " + std::to_string(timeout.count()) + "ms: " + failureMessage);
    return false;
}

} // namespace harness
} // namespace faultline
