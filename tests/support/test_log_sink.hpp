// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Log sink capturing formatted records in memory

#ifndef FAULTLINE_TESTS_SUPPORT_TEST_LOG_SINK_HPP
#define FAULTLINE_TESTS_SUPPORT_TEST_LOG_SINK_HPP

#include "faultline/core/structured_logger.hpp"
#include "faultline/pal/log_pal.hpp"
#include "faultline/pal/pal_types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace faultline {
namespace test {

class TestLogSink : public pal::ILogSink {
public:
    struct Entry {
        pal::LogLevel level;
        std::string message;
        std::string category;
    };

    void write(pal::LogLevel level, const std::string& message,
               const std::string& category, const pal::LogContext&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(Entry{level, message, category});
    }

    void flush() override {
        flushCount_++;
    }

    std::string getName() const override {
        return "TestLogSink";
    }

    std::vector<Entry> getEntries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    bool contains(const std::string& fragment) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : entries_) {
            if (entry.message.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    int getFlushCount() const {
        return flushCount_.load();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    std::atomic<int> flushCount_{0};
};

/**
 * @brief Debug-level logger writing only to the returned sink.
 */
inline std::shared_ptr<core::StructuredLogger> makeCapturingLogger(std::shared_ptr<TestLogSink>& sink) {
    sink = std::make_shared<TestLogSink>();
    auto logger = std::make_shared<core::StructuredLogger>();
    logger->setLevel(core::LogLevelConfig::Debug);
    logger->addSink(sink);
    return logger;
}

} // namespace test
} // namespace faultline

#endif // FAULTLINE_TESTS_SUPPORT_TEST_LOG_SINK_HPP
