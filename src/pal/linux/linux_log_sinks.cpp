// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Linux log sinks implementation

#include "faultline/pal/linux/linux_log_sinks.hpp"

#include <cstdio>

namespace faultline {
namespace pal {
namespace linux {

// =============================================================================
// ConsoleLogSink
// =============================================================================

void ConsoleLogSink::write(
    LogLevel /*level*/,
    const std::string& message,
    const std::string& /*category*/,
    const LogContext& /*context*/
) {
    // The structured logger already embeds level and category in message.
    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(stderr, "%s\n", message.c_str());
}

void ConsoleLogSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stderr);
}

// =============================================================================
// FileLogSink
// =============================================================================

FileLogSink::FileLogSink(const std::string& path)
    : path_(path)
    , stream_(path, std::ios::out | std::ios::app) {}

FileLogSink::~FileLogSink() {
    flush();
}

bool FileLogSink::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_.is_open();
}

void FileLogSink::write(
    LogLevel /*level*/,
    const std::string& message,
    const std::string& /*category*/,
    const LogContext& /*context*/
) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_.is_open()) {
        stream_ << message << '\n';
    }
}

void FileLogSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_.is_open()) {
        stream_.flush();
    }
}

} // namespace linux
} // namespace pal
} // namespace faultline
