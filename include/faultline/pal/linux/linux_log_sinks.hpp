// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Linux log sinks: stderr console and append-only file

#ifndef FAULTLINE_PAL_LINUX_LINUX_LOG_SINKS_HPP
#define FAULTLINE_PAL_LINUX_LINUX_LOG_SINKS_HPP

#include "faultline/pal/log_pal.hpp"

#include <fstream>
#include <mutex>
#include <string>

namespace faultline {
namespace pal {
namespace linux {

/**
 * @brief Writes each record as one line to stderr.
 *
 * Container runtimes collect stderr, so this is the sink the proxy
 * executable uses; its output ends up in the saved container logs.
 */
class ConsoleLogSink : public ILogSink {
public:
    void write(LogLevel level, const std::string& message,
               const std::string& category, const LogContext& context) override;
    void flush() override;
    std::string getName() const override { return "console"; }

private:
    std::mutex mutex_;
};

/**
 * @brief Appends each record as one line to a file.
 */
class FileLogSink : public ILogSink {
public:
    explicit FileLogSink(const std::string& path);
    ~FileLogSink() override;

    FileLogSink(const FileLogSink&) = delete;
    FileLogSink& operator=(const FileLogSink&) = delete;

    /**
     * @brief False when the file could not be opened; writes are dropped.
     */
    bool isOpen() const;

    void write(LogLevel level, const std::string& message,
               const std::string& category, const LogContext& context) override;
    void flush() override;
    std::string getName() const override { return "file:" + path_; }

private:
    std::string path_;
    mutable std::mutex mutex_;
    std::ofstream stream_;
};

} // namespace linux
} // namespace pal
} // namespace faultline

#endif // FAULTLINE_PAL_LINUX_LINUX_LOG_SINKS_HPP
