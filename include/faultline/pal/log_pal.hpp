// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Platform Abstraction Layer - Log Sink Interface
//
// The structured logger formats records and hands them to one or more sinks.
// Linux sinks live in pal/linux/linux_log_sinks.hpp.

#ifndef FAULTLINE_PAL_LOG_PAL_HPP
#define FAULTLINE_PAL_LOG_PAL_HPP

#include "faultline/pal/pal_types.hpp"

#include <string>

namespace faultline {
namespace pal {

/**
 * @brief Interface for log output sinks.
 *
 * Sinks receive fully formatted lines. They must tolerate concurrent
 * write() calls; the logger serializes dispatch but a sink may be shared
 * between loggers.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /**
     * @brief Write a log message.
     *
     * @param level Log level of the message
     * @param message Formatted log line
     * @param category Log category (e.g. "ReverseProxy", "Deployment")
     * @param context Source context
     */
    virtual void write(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) = 0;

    virtual void flush() = 0;

    virtual std::string getName() const = 0;
};

} // namespace pal
} // namespace faultline

#endif // FAULTLINE_PAL_LOG_PAL_HPP
