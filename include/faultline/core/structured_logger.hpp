// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Structured Logging Component
//
// Plain-text or JSON line logging with categories, routed to pluggable
// sinks. Every Faultline component takes a shared logger; components
// constructed without one fall back to defaultLogger().

#ifndef FAULTLINE_CORE_STRUCTURED_LOGGER_HPP
#define FAULTLINE_CORE_STRUCTURED_LOGGER_HPP

#include "faultline/pal/log_pal.hpp"
#include "faultline/pal/pal_types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace faultline {
namespace core {

/**
 * @brief Configurable log levels. Messages below the configured level are
 * dropped before formatting.
 */
enum class LogLevelConfig {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

std::string logLevelToString(LogLevelConfig level);

/**
 * @brief Case-insensitive level parse; defaults to Info for unknown input.
 */
LogLevelConfig stringToLogLevel(const std::string& str);

/**
 * @brief Strict level parse used by configuration validation.
 */
std::optional<LogLevelConfig> parseLogLevel(const std::string& str);

/**
 * @brief What the reverse proxy did with one request.
 */
enum class TrafficEventType {
    Forwarded,        ///< Passed through unmodified
    Blocked,          ///< Short-circuited with a synthetic status
    StatusRewritten,  ///< Forwarded, then status replaced
    UpstreamFailed,   ///< Upstream unreachable, 502 returned
    Notified          ///< Callback or sniffer notification dispatched
};

std::string trafficEventTypeToString(TrafficEventType eventType);

/**
 * @brief Request details attached to a traffic event.
 */
struct TrafficInfo {
    std::string method;
    std::string path;
    int status = 0;
    uint16_t listenPort = 0;
    std::string target;  ///< Upstream URL or notification URL
};

/**
 * @brief Context fields for error records.
 */
struct LogContext {
    std::string container;   ///< Container or process name
    std::string route;       ///< Request path or admin route
    int ruleIndex = -1;      ///< Index of the rule involved, -1 if none
    int32_t errorCode = 0;   ///< core::ErrorCode value

    LogContext() = default;
};

/**
 * @brief Structured logger with JSON format support.
 *
 * - Configurable level (debug, info, warning, error)
 * - ISO 8601 UTC timestamps
 * - JSON lines for log aggregation, or bracketed plain text
 * - Multiple sinks
 *
 * All methods are thread-safe.
 *
 * @code
 * auto logger = std::make_shared<StructuredLogger>();
 * logger->addSink(std::make_shared<pal::linux::ConsoleLogSink>());
 * logger->info("listening on :3000", "ReverseProxy");
 *
 * LogContext ctx;
 * ctx.container = "hs1";
 * logger->errorWithContext("container never became ready", ctx, "Deployment");
 * @endcode
 */
class StructuredLogger {
public:
    StructuredLogger();

    /**
     * @brief Flushes all sinks.
     */
    ~StructuredLogger();

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;
    StructuredLogger(StructuredLogger&&) = delete;
    StructuredLogger& operator=(StructuredLogger&&) = delete;

    void setLevel(LogLevelConfig level);
    LogLevelConfig getLevel() const;

    void setJsonFormat(bool enabled);
    bool isJsonFormat() const;

    void debug(const std::string& message, const std::string& category = "Faultline");
    void info(const std::string& message, const std::string& category = "Faultline");
    void warning(const std::string& message, const std::string& category = "Faultline");
    void error(const std::string& message, const std::string& category = "Faultline");

    /**
     * @brief Log one proxied request outcome at Info (Debug for Forwarded).
     */
    void logTrafficEvent(
        TrafficEventType eventType,
        const TrafficInfo& info,
        const std::string& category = "ReverseProxy"
    );

    /**
     * @brief Log at Error with context fields attached.
     */
    void errorWithContext(
        const std::string& message,
        const LogContext& context,
        const std::string& category = "Faultline"
    );

    void addSink(std::shared_ptr<pal::ILogSink> sink);
    void removeSink(std::shared_ptr<pal::ILogSink> sink);
    void flush();

private:
    void log(LogLevelConfig level, const std::string& message, const std::string& category);
    void dispatch(LogLevelConfig level, const std::string& formatted, const std::string& category);

    std::string formatMessage(
        LogLevelConfig level,
        const std::string& message,
        const std::string& category,
        const LogContext* context = nullptr
    );

    std::string formatJson(
        LogLevelConfig level,
        const std::string& message,
        const std::string& category,
        const LogContext* context
    );

    std::string formatPlainText(
        LogLevelConfig level,
        const std::string& message,
        const std::string& category,
        const LogContext* context
    );

    static std::string getTimestamp();
    static pal::LogLevel toPalLogLevel(LogLevelConfig level);

    std::atomic<LogLevelConfig> level_;
    std::atomic<bool> jsonFormat_;

    std::mutex sinksMutex_;
    std::vector<std::shared_ptr<pal::ILogSink>> sinks_;
};

/**
 * @brief Process-wide logger writing to stderr at Info level.
 */
std::shared_ptr<StructuredLogger> defaultLogger();

} // namespace core
} // namespace faultline

#endif // FAULTLINE_CORE_STRUCTURED_LOGGER_HPP
