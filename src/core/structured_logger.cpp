// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Structured Logging Component Implementation

#include "faultline/core/structured_logger.hpp"

#include "faultline/core/json.hpp"
#include "faultline/pal/linux/linux_log_sinks.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace faultline {
namespace core {

// =============================================================================
// Helper Functions
// =============================================================================

std::string logLevelToString(LogLevelConfig level) {
    switch (level) {
        case LogLevelConfig::Debug:
            return "debug";
        case LogLevelConfig::Info:
            return "info";
        case LogLevelConfig::Warning:
            return "warning";
        case LogLevelConfig::Error:
            return "error";
        default:
            return "info";
    }
}

std::optional<LogLevelConfig> parseLogLevel(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        return LogLevelConfig::Debug;
    } else if (lower == "info") {
        return LogLevelConfig::Info;
    } else if (lower == "warning" || lower == "warn") {
        return LogLevelConfig::Warning;
    } else if (lower == "error") {
        return LogLevelConfig::Error;
    }
    return std::nullopt;
}

LogLevelConfig stringToLogLevel(const std::string& str) {
    return parseLogLevel(str).value_or(LogLevelConfig::Info);
}

std::string trafficEventTypeToString(TrafficEventType eventType) {
    switch (eventType) {
        case TrafficEventType::Forwarded:
            return "forwarded";
        case TrafficEventType::Blocked:
            return "blocked";
        case TrafficEventType::StatusRewritten:
            return "status_rewritten";
        case TrafficEventType::UpstreamFailed:
            return "upstream_failed";
        case TrafficEventType::Notified:
            return "notified";
        default:
            return "unknown";
    }
}

// =============================================================================
// StructuredLogger Implementation
// =============================================================================

StructuredLogger::StructuredLogger()
    : level_(LogLevelConfig::Info)
    , jsonFormat_(false) {
}

StructuredLogger::~StructuredLogger() {
    flush();
}

void StructuredLogger::setLevel(LogLevelConfig level) {
    level_.store(level);
}

LogLevelConfig StructuredLogger::getLevel() const {
    return level_.load();
}

void StructuredLogger::setJsonFormat(bool enabled) {
    jsonFormat_.store(enabled);
}

bool StructuredLogger::isJsonFormat() const {
    return jsonFormat_.load();
}

void StructuredLogger::debug(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Debug, message, category);
}

void StructuredLogger::info(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Info, message, category);
}

void StructuredLogger::warning(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Warning, message, category);
}

void StructuredLogger::error(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Error, message, category);
}

void StructuredLogger::logTrafficEvent(
    TrafficEventType eventType,
    const TrafficInfo& info,
    const std::string& category)
{
    LogLevelConfig level = eventType == TrafficEventType::Forwarded
        ? LogLevelConfig::Debug : LogLevelConfig::Info;
    if (static_cast<int>(level) < static_cast<int>(level_.load())) {
        return;
    }

    std::string formattedMessage;
    if (jsonFormat_.load()) {
        JsonWriter w;
        w.beginObject();
        w.key("timestamp").value(getTimestamp());
        w.key("level").value(logLevelToString(level));
        w.key("category").value(category);
        w.key("event").value(trafficEventTypeToString(eventType));
        w.key("method").value(info.method);
        w.key("path").value(info.path);
        if (info.status != 0) {
            w.key("status").value(info.status);
        }
        if (info.listenPort != 0) {
            w.key("listen_port").value(static_cast<int>(info.listenPort));
        }
        if (!info.target.empty()) {
            w.key("target").value(info.target);
        }
        w.endObject();
        formattedMessage = w.str();
    } else {
        std::ostringstream oss;
        oss << "[" << getTimestamp() << "] ";
        oss << "[" << logLevelToString(level) << "] ";
        oss << "[" << category << "] ";
        oss << trafficEventTypeToString(eventType) << " " << info.method << " " << info.path;
        if (info.status != 0) {
            oss << " -> " << info.status;
        }
        if (info.listenPort != 0) {
            oss << " (port " << info.listenPort << ")";
        }
        if (!info.target.empty()) {
            oss << " target=" << info.target;
        }
        formattedMessage = oss.str();
    }

    dispatch(level, formattedMessage, category);
}

void StructuredLogger::errorWithContext(
    const std::string& message,
    const LogContext& context,
    const std::string& category)
{
    if (static_cast<int>(LogLevelConfig::Error) < static_cast<int>(level_.load())) {
        return;
    }
    dispatch(LogLevelConfig::Error,
             formatMessage(LogLevelConfig::Error, message, category, &context),
             category);
}

void StructuredLogger::addSink(std::shared_ptr<pal::ILogSink> sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void StructuredLogger::removeSink(std::shared_ptr<pal::ILogSink> sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(
        std::remove(sinks_.begin(), sinks_.end(), sink),
        sinks_.end()
    );
}

void StructuredLogger::flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        if (sink) {
            sink->flush();
        }
    }
}

void StructuredLogger::log(LogLevelConfig level, const std::string& message, const std::string& category) {
    if (static_cast<int>(level) < static_cast<int>(level_.load())) {
        return;
    }
    dispatch(level, formatMessage(level, message, category), category);
}

void StructuredLogger::dispatch(
    LogLevelConfig level,
    const std::string& formatted,
    const std::string& category)
{
    pal::LogContext palContext;
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        if (sink) {
            sink->write(toPalLogLevel(level), formatted, category, palContext);
        }
    }
}

std::string StructuredLogger::formatMessage(
    LogLevelConfig level,
    const std::string& message,
    const std::string& category,
    const LogContext* context)
{
    if (jsonFormat_.load()) {
        return formatJson(level, message, category, context);
    }
    return formatPlainText(level, message, category, context);
}

std::string StructuredLogger::formatJson(
    LogLevelConfig level,
    const std::string& message,
    const std::string& category,
    const LogContext* context)
{
    JsonWriter w;
    w.beginObject();
    w.key("timestamp").value(getTimestamp());
    w.key("level").value(logLevelToString(level));
    w.key("category").value(category);
    w.key("message").value(message);

    if (context) {
        if (!context->container.empty()) {
            w.key("container").value(context->container);
        }
        if (!context->route.empty()) {
            w.key("route").value(context->route);
        }
        if (context->ruleIndex >= 0) {
            w.key("rule_index").value(context->ruleIndex);
        }
        if (context->errorCode != 0) {
            w.key("error_code").value(static_cast<int>(context->errorCode));
        }
    }

    w.endObject();
    return w.str();
}

std::string StructuredLogger::formatPlainText(
    LogLevelConfig level,
    const std::string& message,
    const std::string& category,
    const LogContext* context)
{
    std::ostringstream oss;
    oss << "[" << getTimestamp() << "] ";
    oss << "[" << logLevelToString(level) << "] ";
    oss << "[" << category << "] ";
    oss << message;

    if (context) {
        if (!context->container.empty()) {
            oss << " container=" << context->container;
        }
        if (!context->route.empty()) {
            oss << " route=" << context->route;
        }
        if (context->ruleIndex >= 0) {
            oss << " rule=" << context->ruleIndex;
        }
        if (context->errorCode != 0) {
            oss << " code=" << context->errorCode;
        }
    }
    return oss.str();
}

std::string StructuredLogger::getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    oss << "Z";
    return oss.str();
}

pal::LogLevel StructuredLogger::toPalLogLevel(LogLevelConfig level) {
    switch (level) {
        case LogLevelConfig::Debug:
            return pal::LogLevel::Debug;
        case LogLevelConfig::Info:
            return pal::LogLevel::Info;
        case LogLevelConfig::Warning:
            return pal::LogLevel::Warning;
        case LogLevelConfig::Error:
            return pal::LogLevel::Error;
        default:
            return pal::LogLevel::Info;
    }
}

std::shared_ptr<StructuredLogger> defaultLogger() {
    static std::shared_ptr<StructuredLogger> instance = [] {
        auto logger = std::make_shared<StructuredLogger>();
        logger->addSink(std::make_shared<pal::linux::ConsoleLogSink>());
        return logger;
    }();
    return instance;
}

} // namespace core
} // namespace faultline
