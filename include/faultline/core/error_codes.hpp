// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Common error codes and Error structure

#ifndef FAULTLINE_CORE_ERROR_CODES_HPP
#define FAULTLINE_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <string>

namespace faultline {
namespace core {

/**
 * @brief Error codes shared by every Faultline layer.
 *
 * Codes are grouped in ranges of one hundred so that the failure class
 * (provisioning, rule push, wait, teardown) can be read off the number in
 * logs.
 */
enum class ErrorCode : uint32_t {
    // General errors (0-99)
    Success = 0,
    Unknown = 1,
    InvalidArgument = 2,
    InvalidState = 3,
    NotInitialized = 4,
    NotFound = 7,

    // Timeout (100-199)
    Timeout = 100,

    // Network errors (200-299)
    NetworkError = 200,
    ConnectionFailed = 201,
    BindFailed = 204,

    // HTTP errors (300-399)
    HttpError = 300,
    MalformedRequest = 301,
    UpstreamUnavailable = 303,

    // Rule errors (400-499)
    RuleError = 400,
    InvalidFilter = 401,
    InvalidRule = 402,
    RulePushFailed = 403,
    RulePushRejected = 404,

    // Provisioning errors (500-599)
    ProvisioningFailed = 500,
    ReadinessTimeout = 501,
    ContainerStartFailed = 502,
    NetworkCreateFailed = 503,
    PortLookupFailed = 504,
    TeardownFailed = 505,
    LogCaptureFailed = 506,

    // Process errors (700-799)
    ProcessError = 700,
    ProcessSpawnFailed = 701,
    ProcessExitedNonZero = 702,
};

/**
 * @brief Convert error code to human-readable string.
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::NotInitialized: return "Not initialized";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::BindFailed: return "Bind failed";
        case ErrorCode::HttpError: return "HTTP error";
        case ErrorCode::MalformedRequest: return "Malformed request";
        case ErrorCode::UpstreamUnavailable: return "Upstream unavailable";
        case ErrorCode::RuleError: return "Rule error";
        case ErrorCode::InvalidFilter: return "Invalid filter expression";
        case ErrorCode::InvalidRule: return "Invalid rule";
        case ErrorCode::RulePushFailed: return "Rule push failed";
        case ErrorCode::RulePushRejected: return "Rule push rejected";
        case ErrorCode::ProvisioningFailed: return "Provisioning failed";
        case ErrorCode::ReadinessTimeout: return "Readiness timeout";
        case ErrorCode::ContainerStartFailed: return "Container start failed";
        case ErrorCode::NetworkCreateFailed: return "Network create failed";
        case ErrorCode::PortLookupFailed: return "Port lookup failed";
        case ErrorCode::TeardownFailed: return "Teardown failed";
        case ErrorCode::LogCaptureFailed: return "Log capture failed";
        case ErrorCode::ProcessError: return "Process error";
        case ErrorCode::ProcessSpawnFailed: return "Process spawn failed";
        case ErrorCode::ProcessExitedNonZero: return "Process exited non-zero";
        default: return "Unknown error code";
    }
}

/**
 * @brief Error code plus message and optional context (container, route...).
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;

    Error(ErrorCode c = ErrorCode::Unknown,
          std::string msg = "",
          std::string ctx = "")
        : code(c)
        , message(std::move(msg))
        , context(std::move(ctx)) {}

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == ErrorCode::Success;
    }

    [[nodiscard]] std::string toString() const {
        std::string result = errorCodeToString(code);
        if (!message.empty()) {
            result += ": " + message;
        }
        if (!context.empty()) {
            result += " [" + context + "]";
        }
        return result;
    }
};

} // namespace core
} // namespace faultline

#endif // FAULTLINE_CORE_ERROR_CODES_HPP
