// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Platform Abstraction Layer - Common Types
//
// Handles, error records and callback signatures shared by the network,
// process and logging abstractions.

#ifndef FAULTLINE_PAL_PAL_TYPES_HPP
#define FAULTLINE_PAL_PAL_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace faultline {

// Forward declarations
namespace core {
template<typename T, typename E> class Result;
}

namespace pal {

// =============================================================================
// Handle Types
// =============================================================================

/**
 * @brief Platform-independent socket handle wrapping the native descriptor.
 */
struct SocketHandle {
    uint64_t value;

    bool operator==(const SocketHandle& other) const { return value == other.value; }
    bool operator!=(const SocketHandle& other) const { return value != other.value; }
};

/**
 * @brief Handle of a child process started with IProcessPAL::spawn.
 */
struct ProcessHandle {
    int64_t pid;

    bool operator==(const ProcessHandle& other) const { return pid == other.pid; }
    bool operator!=(const ProcessHandle& other) const { return pid != other.pid; }
};

constexpr SocketHandle INVALID_SOCKET_HANDLE{~uint64_t{0}};
constexpr ProcessHandle INVALID_PROCESS_HANDLE{-1};

// =============================================================================
// Error Codes
// =============================================================================

/**
 * @brief Network operation error codes.
 */
enum class NetworkErrorCode : uint32_t {
    Success = 0,
    Unknown = 1,

    // Initialization errors
    InitializationFailed = 100,
    AlreadyInitialized = 101,
    NotInitialized = 102,

    // Socket errors
    SocketCreationFailed = 200,
    BindFailed = 201,
    ListenFailed = 202,
    AcceptFailed = 203,
    ConnectionReset = 206,
    ConnectionRefused = 207,
    ConnectionClosed = 208,
    SocketNotFound = 209,

    // I/O errors
    ReadFailed = 300,
    WriteFailed = 301,
    Timeout = 303,

    // Address errors
    AddressInUse = 400,
    AddressNotAvailable = 401,
    InvalidAddress = 402,

    // Resource errors
    TooManyOpenFiles = 500,

    // Permission errors
    PermissionDenied = 600,
};

/**
 * @brief Child process error codes.
 */
enum class ProcessErrorCode : uint32_t {
    Success = 0,
    Unknown = 1,
    PipeFailed = 100,
    ForkFailed = 101,
    ExecFailed = 102,
    WaitFailed = 103,
    SignalFailed = 104,
    Timeout = 105,
    InvalidHandle = 106,
};

/**
 * @brief Log levels for the logging PAL, most verbose first.
 */
enum class LogLevel : uint32_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

// =============================================================================
// Error Structures
// =============================================================================

/**
 * @brief Detailed network error information.
 */
struct NetworkError {
    NetworkErrorCode code;
    std::string message;
    int32_t systemErrorCode;  ///< errno at the failure site

    NetworkError(NetworkErrorCode c = NetworkErrorCode::Unknown,
                 std::string msg = "",
                 int32_t sysErr = 0)
        : code(c)
        , message(std::move(msg))
        , systemErrorCode(sysErr) {}
};

/**
 * @brief Detailed process error information.
 */
struct ProcessError {
    ProcessErrorCode code;
    std::string message;
    int32_t systemErrorCode;

    ProcessError(ProcessErrorCode c = ProcessErrorCode::Unknown,
                 std::string msg = "",
                 int32_t sysErr = 0)
        : code(c)
        , message(std::move(msg))
        , systemErrorCode(sysErr) {}
};

// =============================================================================
// Configuration Structures
// =============================================================================

/**
 * @brief Options for creating a server socket.
 */
struct ServerOptions {
    int backlog = 128;           ///< Listen backlog size
    bool reuseAddr = true;       ///< Enable SO_REUSEADDR
};

/**
 * @brief Server socket information.
 *
 * port holds the bound port, which differs from the requested one when an
 * ephemeral port (0) was requested.
 */
struct ServerSocket {
    SocketHandle handle;
    std::string address;
    uint16_t port;
};

/**
 * @brief Description of a child process to run.
 *
 * The executable is searched on PATH when it contains no slash.
 */
struct ProcessSpec {
    std::string executable;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;  ///< Added to the inherited environment
    std::chrono::milliseconds timeout{0};    ///< 0 = no deadline (run only)
    std::string stdoutPath;                  ///< spawn only; empty = /dev/null
};

/**
 * @brief Outcome of a completed child process.
 */
struct ProcessResult {
    int exitCode = -1;          ///< Exit status, or 128 + signal number
    std::string stdoutText;
    std::string stderrText;
};

/**
 * @brief Source context attached to a log record.
 */
struct LogContext {
    const char* file = nullptr;
    int line = 0;
    const char* function = nullptr;
    std::string threadName;
};

// =============================================================================
// Callback Types
// =============================================================================

using AcceptCallback = std::function<void(core::Result<SocketHandle, NetworkError>)>;

using ReadCallback = std::function<void(core::Result<size_t, NetworkError>)>;

using WriteCallback = std::function<void(core::Result<size_t, NetworkError>)>;

} // namespace pal
} // namespace faultline

#endif // FAULTLINE_PAL_PAL_TYPES_HPP
