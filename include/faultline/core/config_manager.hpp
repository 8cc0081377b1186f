// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Configuration Manager
//
// Loads the harness and proxy configuration from JSON, applies FAULTLINE_*
// environment overrides (plus the REVERSE_PROXY_* variables the proxy
// container is started with) and validates the result.

#ifndef FAULTLINE_CORE_CONFIG_MANAGER_HPP
#define FAULTLINE_CORE_CONFIG_MANAGER_HPP

#include "faultline/core/result.hpp"
#include "faultline/core/structured_logger.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace faultline {
namespace core {

// =============================================================================
// Configuration Structures
// =============================================================================

/**
 * @brief Images, ports and timing of the provisioned topology.
 */
struct DeploymentConfig {
    std::string chatServerImage = "ghcr.io/matrix-org/synapse-service:v1.94.0";
    std::vector<std::string> chatServerNames = {"hs1", "hs2"};
    uint16_t chatServerPort = 8008;
    std::string chatServerReadyPath = "/_matrix/client/versions";

    std::string datastoreImage = "postgres:13-alpine";

    std::string syncProxyImage = "ghcr.io/matrix-org/sliding-sync:v0.99.12";
    std::string syncProxySecret = "secret";

    std::string reverseProxyImage = "faultline/reverse-proxy:latest";
    uint16_t reverseProxyFirstPort = 3000;   ///< Front port of the first chat server
    uint16_t reverseProxyAdminPort = 9000;

    uint32_t startupTimeoutMs = 60000;
    uint32_t readinessPollIntervalMs = 1000;
    std::string networkPrefix = "faultline";
};

/**
 * @brief Packet capture and container log persistence.
 */
struct CaptureConfig {
    bool packetCapture = false;
    std::string packetCaptureFile = "test.pcap";
    bool writeContainerLogs = true;
    std::string logDirectory = ".";
    bool compressLogs = false;  ///< Write container-<name>.log.gz
};

/**
 * @brief Where callback relay servers listen and how the proxy reaches them.
 */
struct CallbackConfig {
    std::string advertiseHost = "host.docker.internal";
    std::string bindAddress = "0.0.0.0";
};

struct LoggingConfig {
    LogLevelConfig level = LogLevelConfig::Info;
    bool json = false;
    std::string file;  ///< Optional log file in addition to stderr
};

/**
 * @brief Settings of the faultline-proxy executable.
 */
struct ProxyConfig {
    std::string upstreams;      ///< "http://hs1:8008,3000;http://hs2:8008,3001"
    uint16_t adminPort = 9000;
    std::string bindAddress = "0.0.0.0";
    uint32_t upstreamTimeoutMs = 30000;
    std::string controllerUrl;  ///< REVERSE_PROXY_CONTROLLER_URL, informational
};

struct HarnessConfig {
    DeploymentConfig deployment;
    CaptureConfig capture;
    CallbackConfig callback;
    LoggingConfig logging;
    ProxyConfig proxy;
};

/**
 * @brief One front listener of the reverse proxy and where it forwards to.
 */
struct UpstreamRoute {
    std::string upstreamUrl;  ///< Scheme, host and optional port, no trailing slash
    uint16_t listenPort = 0;
};

// =============================================================================
// Error Types
// =============================================================================

struct ConfigError {
    enum class Code {
        None,
        FileNotFound,
        ParseError,
        ValidationError,
        IOError
    };

    Code code = Code::None;
    std::string message;
    std::string field;  ///< Field that caused the error (if applicable)

    ConfigError() = default;
    ConfigError(Code c, std::string msg) : code(c), message(std::move(msg)) {}
    ConfigError(Code c, std::string msg, std::string f)
        : code(c), message(std::move(msg)), field(std::move(f)) {}
};

/**
 * @brief Parse the upstream routing table.
 *
 * Format: entries separated by ';', each "<upstream url>,<listen port>",
 * e.g. "http://hs1:8008,3000;http://hs2:8008,3001". Whitespace around
 * entries is ignored; empty entries are skipped.
 */
Result<std::vector<UpstreamRoute>, ConfigError> parseUpstreamRoutes(const std::string& spec);

/**
 * @brief Inverse of parseUpstreamRoutes.
 */
std::string formatUpstreamRoutes(const std::vector<UpstreamRoute>& routes);

/**
 * @brief Logger with a stderr sink, plus a file sink when config.file is set.
 */
std::shared_ptr<StructuredLogger> createLogger(const LoggingConfig& config);

// =============================================================================
// Configuration Manager
// =============================================================================

using ConfigLogCallback = std::function<void(const std::string&)>;

/**
 * @brief Loads, overrides and validates HarnessConfig.
 *
 * Missing sections and fields keep their defaults. A field of the wrong
 * JSON type is a parse error naming the field.
 *
 * Thread Safety: all public methods are thread-safe.
 *
 * @code
 * ConfigManager manager;
 * manager.setLogCallback([](const std::string& msg) { std::cerr << msg << "\n"; });
 * auto loaded = manager.loadFromFile("faultline.json");
 * manager.applyEnvironmentOverrides();
 * auto valid = manager.validate();
 * HarnessConfig config = manager.getConfig();
 * @endcode
 */
class ConfigManager {
public:
    ConfigManager();
    virtual ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    Result<void, ConfigError> loadFromFile(const std::string& filePath);
    Result<void, ConfigError> loadFromJsonString(const std::string& jsonContent);

    /**
     * @brief Reset to built-in defaults.
     */
    void loadDefaults();

    /**
     * @brief Apply environment variable overrides.
     *
     * Invalid values are logged and ignored.
     */
    void applyEnvironmentOverrides();

    Result<void, ConfigError> validate() const;

    HarnessConfig getConfig() const;

    /**
     * @brief Effective configuration as a JSON document.
     */
    std::string dumpConfig() const;

    void setLogCallback(ConfigLogCallback callback);

protected:
    /**
     * @brief Environment lookup; overridable in tests.
     */
    virtual std::optional<std::string> getEnvVar(const std::string& name) const;

private:
    Result<void, ConfigError> parseJson(const std::string& content);
    Result<std::string, ConfigError> readFile(const std::string& filePath) const;
    void log(const std::string& message) const;
    void logEffectiveConfig() const;

    mutable std::shared_mutex configMutex_;
    HarnessConfig config_;

    mutable std::mutex logMutex_;
    ConfigLogCallback logCallback_;
};

} // namespace core
} // namespace faultline

#endif // FAULTLINE_CORE_CONFIG_MANAGER_HPP
