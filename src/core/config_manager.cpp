// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Configuration Manager Implementation

#include "faultline/core/config_manager.hpp"

#include "faultline/core/json.hpp"
#include "faultline/pal/linux/linux_log_sinks.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace faultline {
namespace core {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

bool parseBoolText(const std::string& text) {
    std::string lower = toLower(text);
    return lower == "true" || lower == "1" || lower == "yes";
}

std::optional<uint64_t> parseUnsigned(const std::string& text, uint64_t max) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        uint64_t value = std::stoull(text);
        if (value > max) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// =============================================================================
// Typed field readers
// =============================================================================

Result<void, ConfigError> typeError(const std::string& field, const char* expected) {
    return Result<void, ConfigError>::error(
        ConfigError(ConfigError::Code::ParseError,
                    field + " must be " + expected, field));
}

Result<void, ConfigError> readString(const JsonValue& section, const std::string& key,
                                     const std::string& path, std::string& out) {
    const JsonValue& v = section[key];
    if (v.isNull()) return Result<void, ConfigError>::success();
    if (!v.isString()) return typeError(path + "." + key, "a string");
    out = v.stringValue;
    return Result<void, ConfigError>::success();
}

Result<void, ConfigError> readBool(const JsonValue& section, const std::string& key,
                                   const std::string& path, bool& out) {
    const JsonValue& v = section[key];
    if (v.isNull()) return Result<void, ConfigError>::success();
    if (!v.isBool()) return typeError(path + "." + key, "a boolean");
    out = v.boolValue;
    return Result<void, ConfigError>::success();
}

template<typename T>
Result<void, ConfigError> readUnsigned(const JsonValue& section, const std::string& key,
                                       const std::string& path, T& out) {
    const JsonValue& v = section[key];
    if (v.isNull()) return Result<void, ConfigError>::success();
    if (!v.isInteger() || v.numberValue < 0 ||
        v.numberValue > static_cast<double>(std::numeric_limits<T>::max())) {
        return typeError(path + "." + key, "a non-negative integer in range");
    }
    out = static_cast<T>(v.numberValue);
    return Result<void, ConfigError>::success();
}

Result<void, ConfigError> readStringList(const JsonValue& section, const std::string& key,
                                         const std::string& path, std::vector<std::string>& out) {
    const JsonValue& v = section[key];
    if (v.isNull()) return Result<void, ConfigError>::success();
    if (!v.isArray()) return typeError(path + "." + key, "an array of strings");
    std::vector<std::string> values;
    for (const auto& item : v.arrayValue) {
        if (!item.isString()) return typeError(path + "." + key, "an array of strings");
        values.push_back(item.stringValue);
    }
    out = std::move(values);
    return Result<void, ConfigError>::success();
}

} // namespace

// =============================================================================
// Upstream routes
// =============================================================================

Result<std::vector<UpstreamRoute>, ConfigError> parseUpstreamRoutes(const std::string& spec) {
    using R = Result<std::vector<UpstreamRoute>, ConfigError>;
    std::vector<UpstreamRoute> routes;

    std::stringstream entries(spec);
    std::string entry;
    while (std::getline(entries, entry, ';')) {
        entry = trim(entry);
        if (entry.empty()) {
            continue;
        }
        size_t comma = entry.rfind(',');
        if (comma == std::string::npos) {
            return R::error(ConfigError(ConfigError::Code::ValidationError,
                "Upstream entry missing ',<port>': " + entry, "proxy.upstreams"));
        }
        std::string url = trim(entry.substr(0, comma));
        std::string portText = trim(entry.substr(comma + 1));

        if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
            return R::error(ConfigError(ConfigError::Code::ValidationError,
                "Upstream URL must start with http:// or https://: " + url, "proxy.upstreams"));
        }
        while (!url.empty() && url.back() == '/') {
            url.pop_back();
        }

        auto port = parseUnsigned(portText, 65535);
        if (!port || *port == 0) {
            return R::error(ConfigError(ConfigError::Code::ValidationError,
                "Invalid listen port in upstream entry: " + entry, "proxy.upstreams"));
        }
        for (const auto& existing : routes) {
            if (existing.listenPort == *port) {
                return R::error(ConfigError(ConfigError::Code::ValidationError,
                    "Duplicate listen port " + portText, "proxy.upstreams"));
            }
        }
        routes.push_back(UpstreamRoute{url, static_cast<uint16_t>(*port)});
    }
    return R::success(std::move(routes));
}

std::string formatUpstreamRoutes(const std::vector<UpstreamRoute>& routes) {
    std::string out;
    for (const auto& route : routes) {
        if (!out.empty()) {
            out += ';';
        }
        out += route.upstreamUrl + "," + std::to_string(route.listenPort);
    }
    return out;
}

// =============================================================================
// ConfigManager Implementation
// =============================================================================

ConfigManager::ConfigManager() = default;

ConfigManager::~ConfigManager() = default;

Result<void, ConfigError> ConfigManager::loadFromFile(const std::string& filePath) {
    auto contentResult = readFile(filePath);
    if (contentResult.isError()) {
        return Result<void, ConfigError>::error(contentResult.error());
    }
    return loadFromJsonString(contentResult.value());
}

Result<void, ConfigError> ConfigManager::loadFromJsonString(const std::string& jsonContent) {
    auto result = parseJson(jsonContent);
    if (result.isSuccess()) {
        logEffectiveConfig();
    }
    return result;
}

void ConfigManager::loadDefaults() {
    {
        std::unique_lock<std::shared_mutex> lock(configMutex_);
        config_ = HarnessConfig{};
    }
    log("Configuration loaded with default values");
}

void ConfigManager::applyEnvironmentOverrides() {
    std::unique_lock<std::shared_mutex> lock(configMutex_);

    auto overrideString = [this](const char* name, std::string& target) {
        if (auto val = getEnvVar(name)) {
            target = *val;
            log(std::string("Environment override: ") + name + "=" + *val);
        }
    };
    auto overrideBool = [this](const char* name, bool& target) {
        if (auto val = getEnvVar(name)) {
            target = parseBoolText(*val);
            log(std::string("Environment override: ") + name + "=" + *val);
        }
    };

    if (auto val = getEnvVar("FAULTLINE_LOG_LEVEL")) {
        if (auto level = parseLogLevel(*val)) {
            config_.logging.level = *level;
            log("Environment override: FAULTLINE_LOG_LEVEL=" + *val);
        } else {
            log("Warning: Invalid FAULTLINE_LOG_LEVEL value: " + *val);
        }
    }
    overrideBool("FAULTLINE_LOG_JSON", config_.logging.json);

    overrideBool("FAULTLINE_PACKET_CAPTURE", config_.capture.packetCapture);
    overrideBool("FAULTLINE_WRITE_CONTAINER_LOGS", config_.capture.writeContainerLogs);
    overrideString("FAULTLINE_LOG_DIR", config_.capture.logDirectory);

    overrideString("FAULTLINE_CALLBACK_HOST", config_.callback.advertiseHost);

    if (auto val = getEnvVar("FAULTLINE_STARTUP_TIMEOUT_MS")) {
        if (auto ms = parseUnsigned(*val, UINT32_MAX)) {
            config_.deployment.startupTimeoutMs = static_cast<uint32_t>(*ms);
            log("Environment override: FAULTLINE_STARTUP_TIMEOUT_MS=" + *val);
        } else {
            log("Warning: Invalid FAULTLINE_STARTUP_TIMEOUT_MS value: " + *val);
        }
    }

    overrideString("FAULTLINE_CHAT_SERVER_IMAGE", config_.deployment.chatServerImage);
    overrideString("FAULTLINE_REVERSE_PROXY_IMAGE", config_.deployment.reverseProxyImage);
    overrideString("FAULTLINE_SYNC_PROXY_IMAGE", config_.deployment.syncProxyImage);

    overrideString("REVERSE_PROXY_HOSTS", config_.proxy.upstreams);
    overrideString("REVERSE_PROXY_CONTROLLER_URL", config_.proxy.controllerUrl);

    if (auto val = getEnvVar("REVERSE_PROXY_ADMIN_PORT")) {
        auto port = parseUnsigned(*val, 65535);
        if (port && *port != 0) {
            config_.proxy.adminPort = static_cast<uint16_t>(*port);
            log("Environment override: REVERSE_PROXY_ADMIN_PORT=" + *val);
        } else {
            log("Warning: Invalid REVERSE_PROXY_ADMIN_PORT value: " + *val);
        }
    }
}

Result<void, ConfigError> ConfigManager::validate() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);
    using R = Result<void, ConfigError>;

    const DeploymentConfig& d = config_.deployment;
    const struct { const std::string& value; const char* field; } images[] = {
        {d.chatServerImage, "deployment.chatServerImage"},
        {d.datastoreImage, "deployment.datastoreImage"},
        {d.syncProxyImage, "deployment.syncProxyImage"},
        {d.reverseProxyImage, "deployment.reverseProxyImage"},
    };
    for (const auto& image : images) {
        if (image.value.empty()) {
            return R::error(ConfigError(ConfigError::Code::ValidationError,
                std::string(image.field) + " must not be empty", image.field));
        }
    }

    if (d.chatServerNames.empty()) {
        return R::error(ConfigError(ConfigError::Code::ValidationError,
            "deployment.chatServerNames must name at least one server",
            "deployment.chatServerNames"));
    }
    if (d.chatServerPort == 0) {
        return R::error(ConfigError(ConfigError::Code::ValidationError,
            "deployment.chatServerPort must be between 1 and 65535",
            "deployment.chatServerPort"));
    }
    if (d.reverseProxyFirstPort == 0 ||
        static_cast<uint32_t>(d.reverseProxyFirstPort) + d.chatServerNames.size() > 65536) {
        return R::error(ConfigError(ConfigError::Code::ValidationError,
            "deployment.reverseProxyFirstPort leaves no room for every chat server",
            "deployment.reverseProxyFirstPort"));
    }
    if (d.reverseProxyAdminPort == 0) {
        return R::error(ConfigError(ConfigError::Code::ValidationError,
            "deployment.reverseProxyAdminPort must be between 1 and 65535",
            "deployment.reverseProxyAdminPort"));
    }
    if (d.reverseProxyAdminPort >= d.reverseProxyFirstPort &&
        d.reverseProxyAdminPort < d.reverseProxyFirstPort + d.chatServerNames.size()) {
        return R::error(ConfigError(ConfigError::Code::ValidationError,
            "deployment.reverseProxyAdminPort collides with a front port",
            "deployment.reverseProxyAdminPort"));
    }
    if (d.startupTimeoutMs == 0) {
        return R::error(ConfigError(ConfigError::Code::ValidationError,
            "deployment.startupTimeoutMs must be greater than 0",
            "deployment.startupTimeoutMs"));
    }
    if (d.readinessPollIntervalMs == 0 || d.readinessPollIntervalMs > d.startupTimeoutMs) {
        return R::error(ConfigError(ConfigError::Code::ValidationError,
            "deployment.readinessPollIntervalMs must be in (0, startupTimeoutMs]",
            "deployment.readinessPollIntervalMs"));
    }

    if (config_.capture.packetCapture && config_.capture.packetCaptureFile.empty()) {
        return R::error(ConfigError(ConfigError::Code::ValidationError,
            "capture.packetCaptureFile is required when packet capture is enabled",
            "capture.packetCaptureFile"));
    }

    if (config_.callback.advertiseHost.empty()) {
        return R::error(ConfigError(ConfigError::Code::ValidationError,
            "callback.advertiseHost must not be empty", "callback.advertiseHost"));
    }

    if (config_.proxy.adminPort == 0) {
        return R::error(ConfigError(ConfigError::Code::ValidationError,
            "proxy.adminPort must be between 1 and 65535", "proxy.adminPort"));
    }
    auto routes = parseUpstreamRoutes(config_.proxy.upstreams);
    if (routes.isError()) {
        return R::error(routes.error());
    }
    for (const auto& route : routes.value()) {
        if (route.listenPort == config_.proxy.adminPort) {
            return R::error(ConfigError(ConfigError::Code::ValidationError,
                "proxy.adminPort collides with upstream listen port", "proxy.adminPort"));
        }
    }

    return R::success();
}

HarnessConfig ConfigManager::getConfig() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);
    return config_;
}

std::string ConfigManager::dumpConfig() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);
    const HarnessConfig& c = config_;

    JsonWriter w;
    w.beginObject();

    w.key("deployment").beginObject();
    w.key("chatServerImage").value(c.deployment.chatServerImage);
    w.key("chatServerNames").beginArray();
    for (const auto& name : c.deployment.chatServerNames) {
        w.value(name);
    }
    w.endArray();
    w.key("chatServerPort").value(static_cast<int>(c.deployment.chatServerPort));
    w.key("chatServerReadyPath").value(c.deployment.chatServerReadyPath);
    w.key("datastoreImage").value(c.deployment.datastoreImage);
    w.key("syncProxyImage").value(c.deployment.syncProxyImage);
    w.key("reverseProxyImage").value(c.deployment.reverseProxyImage);
    w.key("reverseProxyFirstPort").value(static_cast<int>(c.deployment.reverseProxyFirstPort));
    w.key("reverseProxyAdminPort").value(static_cast<int>(c.deployment.reverseProxyAdminPort));
    w.key("startupTimeoutMs").value(static_cast<uint64_t>(c.deployment.startupTimeoutMs));
    w.key("readinessPollIntervalMs").value(static_cast<uint64_t>(c.deployment.readinessPollIntervalMs));
    w.key("networkPrefix").value(c.deployment.networkPrefix);
    w.endObject();

    w.key("capture").beginObject();
    w.key("packetCapture").value(c.capture.packetCapture);
    w.key("packetCaptureFile").value(c.capture.packetCaptureFile);
    w.key("writeContainerLogs").value(c.capture.writeContainerLogs);
    w.key("logDirectory").value(c.capture.logDirectory);
    w.key("compressLogs").value(c.capture.compressLogs);
    w.endObject();

    w.key("callback").beginObject();
    w.key("advertiseHost").value(c.callback.advertiseHost);
    w.key("bindAddress").value(c.callback.bindAddress);
    w.endObject();

    w.key("logging").beginObject();
    w.key("level").value(logLevelToString(c.logging.level));
    w.key("json").value(c.logging.json);
    w.key("file").value(c.logging.file);
    w.endObject();

    w.key("proxy").beginObject();
    w.key("upstreams").value(c.proxy.upstreams);
    w.key("adminPort").value(static_cast<int>(c.proxy.adminPort));
    w.key("bindAddress").value(c.proxy.bindAddress);
    w.key("upstreamTimeoutMs").value(static_cast<uint64_t>(c.proxy.upstreamTimeoutMs));
    w.endObject();

    w.endObject();
    return w.str();
}

void ConfigManager::setLogCallback(ConfigLogCallback callback) {
    std::lock_guard<std::mutex> lock(logMutex_);
    logCallback_ = std::move(callback);
}

// =============================================================================
// Private Implementation
// =============================================================================

Result<void, ConfigError> ConfigManager::parseJson(const std::string& content) {
    using R = Result<void, ConfigError>;

    auto parsed = core::parseJson(content);
    if (parsed.isError()) {
        return R::error(ConfigError(ConfigError::Code::ParseError, parsed.error().toString()));
    }
    const JsonValue& root = parsed.value();
    if (!root.isObject()) {
        return R::error(ConfigError(ConfigError::Code::ParseError,
                                    "Configuration root must be an object"));
    }

    // Parse into a copy so that a failed load leaves the current config intact.
    HarnessConfig next = getConfig();
    std::vector<R> steps;

    if (root.contains("deployment")) {
        const JsonValue& d = root["deployment"];
        if (!d.isObject()) return typeError("deployment", "an object");
        DeploymentConfig& c = next.deployment;
        steps.push_back(readString(d, "chatServerImage", "deployment", c.chatServerImage));
        steps.push_back(readStringList(d, "chatServerNames", "deployment", c.chatServerNames));
        steps.push_back(readUnsigned(d, "chatServerPort", "deployment", c.chatServerPort));
        steps.push_back(readString(d, "chatServerReadyPath", "deployment", c.chatServerReadyPath));
        steps.push_back(readString(d, "datastoreImage", "deployment", c.datastoreImage));
        steps.push_back(readString(d, "syncProxyImage", "deployment", c.syncProxyImage));
        steps.push_back(readString(d, "syncProxySecret", "deployment", c.syncProxySecret));
        steps.push_back(readString(d, "reverseProxyImage", "deployment", c.reverseProxyImage));
        steps.push_back(readUnsigned(d, "reverseProxyFirstPort", "deployment", c.reverseProxyFirstPort));
        steps.push_back(readUnsigned(d, "reverseProxyAdminPort", "deployment", c.reverseProxyAdminPort));
        steps.push_back(readUnsigned(d, "startupTimeoutMs", "deployment", c.startupTimeoutMs));
        steps.push_back(readUnsigned(d, "readinessPollIntervalMs", "deployment", c.readinessPollIntervalMs));
        steps.push_back(readString(d, "networkPrefix", "deployment", c.networkPrefix));
    }

    if (root.contains("capture")) {
        const JsonValue& s = root["capture"];
        if (!s.isObject()) return typeError("capture", "an object");
        CaptureConfig& c = next.capture;
        steps.push_back(readBool(s, "packetCapture", "capture", c.packetCapture));
        steps.push_back(readString(s, "packetCaptureFile", "capture", c.packetCaptureFile));
        steps.push_back(readBool(s, "writeContainerLogs", "capture", c.writeContainerLogs));
        steps.push_back(readString(s, "logDirectory", "capture", c.logDirectory));
        steps.push_back(readBool(s, "compressLogs", "capture", c.compressLogs));
    }

    if (root.contains("callback")) {
        const JsonValue& s = root["callback"];
        if (!s.isObject()) return typeError("callback", "an object");
        steps.push_back(readString(s, "advertiseHost", "callback", next.callback.advertiseHost));
        steps.push_back(readString(s, "bindAddress", "callback", next.callback.bindAddress));
    }

    if (root.contains("logging")) {
        const JsonValue& s = root["logging"];
        if (!s.isObject()) return typeError("logging", "an object");
        std::string levelText;
        steps.push_back(readString(s, "level", "logging", levelText));
        if (!levelText.empty()) {
            auto level = parseLogLevel(levelText);
            if (!level) {
                return R::error(ConfigError(ConfigError::Code::ValidationError,
                    "logging.level must be one of debug, info, warning, error",
                    "logging.level"));
            }
            next.logging.level = *level;
        }
        steps.push_back(readBool(s, "json", "logging", next.logging.json));
        steps.push_back(readString(s, "file", "logging", next.logging.file));
    }

    if (root.contains("proxy")) {
        const JsonValue& s = root["proxy"];
        if (!s.isObject()) return typeError("proxy", "an object");
        steps.push_back(readString(s, "upstreams", "proxy", next.proxy.upstreams));
        steps.push_back(readUnsigned(s, "adminPort", "proxy", next.proxy.adminPort));
        steps.push_back(readString(s, "bindAddress", "proxy", next.proxy.bindAddress));
        steps.push_back(readUnsigned(s, "upstreamTimeoutMs", "proxy", next.proxy.upstreamTimeoutMs));
    }

    for (const auto& step : steps) {
        if (step.isError()) {
            return step;
        }
    }

    std::unique_lock<std::shared_mutex> lock(configMutex_);
    config_ = std::move(next);
    return R::success();
}

Result<std::string, ConfigError> ConfigManager::readFile(const std::string& filePath) const {
    std::ifstream file(filePath, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return Result<std::string, ConfigError>::error(
            ConfigError(ConfigError::Code::FileNotFound,
                        "Configuration file not found: " + filePath));
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return Result<std::string, ConfigError>::error(
            ConfigError(ConfigError::Code::IOError,
                        "Failed to read configuration file: " + filePath));
    }
    return Result<std::string, ConfigError>::success(ss.str());
}

void ConfigManager::log(const std::string& message) const {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logCallback_) {
        logCallback_(message);
    }
}

void ConfigManager::logEffectiveConfig() const {
    HarnessConfig c = getConfig();
    log("Effective configuration:");
    log("  deployment.chatServerImage: " + c.deployment.chatServerImage);
    log("  deployment.reverseProxyImage: " + c.deployment.reverseProxyImage);
    log("  deployment.syncProxyImage: " + c.deployment.syncProxyImage);
    log("  deployment.startupTimeoutMs: " + std::to_string(c.deployment.startupTimeoutMs));
    log("  capture.packetCapture: " + std::string(c.capture.packetCapture ? "true" : "false"));
    log("  capture.writeContainerLogs: " + std::string(c.capture.writeContainerLogs ? "true" : "false"));
    log("  callback.advertiseHost: " + c.callback.advertiseHost);
    log("  logging.level: " + logLevelToString(c.logging.level));
    log("  proxy.upstreams: " + c.proxy.upstreams);
}

std::optional<std::string> ConfigManager::getEnvVar(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

std::shared_ptr<StructuredLogger> createLogger(const LoggingConfig& config) {
    auto logger = std::make_shared<StructuredLogger>();
    logger->setLevel(config.level);
    logger->setJsonFormat(config.json);
    logger->addSink(std::make_shared<pal::linux::ConsoleLogSink>());

    if (!config.file.empty()) {
        auto fileSink = std::make_shared<pal::linux::FileLogSink>(config.file);
        if (fileSink->isOpen()) {
            logger->addSink(fileSink);
        } else {
            logger->warning("cannot open log file " + config.file, "Config");
        }
    }
    return logger;
}

} // namespace core
} // namespace faultline
