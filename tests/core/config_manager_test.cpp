// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Tests for Configuration Manager
//
// Tests cover:
// - Defaults when no configuration file is given
// - JSON loading, type errors and partial sections
// - FAULTLINE_* and REVERSE_PROXY_* environment overrides
// - Validation of deployment, capture and proxy settings
// - Upstream route parsing

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <map>
#include <string>
#include <vector>

#include <unistd.h>

#include "faultline/core/config_manager.hpp"

namespace faultline {
namespace core {
namespace test {

// =============================================================================
// Test Fixtures
// =============================================================================

/**
 * @brief ConfigManager reading its environment from a map.
 */
class FakeEnvConfigManager : public ConfigManager {
public:
    std::map<std::string, std::string> env;

protected:
    std::optional<std::string> getEnvVar(const std::string& name) const override {
        auto it = env.find(name);
        if (it == env.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        manager_.setLogCallback([this](const std::string& msg) { logs_.push_back(msg); });
        manager_.loadDefaults();
    }

    void TearDown() override {
        for (const auto& path : files_) {
            std::remove(path.c_str());
        }
    }

    std::string writeTempFile(const std::string& content) {
        std::string path = "/tmp/faultline_config_test_" + std::to_string(getpid()) +
                           "_" + std::to_string(files_.size()) + ".json";
        std::ofstream out(path);
        out << content;
        files_.push_back(path);
        return path;
    }

    bool logged(const std::string& fragment) const {
        for (const auto& line : logs_) {
            if (line.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    FakeEnvConfigManager manager_;
    std::vector<std::string> logs_;
    std::vector<std::string> files_;
};

// =============================================================================
// Defaults
// =============================================================================

TEST_F(ConfigManagerTest, DefaultsAreValid) {
    EXPECT_TRUE(manager_.validate().isSuccess());

    HarnessConfig config = manager_.getConfig();
    EXPECT_EQ(config.deployment.chatServerNames, (std::vector<std::string>{"hs1", "hs2"}));
    EXPECT_EQ(config.deployment.reverseProxyFirstPort, 3000);
    EXPECT_EQ(config.deployment.startupTimeoutMs, 60000u);
    EXPECT_EQ(config.capture.packetCaptureFile, "test.pcap");
    EXPECT_TRUE(config.capture.writeContainerLogs);
    EXPECT_EQ(config.callback.advertiseHost, "host.docker.internal");
    EXPECT_EQ(config.logging.level, LogLevelConfig::Info);
}

// =============================================================================
// JSON loading
// =============================================================================

TEST_F(ConfigManagerTest, LoadsAllSectionsFromFile) {
    std::string path = writeTempFile(R"({
        "deployment": {
            "chatServerNames": ["hs1", "hs2", "hs3"],
            "reverseProxyFirstPort": 4000,
            "startupTimeoutMs": 30000
        },
        "capture": { "packetCapture": true, "compressLogs": true },
        "callback": { "advertiseHost": "10.0.0.5" },
        "logging": { "level": "debug", "json": true },
        "proxy": { "upstreams": "http://hs1:8008,3000", "adminPort": 9100 }
    })");

    auto result = manager_.loadFromFile(path);
    ASSERT_TRUE(result.isSuccess()) << result.error().message;

    HarnessConfig config = manager_.getConfig();
    EXPECT_EQ(config.deployment.chatServerNames.size(), 3u);
    EXPECT_EQ(config.deployment.reverseProxyFirstPort, 4000);
    EXPECT_EQ(config.deployment.startupTimeoutMs, 30000u);
    EXPECT_EQ(config.deployment.chatServerPort, 8008);
    EXPECT_TRUE(config.capture.packetCapture);
    EXPECT_TRUE(config.capture.compressLogs);
    EXPECT_EQ(config.callback.advertiseHost, "10.0.0.5");
    EXPECT_EQ(config.logging.level, LogLevelConfig::Debug);
    EXPECT_TRUE(config.logging.json);
    EXPECT_EQ(config.proxy.adminPort, 9100);

    EXPECT_TRUE(logged("Effective configuration"));
}

TEST_F(ConfigManagerTest, MissingFileIsReported) {
    auto result = manager_.loadFromFile("/nonexistent/faultline.json");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConfigError::Code::FileNotFound);
}

TEST_F(ConfigManagerTest, MalformedJsonIsParseError) {
    auto result = manager_.loadFromJsonString("{ \"deployment\": ");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConfigError::Code::ParseError);
}

// Test: a wrong type names the offending field and leaves the config unchanged
TEST_F(ConfigManagerTest, TypeErrorNamesFieldAndKeepsPreviousConfig) {
    auto result = manager_.loadFromJsonString(R"({
        "deployment": { "reverseProxyFirstPort": 5000, "chatServerPort": "8008" }
    })");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "deployment.chatServerPort");
    EXPECT_EQ(manager_.getConfig().deployment.reverseProxyFirstPort, 3000);
}

TEST_F(ConfigManagerTest, OutOfRangePortIsTypeError) {
    auto result = manager_.loadFromJsonString(R"({ "proxy": { "adminPort": 70000 } })");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "proxy.adminPort");
}

TEST_F(ConfigManagerTest, UnknownLogLevelIsRejected) {
    auto result = manager_.loadFromJsonString(R"({ "logging": { "level": "verbose" } })");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConfigError::Code::ValidationError);
    EXPECT_EQ(result.error().field, "logging.level");
}

TEST_F(ConfigManagerTest, SectionMustBeObject) {
    auto result = manager_.loadFromJsonString(R"({ "capture": [] })");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "capture");
}

// =============================================================================
// Environment overrides
// =============================================================================

TEST_F(ConfigManagerTest, EnvironmentOverridesFileValues) {
    ASSERT_TRUE(manager_.loadFromJsonString(R"({ "capture": { "logDirectory": "/var/log" } })").isSuccess());

    manager_.env["FAULTLINE_LOG_DIR"] = "/tmp/faultline";
    manager_.env["FAULTLINE_PACKET_CAPTURE"] = "1";
    manager_.env["FAULTLINE_WRITE_CONTAINER_LOGS"] = "false";
    manager_.env["FAULTLINE_LOG_LEVEL"] = "warn";
    manager_.env["FAULTLINE_STARTUP_TIMEOUT_MS"] = "90000";
    manager_.env["FAULTLINE_CALLBACK_HOST"] = "172.17.0.1";
    manager_.applyEnvironmentOverrides();

    HarnessConfig config = manager_.getConfig();
    EXPECT_EQ(config.capture.logDirectory, "/tmp/faultline");
    EXPECT_TRUE(config.capture.packetCapture);
    EXPECT_FALSE(config.capture.writeContainerLogs);
    EXPECT_EQ(config.logging.level, LogLevelConfig::Warning);
    EXPECT_EQ(config.deployment.startupTimeoutMs, 90000u);
    EXPECT_EQ(config.callback.advertiseHost, "172.17.0.1");
    EXPECT_TRUE(logged("Environment override: FAULTLINE_LOG_DIR=/tmp/faultline"));
}

TEST_F(ConfigManagerTest, ReverseProxyVariablesFeedProxySection) {
    manager_.env["REVERSE_PROXY_HOSTS"] = "http://hs1:8008,3000;http://hs2:8008,3001";
    manager_.env["REVERSE_PROXY_CONTROLLER_URL"] = "http://reverseproxy:9000";
    manager_.applyEnvironmentOverrides();

    HarnessConfig config = manager_.getConfig();
    EXPECT_EQ(config.proxy.upstreams, "http://hs1:8008,3000;http://hs2:8008,3001");
    EXPECT_EQ(config.proxy.controllerUrl, "http://reverseproxy:9000");
    EXPECT_TRUE(manager_.validate().isSuccess());
}

TEST_F(ConfigManagerTest, AdminPortOverride) {
    manager_.env["REVERSE_PROXY_ADMIN_PORT"] = "9100";
    manager_.applyEnvironmentOverrides();

    EXPECT_EQ(manager_.getConfig().proxy.adminPort, 9100);
    EXPECT_TRUE(logged("Environment override: REVERSE_PROXY_ADMIN_PORT=9100"));
}

TEST_F(ConfigManagerTest, InvalidAdminPortOverrideKeepsDefault) {
    manager_.env["REVERSE_PROXY_ADMIN_PORT"] = "0";
    manager_.applyEnvironmentOverrides();
    EXPECT_EQ(manager_.getConfig().proxy.adminPort, 9000);

    manager_.env["REVERSE_PROXY_ADMIN_PORT"] = "70000";
    manager_.applyEnvironmentOverrides();
    EXPECT_EQ(manager_.getConfig().proxy.adminPort, 9000);
    EXPECT_TRUE(logged("Warning: Invalid REVERSE_PROXY_ADMIN_PORT"));
}

TEST_F(ConfigManagerTest, InvalidNumericOverrideIsIgnoredWithWarning) {
    manager_.env["FAULTLINE_STARTUP_TIMEOUT_MS"] = "soon";
    manager_.env["FAULTLINE_LOG_LEVEL"] = "chatty";
    manager_.applyEnvironmentOverrides();

    HarnessConfig config = manager_.getConfig();
    EXPECT_EQ(config.deployment.startupTimeoutMs, 60000u);
    EXPECT_EQ(config.logging.level, LogLevelConfig::Info);
    EXPECT_TRUE(logged("Warning: Invalid FAULTLINE_STARTUP_TIMEOUT_MS"));
    EXPECT_TRUE(logged("Warning: Invalid FAULTLINE_LOG_LEVEL"));
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(ConfigManagerTest, RejectsEmptyServerList) {
    ASSERT_TRUE(manager_.loadFromJsonString(R"({ "deployment": { "chatServerNames": [] } })").isSuccess());

    auto result = manager_.validate();
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "deployment.chatServerNames");
}

TEST_F(ConfigManagerTest, RejectsAdminPortInsideFrontRange) {
    ASSERT_TRUE(manager_.loadFromJsonString(
        R"({ "deployment": { "reverseProxyFirstPort": 3000, "reverseProxyAdminPort": 3001 } })").isSuccess());

    auto result = manager_.validate();
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "deployment.reverseProxyAdminPort");
}

TEST_F(ConfigManagerTest, RejectsPollIntervalLongerThanTimeout) {
    ASSERT_TRUE(manager_.loadFromJsonString(
        R"({ "deployment": { "startupTimeoutMs": 500, "readinessPollIntervalMs": 1000 } })").isSuccess());

    auto result = manager_.validate();
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "deployment.readinessPollIntervalMs");
}

TEST_F(ConfigManagerTest, PacketCaptureRequiresFile) {
    ASSERT_TRUE(manager_.loadFromJsonString(
        R"({ "capture": { "packetCapture": true, "packetCaptureFile": "" } })").isSuccess());

    auto result = manager_.validate();
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "capture.packetCaptureFile");
}

TEST_F(ConfigManagerTest, RejectsAdminPortCollidingWithUpstream) {
    ASSERT_TRUE(manager_.loadFromJsonString(
        R"({ "proxy": { "upstreams": "http://hs1:8008,9000", "adminPort": 9000 } })").isSuccess());

    auto result = manager_.validate();
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "proxy.adminPort");
}

TEST_F(ConfigManagerTest, DumpConfigIsJson) {
    std::string dump = manager_.dumpConfig();

    EXPECT_NE(dump.find("\"chatServerNames\":[\"hs1\",\"hs2\"]"), std::string::npos);
    EXPECT_NE(dump.find("\"level\":\"info\""), std::string::npos);
}

// =============================================================================
// Upstream routes
// =============================================================================

TEST(UpstreamRoutesTest, ParsesEntriesAndStripsTrailingSlash) {
    auto routes = parseUpstreamRoutes(" http://hs1:8008/,3000 ; http://hs2:8008,3001;");

    ASSERT_TRUE(routes.isSuccess());
    ASSERT_EQ(routes.value().size(), 2u);
    EXPECT_EQ(routes.value()[0].upstreamUrl, "http://hs1:8008");
    EXPECT_EQ(routes.value()[0].listenPort, 3000);
    EXPECT_EQ(routes.value()[1].upstreamUrl, "http://hs2:8008");
    EXPECT_EQ(routes.value()[1].listenPort, 3001);
}

TEST(UpstreamRoutesTest, EmptyStringHasNoRoutes) {
    auto routes = parseUpstreamRoutes("");

    ASSERT_TRUE(routes.isSuccess());
    EXPECT_TRUE(routes.value().empty());
}

TEST(UpstreamRoutesTest, RejectsBadEntries) {
    EXPECT_TRUE(parseUpstreamRoutes("http://hs1:8008").isError());
    EXPECT_TRUE(parseUpstreamRoutes("hs1:8008,3000").isError());
    EXPECT_TRUE(parseUpstreamRoutes("http://hs1:8008,0").isError());
    EXPECT_TRUE(parseUpstreamRoutes("http://hs1:8008,http").isError());
    EXPECT_TRUE(parseUpstreamRoutes("http://hs1:8008,3000;http://hs2:8008,3000").isError());
}

TEST(UpstreamRoutesTest, FormatMatchesParseInput) {
    std::vector<UpstreamRoute> routes = {
        {"http://hs1:8008", 3000},
        {"http://hs2:8008", 3001},
    };

    EXPECT_EQ(formatUpstreamRoutes(routes), "http://hs1:8008,3000;http://hs2:8008,3001");
}

} // namespace test
} // namespace core
} // namespace faultline
