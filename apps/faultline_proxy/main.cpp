// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// faultline-proxy: the reverse proxy executable run inside the proxy container

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "faultline/core/config_manager.hpp"
#include "faultline/http/http_client.hpp"
#include "faultline/proxy/reverse_proxy.hpp"

namespace {

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config FILE     JSON configuration file\n"
              << "  -h, --help            Show this help\n"
              << "\nEnvironment:\n"
              << "  REVERSE_PROXY_HOSTS           upstream routes, e.g. http://hs1:8008,3000;http://hs2:8008,3001\n"
              << "  REVERSE_PROXY_CONTROLLER_URL  URL of the controlling test process (informational)\n"
              << "  REVERSE_PROXY_ADMIN_PORT      port of the admin API (default 9000)\n"
              << "  FAULTLINE_LOG_LEVEL           debug, info, warning or error\n"
              << "  FAULTLINE_LOG_JSON            emit JSON log lines\n"
              << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            configPath = argv[++i];
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    faultline::core::ConfigManager manager;
    manager.setLogCallback([](const std::string& msg) {
        std::cerr << "[Config] " << msg << std::endl;
    });

    if (!configPath.empty()) {
        auto loaded = manager.loadFromFile(configPath);
        if (loaded.isError()) {
            std::cerr << "Failed to load " << configPath << ": " << loaded.error().message << std::endl;
            return 1;
        }
    }
    manager.applyEnvironmentOverrides();

    auto valid = manager.validate();
    if (valid.isError()) {
        std::cerr << "Invalid configuration (" << valid.error().field << "): "
                  << valid.error().message << std::endl;
        return 1;
    }

    faultline::core::HarnessConfig config = manager.getConfig();
    auto logger = faultline::core::createLogger(config.logging);

    auto routes = faultline::core::parseUpstreamRoutes(config.proxy.upstreams);
    if (routes.isError() || routes.value().empty()) {
        logger->error("no upstream routes; set REVERSE_PROXY_HOSTS or proxy.upstreams", "ReverseProxy");
        return 1;
    }
    if (!config.proxy.controllerUrl.empty()) {
        logger->info("controller at " + config.proxy.controllerUrl, "ReverseProxy");
    }

    faultline::proxy::ReverseProxyOptions options;
    options.routes = routes.value();
    options.bindAddress = config.proxy.bindAddress;
    options.adminPort = config.proxy.adminPort;
    options.upstreamTimeout = std::chrono::milliseconds(config.proxy.upstreamTimeoutMs);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);

    faultline::proxy::ReverseProxy proxy(
        std::make_shared<faultline::http::CurlHttpClient>(), logger);

    auto started = proxy.start(options);
    if (started.isError()) {
        logger->error("failed to start: " + started.error().toString(), "ReverseProxy");
        return 1;
    }

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    logger->info("shutting down", "ReverseProxy");
    proxy.stop();
    logger->flush();
    return 0;
}
