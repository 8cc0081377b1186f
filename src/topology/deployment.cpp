// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Network Topology Builder and Lifecycle Manager

#include "faultline/topology/deployment.hpp"

#include "faultline/topology/log_capture.hpp"

#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

namespace faultline {
namespace topology {

namespace {
const char* const CATEGORY = "Deployment";
}

// =============================================================================
// Deployment
// =============================================================================

Deployment::Deployment(std::shared_ptr<IContainerRuntime> runtime,
                       core::CaptureConfig capture,
                       std::shared_ptr<core::StructuredLogger> logger)
    : runtime_(std::move(runtime))
    , capture_(std::move(capture))
    , logger_(logger ? std::move(logger) : core::defaultLogger()) {}

Deployment::~Deployment() {
    teardown(false);
}

core::Result<std::string, core::Error> Deployment::chatServerUrl(const std::string& name) const {
    auto it = chatServerUrls_.find(name);
    if (it == chatServerUrls_.end()) {
        return core::Result<std::string, core::Error>::error(
            core::Error(core::ErrorCode::NotFound, "no chat server named " + name, CATEGORY));
    }
    return core::Result<std::string, core::Error>::success(it->second);
}

core::Result<std::string, core::Error> Deployment::proxiedChatServerUrl(const std::string& name) const {
    auto it = proxiedUrls_.find(name);
    if (it == proxiedUrls_.end()) {
        return core::Result<std::string, core::Error>::error(
            core::Error(core::ErrorCode::NotFound, "no proxied chat server named " + name, CATEGORY));
    }
    return core::Result<std::string, core::Error>::success(it->second);
}

std::vector<std::string> Deployment::chatServerNames() const {
    return chatServerNames_;
}

core::Result<harness::ProxyController*, core::Error> Deployment::controller() {
    if (!controller_) {
        return core::Result<harness::ProxyController*, core::Error>::error(
            core::Error(core::ErrorCode::NotInitialized, "deployment has no reverse proxy controller", CATEGORY));
    }
    return core::Result<harness::ProxyController*, core::Error>::success(controller_.get());
}

void Deployment::teardown(bool writeLogs) {
    if (tornDown_.exchange(true)) {
        return;
    }

    logger_->info("tearing down network " + networkName_, CATEGORY);

    for (auto it = members_.rbegin(); it != members_.rend(); ++it) {
        if (it->isReverseProxy && controller_) {
            auto terminated = controller_->terminate();
            if (terminated.isError()) {
                logger_->warning("controller terminate: " + terminated.error().toString(), CATEGORY);
            }
        }

        if (writeLogs) {
            auto output = runtime_->logs(it->containerId);
            if (output.isError()) {
                core::LogContext context;
                context.container = it->name;
                context.errorCode = static_cast<int>(core::ErrorCode::LogCaptureFailed);
                logger_->errorWithContext("failed to read logs: " + output.error().toString(), context, CATEGORY);
            } else {
                auto written = writeContainerLog(capture_.logDirectory, it->name,
                                                 output.value(), capture_.compressLogs);
                if (written.isError()) {
                    core::LogContext context;
                    context.container = it->name;
                    context.errorCode = static_cast<int>(written.error().code);
                    logger_->errorWithContext("failed to write logs: " + written.error().toString(), context, CATEGORY);
                } else {
                    logger_->debug("wrote " + written.value(), CATEGORY);
                }
            }
        }

        auto stopped = runtime_->stopContainer(it->containerId);
        if (stopped.isError()) {
            core::LogContext context;
            context.container = it->name;
            context.errorCode = static_cast<int>(stopped.error().code);
            logger_->errorWithContext("failed to stop: " + stopped.error().toString(), context, CATEGORY);
        } else {
            logger_->info("stopped " + it->name, CATEGORY);
        }
    }

    if (!networkId_.empty()) {
        auto removed = runtime_->removeNetwork(networkId_);
        if (removed.isError()) {
            logger_->error("failed to remove network " + networkName_ + ": " + removed.error().toString(), CATEGORY);
        }
    }

    if (packetCapture_) {
        auto stopped = packetCapture_->stop();
        if (stopped.isError()) {
            logger_->error("packet capture: " + stopped.error().toString(), CATEGORY);
        }
    }
}

// =============================================================================
// DeploymentBuilder
// =============================================================================

DeploymentBuilder::DeploymentBuilder(core::HarnessConfig config,
                                     std::shared_ptr<IContainerRuntime> runtime,
                                     std::shared_ptr<pal::IProcessPAL> process,
                                     std::shared_ptr<http::IHttpClient> httpClient,
                                     std::shared_ptr<core::StructuredLogger> logger)
    : config_(std::move(config))
    , runtime_(std::move(runtime))
    , process_(std::move(process))
    , httpClient_(std::move(httpClient))
    , logger_(logger ? std::move(logger) : core::defaultLogger()) {}

std::vector<core::UpstreamRoute> DeploymentBuilder::reverseProxyRoutes(const core::DeploymentConfig& config) {
    std::vector<core::UpstreamRoute> routes;
    for (size_t i = 0; i < config.chatServerNames.size(); ++i) {
        core::UpstreamRoute route;
        route.upstreamUrl = "http://" + config.chatServerNames[i] + ":" + std::to_string(config.chatServerPort);
        route.listenPort = static_cast<uint16_t>(config.reverseProxyFirstPort + i);
        routes.push_back(route);
    }
    return routes;
}

std::string DeploymentBuilder::makeNetworkName() const {
    std::random_device rd;
    std::ostringstream name;
    name << config_.deployment.networkPrefix << "-" << std::hex << std::setw(8) << std::setfill('0') << rd();
    return name.str();
}

core::Result<std::string, core::Error> DeploymentBuilder::hostUrl(const std::string& containerId, uint16_t port) {
    auto hostPort = runtime_->mappedPort(containerId, port);
    if (hostPort.isError()) {
        return core::Result<std::string, core::Error>::error(hostPort.error());
    }
    return core::Result<std::string, core::Error>::success(hostPort.value().toUrl());
}

core::Result<std::string, core::Error> DeploymentBuilder::startMember(Deployment& deployment,
                                                                      const std::string& name,
                                                                      ContainerSpec spec,
                                                                      const WaitStrategy& readiness,
                                                                      bool isReverseProxy) {
    using Res = core::Result<std::string, core::Error>;

    spec.name = deployment.networkName_ + "-" + name;
    spec.network = deployment.networkId_;

    auto started = runtime_->startContainer(spec);
    if (started.isError()) {
        return Res::error(core::Error(started.error().code,
            "failed to start " + name + ": " + started.error().message, started.error().context));
    }

    Deployment::Member member;
    member.name = name;
    member.containerId = started.value();
    member.isReverseProxy = isReverseProxy;
    deployment.members_.push_back(member);

    auto ready = waitUntilReady(readiness, *runtime_, *httpClient_, member.containerId, name,
        std::chrono::milliseconds(config_.deployment.startupTimeoutMs),
        std::chrono::milliseconds(config_.deployment.readinessPollIntervalMs),
        *logger_);
    if (ready.isError()) {
        return Res::error(ready.error());
    }
    return Res::success(member.containerId);
}

core::Result<std::shared_ptr<Deployment>, core::Error> DeploymentBuilder::deploy() {
    using Res = core::Result<std::shared_ptr<Deployment>, core::Error>;

    const core::DeploymentConfig& dc = config_.deployment;
    if (dc.chatServerNames.empty()) {
        return Res::error(core::Error(core::ErrorCode::InvalidArgument, "no chat servers configured", CATEGORY));
    }

    auto deployment = std::make_shared<Deployment>(runtime_, config_.capture, logger_);
    deployment->networkName_ = makeNetworkName();

    auto fail = [&](const core::Error& error) {
        core::LogContext context;
        context.errorCode = static_cast<int>(error.code);
        logger_->errorWithContext("provisioning failed: " + error.toString(), context, CATEGORY);
        deployment->teardown(config_.capture.writeContainerLogs);
        return Res::error(error);
    };

    // Network
    auto network = runtime_->createNetwork(deployment->networkName_);
    if (network.isError()) {
        return fail(network.error());
    }
    deployment->networkId_ = network.value();

    // Chat servers
    for (const auto& name : dc.chatServerNames) {
        ContainerSpec spec;
        spec.image = dc.chatServerImage;
        spec.aliases = {name};
        spec.env["SERVER_NAME"] = name;
        spec.exposedPorts = {dc.chatServerPort};

        auto id = startMember(*deployment, name, spec,
                              WaitStrategy::forHttp(dc.chatServerPort, dc.chatServerReadyPath), false);
        if (id.isError()) {
            return fail(id.error());
        }
        auto url = hostUrl(id.value(), dc.chatServerPort);
        if (url.isError()) {
            return fail(url.error());
        }
        deployment->chatServerNames_.push_back(name);
        deployment->chatServerUrls_[name] = url.value();
    }

    // Datastore
    {
        ContainerSpec spec;
        spec.image = dc.datastoreImage;
        spec.aliases = {DATASTORE_ALIAS};
        spec.env["POSTGRES_USER"] = "postgres";
        spec.env["POSTGRES_PASSWORD"] = "postgres";
        spec.env["POSTGRES_DB"] = "syncv3";
        spec.exposedPorts = {DATASTORE_PORT};

        auto id = startMember(*deployment, DATASTORE_ALIAS, spec, WaitStrategy::forExec({"pg_isready"}), false);
        if (id.isError()) {
            return fail(id.error());
        }
        deployment->datastoreAddress_ = std::string(DATASTORE_ALIAS) + ":" + std::to_string(DATASTORE_PORT);
    }

    // Reverse proxy
    {
        auto routes = reverseProxyRoutes(dc);

        ContainerSpec spec;
        spec.image = dc.reverseProxyImage;
        spec.aliases = {REVERSE_PROXY_ALIAS};
        spec.env["REVERSE_PROXY_HOSTS"] = core::formatUpstreamRoutes(routes);
        spec.env["REVERSE_PROXY_CONTROLLER_URL"] =
            std::string("http://") + REVERSE_PROXY_ALIAS + ":" + std::to_string(dc.reverseProxyAdminPort);
        spec.env["REVERSE_PROXY_ADMIN_PORT"] = std::to_string(dc.reverseProxyAdminPort);
        for (const auto& route : routes) {
            spec.exposedPorts.push_back(route.listenPort);
        }
        spec.exposedPorts.push_back(dc.reverseProxyAdminPort);

        auto id = startMember(*deployment, REVERSE_PROXY_ALIAS, spec,
                              WaitStrategy::forHttp(dc.reverseProxyAdminPort, REVERSE_PROXY_HEALTH_PATH), true);
        if (id.isError()) {
            return fail(id.error());
        }

        for (size_t i = 0; i < routes.size(); ++i) {
            auto url = hostUrl(id.value(), routes[i].listenPort);
            if (url.isError()) {
                return fail(url.error());
            }
            deployment->proxiedUrls_[dc.chatServerNames[i]] = url.value();
        }

        auto admin = hostUrl(id.value(), dc.reverseProxyAdminPort);
        if (admin.isError()) {
            return fail(admin.error());
        }
        deployment->adminUrl_ = admin.value();
        deployment->controller_ = std::make_unique<harness::ProxyController>(
            deployment->adminUrl_, httpClient_, logger_);
    }

    // Sync-aggregation proxy
    {
        ContainerSpec spec;
        spec.image = dc.syncProxyImage;
        spec.aliases = {SYNC_PROXY_ALIAS};
        spec.env["SYNCV3_SECRET"] = dc.syncProxySecret;
        spec.env["SYNCV3_BINDADDR"] = ":" + std::to_string(SYNC_PROXY_PORT);
        spec.env["SYNCV3_SERVER"] = "http://" + dc.chatServerNames.front() + ":" + std::to_string(dc.chatServerPort);
        spec.env["SYNCV3_DB"] = "user=postgres dbname=syncv3 sslmode=disable host=postgres password=postgres";
        spec.exposedPorts = {SYNC_PROXY_PORT};

        auto id = startMember(*deployment, SYNC_PROXY_ALIAS, spec, WaitStrategy::forLog("listening on"), false);
        if (id.isError()) {
            return fail(id.error());
        }
        auto url = hostUrl(id.value(), SYNC_PROXY_PORT);
        if (url.isError()) {
            return fail(url.error());
        }
        deployment->syncProxyUrl_ = url.value();
    }

    // Packet capture of host-side traffic to the chat servers, the front
    // listeners and the sync proxy
    if (config_.capture.packetCapture) {
        std::vector<uint16_t> ports;
        for (const auto& member : deployment->members_) {
            std::vector<uint16_t> containerPorts;
            if (deployment->chatServerUrls_.count(member.name) > 0) {
                containerPorts.push_back(dc.chatServerPort);
            } else if (member.isReverseProxy) {
                for (const auto& route : reverseProxyRoutes(dc)) {
                    containerPorts.push_back(route.listenPort);
                }
            } else if (member.name == SYNC_PROXY_ALIAS) {
                containerPorts.push_back(SYNC_PROXY_PORT);
            }
            for (uint16_t port : containerPorts) {
                auto hostPort = runtime_->mappedPort(member.containerId, port);
                if (hostPort.isError()) {
                    return fail(hostPort.error());
                }
                ports.push_back(hostPort.value().port);
            }
        }

        deployment->packetCapture_ = std::make_unique<PacketCapture>(process_, logger_);
        auto started = deployment->packetCapture_->start(ports, config_.capture.packetCaptureFile);
        if (started.isError()) {
            deployment->packetCapture_.reset();
            return fail(started.error());
        }
    }

    logger_->info("deployment ready on network " + deployment->networkName_, CATEGORY);
    for (const auto& name : deployment->chatServerNames_) {
        logger_->info("  " + name + ": " + deployment->chatServerUrls_[name] +
                      " (proxied " + deployment->proxiedUrls_[name] + ")", CATEGORY);
    }
    logger_->info("  sync proxy: " + deployment->syncProxyUrl_, CATEGORY);
    logger_->info("  reverse proxy admin: " + deployment->adminUrl_, CATEGORY);
    logger_->info("  datastore: " + deployment->datastoreAddress_, CATEGORY);

    return Res::success(deployment);
}

} // namespace topology
} // namespace faultline
