// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Container readiness strategies

#include "faultline/topology/readiness.hpp"

#include <algorithm>
#include <thread>

namespace faultline {
namespace topology {

namespace {
const char* const CATEGORY = "Deployment";
}

WaitStrategy WaitStrategy::forLog(std::string substring) {
    WaitStrategy strategy;
    strategy.kind_ = Kind::Log;
    strategy.text_ = std::move(substring);
    return strategy;
}

WaitStrategy WaitStrategy::forExec(std::vector<std::string> argv) {
    WaitStrategy strategy;
    strategy.kind_ = Kind::Exec;
    strategy.argv_ = std::move(argv);
    return strategy;
}

WaitStrategy WaitStrategy::forHttp(uint16_t containerPort, std::string path) {
    WaitStrategy strategy;
    strategy.kind_ = Kind::Http;
    strategy.port_ = containerPort;
    strategy.text_ = path.empty() ? "/" : std::move(path);
    return strategy;
}

std::string WaitStrategy::describe() const {
    switch (kind_) {
        case Kind::None:
            return "started";
        case Kind::Log:
            return "log '" + text_ + "'";
        case Kind::Exec: {
            std::string cmd;
            for (const auto& arg : argv_) {
                cmd += (cmd.empty() ? "" : " ") + arg;
            }
            return "exec '" + cmd + "'";
        }
        case Kind::Http:
            return "GET :" + std::to_string(port_) + text_;
    }
    return "unknown";
}

core::Result<bool, core::Error> WaitStrategy::probe(IContainerRuntime& runtime,
                                                    http::IHttpClient& client,
                                                    const std::string& containerId,
                                                    std::chrono::milliseconds probeTimeout) const {
    using Res = core::Result<bool, core::Error>;

    switch (kind_) {
        case Kind::None:
            return Res::success(true);

        case Kind::Log: {
            auto output = runtime.logs(containerId);
            if (output.isError()) {
                return Res::error(output.error());
            }
            return Res::success(output.value().find(text_) != std::string::npos);
        }

        case Kind::Exec: {
            auto exitCode = runtime.exec(containerId, argv_);
            if (exitCode.isError()) {
                return Res::error(exitCode.error());
            }
            return Res::success(exitCode.value() == 0);
        }

        case Kind::Http: {
            auto hostPort = runtime.mappedPort(containerId, port_);
            if (hostPort.isError()) {
                return Res::error(hostPort.error());
            }
            http::HttpRequest request;
            request.method = "GET";
            request.target = text_;
            auto response = client.send(hostPort.value().toUrl() + text_, request, probeTimeout);
            if (response.isError()) {
                return Res::error(core::Error(core::ErrorCode::ConnectionFailed,
                                              response.error().toString(), describe()));
            }
            int status = response.value().status;
            return Res::success(status >= 200 && status < 300);
        }
    }
    return Res::error(core::Error(core::ErrorCode::InvalidState, "unknown wait strategy", CATEGORY));
}

core::Result<void, core::Error> waitUntilReady(const WaitStrategy& strategy,
                                               IContainerRuntime& runtime,
                                               http::IHttpClient& client,
                                               const std::string& containerId,
                                               const std::string& name,
                                               std::chrono::milliseconds timeout,
                                               std::chrono::milliseconds pollInterval,
                                               core::StructuredLogger& logger) {
    using Res = core::Result<void, core::Error>;
    using Clock = std::chrono::steady_clock;

    const auto deadline = Clock::now() + timeout;
    const auto probeTimeout = std::max(pollInterval, std::chrono::milliseconds(1000));
    std::string lastProblem = "not ready";
    int attempts = 0;

    while (true) {
        ++attempts;
        auto ready = strategy.probe(runtime, client, containerId, probeTimeout);
        if (ready.isSuccess() && ready.value()) {
            logger.info(name + " ready (" + strategy.describe() + ") after " +
                        std::to_string(attempts) + " probe(s)", CATEGORY);
            return Res::success();
        }
        if (ready.isError()) {
            lastProblem = ready.error().toString();
            logger.debug(name + " probe failed: " + lastProblem, CATEGORY);
        }

        auto now = Clock::now();
        if (now >= deadline) {
            break;
        }
        std::this_thread::sleep_for(std::min<Clock::duration>(pollInterval, deadline - now));
    }

    return Res::error(core::Error(core::ErrorCode::ReadinessTimeout,
        name + " not ready (" + strategy.describe() + ") within " +
        std::to_string(timeout.count()) + "ms: " + lastProblem, CATEGORY));
}

} // namespace topology
} // namespace faultline
