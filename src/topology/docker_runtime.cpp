// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Container runtime backed by the docker command line

#include "faultline/topology/docker_runtime.hpp"

#include <cctype>

namespace faultline {
namespace topology {

namespace {

const char* const CATEGORY = "Docker";

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

std::string joinCommand(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& arg : args) {
        if (!out.empty()) {
            out += ' ';
        }
        out += arg;
    }
    return out;
}

/**
 * @brief Error for a docker invocation that exited non-zero.
 */
core::Error commandFailed(core::ErrorCode code, const std::string& what, const pal::ProcessResult& result) {
    std::string detail = trim(result.stderrText);
    if (detail.empty()) {
        detail = trim(result.stdoutText);
    }
    return core::Error(code, what + " (exit " + std::to_string(result.exitCode) + "): " + detail, CATEGORY);
}

} // namespace

DockerCliRuntime::DockerCliRuntime(std::shared_ptr<pal::IProcessPAL> process,
                                   std::shared_ptr<core::StructuredLogger> logger,
                                   std::chrono::milliseconds commandTimeout,
                                   std::string dockerBinary)
    : process_(std::move(process))
    , logger_(logger ? std::move(logger) : core::defaultLogger())
    , commandTimeout_(commandTimeout)
    , dockerBinary_(std::move(dockerBinary)) {}

core::Result<pal::ProcessResult, core::Error> DockerCliRuntime::docker(const std::vector<std::string>& args) {
    using Res = core::Result<pal::ProcessResult, core::Error>;

    pal::ProcessSpec spec;
    spec.executable = dockerBinary_;
    spec.args = args;
    spec.timeout = commandTimeout_;

    logger_->debug(dockerBinary_ + " " + joinCommand(args), CATEGORY);

    auto result = process_->run(spec);
    if (result.isError()) {
        const pal::ProcessError& err = result.error();
        core::ErrorCode code = err.code == pal::ProcessErrorCode::Timeout
            ? core::ErrorCode::Timeout
            : core::ErrorCode::ProcessSpawnFailed;
        return Res::error(core::Error(code, err.message, dockerBinary_ + " " + joinCommand(args)));
    }
    return Res::success(std::move(result.value()));
}

// =============================================================================
// Networks
// =============================================================================

core::Result<std::string, core::Error> DockerCliRuntime::createNetwork(const std::string& name) {
    using Res = core::Result<std::string, core::Error>;

    auto result = docker({"network", "create", name});
    if (result.isError()) {
        return Res::error(result.error());
    }
    if (result.value().exitCode != 0) {
        return Res::error(commandFailed(core::ErrorCode::NetworkCreateFailed,
                                        "network create " + name, result.value()));
    }

    std::string id = trim(result.value().stdoutText);
    if (id.empty()) {
        id = name;
    }
    logger_->info("created network " + name, CATEGORY);
    return Res::success(id);
}

core::Result<void, core::Error> DockerCliRuntime::removeNetwork(const std::string& networkId) {
    using Res = core::Result<void, core::Error>;

    auto result = docker({"network", "rm", networkId});
    if (result.isError()) {
        return Res::error(result.error());
    }
    if (result.value().exitCode != 0) {
        return Res::error(commandFailed(core::ErrorCode::TeardownFailed,
                                        "network rm " + networkId, result.value()));
    }
    return Res::success();
}

// =============================================================================
// Containers
// =============================================================================

std::vector<std::string> DockerCliRuntime::runArguments(const ContainerSpec& spec) {
    std::vector<std::string> args = {"run", "-d"};

    if (!spec.name.empty()) {
        args.push_back("--name");
        args.push_back(spec.name);
    }
    if (!spec.network.empty()) {
        args.push_back("--network");
        args.push_back(spec.network);
        for (const auto& alias : spec.aliases) {
            args.push_back("--network-alias");
            args.push_back(alias);
        }
    }
    for (const auto& entry : spec.env) {
        args.push_back("-e");
        args.push_back(entry.first + "=" + entry.second);
    }
    for (uint16_t port : spec.exposedPorts) {
        args.push_back("-p");
        args.push_back("127.0.0.1::" + std::to_string(port));
    }
    args.push_back("--add-host");
    args.push_back("host.docker.internal:host-gateway");

    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());
    return args;
}

core::Result<std::string, core::Error> DockerCliRuntime::startContainer(const ContainerSpec& spec) {
    using Res = core::Result<std::string, core::Error>;

    if (spec.image.empty()) {
        return Res::error(core::Error(core::ErrorCode::InvalidArgument, "image is required", spec.name));
    }

    auto result = docker(runArguments(spec));
    if (result.isError()) {
        return Res::error(result.error());
    }
    if (result.value().exitCode != 0) {
        return Res::error(commandFailed(core::ErrorCode::ContainerStartFailed,
                                        "run " + spec.image, result.value()));
    }

    std::string id = trim(result.value().stdoutText);
    // Pull progress can precede the id; the id is the last line.
    size_t newline = id.find_last_of('\n');
    if (newline != std::string::npos) {
        id = trim(id.substr(newline + 1));
    }
    if (id.empty()) {
        return Res::error(core::Error(core::ErrorCode::ContainerStartFailed,
                                      "docker run printed no container id", spec.name));
    }

    logger_->info("started " + spec.name + " (" + spec.image + ") as " + id.substr(0, 12), CATEGORY);
    return Res::success(id);
}

core::Result<std::string, core::Error> DockerCliRuntime::logs(const std::string& containerId) {
    using Res = core::Result<std::string, core::Error>;

    auto result = docker({"logs", containerId});
    if (result.isError()) {
        return Res::error(result.error());
    }
    if (result.value().exitCode != 0) {
        return Res::error(commandFailed(core::ErrorCode::ProcessExitedNonZero,
                                        "logs " + containerId, result.value()));
    }
    return Res::success(result.value().stdoutText + result.value().stderrText);
}

core::Result<int, core::Error> DockerCliRuntime::exec(const std::string& containerId,
                                                      const std::vector<std::string>& argv) {
    using Res = core::Result<int, core::Error>;

    std::vector<std::string> args = {"exec", containerId};
    args.insert(args.end(), argv.begin(), argv.end());

    auto result = docker(args);
    if (result.isError()) {
        return Res::error(result.error());
    }
    return Res::success(result.value().exitCode);
}

core::Result<core::HostPort, core::Error> DockerCliRuntime::parsePortOutput(const std::string& output) {
    using Res = core::Result<core::HostPort, core::Error>;

    // One line per binding, e.g. "127.0.0.1:49153" or "[::]:49153".
    std::string line = trim(output);
    size_t newline = line.find('\n');
    if (newline != std::string::npos) {
        line = trim(line.substr(0, newline));
    }

    size_t colon = line.rfind(':');
    if (colon == std::string::npos || colon + 1 >= line.size()) {
        return Res::error(core::Error(core::ErrorCode::PortLookupFailed,
                                      "unexpected port mapping '" + line + "'", CATEGORY));
    }

    std::string host = line.substr(0, colon);
    std::string portText = line.substr(colon + 1);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    if (host.empty() || host == "0.0.0.0" || host == "::") {
        host = "127.0.0.1";
    }

    unsigned long port = 0;
    for (char c : portText) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return Res::error(core::Error(core::ErrorCode::PortLookupFailed,
                                          "unexpected port mapping '" + line + "'", CATEGORY));
        }
        port = port * 10 + static_cast<unsigned long>(c - '0');
        if (port > 65535) {
            break;
        }
    }
    if (port == 0 || port > 65535) {
        return Res::error(core::Error(core::ErrorCode::PortLookupFailed,
                                      "port out of range in '" + line + "'", CATEGORY));
    }

    core::HostPort hostPort;
    hostPort.host = host;
    hostPort.port = static_cast<uint16_t>(port);
    return Res::success(hostPort);
}

core::Result<core::HostPort, core::Error> DockerCliRuntime::mappedPort(const std::string& containerId,
                                                                       uint16_t containerPort) {
    using Res = core::Result<core::HostPort, core::Error>;

    auto result = docker({"port", containerId, std::to_string(containerPort) + "/tcp"});
    if (result.isError()) {
        return Res::error(result.error());
    }
    if (result.value().exitCode != 0) {
        return Res::error(commandFailed(core::ErrorCode::PortLookupFailed,
                                        "port " + std::to_string(containerPort), result.value()));
    }
    return parsePortOutput(result.value().stdoutText);
}

core::Result<void, core::Error> DockerCliRuntime::stopContainer(const std::string& containerId) {
    using Res = core::Result<void, core::Error>;

    auto result = docker({"rm", "-f", containerId});
    if (result.isError()) {
        return Res::error(result.error());
    }
    if (result.value().exitCode != 0) {
        return Res::error(commandFailed(core::ErrorCode::TeardownFailed,
                                        "rm -f " + containerId, result.value()));
    }
    return Res::success();
}

} // namespace topology
} // namespace faultline
