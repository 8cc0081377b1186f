// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Container runtime backed by the docker command line

#ifndef FAULTLINE_TOPOLOGY_DOCKER_RUNTIME_HPP
#define FAULTLINE_TOPOLOGY_DOCKER_RUNTIME_HPP

#include "faultline/core/structured_logger.hpp"
#include "faultline/pal/process_pal.hpp"
#include "faultline/topology/container_runtime.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace faultline {
namespace topology {

/**
 * @brief IContainerRuntime that shells out to `docker`.
 *
 * Published ports are bound to an ephemeral port on 127.0.0.1, and every
 * container can reach the host as host.docker.internal, which is where the
 * harness's callback servers listen.
 */
class DockerCliRuntime : public IContainerRuntime {
public:
    /**
     * @param commandTimeout Deadline of a single docker invocation; `run`
     *        may pull the image, so this is generous
     */
    DockerCliRuntime(std::shared_ptr<pal::IProcessPAL> process,
                     std::shared_ptr<core::StructuredLogger> logger = nullptr,
                     std::chrono::milliseconds commandTimeout = std::chrono::minutes(5),
                     std::string dockerBinary = "docker");

    core::Result<std::string, core::Error> createNetwork(const std::string& name) override;
    core::Result<void, core::Error> removeNetwork(const std::string& networkId) override;
    core::Result<std::string, core::Error> startContainer(const ContainerSpec& spec) override;
    core::Result<std::string, core::Error> logs(const std::string& containerId) override;
    core::Result<int, core::Error> exec(const std::string& containerId,
                                        const std::vector<std::string>& argv) override;
    core::Result<core::HostPort, core::Error> mappedPort(const std::string& containerId,
                                                         uint16_t containerPort) override;
    core::Result<void, core::Error> stopContainer(const std::string& containerId) override;

    /**
     * @brief Arguments of the `docker run` invocation for a spec.
     */
    static std::vector<std::string> runArguments(const ContainerSpec& spec);

    /**
     * @brief Parse `docker port` output such as "127.0.0.1:49153".
     */
    static core::Result<core::HostPort, core::Error> parsePortOutput(const std::string& output);

private:
    core::Result<pal::ProcessResult, core::Error> docker(const std::vector<std::string>& args);

    std::shared_ptr<pal::IProcessPAL> process_;
    std::shared_ptr<core::StructuredLogger> logger_;
    std::chrono::milliseconds commandTimeout_;
    std::string dockerBinary_;
};

} // namespace topology
} // namespace faultline

#endif // FAULTLINE_TOPOLOGY_DOCKER_RUNTIME_HPP
