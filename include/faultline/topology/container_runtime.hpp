// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Container runtime interface

#ifndef FAULTLINE_TOPOLOGY_CONTAINER_RUNTIME_HPP
#define FAULTLINE_TOPOLOGY_CONTAINER_RUNTIME_HPP

#include "faultline/core/error_codes.hpp"
#include "faultline/core/result.hpp"
#include "faultline/core/types.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace faultline {
namespace topology {

/**
 * @brief Everything needed to start one container.
 */
struct ContainerSpec {
    std::string name;                          ///< Unique container name
    std::string image;
    std::string network;                       ///< Network id or name to attach to
    std::vector<std::string> aliases;          ///< DNS names inside the network
    std::map<std::string, std::string> env;
    std::vector<uint16_t> exposedPorts;        ///< TCP ports published on the host
    std::vector<std::string> command;          ///< Overrides the image command when set
};

/**
 * @brief Operations the deployment needs from a container engine.
 *
 * Container and network identifiers are whatever the engine returns from
 * createNetwork() and startContainer().
 */
class IContainerRuntime {
public:
    virtual ~IContainerRuntime() = default;

    /**
     * @return Network identifier
     */
    virtual core::Result<std::string, core::Error> createNetwork(const std::string& name) = 0;

    virtual core::Result<void, core::Error> removeNetwork(const std::string& networkId) = 0;

    /**
     * @brief Start a detached container.
     *
     * Returns as soon as the engine accepted the container; readiness is
     * checked separately.
     *
     * @return Container identifier
     */
    virtual core::Result<std::string, core::Error> startContainer(const ContainerSpec& spec) = 0;

    /**
     * @brief Combined stdout and stderr of the container so far.
     */
    virtual core::Result<std::string, core::Error> logs(const std::string& containerId) = 0;

    /**
     * @brief Run a command inside the container.
     *
     * @return Exit code of the command
     */
    virtual core::Result<int, core::Error> exec(const std::string& containerId,
                                                const std::vector<std::string>& argv) = 0;

    /**
     * @brief Host address of a published container port.
     */
    virtual core::Result<core::HostPort, core::Error> mappedPort(const std::string& containerId,
                                                                 uint16_t containerPort) = 0;

    /**
     * @brief Stop and remove the container.
     */
    virtual core::Result<void, core::Error> stopContainer(const std::string& containerId) = 0;
};

} // namespace topology
} // namespace faultline

#endif // FAULTLINE_TOPOLOGY_CONTAINER_RUNTIME_HPP
