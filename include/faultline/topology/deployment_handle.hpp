// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Process-wide shared deployment

#ifndef FAULTLINE_TOPOLOGY_DEPLOYMENT_HANDLE_HPP
#define FAULTLINE_TOPOLOGY_DEPLOYMENT_HANDLE_HPP

#include "faultline/core/error_codes.hpp"
#include "faultline/core/result.hpp"
#include "faultline/topology/deployment.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace faultline {
namespace topology {

using DeploymentFactory = std::function<core::Result<std::shared_ptr<Deployment>, core::Error>()>;

/**
 * @brief Lazily builds one Deployment and shares it between tests.
 *
 * The first get() runs the factory under the handle's mutex; every later
 * call returns the same instance, or the same error if the factory failed.
 * After teardown() get() fails with ErrorCode::InvalidState.
 *
 * @code
 * auto handle = std::make_shared<DeploymentHandle>([config]() {
 *     return DeploymentBuilder(config, runtime, process, client).deploy();
 * });
 * auto deployment = handle->get();
 * @endcode
 */
class DeploymentHandle {
public:
    explicit DeploymentHandle(DeploymentFactory factory);

    DeploymentHandle(const DeploymentHandle&) = delete;
    DeploymentHandle& operator=(const DeploymentHandle&) = delete;

    core::Result<std::shared_ptr<Deployment>, core::Error> get();

    /**
     * @brief Tear down the deployment if one was built. Runs at most once.
     */
    void teardown(bool writeLogs);

    bool isTornDown() const { return tornDown_.load(); }

private:
    DeploymentFactory factory_;

    std::mutex mutex_;
    std::shared_ptr<Deployment> deployment_;
    std::optional<core::Error> failure_;
    std::atomic<bool> tornDown_{false};
};

} // namespace topology
} // namespace faultline

#endif // FAULTLINE_TOPOLOGY_DEPLOYMENT_HANDLE_HPP
