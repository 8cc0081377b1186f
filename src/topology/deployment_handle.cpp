// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Process-wide shared deployment

#include "faultline/topology/deployment_handle.hpp"

namespace faultline {
namespace topology {

DeploymentHandle::DeploymentHandle(DeploymentFactory factory)
    : factory_(std::move(factory)) {}

core::Result<std::shared_ptr<Deployment>, core::Error> DeploymentHandle::get() {
    using Res = core::Result<std::shared_ptr<Deployment>, core::Error>;

    std::lock_guard<std::mutex> lock(mutex_);
    if (tornDown_.load()) {
        return Res::error(core::Error(core::ErrorCode::InvalidState, "deployment already torn down", "Deployment"));
    }
    if (deployment_) {
        return Res::success(deployment_);
    }
    if (failure_) {
        return Res::error(*failure_);
    }
    if (!factory_) {
        failure_ = core::Error(core::ErrorCode::NotInitialized, "no deployment factory", "Deployment");
        return Res::error(*failure_);
    }

    auto built = factory_();
    if (built.isError()) {
        failure_ = built.error();
        return Res::error(*failure_);
    }
    deployment_ = built.value();
    return Res::success(deployment_);
}

void DeploymentHandle::teardown(bool writeLogs) {
    if (tornDown_.exchange(true)) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (deployment_) {
        deployment_->teardown(writeLogs);
    }
}

} // namespace topology
} // namespace faultline
