// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Tests for the shared deployment handle

#include <gtest/gtest.h>
#include "faultline/topology/deployment_handle.hpp"
#include "support/deployment_environment.hpp"
#include "support/fake_container_runtime.hpp"

#include <atomic>
#include <thread>
#include <vector>

namespace faultline {
namespace topology {
namespace test {

class DeploymentHandleTest : public ::testing::Test {
protected:
    void SetUp() override {
        runtime_ = std::make_shared<FakeContainerRuntime>();
    }

    DeploymentFactory countingFactory() {
        return [this]() {
            ++factoryCalls_;
            return core::Result<std::shared_ptr<Deployment>, core::Error>::success(
                std::make_shared<Deployment>(runtime_, core::CaptureConfig()));
        };
    }

    std::shared_ptr<FakeContainerRuntime> runtime_;
    std::atomic<int> factoryCalls_{0};
};

TEST_F(DeploymentHandleTest, BuildsOnceAndShares) {
    DeploymentHandle handle(countingFactory());

    auto first = handle.get();
    auto second = handle.get();

    ASSERT_TRUE(first.isSuccess());
    ASSERT_TRUE(second.isSuccess());
    EXPECT_EQ(first.value().get(), second.value().get());
    EXPECT_EQ(factoryCalls_.load(), 1);
}

TEST_F(DeploymentHandleTest, ConcurrentGetBuildsOnce) {
    DeploymentHandle handle(countingFactory());

    std::vector<std::thread> threads;
    std::atomic<int> successes{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (handle.get().isSuccess()) {
                ++successes;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(successes.load(), 8);
    EXPECT_EQ(factoryCalls_.load(), 1);
}

// Test: a failed build is not retried
TEST_F(DeploymentHandleTest, FactoryFailureIsCached) {
    int calls = 0;
    DeploymentHandle handle([&calls]() {
        ++calls;
        return core::Result<std::shared_ptr<Deployment>, core::Error>::error(
            core::Error(core::ErrorCode::ContainerStartFailed, "image not found"));
    });

    EXPECT_EQ(handle.get().error().code, core::ErrorCode::ContainerStartFailed);
    EXPECT_EQ(handle.get().error().code, core::ErrorCode::ContainerStartFailed);
    EXPECT_EQ(calls, 1);
}

TEST_F(DeploymentHandleTest, MissingFactory) {
    DeploymentHandle handle(nullptr);

    EXPECT_EQ(handle.get().error().code, core::ErrorCode::NotInitialized);
}

TEST_F(DeploymentHandleTest, TeardownThenGetFails) {
    DeploymentHandle handle(countingFactory());
    auto deployment = handle.get().value();

    handle.teardown(false);
    handle.teardown(false);

    EXPECT_TRUE(handle.isTornDown());
    EXPECT_TRUE(deployment->isTornDown());
    auto after = handle.get();
    ASSERT_TRUE(after.isError());
    EXPECT_EQ(after.error().code, core::ErrorCode::InvalidState);
}

TEST_F(DeploymentHandleTest, TeardownWithoutDeploymentNeverBuilds) {
    DeploymentHandle handle(countingFactory());

    handle.teardown(true);

    EXPECT_EQ(factoryCalls_.load(), 0);
    EXPECT_TRUE(runtime_->calls().empty());
}

// Test: the global environment tears the shared deployment down
TEST_F(DeploymentHandleTest, EnvironmentTearsDownHandle) {
    auto handle = std::make_shared<DeploymentHandle>(countingFactory());
    auto deployment = handle->get().value();
    faultline::test::DeploymentEnvironment environment(handle, false);

    environment.TearDown();

    EXPECT_TRUE(handle->isTornDown());
    EXPECT_TRUE(deployment->isTornDown());
    EXPECT_EQ(environment.handle().get(), handle.get());
}

} // namespace test
} // namespace topology
} // namespace faultline
