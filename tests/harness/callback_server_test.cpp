// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Tests for CallbackServer

#include <gtest/gtest.h>
#include "faultline/harness/callback_server.hpp"
#include "faultline/harness/waiter.hpp"
#include "faultline/http/http_client.hpp"
#include "faultline/proxy/rule_codec.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace faultline {
namespace harness {
namespace test {

// =============================================================================
// Test Fixtures
// =============================================================================

class CallbackServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.advertiseHost = "127.0.0.1";
        config_.bindAddress = "127.0.0.1";
    }

    core::Result<http::HttpResponse, http::HttpError> post(const std::string& url, const std::string& body,
                                                           const std::string& method = "POST") {
        http::HttpRequest request;
        request.method = method;
        request.body = body;
        request.headers.emplace_back("Content-Type", "application/json");
        return client_.send(url, request, std::chrono::milliseconds(5000));
    }

    static core::CallbackEvent sampleEvent(const std::string& path) {
        core::CallbackEvent event;
        event.method = "PUT";
        event.url = "http://hs1:8008" + path;
        event.path = path;
        event.accessToken = "syt_alice";
        event.responseCode = 504;
        return event;
    }

    core::CallbackConfig config_;
    http::CurlHttpClient client_;
};

// =============================================================================
// Delivery
// =============================================================================

TEST_F(CallbackServerTest, DeliversDecodedEventToHandler) {
    CallbackServer server(config_);
    auto waiter = Waiter::create();
    std::mutex mutex;
    core::CallbackEvent seen;

    auto url = server.start([&](const core::CallbackEvent& event) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            seen = event;
        }
        waiter->finish();
    });
    ASSERT_TRUE(url.isSuccess()) << url.error().toString();
    EXPECT_EQ(url.value(), "http://127.0.0.1:" + std::to_string(server.port()));

    auto response = post(url.value(), proxy::encodeCallbackEvent(sampleEvent("/sendToDevice/1")));
    ASSERT_TRUE(response.isSuccess());
    EXPECT_EQ(response.value().status, 200);

    ASSERT_TRUE(waiter->wait(std::chrono::milliseconds(5000)));
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(seen.path, "/sendToDevice/1");
    EXPECT_EQ(seen.responseCode, 504);
    EXPECT_EQ(server.receivedCount(), 1u);
}

// Test: the proxy is acknowledged before a slow handler finishes
TEST_F(CallbackServerTest, AcknowledgesBeforeHandlerCompletes) {
    CallbackServer server(config_);
    auto release = Waiter::create();

    auto url = server.start([release](const core::CallbackEvent&) {
        release->wait(std::chrono::milliseconds(5000));
    });
    ASSERT_TRUE(url.isSuccess());

    auto started = std::chrono::steady_clock::now();
    auto response = post(url.value(), proxy::encodeCallbackEvent(sampleEvent("/sync")));
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(response.isSuccess());
    EXPECT_EQ(response.value().status, 200);
    EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
    release->finish();
}

TEST_F(CallbackServerTest, RejectsMalformedNotifications) {
    CallbackServer server(config_);
    auto url = server.start([](const core::CallbackEvent&) {
        ADD_FAILURE() << "handler must not run";
    });
    ASSERT_TRUE(url.isSuccess());

    auto malformed = post(url.value(), "{\"method\":\"GET\"}");
    ASSERT_TRUE(malformed.isSuccess());
    EXPECT_EQ(malformed.value().status, 400);

    auto wrongMethod = post(url.value(), proxy::encodeCallbackEvent(sampleEvent("/x")), "PUT");
    ASSERT_TRUE(wrongMethod.isSuccess());
    EXPECT_EQ(wrongMethod.value().status, 405);

    server.stop();
    EXPECT_EQ(server.receivedCount(), 0u);
}

TEST_F(CallbackServerTest, StopWaitsForRunningHandlers) {
    CallbackServer server(config_);
    auto entered = Waiter::create();
    std::atomic<bool> finished{false};

    auto url = server.start([&](const core::CallbackEvent&) {
        entered->finish();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        finished.store(true);
    });
    ASSERT_TRUE(url.isSuccess());
    ASSERT_TRUE(post(url.value(), proxy::encodeCallbackEvent(sampleEvent("/x"))).isSuccess());
    ASSERT_TRUE(entered->wait(std::chrono::milliseconds(5000)));

    server.stop();
    EXPECT_TRUE(finished.load());
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(CallbackServerTest, StartValidation) {
    CallbackServer server(config_);

    EXPECT_EQ(server.start(CallbackHandler()).error().code, core::ErrorCode::InvalidArgument);
    ASSERT_TRUE(server.start([](const core::CallbackEvent&) {}).isSuccess());
    EXPECT_EQ(server.start([](const core::CallbackEvent&) {}).error().code, core::ErrorCode::InvalidState);
}

TEST_F(CallbackServerTest, AdvertisesConfiguredHost) {
    config_.advertiseHost = "host.docker.internal";
    CallbackServer server(config_);

    auto url = server.start([](const core::CallbackEvent&) {});
    ASSERT_TRUE(url.isSuccess());
    EXPECT_EQ(url.value().rfind("http://host.docker.internal:", 0), 0u);
    EXPECT_EQ(server.url(), url.value());
}

} // namespace test
} // namespace harness
} // namespace faultline
