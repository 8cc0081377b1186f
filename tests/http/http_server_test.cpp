// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Tests for HttpServer and CurlHttpClient over loopback

#include <gtest/gtest.h>
#include "faultline/http/http_client.hpp"
#include "faultline/http/http_server.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace faultline {
namespace http {
namespace test {

// =============================================================================
// Test Fixtures
// =============================================================================

class HttpServerTest : public ::testing::Test {
protected:
    void TearDown() override {
        server_.stop();
    }

    uint16_t startServer(RequestHandler handler, size_t maxRequestSize = HttpRequestParser::DEFAULT_MAX_REQUEST_SIZE) {
        HttpServerOptions options;
        options.bindAddress = "127.0.0.1";
        options.maxRequestSize = maxRequestSize;
        options.name = "TestServer";
        auto started = server_.start(options, std::move(handler));
        EXPECT_TRUE(started.isSuccess()) << (started.isError() ? started.error().toString() : "");
        return started.isSuccess() ? started.value() : 0;
    }

    std::string url(uint16_t port, const std::string& target) const {
        return "http://127.0.0.1:" + std::to_string(port) + target;
    }

    core::Result<HttpResponse, HttpError> send(const std::string& target, const std::string& method,
                                              const std::string& body = "") {
        HttpRequest request;
        request.method = method;
        request.body = body;
        if (!body.empty()) {
            request.headers.emplace_back("Content-Type", "application/json");
        }
        return client_.send(url(server_.port(), target), request, std::chrono::milliseconds(5000));
    }

    HttpServer server_;
    CurlHttpClient client_;
};

// =============================================================================
// Request / response
// =============================================================================

TEST_F(HttpServerTest, HandlerSeesMethodTargetHeadersAndBody) {
    HttpRequest seen;
    std::mutex mutex;
    uint16_t port = startServer([&](const HttpRequest& req) {
        std::lock_guard<std::mutex> lock(mutex);
        seen = req;
        HttpResponse response = HttpResponse::json(201, "{\"ok\":true}");
        response.headers.emplace_back("X-Handled", "yes");
        return response;
    });
    ASSERT_NE(port, 0);

    auto result = send("/rules?x=1", "POST", "{\"rules\":[]}");

    ASSERT_TRUE(result.isSuccess()) << result.error().toString();
    EXPECT_EQ(result.value().status, 201);
    EXPECT_EQ(result.value().body, "{\"ok\":true}");
    EXPECT_EQ(result.value().header("X-Handled").value_or(""), "yes");

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(seen.method, "POST");
    EXPECT_EQ(seen.target, "/rules?x=1");
    EXPECT_EQ(seen.body, "{\"rules\":[]}");
    EXPECT_EQ(seen.header("Content-Type").value_or(""), "application/json");
}

// Test: any status from the peer is a successful exchange for the client
TEST_F(HttpServerTest, ErrorStatusIsNotATransportError) {
    startServer([](const HttpRequest&) { return HttpResponse::json(504, "{}"); });

    auto result = send("/", "GET");

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value().status, 504);
}

TEST_F(HttpServerTest, HandlerExceptionBecomes500) {
    startServer([](const HttpRequest&) -> HttpResponse { throw std::runtime_error("boom"); });

    auto result = send("/", "GET");

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value().status, 500);
}

TEST_F(HttpServerTest, OversizedBodyIsRejectedWith413) {
    std::atomic<int> calls{0};
    startServer([&calls](const HttpRequest&) {
        calls.fetch_add(1);
        return HttpResponse::json(200, "{}");
    }, 128);

    auto result = send("/", "PUT", std::string(1024, 'x'));

    // The server may close before curl finishes uploading; either way the
    // handler never runs.
    if (result.isSuccess()) {
        EXPECT_EQ(result.value().status, 413);
    }
    EXPECT_EQ(calls.load(), 0);
}

// Test: a slow handler does not block other requests
TEST_F(HttpServerTest, SlowHandlerDoesNotBlockOthers) {
    startServer([](const HttpRequest& req) {
        if (req.path() == "/slow") {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
        return HttpResponse::json(200, "{}");
    });

    std::thread slow([this]() { (void)send("/slow", "GET"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto started = std::chrono::steady_clock::now();
    auto fast = send("/fast", "GET");
    auto elapsed = std::chrono::steady_clock::now() - started;
    slow.join();

    ASSERT_TRUE(fast.isSuccess());
    EXPECT_LT(elapsed, std::chrono::milliseconds(400));
}

TEST_F(HttpServerTest, ConcurrentRequests) {
    std::atomic<int> calls{0};
    startServer([&calls](const HttpRequest&) {
        calls.fetch_add(1);
        return HttpResponse::json(200, "{}");
    });

    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([this, &ok]() {
            auto result = send("/", "GET");
            if (result.isSuccess() && result.value().status == 200) {
                ok.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(ok.load(), 8);
    EXPECT_EQ(calls.load(), 8);
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(HttpServerTest, StartTwiceFails) {
    startServer([](const HttpRequest&) { return HttpResponse::json(200, "{}"); });

    HttpServerOptions options;
    options.bindAddress = "127.0.0.1";
    auto again = server_.start(options, [](const HttpRequest&) { return HttpResponse(); });

    ASSERT_TRUE(again.isError());
    EXPECT_EQ(again.error().code, core::ErrorCode::InvalidState);
}

TEST_F(HttpServerTest, StartWithoutHandlerFails) {
    auto result = server_.start(HttpServerOptions(), RequestHandler());

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::InvalidArgument);
}

TEST_F(HttpServerTest, StopIsIdempotent) {
    startServer([](const HttpRequest&) { return HttpResponse::json(200, "{}"); });

    server_.stop();
    server_.stop();
    EXPECT_FALSE(server_.isRunning());
}

TEST_F(HttpServerTest, ClientReportsRefusedConnection) {
    uint16_t port = startServer([](const HttpRequest&) { return HttpResponse::json(200, "{}"); });
    server_.stop();

    HttpRequest request;
    request.method = "GET";
    auto result = client_.send(url(port, "/"), request, std::chrono::milliseconds(2000));

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, HttpError::Code::ConnectionFailed);
}

TEST(CurlHttpClientTest, RejectsMalformedUrl) {
    CurlHttpClient client;
    HttpRequest request;

    auto result = client.send("not a url", request, std::chrono::milliseconds(1000));

    ASSERT_TRUE(result.isError());
}

} // namespace test
} // namespace http
} // namespace faultline
