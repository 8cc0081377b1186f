// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Tests for withSniffedEndpoint

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "faultline/core/json.hpp"
#include "faultline/harness/sniffer.hpp"
#include "faultline/harness/waiter.hpp"
#include "faultline/proxy/rule_codec.hpp"
#include "support/mock_http_client.hpp"
#include "support/recording_reporter.hpp"
#include "support/test_log_sink.hpp"

#include <atomic>
#include <stdexcept>

namespace faultline {
namespace harness {
namespace test {

using http::test::MockHttpClient;
using http::test::connectionRefused;
using http::test::respond;
using ::testing::_;
using ::testing::Return;

// =============================================================================
// Test Fixtures
// =============================================================================

/**
 * The admin API is mocked; notifications are sent for real to the callback
 * server the sniffer opens, the way the proxy would.
 */
class SnifferTest : public ::testing::Test {
protected:
    void SetUp() override {
        admin_ = std::make_shared<::testing::StrictMock<MockHttpClient>>();
        controller_ = std::make_unique<ProxyController>("http://127.0.0.1:9000", admin_);
        config_.advertiseHost = "127.0.0.1";
        config_.bindAddress = "127.0.0.1";
    }

    void expectRegistration(uint64_t id) {
        EXPECT_CALL(*admin_, send("http://127.0.0.1:9000/sniffers", _, _))
            .WillOnce([this, id](const std::string&, const http::HttpRequest& req, std::chrono::milliseconds) {
                auto doc = core::parseJson(req.body);
                if (doc.isSuccess()) {
                    filter_ = doc.value()["filter"].getString();
                    callbackUrl_ = doc.value()["callback_url"].getString();
                }
                return respond(200, "{\"id\":" + std::to_string(id) + "}");
            });
    }

    core::Result<http::HttpResponse, http::HttpError> notify(const std::string& path) {
        core::CallbackEvent event;
        event.method = "GET";
        event.url = "http://hs1:8008" + path;
        event.path = path;
        event.responseCode = 200;

        http::HttpRequest request;
        request.method = "POST";
        request.body = proxy::encodeCallbackEvent(event);
        return delivery_.send(callbackUrl_, request, std::chrono::milliseconds(5000));
    }

    std::shared_ptr<::testing::StrictMock<MockHttpClient>> admin_;
    std::unique_ptr<ProxyController> controller_;
    core::CallbackConfig config_;
    http::CurlHttpClient delivery_;
    RecordingReporter reporter_;
    std::string filter_;
    std::string callbackUrl_;
};

TEST_F(SnifferTest, EventsReachHandlerWhileActionRuns) {
    expectRegistration(4);
    EXPECT_CALL(*admin_, send("http://127.0.0.1:9000/sniffers/4", _, _)).WillOnce(Return(respond(200)));

    auto seen = Waiter::create();
    std::string seenPath;

    withSniffedEndpoint(*controller_, config_, reporter_, endpointFilter("/sync"),
        [&](const core::CallbackEvent& event) {
            seenPath = event.path;
            seen->finish();
        },
        [&]() {
            ASSERT_TRUE(notify("/_matrix/client/v3/sync?since=s1").isSuccess());
            seen->wait(reporter_, std::chrono::milliseconds(5000), "sync not observed");
        });

    EXPECT_EQ(filter_, "~u .*/sync.*");
    EXPECT_EQ(callbackUrl_.rfind("http://127.0.0.1:", 0), 0u);
    EXPECT_EQ(seenPath, "/_matrix/client/v3/sync?since=s1");
    EXPECT_TRUE(reporter_.errors().empty());
}

// Test: the handler is never called after the scope ends
TEST_F(SnifferTest, ServerIsClosedAfterScope) {
    expectRegistration(5);
    EXPECT_CALL(*admin_, send("http://127.0.0.1:9000/sniffers/5", _, _)).WillOnce(Return(respond(200)));
    std::atomic<int> calls{0};

    withSniffedEndpoint(*controller_, config_, reporter_, "",
        [&calls](const core::CallbackEvent&) { calls.fetch_add(1); },
        []() {});

    auto late = notify("/late");
    EXPECT_TRUE(late.isError());
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(SnifferTest, ScopeLogsUnderItsOwnCategory) {
    expectRegistration(6);
    EXPECT_CALL(*admin_, send("http://127.0.0.1:9000/sniffers/6", _, _)).WillOnce(Return(respond(200)));
    std::shared_ptr<faultline::test::TestLogSink> sink;
    auto logger = faultline::test::makeCapturingLogger(sink);

    withSniffedEndpoint(*controller_, config_, reporter_, "",
        [](const core::CallbackEvent&) {}, []() {}, logger);

    bool found = false;
    for (const auto& entry : sink->getEntries()) {
        if (entry.category == "Sniffer" &&
            entry.message.find("sniffer scope closed after 0 notification(s)") != std::string::npos) {
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(SnifferTest, SnifferRemovedWhenActionThrows) {
    expectRegistration(6);
    EXPECT_CALL(*admin_, send("http://127.0.0.1:9000/sniffers/6", _, _)).WillOnce(Return(respond(200)));

    EXPECT_THROW(withSniffedEndpoint(*controller_, config_, reporter_, "",
                     [](const core::CallbackEvent&) {},
                     []() { throw std::runtime_error("client failed"); }),
                 std::runtime_error);
}

TEST_F(SnifferTest, FailedRegistrationIsFatal) {
    EXPECT_CALL(*admin_, send("http://127.0.0.1:9000/sniffers", _, _)).WillOnce(Return(connectionRefused()));
    bool ran = false;

    EXPECT_THROW(withSniffedEndpoint(*controller_, config_, reporter_, "",
                     [](const core::CallbackEvent&) {},
                     [&ran]() { ran = true; }),
                 FatalFailure);

    EXPECT_FALSE(ran);
    ASSERT_EQ(reporter_.errors().size(), 1u);
    EXPECT_NE(reporter_.errors()[0].find("failed to register sniffer"), std::string::npos);
}

TEST_F(SnifferTest, FailedRemovalIsReportedNonFatally) {
    expectRegistration(8);
    EXPECT_CALL(*admin_, send("http://127.0.0.1:9000/sniffers/8", _, _)).WillOnce(Return(connectionRefused()));

    withSniffedEndpoint(*controller_, config_, reporter_, "",
        [](const core::CallbackEvent&) {}, []() {});

    ASSERT_EQ(reporter_.errors().size(), 1u);
    EXPECT_NE(reporter_.errors()[0].find("failed to remove sniffer"), std::string::npos);
}

} // namespace test
} // namespace harness
} // namespace faultline
