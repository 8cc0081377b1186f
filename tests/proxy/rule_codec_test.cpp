// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Tests for the rule set and callback event wire format

#include <gtest/gtest.h>
#include "faultline/proxy/rule_codec.hpp"

namespace faultline {
namespace proxy {
namespace test {

// =============================================================================
// Rule sets
// =============================================================================

TEST(RuleCodecTest, DecodesSingleObjects) {
    auto rules = decodeRuleSet(R"({
        "statuscode": {"return_status": 504, "block_request": true, "count": 3, "filter": "~u /keys/query"},
        "callback": {"callback_url": "http://127.0.0.1:41234", "filter": "~u /keys/query"}
    })");

    ASSERT_TRUE(rules.isSuccess()) << rules.error().toString();
    ASSERT_EQ(rules.value().size(), 2u);

    const Rule& block = rules.value()[0];
    ASSERT_TRUE(std::holds_alternative<Block>(block.action));
    EXPECT_EQ(std::get<Block>(block.action).status, 504);
    EXPECT_EQ(block.budget, std::optional<uint32_t>(3));
    EXPECT_EQ(block.filter, "~u /keys/query");

    const Rule& callback = rules.value()[1];
    ASSERT_TRUE(std::holds_alternative<Callback>(callback.action));
    EXPECT_EQ(std::get<Callback>(callback.action).url, "http://127.0.0.1:41234");
    EXPECT_FALSE(callback.budget.has_value());
}

TEST(RuleCodecTest, DecodesArraysInDocumentOrder) {
    auto rules = decodeRuleSet(R"({
        "statuscode": [
            {"return_status": 500, "filter": "~u /a"},
            {"return_status": 429}
        ]
    })");

    ASSERT_TRUE(rules.isSuccess());
    ASSERT_EQ(rules.value().size(), 2u);
    ASSERT_TRUE(std::holds_alternative<StatusOverride>(rules.value()[0].action));
    EXPECT_EQ(std::get<StatusOverride>(rules.value()[0].action).status, 500);
    EXPECT_EQ(rules.value()[1].filter, "");
    EXPECT_EQ(std::get<StatusOverride>(rules.value()[1].action).status, 429);
}

TEST(RuleCodecTest, EmptyDocumentIsEmptyRuleSet) {
    auto rules = decodeRuleSet("{}");

    ASSERT_TRUE(rules.isSuccess());
    EXPECT_TRUE(rules.value().empty());
}

// Test: malformed rule documents are rejected as InvalidRule
TEST(RuleCodecTest, RejectsInvalidDocuments) {
    const char* invalid[] = {
        "not json",
        "[]",
        R"({"redirect": {}})",
        R"({"statuscode": {}})",
        R"({"statuscode": {"return_status": 99}})",
        R"({"statuscode": {"return_status": 504.5}})",
        R"({"statuscode": {"return_status": 504, "count": 0}})",
        R"({"statuscode": {"return_status": 504, "block_request": "yes"}})",
        R"({"statuscode": {"return_status": 504, "extra": 1}})",
        R"({"statuscode": [1]})",
        R"({"statuscode": "504"})",
        R"({"callback": {"callback_url": ""}})",
        R"({"callback": {"callback_url": "http://h", "count": 1}})",
        R"({"callback": {"callback_url": "http://h", "filter": 3}})",
    };

    for (const char* doc : invalid) {
        auto rules = decodeRuleSet(doc);
        ASSERT_TRUE(rules.isError()) << doc;
        EXPECT_EQ(rules.error().code, core::ErrorCode::InvalidRule) << doc;
    }
}

TEST(RuleCodecTest, ErrorNamesArrayPosition) {
    auto rules = decodeRuleSet(R"({"statuscode": [{"return_status": 504}, {"return_status": 1000}]})");

    ASSERT_TRUE(rules.isError());
    EXPECT_EQ(rules.error().context, "statuscode[1]");
}

TEST(RuleCodecTest, EncodeProducesDecodableDocument) {
    RuleSet rules = {
        Rule::block("~u /keys/query", 504, 3),
        Rule::statusOverride("", 500),
        Rule::callback("~u /sync", "http://127.0.0.1:5000"),
    };

    std::string json = encodeRuleSet(rules);
    EXPECT_EQ(json,
        R"({"statuscode":[{"return_status":504,"filter":"~u /keys/query","block_request":true,"count":3},)"
        R"({"return_status":500}],"callback":[{"callback_url":"http://127.0.0.1:5000","filter":"~u /sync"}]})");

    auto decoded = decodeRuleSet(json);
    ASSERT_TRUE(decoded.isSuccess());
    EXPECT_EQ(decoded.value().size(), 3u);
}

TEST(RuleCodecTest, SniffEncodesAsCallback) {
    RuleSet rules = {Rule{"~u /sync", Sniff{"http://127.0.0.1:6000"}, std::nullopt}};

    EXPECT_EQ(encodeRuleSet(rules), R"({"callback":[{"callback_url":"http://127.0.0.1:6000","filter":"~u /sync"}]})");
    EXPECT_EQ(encodeRuleSet({}), "{}");
}

TEST(RuleCodecTest, ActionNames) {
    EXPECT_STREQ(actionName(Action(Block{504})), "block");
    EXPECT_STREQ(actionName(Action(StatusOverride{500})), "status_override");
    EXPECT_STREQ(actionName(Action(Callback{"u"})), "callback");
    EXPECT_STREQ(actionName(Action(Sniff{"u"})), "sniff");
}

// =============================================================================
// Callback events
// =============================================================================

TEST(CallbackEventCodecTest, EncodesAllFields) {
    core::CallbackEvent event;
    event.method = "PUT";
    event.url = "http://hs1:8008/_matrix/client/v3/sendToDevice/m.room.encrypted/1";
    event.path = "/_matrix/client/v3/sendToDevice/m.room.encrypted/1";
    event.accessToken = "syt_alice";
    event.responseCode = 504;
    event.requestBody = "{\"messages\":{}}";
    event.responseBody = "";
    event.requestHeaders = {{"Authorization", "Bearer syt_alice"}, {"X-Dup", "1"}, {"X-Dup", "2"}};

    auto decoded = decodeCallbackEvent(encodeCallbackEvent(event));

    ASSERT_TRUE(decoded.isSuccess());
    EXPECT_EQ(decoded.value().method, "PUT");
    EXPECT_EQ(decoded.value().url, event.url);
    EXPECT_EQ(decoded.value().path, event.path);
    EXPECT_EQ(decoded.value().accessToken, "syt_alice");
    EXPECT_EQ(decoded.value().responseCode, 504);
    EXPECT_EQ(decoded.value().requestBody, event.requestBody);
    EXPECT_EQ(decoded.value().requestHeaders, event.requestHeaders);
}

TEST(CallbackEventCodecTest, OptionalFieldsDefault) {
    auto decoded = decodeCallbackEvent(R"({"method":"GET","url":"http://hs1/sync","response_code":200})");

    ASSERT_TRUE(decoded.isSuccess());
    EXPECT_TRUE(decoded.value().accessToken.empty());
    EXPECT_TRUE(decoded.value().requestHeaders.empty());
}

TEST(CallbackEventCodecTest, RejectsMissingRequiredFields) {
    auto missing = decodeCallbackEvent(R"({"method":"GET","url":"http://hs1/sync"})");
    ASSERT_TRUE(missing.isError());
    EXPECT_EQ(missing.error().code, core::ErrorCode::MalformedRequest);

    EXPECT_TRUE(decodeCallbackEvent("{").isError());
    EXPECT_TRUE(decodeCallbackEvent("[]").isError());
}

} // namespace test
} // namespace proxy
} // namespace faultline
