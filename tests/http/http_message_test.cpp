// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Tests for the HTTP request parser, response serialization and URL parsing

#include <gtest/gtest.h>
#include "faultline/http/http_message.hpp"

#include <string>

namespace faultline {
namespace http {
namespace test {

// =============================================================================
// Test Fixtures
// =============================================================================

class HttpRequestParserTest : public ::testing::Test {
protected:
    core::Result<bool, HttpError> feed(const std::string& data) {
        return parser_.feed(data.data(), data.size());
    }

    HttpRequestParser parser_;
};

// =============================================================================
// Request parser
// =============================================================================

TEST_F(HttpRequestParserTest, ParsesRequestWithContentLength) {
    auto result = feed("PUT /_matrix/client/v3/sendToDevice/m.room.encrypted/1?access_token=abc HTTP/1.1\r\n"
                       "Host: hs1\r\n"
                       "Content-Length: 7\r\n"
                       "\r\n"
                       "{\"a\":1}");

    ASSERT_TRUE(result.isSuccess());
    EXPECT_TRUE(result.value());
    const HttpRequest& req = parser_.request();
    EXPECT_EQ(req.method, "PUT");
    EXPECT_EQ(req.path(), "/_matrix/client/v3/sendToDevice/m.room.encrypted/1");
    EXPECT_EQ(req.query(), "access_token=abc");
    EXPECT_EQ(req.queryParam("access_token").value_or(""), "abc");
    EXPECT_EQ(req.header("host").value_or(""), "hs1");
    EXPECT_EQ(req.body, "{\"a\":1}");
}

// Test: input split at arbitrary points produces the same request
TEST_F(HttpRequestParserTest, AcceptsInputInFragments) {
    const std::string raw = "POST /keys/query HTTP/1.1\r\nContent-Length: 11\r\n\r\nhello world";

    for (size_t i = 0; i + 1 < raw.size(); ++i) {
        auto r = parser_.feed(&raw[i], 1);
        ASSERT_TRUE(r.isSuccess());
        EXPECT_FALSE(r.value()) << "completed early at byte " << i;
    }
    auto last = parser_.feed(&raw[raw.size() - 1], 1);
    ASSERT_TRUE(last.isSuccess());
    EXPECT_TRUE(last.value());
    EXPECT_EQ(parser_.request().body, "hello world");
}

TEST_F(HttpRequestParserTest, DecodesChunkedBody) {
    auto result = feed("POST /upload HTTP/1.1\r\n"
                       "Transfer-Encoding: chunked\r\n"
                       "\r\n"
                       "5;ext=1\r\nhello\r\n"
                       "6\r\n world\r\n"
                       "0\r\n"
                       "X-Trailer: ignored\r\n"
                       "\r\n");

    ASSERT_TRUE(result.isSuccess());
    EXPECT_TRUE(result.value());
    EXPECT_EQ(parser_.request().body, "hello world");
    EXPECT_FALSE(parser_.request().header("Transfer-Encoding").has_value());
}

TEST_F(HttpRequestParserTest, RequestWithoutBodyCompletesAtHeaders) {
    auto result = feed("GET /_matrix/client/versions HTTP/1.1\r\nHost: hs1\r\n\r\n");

    ASSERT_TRUE(result.isSuccess());
    EXPECT_TRUE(result.value());
    EXPECT_TRUE(parser_.request().body.empty());
}

TEST_F(HttpRequestParserTest, AbsoluteFormTargetIsReduced) {
    auto result = feed("GET http://hs1:8008/sync?since=s1 HTTP/1.1\r\n\r\n");

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(parser_.request().target, "/sync?since=s1");
}

TEST_F(HttpRequestParserTest, TakeRequestResetsParser) {
    ASSERT_TRUE(feed("GET /a HTTP/1.1\r\n\r\n").value());
    HttpRequest first = parser_.takeRequest();
    EXPECT_EQ(first.target, "/a");
    EXPECT_FALSE(parser_.isComplete());

    ASSERT_TRUE(feed("GET /b HTTP/1.1\r\n\r\n").value());
    EXPECT_EQ(parser_.request().target, "/b");
}

TEST_F(HttpRequestParserTest, RejectsMalformedRequestLine) {
    auto result = feed("GET /a\r\n\r\n");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, HttpError::Code::MalformedRequest);

    // The parser stays failed.
    EXPECT_TRUE(feed("GET /a HTTP/1.1\r\n\r\n").isError());
}

TEST_F(HttpRequestParserTest, RejectsUnsupportedVersionAndBadHeaders) {
    EXPECT_TRUE(feed("GET / HTTP/2.0\r\n\r\n").isError());

    HttpRequestParser noColon;
    std::string raw = "GET / HTTP/1.1\r\nBroken header\r\n\r\n";
    EXPECT_TRUE(noColon.feed(raw.data(), raw.size()).isError());
}

TEST_F(HttpRequestParserTest, RejectsConflictingFraming) {
    auto result = feed("POST / HTTP/1.1\r\nContent-Length: 3\r\nTransfer-Encoding: chunked\r\n\r\n");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, HttpError::Code::MalformedRequest);
}

TEST_F(HttpRequestParserTest, RejectsBadChunkSize) {
    auto result = feed("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n");

    ASSERT_TRUE(result.isError());
}

TEST(HttpRequestParserLimitTest, RejectsOversizedRequest) {
    HttpRequestParser parser(64);
    std::string raw = "POST / HTTP/1.1\r\nContent-Length: 100\r\n\r\n";

    auto result = parser.feed(raw.data(), raw.size());
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, HttpError::Code::RequestTooLarge);
}

TEST(HttpRequestParserLimitTest, RejectsOverlongLine) {
    HttpRequestParser parser;
    std::string raw = "GET /" + std::string(20 * 1024, 'a');

    auto result = parser.feed(raw.data(), raw.size());
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, HttpError::Code::MalformedRequest);
}

// =============================================================================
// Headers
// =============================================================================

TEST(HttpHeaderTest, LookupIsCaseInsensitive) {
    core::HeaderList headers = {{"Content-Type", "application/json"}, {"X-Trace", "1"}};

    EXPECT_EQ(findHeader(headers, "content-type").value_or(""), "application/json");
    setHeader(headers, "x-trace", "2");
    EXPECT_EQ(headers.size(), 2u);
    EXPECT_EQ(findHeader(headers, "X-Trace").value_or(""), "2");
    removeHeader(headers, "CONTENT-TYPE");
    EXPECT_FALSE(findHeader(headers, "Content-Type").has_value());
}

TEST(HttpHeaderTest, HopByHopHeaders) {
    EXPECT_TRUE(isHopByHopHeader("connection"));
    EXPECT_TRUE(isHopByHopHeader("Transfer-Encoding"));
    EXPECT_FALSE(isHopByHopHeader("Authorization"));
    EXPECT_FALSE(isHopByHopHeader("Content-Length"));
}

TEST(HttpHeaderTest, UrlDecode) {
    EXPECT_EQ(urlDecode("a%20b+c"), "a b c");
    EXPECT_EQ(urlDecode("trailing%2"), "trailing%2");
    EXPECT_EQ(urlDecode("%41%42"), "AB");
}

// =============================================================================
// Responses
// =============================================================================

TEST(HttpResponseTest, SerializeReplacesFramingHeaders) {
    HttpResponse response = HttpResponse::json(504, "{}");
    response.headers.emplace_back("Content-Length", "999");
    response.headers.emplace_back("Connection", "keep-alive");

    std::string wire = serializeResponse(response);

    EXPECT_EQ(wire.rfind("HTTP/1.1 504 Gateway Timeout\r\n", 0), 0u);
    EXPECT_NE(wire.find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Content-Length: 2\r\n"), std::string::npos);
    EXPECT_EQ(wire.find("999"), std::string::npos);
    EXPECT_NE(wire.find("Connection: close\r\n\r\n{}"), std::string::npos);
}

TEST(HttpResponseTest, CustomReason) {
    HttpResponse response;
    response.status = 599;
    response.reason = "Injected";

    EXPECT_EQ(serializeResponse(response).rfind("HTTP/1.1 599 Injected\r\n", 0), 0u);
    EXPECT_STREQ(reasonPhrase(599), "Unknown");
}

// =============================================================================
// URLs
// =============================================================================

TEST(ParseUrlTest, ParsesHostPortAndTarget) {
    auto url = parseUrl("http://127.0.0.1:5000/callback?x=1");

    ASSERT_TRUE(url.isSuccess());
    EXPECT_EQ(url.value().scheme, "http");
    EXPECT_EQ(url.value().host, "127.0.0.1");
    EXPECT_EQ(url.value().port, 5000);
    EXPECT_EQ(url.value().target, "/callback?x=1");
    EXPECT_EQ(url.value().origin(), "http://127.0.0.1:5000");
}

TEST(ParseUrlTest, DefaultsPortAndPath) {
    auto http = parseUrl("http://hs1");
    auto https = parseUrl("HTTPS://hs1?q");

    ASSERT_TRUE(http.isSuccess());
    EXPECT_EQ(http.value().port, 80);
    EXPECT_EQ(http.value().target, "/");
    ASSERT_TRUE(https.isSuccess());
    EXPECT_EQ(https.value().port, 443);
    EXPECT_EQ(https.value().target, "/?q");
}

TEST(ParseUrlTest, RejectsInvalidUrls) {
    EXPECT_TRUE(parseUrl("hs1:8008").isError());
    EXPECT_TRUE(parseUrl("ftp://hs1").isError());
    EXPECT_TRUE(parseUrl("http://:8008/").isError());
    EXPECT_TRUE(parseUrl("http://hs1:0/").isError());
    EXPECT_TRUE(parseUrl("http://hs1:99999/").isError());
    EXPECT_EQ(parseUrl("http://hs1:port/").error().code, HttpError::Code::InvalidUrl);
}

} // namespace test
} // namespace http
} // namespace faultline
