// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// HTTP/1.1 message types, request parser and response serialization

#ifndef FAULTLINE_HTTP_HTTP_MESSAGE_HPP
#define FAULTLINE_HTTP_HTTP_MESSAGE_HPP

#include "faultline/core/result.hpp"
#include "faultline/core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace faultline {
namespace http {

// =============================================================================
// Errors
// =============================================================================

/**
 * @brief HTTP-layer error (parsing on the server side, transport on the client side).
 */
struct HttpError {
    enum class Code {
        None,
        MalformedRequest,
        RequestTooLarge,
        InvalidUrl,
        ConnectionFailed,
        Timeout,
        TransportError
    };

    Code code;
    std::string message;

    HttpError(Code c = Code::None, std::string msg = "")
        : code(c), message(std::move(msg)) {}

    std::string toString() const;
};

// =============================================================================
// Header helpers
// =============================================================================

bool equalsIgnoreCase(const std::string& a, const std::string& b);

std::string toLower(std::string s);

/**
 * @brief First header with the given name (case-insensitive), if any.
 */
std::optional<std::string> findHeader(const core::HeaderList& headers, const std::string& name);

/**
 * @brief Replace every header with the given name by a single entry.
 */
void setHeader(core::HeaderList& headers, const std::string& name, const std::string& value);

void removeHeader(core::HeaderList& headers, const std::string& name);

/**
 * @brief Connection-scoped headers a proxy must not forward.
 */
bool isHopByHopHeader(const std::string& name);

std::string urlDecode(const std::string& s);

// =============================================================================
// Messages
// =============================================================================

struct HttpRequest {
    std::string method;
    std::string target;              ///< Origin-form: path plus optional query
    std::string version = "HTTP/1.1";
    core::HeaderList headers;
    std::string body;

    std::optional<std::string> header(const std::string& name) const {
        return findHeader(headers, name);
    }

    std::string path() const;

    std::string query() const;

    /**
     * @brief Decoded value of a query parameter.
     */
    std::optional<std::string> queryParam(const std::string& name) const;
};

struct HttpResponse {
    int status = 200;
    std::string reason;              ///< Empty = standard phrase for status
    core::HeaderList headers;
    std::string body;

    std::optional<std::string> header(const std::string& name) const {
        return findHeader(headers, name);
    }

    /**
     * @brief Response with a JSON body and matching Content-Type.
     */
    static HttpResponse json(int status, std::string body);
};

const char* reasonPhrase(int status);

/**
 * @brief Serialize a response for the wire.
 *
 * Framing headers from the message (Content-Length, Transfer-Encoding,
 * Connection) are replaced: the body is sent with an explicit length and
 * the connection is closed afterwards.
 */
std::string serializeResponse(const HttpResponse& response);

// =============================================================================
// URLs
// =============================================================================

struct ParsedUrl {
    std::string scheme;
    std::string host;
    uint16_t port = 0;               ///< Scheme default when absent
    std::string target = "/";        ///< Path plus query

    std::string origin() const;      ///< scheme://host:port
};

core::Result<ParsedUrl, HttpError> parseUrl(const std::string& url);

// =============================================================================
// Request parser
// =============================================================================

/**
 * @brief Incremental HTTP/1.1 request parser.
 *
 * Bytes are fed as they arrive from the socket. Bodies are framed by
 * Content-Length or chunked transfer coding; chunked bodies are decoded and
 * the Transfer-Encoding header is removed from the parsed request.
 */
class HttpRequestParser {
public:
    static constexpr size_t DEFAULT_MAX_REQUEST_SIZE = 16 * 1024 * 1024;

    explicit HttpRequestParser(size_t maxRequestSize = DEFAULT_MAX_REQUEST_SIZE);

    /**
     * @brief Consume more input.
     *
     * @return true once a complete request is available, false if more input
     *         is needed, or an error for malformed or oversized input
     */
    core::Result<bool, HttpError> feed(const char* data, size_t len);

    bool isComplete() const { return state_ == State::Complete; }

    const HttpRequest& request() const { return request_; }

    HttpRequest takeRequest();

    void reset();

private:
    enum class State {
        RequestLine,
        Headers,
        Body,
        ChunkSize,
        ChunkData,
        ChunkDataEnd,
        Trailers,
        Complete,
        Failed
    };

    core::Result<bool, HttpError> advance();

    core::Result<bool, HttpError> fail(HttpError::Code code, const std::string& message);

    bool takeLine(std::string& line);

    core::Result<bool, HttpError> parseRequestLine(const std::string& line);

    core::Result<bool, HttpError> parseHeaderLine(const std::string& line);

    core::Result<bool, HttpError> finishHeaders();

    size_t maxRequestSize_;
    size_t consumed_ = 0;
    State state_ = State::RequestLine;
    std::string buffer_;
    size_t pos_ = 0;
    size_t remaining_ = 0;
    HttpRequest request_;
};

} // namespace http
} // namespace faultline

#endif // FAULTLINE_HTTP_HTTP_MESSAGE_HPP
