// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// HTTP/1.1 message types, request parser and response serialization

#include "faultline/http/http_message.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace faultline {
namespace http {

namespace {

constexpr size_t MAX_LINE_LENGTH = 16 * 1024;

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

bool isTokenChar(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
        return true;
    }
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string HttpError::toString() const {
    const char* name = "None";
    switch (code) {
        case Code::None: name = "None"; break;
        case Code::MalformedRequest: name = "MalformedRequest"; break;
        case Code::RequestTooLarge: name = "RequestTooLarge"; break;
        case Code::InvalidUrl: name = "InvalidUrl"; break;
        case Code::ConnectionFailed: name = "ConnectionFailed"; break;
        case Code::Timeout: name = "Timeout"; break;
        case Code::TransportError: name = "TransportError"; break;
    }
    return std::string(name) + ": " + message;
}

// =============================================================================
// Header helpers
// =============================================================================

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<std::string> findHeader(const core::HeaderList& headers, const std::string& name) {
    for (const auto& h : headers) {
        if (equalsIgnoreCase(h.first, name)) {
            return h.second;
        }
    }
    return std::nullopt;
}

void setHeader(core::HeaderList& headers, const std::string& name, const std::string& value) {
    removeHeader(headers, name);
    headers.emplace_back(name, value);
}

void removeHeader(core::HeaderList& headers, const std::string& name) {
    headers.erase(std::remove_if(headers.begin(), headers.end(),
                                 [&](const std::pair<std::string, std::string>& h) {
                                     return equalsIgnoreCase(h.first, name);
                                 }),
                  headers.end());
}

bool isHopByHopHeader(const std::string& name) {
    static const char* const kHopByHop[] = {
        "Connection", "Keep-Alive", "Proxy-Authenticate", "Proxy-Authorization",
        "TE", "Trailer", "Transfer-Encoding", "Upgrade", "Proxy-Connection"
    };
    for (const char* h : kHopByHop) {
        if (equalsIgnoreCase(name, h)) {
            return true;
        }
    }
    return false;
}

std::string urlDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i] == '+' ? ' ' : s[i]);
    }
    return out;
}

// =============================================================================
// Messages
// =============================================================================

std::string HttpRequest::path() const {
    size_t q = target.find('?');
    return q == std::string::npos ? target : target.substr(0, q);
}

std::string HttpRequest::query() const {
    size_t q = target.find('?');
    return q == std::string::npos ? "" : target.substr(q + 1);
}

std::optional<std::string> HttpRequest::queryParam(const std::string& name) const {
    std::istringstream in(query());
    std::string pair;
    while (std::getline(in, pair, '&')) {
        size_t eq = pair.find('=');
        std::string key = urlDecode(pair.substr(0, eq));
        if (key == name) {
            return eq == std::string::npos ? "" : urlDecode(pair.substr(eq + 1));
        }
    }
    return std::nullopt;
}

HttpResponse HttpResponse::json(int status, std::string body) {
    HttpResponse response;
    response.status = status;
    response.headers.emplace_back("Content-Type", "application/json");
    response.body = std::move(body);
    return response;
}

const char* reasonPhrase(int status) {
    switch (status) {
        case 100: return "Continue";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "Unknown";
    }
}

std::string serializeResponse(const HttpResponse& response) {
    std::string out;
    out.reserve(response.body.size() + 256);

    out += "HTTP/1.1 ";
    out += std::to_string(response.status);
    out += ' ';
    out += response.reason.empty() ? reasonPhrase(response.status) : response.reason;
    out += "\r\n";

    for (const auto& h : response.headers) {
        if (equalsIgnoreCase(h.first, "Content-Length") ||
            equalsIgnoreCase(h.first, "Transfer-Encoding") ||
            equalsIgnoreCase(h.first, "Connection")) {
            continue;
        }
        out += h.first;
        out += ": ";
        out += h.second;
        out += "\r\n";
    }
    out += "Content-Length: " + std::to_string(response.body.size()) + "\r\n";
    out += "Connection: close\r\n\r\n";
    out += response.body;
    return out;
}

// =============================================================================
// URLs
// =============================================================================

std::string ParsedUrl::origin() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

core::Result<ParsedUrl, HttpError> parseUrl(const std::string& url) {
    using Res = core::Result<ParsedUrl, HttpError>;

    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        return Res::error(HttpError(HttpError::Code::InvalidUrl, "missing scheme in '" + url + "'"));
    }

    ParsedUrl parsed;
    parsed.scheme = toLower(url.substr(0, schemeEnd));
    if (parsed.scheme == "http") {
        parsed.port = 80;
    } else if (parsed.scheme == "https") {
        parsed.port = 443;
    } else {
        return Res::error(HttpError(HttpError::Code::InvalidUrl,
            "unsupported scheme '" + parsed.scheme + "'"));
    }

    size_t authorityStart = schemeEnd + 3;
    size_t pathStart = url.find_first_of("/?", authorityStart);
    std::string authority = url.substr(authorityStart,
        pathStart == std::string::npos ? std::string::npos : pathStart - authorityStart);
    if (pathStart != std::string::npos) {
        parsed.target = url.substr(pathStart);
        if (parsed.target[0] == '?') {
            parsed.target = "/" + parsed.target;
        }
    }

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        std::string portText = authority.substr(colon + 1);
        if (portText.empty() ||
            !std::all_of(portText.begin(), portText.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; }) ||
            portText.size() > 5 || std::stoul(portText) == 0 || std::stoul(portText) > 65535) {
            return Res::error(HttpError(HttpError::Code::InvalidUrl,
                "invalid port in '" + url + "'"));
        }
        parsed.port = static_cast<uint16_t>(std::stoul(portText));
        authority = authority.substr(0, colon);
    }

    if (authority.empty()) {
        return Res::error(HttpError(HttpError::Code::InvalidUrl, "missing host in '" + url + "'"));
    }
    parsed.host = authority;
    return Res::success(std::move(parsed));
}

// =============================================================================
// Request parser
// =============================================================================

HttpRequestParser::HttpRequestParser(size_t maxRequestSize)
    : maxRequestSize_(maxRequestSize) {}

void HttpRequestParser::reset() {
    consumed_ = 0;
    state_ = State::RequestLine;
    buffer_.clear();
    pos_ = 0;
    remaining_ = 0;
    request_ = HttpRequest();
}

HttpRequest HttpRequestParser::takeRequest() {
    HttpRequest out = std::move(request_);
    reset();
    return out;
}

core::Result<bool, HttpError> HttpRequestParser::fail(HttpError::Code code, const std::string& message) {
    state_ = State::Failed;
    return core::Result<bool, HttpError>::error(HttpError(code, message));
}

core::Result<bool, HttpError> HttpRequestParser::feed(const char* data, size_t len) {
    if (state_ == State::Failed) {
        return fail(HttpError::Code::MalformedRequest, "parser is in error state");
    }
    if (state_ == State::Complete) {
        return core::Result<bool, HttpError>::success(true);
    }

    consumed_ += len;
    if (consumed_ > maxRequestSize_) {
        return fail(HttpError::Code::RequestTooLarge,
            "request exceeds " + std::to_string(maxRequestSize_) + " bytes");
    }

    buffer_.append(data, len);
    auto result = advance();

    // Drop consumed input so the buffer only holds the unparsed tail.
    if (pos_ > 0) {
        buffer_.erase(0, pos_);
        pos_ = 0;
    }
    return result;
}

bool HttpRequestParser::takeLine(std::string& line) {
    size_t eol = buffer_.find("\r\n", pos_);
    if (eol == std::string::npos) {
        return false;
    }
    line = buffer_.substr(pos_, eol - pos_);
    pos_ = eol + 2;
    return true;
}

core::Result<bool, HttpError> HttpRequestParser::advance() {
    using Res = core::Result<bool, HttpError>;

    for (;;) {
        switch (state_) {
            case State::RequestLine:
            case State::Headers:
            case State::ChunkSize:
            case State::ChunkDataEnd:
            case State::Trailers: {
                std::string line;
                if (!takeLine(line)) {
                    if (buffer_.size() - pos_ > MAX_LINE_LENGTH) {
                        return fail(HttpError::Code::MalformedRequest, "line too long");
                    }
                    return Res::success(false);
                }

                if (state_ == State::RequestLine) {
                    // Tolerate empty lines before the request line.
                    if (line.empty()) {
                        continue;
                    }
                    auto r = parseRequestLine(line);
                    if (r.isError()) return r;
                    state_ = State::Headers;
                } else if (state_ == State::Headers) {
                    if (line.empty()) {
                        auto r = finishHeaders();
                        if (r.isError()) return r;
                    } else {
                        auto r = parseHeaderLine(line);
                        if (r.isError()) return r;
                    }
                } else if (state_ == State::ChunkSize) {
                    std::string sizeText = trim(line.substr(0, line.find(';')));
                    if (sizeText.empty() || sizeText.size() > 15) {
                        return fail(HttpError::Code::MalformedRequest, "invalid chunk size");
                    }
                    size_t size = 0;
                    for (char c : sizeText) {
                        int v = hexValue(c);
                        if (v < 0) {
                            return fail(HttpError::Code::MalformedRequest, "invalid chunk size");
                        }
                        size = size * 16 + static_cast<size_t>(v);
                    }
                    if (request_.body.size() + size > maxRequestSize_) {
                        return fail(HttpError::Code::RequestTooLarge, "chunked body too large");
                    }
                    remaining_ = size;
                    state_ = size == 0 ? State::Trailers : State::ChunkData;
                } else if (state_ == State::ChunkDataEnd) {
                    if (!line.empty()) {
                        return fail(HttpError::Code::MalformedRequest, "missing CRLF after chunk");
                    }
                    state_ = State::ChunkSize;
                } else {
                    // Trailer fields are accepted and discarded.
                    if (line.empty()) {
                        state_ = State::Complete;
                    }
                }
                break;
            }

            case State::Body:
            case State::ChunkData: {
                size_t available = buffer_.size() - pos_;
                size_t take = std::min(available, remaining_);
                request_.body.append(buffer_, pos_, take);
                pos_ += take;
                remaining_ -= take;
                if (remaining_ > 0) {
                    return Res::success(false);
                }
                state_ = state_ == State::Body ? State::Complete : State::ChunkDataEnd;
                break;
            }

            case State::Complete:
                return Res::success(true);

            case State::Failed:
                return fail(HttpError::Code::MalformedRequest, "parser is in error state");
        }
    }
}

core::Result<bool, HttpError> HttpRequestParser::parseRequestLine(const std::string& line) {
    size_t sp1 = line.find(' ');
    size_t sp2 = sp1 == std::string::npos ? std::string::npos : line.find(' ', sp1 + 1);
    if (sp1 == std::string::npos || sp2 == std::string::npos ||
        line.find(' ', sp2 + 1) != std::string::npos) {
        return fail(HttpError::Code::MalformedRequest, "malformed request line");
    }

    request_.method = line.substr(0, sp1);
    request_.target = line.substr(sp1 + 1, sp2 - sp1 - 1);
    request_.version = line.substr(sp2 + 1);

    if (request_.method.empty() ||
        !std::all_of(request_.method.begin(), request_.method.end(), isTokenChar)) {
        return fail(HttpError::Code::MalformedRequest, "invalid method");
    }
    if (request_.target.empty()) {
        return fail(HttpError::Code::MalformedRequest, "empty request target");
    }
    if (request_.version != "HTTP/1.1" && request_.version != "HTTP/1.0") {
        return fail(HttpError::Code::MalformedRequest, "unsupported version " + request_.version);
    }

    // Absolute-form targets are reduced to origin-form.
    if (request_.target[0] != '/' && request_.target != "*") {
        auto url = parseUrl(request_.target);
        if (url.isError()) {
            return fail(HttpError::Code::MalformedRequest, "invalid request target");
        }
        request_.target = url.value().target;
    }
    return core::Result<bool, HttpError>::success(false);
}

core::Result<bool, HttpError> HttpRequestParser::parseHeaderLine(const std::string& line) {
    size_t colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
        return fail(HttpError::Code::MalformedRequest, "malformed header line");
    }
    std::string name = line.substr(0, colon);
    if (!std::all_of(name.begin(), name.end(), isTokenChar)) {
        return fail(HttpError::Code::MalformedRequest, "invalid header name");
    }
    request_.headers.emplace_back(name, trim(line.substr(colon + 1)));
    return core::Result<bool, HttpError>::success(false);
}

core::Result<bool, HttpError> HttpRequestParser::finishHeaders() {
    auto transferEncoding = request_.header("Transfer-Encoding");
    auto contentLength = request_.header("Content-Length");

    if (transferEncoding) {
        if (toLower(trim(*transferEncoding)) != "chunked") {
            return fail(HttpError::Code::MalformedRequest,
                "unsupported transfer coding '" + *transferEncoding + "'");
        }
        if (contentLength) {
            return fail(HttpError::Code::MalformedRequest,
                "both Content-Length and Transfer-Encoding present");
        }
        removeHeader(request_.headers, "Transfer-Encoding");
        state_ = State::ChunkSize;
        return core::Result<bool, HttpError>::success(false);
    }

    if (contentLength) {
        const std::string& text = *contentLength;
        if (text.empty() || text.size() > 15 ||
            !std::all_of(text.begin(), text.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return fail(HttpError::Code::MalformedRequest, "invalid Content-Length");
        }
        size_t length = static_cast<size_t>(std::strtoull(text.c_str(), nullptr, 10));
        if (length > maxRequestSize_) {
            return fail(HttpError::Code::RequestTooLarge, "declared body too large");
        }
        remaining_ = length;
        state_ = length == 0 ? State::Complete : State::Body;
        return core::Result<bool, HttpError>::success(false);
    }

    state_ = State::Complete;
    return core::Result<bool, HttpError>::success(false);
}

} // namespace http
} // namespace faultline
