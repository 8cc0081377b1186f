// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// libcurl based HTTP client

#include "faultline/http/http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace faultline {
namespace http {

namespace {

std::once_flag g_curlInitOnce;

struct ResponseSink {
    HttpResponse* response;
};

// libcurl write callback - accumulates response body
size_t writeCallback(char* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    auto* sink = static_cast<ResponseSink*>(userp);
    sink->response->body.append(contents, total);
    return total;
}

// libcurl header callback - captures the reason phrase and response headers
size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    size_t total = size * nitems;
    auto* sink = static_cast<ResponseSink*>(userp);

    std::string line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    if (line.empty()) {
        return total;
    }

    // A new status line starts a new header block (e.g. after 100 Continue).
    if (line.compare(0, 5, "HTTP/") == 0) {
        sink->response->headers.clear();
        sink->response->reason.clear();
        size_t sp1 = line.find(' ');
        size_t sp2 = sp1 == std::string::npos ? std::string::npos : line.find(' ', sp1 + 1);
        if (sp2 != std::string::npos) {
            sink->response->reason = line.substr(sp2 + 1);
        }
        return total;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string value = line.substr(colon + 1);
        size_t first = value.find_first_not_of(" \t");
        value = first == std::string::npos ? "" : value.substr(first);
        sink->response->headers.emplace_back(line.substr(0, colon), value);
    }
    return total;
}

HttpError::Code classify(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return HttpError::Code::Timeout;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return HttpError::Code::ConnectionFailed;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return HttpError::Code::InvalidUrl;
        default:
            return HttpError::Code::TransportError;
    }
}

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // anonymous namespace

CurlHttpClient::CurlHttpClient() {
    std::call_once(g_curlInitOnce, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

core::Result<HttpResponse, HttpError> CurlHttpClient::send(
    const std::string& url,
    const HttpRequest& request,
    std::chrono::milliseconds timeout
) {
    using Res = core::Result<HttpResponse, HttpError>;

    std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
    if (!curl) {
        return Res::error(HttpError(HttpError::Code::TransportError, "curl_easy_init failed"));
    }

    HttpResponse response;
    ResponseSink sink{&response};

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &sink);
    // Bodies are relayed byte for byte, never decoded.
    curl_easy_setopt(h, CURLOPT_HTTP_CONTENT_DECODING, 0L);
    if (timeout.count() > 0) {
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    }

    const std::string method = request.method.empty() ? "GET" : request.method;
    if (method == "HEAD") {
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
    } else if (method != "GET" || !request.body.empty()) {
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }

    // Forward request headers (skip Host and framing - curl sets them)
    curl_slist* raw = nullptr;
    for (const auto& header : request.headers) {
        if (equalsIgnoreCase(header.first, "Host") ||
            equalsIgnoreCase(header.first, "Content-Length") ||
            isHopByHopHeader(header.first)) {
            continue;
        }
        std::string line = header.first + ": " + header.second;
        raw = curl_slist_append(raw, line.c_str());
    }
    // Suppress headers curl would otherwise add on its own.
    raw = curl_slist_append(raw, "Expect:");
    if (!findHeader(request.headers, "Accept")) {
        raw = curl_slist_append(raw, "Accept:");
    }
    if (!findHeader(request.headers, "Content-Type")) {
        raw = curl_slist_append(raw, "Content-Type:");
    }
    std::unique_ptr<curl_slist, SlistDeleter> headerList(raw);
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headerList.get());

    CURLcode res = curl_easy_perform(h);
    if (res != CURLE_OK) {
        return Res::error(HttpError(classify(res),
            std::string(curl_easy_strerror(res)) + " (" + method + " " + url + ")"));
    }

    long status = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<int>(status);

    return Res::success(std::move(response));
}

} // namespace http
} // namespace faultline
