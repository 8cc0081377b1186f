// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Outbound HTTP client interface and libcurl implementation

#ifndef FAULTLINE_HTTP_HTTP_CLIENT_HPP
#define FAULTLINE_HTTP_HTTP_CLIENT_HPP

#include "faultline/core/result.hpp"
#include "faultline/http/http_message.hpp"

#include <chrono>
#include <string>

namespace faultline {
namespace http {

/**
 * @brief Blocking HTTP client.
 *
 * Used by the reverse proxy to reach upstreams and deliver notifications,
 * by the ProxyController for admin calls, and by readiness probes. Any
 * response received from the peer, whatever its status, is a success; only
 * transport failures are errors.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * @brief Send a request to an absolute URL.
     *
     * request.target is ignored; the path and query come from url.
     */
    virtual core::Result<HttpResponse, HttpError> send(
        const std::string& url,
        const HttpRequest& request,
        std::chrono::milliseconds timeout
    ) = 0;
};

/**
 * @brief libcurl based IHttpClient.
 *
 * A fresh easy handle is created per call, so one instance may be shared by
 * any number of threads. Redirects are not followed.
 */
class CurlHttpClient : public IHttpClient {
public:
    CurlHttpClient();

    core::Result<HttpResponse, HttpError> send(
        const std::string& url,
        const HttpRequest& request,
        std::chrono::milliseconds timeout
    ) override;
};

} // namespace http
} // namespace faultline

#endif // FAULTLINE_HTTP_HTTP_CLIENT_HPP
