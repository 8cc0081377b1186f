// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Core data types shared by the proxy and the harness

#ifndef FAULTLINE_CORE_TYPES_HPP
#define FAULTLINE_CORE_TYPES_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace faultline {
namespace core {

/**
 * @brief Ordered list of header name/value pairs.
 *
 * Order and duplicates are preserved because proxied traffic must be
 * forwarded without reordering headers.
 */
using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief One observed request/response exchange through the reverse proxy.
 *
 * Produced by the proxy for callback rules and sniffers and delivered to the
 * test process through the callback relay. Treated as immutable once
 * delivered to a handler.
 */
struct CallbackEvent {
    std::string method;         ///< Request method, e.g. "POST"
    std::string url;            ///< Full request URL as seen by the proxy
    std::string path;           ///< Path and query string
    std::string accessToken;    ///< Bearer token or access_token query value
    int responseCode = 0;       ///< Status code returned to the client
    std::string requestBody;    ///< Raw request body
    std::string responseBody;   ///< Raw response body
    HeaderList requestHeaders;  ///< Request headers as received
};

/**
 * @brief A host-reachable address of a published container port.
 */
struct HostPort {
    std::string host;
    uint16_t port = 0;

    std::string toUrl(const std::string& scheme = "http") const {
        return scheme + "://" + host + ":" + std::to_string(port);
    }
};

} // namespace core
} // namespace faultline

#endif // FAULTLINE_CORE_TYPES_HPP
