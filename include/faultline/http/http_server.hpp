// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// HTTP/1.1 listener on the network PAL

#ifndef FAULTLINE_HTTP_HTTP_SERVER_HPP
#define FAULTLINE_HTTP_HTTP_SERVER_HPP

#include "faultline/core/buffer.hpp"
#include "faultline/core/error_codes.hpp"
#include "faultline/core/result.hpp"
#include "faultline/core/structured_logger.hpp"
#include "faultline/core/task_group.hpp"
#include "faultline/http/http_message.hpp"
#include "faultline/pal/network_pal.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace faultline {
namespace http {

/**
 * @brief Produces the response for one request. Runs on a worker task.
 */
using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

struct HttpServerOptions {
    std::string bindAddress = "0.0.0.0";
    uint16_t port = 0;                        ///< 0 = ephemeral
    size_t maxRequestSize = HttpRequestParser::DEFAULT_MAX_REQUEST_SIZE;
    std::string name = "HttpServer";          ///< Log category and task group name
};

/**
 * @brief Minimal HTTP/1.1 server: one request per connection.
 *
 * The event loop thread accepts connections and parses requests. Each
 * complete request is handed to the handler on its own task, so a slow
 * handler never stalls the loop. Every response closes its connection.
 *
 * A server instance is started at most once.
 */
class HttpServer {
public:
    explicit HttpServer(std::shared_ptr<core::StructuredLogger> logger = nullptr);

    /**
     * @brief Stops the server.
     */
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind, listen and start serving.
     *
     * @return The bound port
     */
    core::Result<uint16_t, core::Error> start(const HttpServerOptions& options, RequestHandler handler);

    /**
     * @brief Stop accepting, close open connections and join handler tasks.
     *
     * Idempotent and safe if the server never started.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    uint16_t port() const { return port_; }

private:
    struct Connection {
        pal::SocketHandle socket;
        core::Buffer readBuffer;
        HttpRequestParser parser;

        Connection(pal::SocketHandle s, size_t maxRequestSize)
            : socket(s), parser(maxRequestSize) {}
    };

    void acceptNext();

    void readMore(const std::shared_ptr<Connection>& conn);

    void onRead(const std::shared_ptr<Connection>& conn,
                core::Result<size_t, pal::NetworkError> result);

    void dispatch(const std::shared_ptr<Connection>& conn, HttpRequest request);

    void respond(const std::shared_ptr<Connection>& conn, const HttpResponse& response);

    void release(const std::shared_ptr<Connection>& conn);

    std::shared_ptr<core::StructuredLogger> logger_;
    HttpServerOptions options_;
    RequestHandler handler_;

    std::unique_ptr<pal::INetworkPAL> pal_;
    pal::ServerSocket serverSocket_{};
    std::thread loopThread_;
    std::unique_ptr<core::TaskGroup> tasks_;

    std::mutex connectionsMutex_;
    std::map<uint64_t, std::shared_ptr<Connection>> connections_;

    std::mutex lifecycleMutex_;
    std::atomic<bool> running_{false};
    bool started_ = false;
    uint16_t port_ = 0;
};

} // namespace http
} // namespace faultline

#endif // FAULTLINE_HTTP_HTTP_SERVER_HPP
