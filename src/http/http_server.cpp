// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// HTTP/1.1 listener on the network PAL

#include "faultline/http/http_server.hpp"

#include "faultline/core/json.hpp"
#include "faultline/pal/linux/linux_network_pal.hpp"

namespace faultline {
namespace http {

namespace {

constexpr size_t READ_CHUNK_SIZE = 16 * 1024;

HttpResponse errorResponse(int status, const std::string& message) {
    core::JsonWriter w;
    w.beginObject().key("error").value(message).endObject();
    return HttpResponse::json(status, w.str());
}

} // anonymous namespace

HttpServer::HttpServer(std::shared_ptr<core::StructuredLogger> logger)
    : logger_(logger ? std::move(logger) : core::defaultLogger()) {}

HttpServer::~HttpServer() {
    stop();
}

core::Result<uint16_t, core::Error> HttpServer::start(
    const HttpServerOptions& options,
    RequestHandler handler
) {
    using Res = core::Result<uint16_t, core::Error>;

    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (started_) {
        return Res::error(core::Error(core::ErrorCode::InvalidState,
            "server already started", options.name));
    }
    if (!handler) {
        return Res::error(core::Error(core::ErrorCode::InvalidArgument,
            "request handler is required", options.name));
    }

    options_ = options;
    handler_ = std::move(handler);

    pal_ = std::make_unique<pal::linux::LinuxNetworkPAL>();
    auto init = pal_->initialize();
    if (init.isError()) {
        return Res::error(core::Error(core::ErrorCode::NetworkError,
            "network initialization failed: " + init.error().message, options.name));
    }

    pal::ServerOptions serverOpts;
    serverOpts.reuseAddr = true;
    auto server = pal_->createServer(options.bindAddress, options.port, serverOpts);
    if (server.isError()) {
        return Res::error(core::Error(core::ErrorCode::BindFailed,
            server.error().message, options.name));
    }

    serverSocket_ = server.value();
    port_ = serverSocket_.port;
    tasks_ = std::make_unique<core::TaskGroup>(options.name, logger_);
    started_ = true;
    running_ = true;

    acceptNext();
    loopThread_ = std::thread([this]() {
        pal_->runEventLoop();
    });

    logger_->debug("serving on " + options.bindAddress + ":" + std::to_string(port_), options.name);
    return Res::success(port_);
}

void HttpServer::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!running_.exchange(false)) {
        return;
    }

    pal_->stopEventLoop();
    if (loopThread_.joinable()) {
        loopThread_.join();
    }

    // Handlers may still be running; they find their connection gone and
    // their write fails quietly.
    std::map<uint64_t, std::shared_ptr<Connection>> open;
    {
        std::lock_guard<std::mutex> connLock(connectionsMutex_);
        open.swap(connections_);
    }
    for (auto& entry : open) {
        pal_->closeSocket(entry.second->socket);
    }
    pal_->closeSocket(serverSocket_.handle);

    tasks_->joinAll();
    logger_->debug("stopped listener on port " + std::to_string(port_), options_.name);
}

// =============================================================================
// Connection handling (event loop thread)
// =============================================================================

void HttpServer::acceptNext() {
    pal_->asyncAccept(serverSocket_,
        [this](core::Result<pal::SocketHandle, pal::NetworkError> result) {
            if (!running_.load()) {
                if (result.isSuccess()) {
                    pal_->closeSocket(result.value());
                }
                return;
            }

            if (result.isError()) {
                if (result.error().code == pal::NetworkErrorCode::SocketNotFound) {
                    return;
                }
                logger_->warning("accept failed: " + result.error().message, options_.name);
                acceptNext();
                return;
            }

            auto conn = std::make_shared<Connection>(result.value(), options_.maxRequestSize);
            {
                std::lock_guard<std::mutex> lock(connectionsMutex_);
                connections_[conn->socket.value] = conn;
            }
            readMore(conn);
            acceptNext();
        });
}

void HttpServer::readMore(const std::shared_ptr<Connection>& conn) {
    pal_->asyncRead(conn->socket, conn->readBuffer, READ_CHUNK_SIZE,
        [this, conn](core::Result<size_t, pal::NetworkError> result) {
            onRead(conn, std::move(result));
        });
}

void HttpServer::onRead(
    const std::shared_ptr<Connection>& conn,
    core::Result<size_t, pal::NetworkError> result
) {
    if (result.isError()) {
        if (result.error().code != pal::NetworkErrorCode::ConnectionClosed &&
            result.error().code != pal::NetworkErrorCode::SocketNotFound) {
            logger_->debug("read failed: " + result.error().message, options_.name);
        }
        release(conn);
        return;
    }

    auto parsed = conn->parser.feed(
        reinterpret_cast<const char*>(conn->readBuffer.data()), result.value());
    if (parsed.isError()) {
        const HttpError& err = parsed.error();
        int status = err.code == HttpError::Code::RequestTooLarge ? 413 : 400;
        auto peer = pal_->getPeerAddress(conn->socket);
        logger_->warning("rejecting request from " + peer.valueOr("unknown peer") + ": " + err.toString(),
                         options_.name);
        respond(conn, errorResponse(status, err.message));
        return;
    }

    if (!parsed.value()) {
        readMore(conn);
        return;
    }

    dispatch(conn, conn->parser.takeRequest());
}

void HttpServer::dispatch(const std::shared_ptr<Connection>& conn, HttpRequest request) {
    auto task = [this, conn, request = std::move(request)]() {
        HttpResponse response;
        try {
            response = handler_(request);
        } catch (const std::exception& e) {
            logger_->error("handler failed for " + request.method + " " + request.target +
                           ": " + e.what(), options_.name);
            response = errorResponse(500, "internal error");
        }
        respond(conn, response);
    };

    if (!tasks_->spawn(std::move(task))) {
        release(conn);
    }
}

void HttpServer::respond(const std::shared_ptr<Connection>& conn, const HttpResponse& response) {
    core::Buffer wire(serializeResponse(response));
    pal_->asyncWrite(conn->socket, wire,
        [this, conn](core::Result<size_t, pal::NetworkError> result) {
            if (result.isError() &&
                result.error().code != pal::NetworkErrorCode::SocketNotFound) {
                logger_->debug("write failed: " + result.error().message, options_.name);
            }
            release(conn);
        });
}

void HttpServer::release(const std::shared_ptr<Connection>& conn) {
    bool owned = false;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        // Descriptor numbers are reused; only drop the entry if it is ours.
        auto it = connections_.find(conn->socket.value);
        if (it != connections_.end() && it->second == conn) {
            connections_.erase(it);
            owned = true;
        }
    }
    if (owned) {
        pal_->closeSocket(conn->socket);
    }
}

} // namespace http
} // namespace faultline
