// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Callback relay server receiving proxy notifications in the test process

#include "faultline/harness/callback_server.hpp"

#include "faultline/proxy/rule_codec.hpp"

namespace faultline {
namespace harness {

namespace {
const char* const CATEGORY = "CallbackServer";
}

CallbackServer::CallbackServer(core::CallbackConfig config,
                               std::shared_ptr<core::StructuredLogger> logger)
    : config_(std::move(config))
    , logger_(logger ? std::move(logger) : core::defaultLogger())
    , server_(logger_) {}

CallbackServer::~CallbackServer() {
    stop();
}

core::Result<std::string, core::Error> CallbackServer::start(CallbackHandler handler) {
    using Res = core::Result<std::string, core::Error>;

    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!handler) {
        return Res::error(core::Error(core::ErrorCode::InvalidArgument, "handler is required", CATEGORY));
    }
    if (handlers_) {
        return Res::error(core::Error(core::ErrorCode::InvalidState, "already started", CATEGORY));
    }

    handler_ = std::move(handler);
    handlers_ = std::make_unique<core::TaskGroup>(CATEGORY, logger_);

    http::HttpServerOptions options;
    options.bindAddress = config_.bindAddress;
    options.port = 0;
    options.name = CATEGORY;

    auto port = server_.start(options, [this](const http::HttpRequest& request) {
        return onNotification(request);
    });
    if (port.isError()) {
        handlers_->joinAll();
        return Res::error(port.error());
    }

    url_ = "http://" + config_.advertiseHost + ":" + std::to_string(port.value());
    logger_->debug("relay listening at " + url_, CATEGORY);
    return Res::success(url_);
}

void CallbackServer::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    server_.stop();
    if (handlers_) {
        handlers_->joinAll();
    }
}

http::HttpResponse CallbackServer::onNotification(const http::HttpRequest& request) {
    if (request.method != "POST") {
        return http::HttpResponse::json(405, "{\"error\":\"POST only\"}");
    }

    auto event = proxy::decodeCallbackEvent(request.body);
    if (event.isError()) {
        logger_->warning("malformed notification: " + event.error().toString(), CATEGORY);
        return http::HttpResponse::json(400, "{\"error\":\"malformed callback event\"}");
    }

    received_++;
    auto shared = std::make_shared<core::CallbackEvent>(std::move(event.value()));
    bool spawned = handlers_->spawn([this, shared]() {
        handler_(*shared);
    });
    if (!spawned) {
        logger_->debug("dropping notification for " + shared->path + " after stop", CATEGORY);
    }
    return http::HttpResponse::json(200, "{}");
}

} // namespace harness
} // namespace faultline
