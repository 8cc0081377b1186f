// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Asynchronous delivery of callback events

#include "faultline/proxy/notifier.hpp"

#include "faultline/proxy/rule_codec.hpp"

namespace faultline {
namespace proxy {

namespace {
const char* const CATEGORY = "Notifier";
}

Notifier::Notifier(std::shared_ptr<http::IHttpClient> client,
                   std::shared_ptr<core::StructuredLogger> logger,
                   std::chrono::milliseconds timeout)
    : client_(std::move(client))
    , logger_(logger ? std::move(logger) : core::defaultLogger())
    , timeout_(timeout)
    , tasks_(CATEGORY, logger_) {}

Notifier::~Notifier() {
    shutdown();
}

void Notifier::notify(const std::string& url, const core::CallbackEvent& event) {
    std::string body = encodeCallbackEvent(event);
    std::string path = event.path;
    bool spawned = tasks_.spawn([this, url, body = std::move(body), path = std::move(path)]() {
        deliver(url, body, path);
    });
    if (!spawned) {
        logger_->debug("dropping notification for " + path + " after shutdown", CATEGORY);
    }
}

void Notifier::shutdown() {
    tasks_.joinAll();
}

void Notifier::deliver(const std::string& url, const std::string& body, const std::string& path) {
    http::HttpRequest request;
    request.method = "POST";
    request.headers.emplace_back("Content-Type", "application/json");
    request.body = body;

    auto result = client_->send(url, request, timeout_);
    if (result.isError()) {
        failed_++;
        core::LogContext ctx;
        ctx.route = path;
        ctx.errorCode = static_cast<int32_t>(core::ErrorCode::ConnectionFailed);
        logger_->errorWithContext("notification to " + url + " failed: " +
                                  result.error().toString(), ctx, CATEGORY);
        return;
    }

    int status = result.value().status;
    if (status < 200 || status >= 300) {
        failed_++;
        logger_->warning("notification to " + url + " answered " + std::to_string(status), CATEGORY);
        return;
    }

    delivered_++;
    core::TrafficInfo info;
    info.method = "POST";
    info.path = path;
    info.status = status;
    info.target = url;
    logger_->logTrafficEvent(core::TrafficEventType::Notified, info, CATEGORY);
}

} // namespace proxy
} // namespace faultline
