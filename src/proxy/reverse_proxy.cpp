// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Fault-injecting reverse proxy with its admin API

#include "faultline/proxy/reverse_proxy.hpp"

#include "faultline/core/json.hpp"
#include "faultline/proxy/rule_codec.hpp"

namespace faultline {
namespace proxy {

namespace {

const char* const CATEGORY = "ReverseProxy";
const char* const ADMIN_CATEGORY = "AdminApi";

const char* const RULES_PATH = "/rules";
const char* const SNIFFERS_PATH = "/sniffers";
const char* const HEALTH_PATH = "/healthz";

http::HttpResponse jsonError(int status, const std::string& errcode, const std::string& message) {
    core::JsonWriter w;
    w.beginObject().key("errcode").value(errcode).key("error").value(message).endObject();
    return http::HttpResponse::json(status, w.str());
}

http::HttpResponse adminError(int status, const std::string& message) {
    core::JsonWriter w;
    w.beginObject().key("error").value(message).endObject();
    return http::HttpResponse::json(status, w.str());
}

} // anonymous namespace

std::string extractAccessToken(const http::HttpRequest& request) {
    auto auth = request.header("Authorization");
    if (auth && auth->size() > 7 && http::equalsIgnoreCase(auth->substr(0, 7), "Bearer ")) {
        std::string token = auth->substr(7);
        size_t first = token.find_first_not_of(' ');
        return first == std::string::npos ? "" : token.substr(first);
    }
    return request.queryParam("access_token").value_or("");
}

ReverseProxy::ReverseProxy(std::shared_ptr<http::IHttpClient> client,
                           std::shared_ptr<core::StructuredLogger> logger)
    : client_(std::move(client))
    , logger_(logger ? std::move(logger) : core::defaultLogger())
    , engine_(logger_) {}

ReverseProxy::~ReverseProxy() {
    stop();
}

// =============================================================================
// Lifecycle
// =============================================================================

core::Result<void, core::Error> ReverseProxy::start(const ReverseProxyOptions& options) {
    using Res = core::Result<void, core::Error>;

    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (running_) {
        return Res::error(core::Error(core::ErrorCode::InvalidState, "reverse proxy already running"));
    }
    if (options.routes.empty()) {
        return Res::error(core::Error(core::ErrorCode::InvalidArgument, "no upstream routes configured"));
    }

    options_ = options;
    frontServers_.clear();
    frontPorts_.clear();
    adminServer_.reset();
    notifier_ = std::make_unique<Notifier>(client_, logger_, options.notifyTimeout);

    auto fail = [this](const core::Error& err) {
        for (auto& server : frontServers_) {
            server->stop();
        }
        frontServers_.clear();
        frontPorts_.clear();
        if (adminServer_) {
            adminServer_->stop();
            adminServer_.reset();
        }
        notifier_->shutdown();
        logger_->error("startup failed: " + err.toString(), CATEGORY);
        return Res::error(err);
    };

    for (size_t i = 0; i < options.routes.size(); ++i) {
        const auto& route = options.routes[i];
        auto upstream = http::parseUrl(route.upstreamUrl);
        if (upstream.isError()) {
            return fail(core::Error(core::ErrorCode::InvalidArgument,
                upstream.error().message, "route " + std::to_string(i)));
        }

        http::HttpServerOptions serverOpts;
        serverOpts.bindAddress = options.bindAddress;
        serverOpts.port = route.listenPort;
        serverOpts.name = CATEGORY;

        auto server = std::make_unique<http::HttpServer>(logger_);
        auto port = server->start(serverOpts, [this, i](const http::HttpRequest& request) {
            return handleProxied(i, request);
        });
        if (port.isError()) {
            return fail(port.error());
        }
        frontPorts_.push_back(port.value());
        frontServers_.push_back(std::move(server));
    }

    http::HttpServerOptions adminOpts;
    adminOpts.bindAddress = options.bindAddress;
    adminOpts.port = options.adminPort;
    adminOpts.name = ADMIN_CATEGORY;

    adminServer_ = std::make_unique<http::HttpServer>(logger_);
    auto admin = adminServer_->start(adminOpts, [this](const http::HttpRequest& request) {
        return handleAdmin(request);
    });
    if (admin.isError()) {
        return fail(admin.error());
    }
    adminPort_ = admin.value();
    running_ = true;

    for (size_t i = 0; i < options.routes.size(); ++i) {
        logger_->info("route :" + std::to_string(frontPorts_[i]) + " -> " +
                      options.routes[i].upstreamUrl, CATEGORY);
    }
    logger_->info("listening on " + options.bindAddress + " (admin :" +
                  std::to_string(adminPort_) + ")", CATEGORY);
    return Res::success();
}

void ReverseProxy::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!running_) {
        return;
    }
    running_ = false;

    if (adminServer_) {
        adminServer_->stop();
    }
    for (auto& server : frontServers_) {
        server->stop();
    }
    notifier_->shutdown();
    logger_->info("stopped (" + std::to_string(notifier_->deliveredCount()) + " notification(s) delivered, " +
                  std::to_string(notifier_->failedCount()) + " failed)", CATEGORY);
}

// =============================================================================
// Proxying
// =============================================================================

http::HttpResponse ReverseProxy::handleProxied(size_t routeIndex, const http::HttpRequest& request) {
    Decision decision = engine_.evaluate(request);
    std::vector<std::string> observers = decision.callbackUrls;
    auto sniffers = engine_.matchingSniffers(request);
    observers.insert(observers.end(), sniffers.begin(), sniffers.end());

    core::TrafficInfo info;
    info.method = request.method;
    info.path = request.target;
    info.listenPort = options_.routes[routeIndex].listenPort;
    info.target = options_.routes[routeIndex].upstreamUrl;

    http::HttpResponse response;
    if (decision.block) {
        response = jsonError(decision.status, "FAULTLINE_INJECTED",
            "request blocked by rule " + std::to_string(decision.ruleIndex));
        info.status = response.status;
        logger_->logTrafficEvent(core::TrafficEventType::Blocked, info, CATEGORY);
    } else {
        bool upstreamFailed = false;
        response = forward(routeIndex, request, upstreamFailed);
        info.status = response.status;
        if (upstreamFailed) {
            logger_->logTrafficEvent(core::TrafficEventType::UpstreamFailed, info, CATEGORY);
        }
        // The rule's budget is already charged, so the override applies even
        // when the upstream could not be reached.
        if (decision.intercepted) {
            response.status = decision.status;
            response.reason.clear();
            info.status = response.status;
            logger_->logTrafficEvent(core::TrafficEventType::StatusRewritten, info, CATEGORY);
        } else if (!upstreamFailed) {
            logger_->logTrafficEvent(core::TrafficEventType::Forwarded, info, CATEGORY);
        }
    }

    if (!observers.empty()) {
        notifyObservers(observers, routeIndex, request, response);
    }
    return response;
}

http::HttpResponse ReverseProxy::forward(size_t routeIndex,
                                         const http::HttpRequest& request,
                                         bool& upstreamFailed) {
    const std::string& upstream = options_.routes[routeIndex].upstreamUrl;

    http::HttpRequest outbound;
    outbound.method = request.method;
    outbound.target = request.target;
    outbound.body = request.body;
    for (const auto& header : request.headers) {
        if (http::isHopByHopHeader(header.first) || http::equalsIgnoreCase(header.first, "Host")) {
            continue;
        }
        outbound.headers.push_back(header);
    }

    auto result = client_->send(upstream + request.target, outbound, options_.upstreamTimeout);
    if (result.isError()) {
        upstreamFailed = true;
        core::LogContext ctx;
        ctx.route = request.target;
        ctx.errorCode = static_cast<int32_t>(core::ErrorCode::UpstreamUnavailable);
        logger_->errorWithContext("upstream " + upstream + " unreachable: " +
                                  result.error().toString(), ctx, CATEGORY);
        return jsonError(502, "FAULTLINE_UPSTREAM_UNAVAILABLE", result.error().message);
    }

    http::HttpResponse response = std::move(result.value());
    for (auto it = response.headers.begin(); it != response.headers.end();) {
        if (http::isHopByHopHeader(it->first) || http::equalsIgnoreCase(it->first, "Content-Length")) {
            it = response.headers.erase(it);
        } else {
            ++it;
        }
    }
    return response;
}

void ReverseProxy::notifyObservers(const std::vector<std::string>& urls,
                                   size_t routeIndex,
                                   const http::HttpRequest& request,
                                   const http::HttpResponse& response) {
    core::CallbackEvent event;
    event.method = request.method;
    event.url = options_.routes[routeIndex].upstreamUrl + request.target;
    event.path = request.target;
    event.accessToken = extractAccessToken(request);
    event.responseCode = response.status;
    event.requestBody = request.body;
    event.responseBody = response.body;
    event.requestHeaders = request.headers;

    for (const auto& url : urls) {
        notifier_->notify(url, event);
    }
}

// =============================================================================
// Admin API
// =============================================================================

http::HttpResponse ReverseProxy::handleAdmin(const http::HttpRequest& request) {
    const std::string path = request.path();
    const std::string& method = request.method;

    if (path == HEALTH_PATH && method == "GET") {
        return http::HttpResponse::json(200, "{}");
    }

    if (path == RULES_PATH) {
        if (method == "POST") {
            auto rules = decodeRuleSet(request.body);
            if (rules.isError()) {
                logger_->warning("rejected rule push: " + rules.error().toString(), ADMIN_CATEGORY);
                return adminError(400, rules.error().toString());
            }
            auto applied = engine_.replaceRules(rules.value());
            if (applied.isError()) {
                return adminError(400, applied.error().toString());
            }
            return http::HttpResponse::json(200, "{}");
        }
        if (method == "DELETE") {
            engine_.clearRules();
            return http::HttpResponse::json(200, "{}");
        }
        if (method == "GET") {
            return http::HttpResponse::json(200, engine_.snapshot().toJson());
        }
        return adminError(405, "method not allowed");
    }

    if (path == SNIFFERS_PATH) {
        if (method != "POST") {
            return adminError(405, "method not allowed");
        }
        auto body = core::parseJson(request.body);
        if (body.isError() || !body.value().isObject()) {
            return adminError(400, "sniffer registration must be a JSON object");
        }
        const auto& doc = body.value();
        for (const auto& member : doc.objectValue) {
            if (member.first != "filter" && member.first != "callback_url") {
                return adminError(400, "unknown field '" + member.first + "'");
            }
        }
        if (!doc["callback_url"].isString() ||
            (doc.contains("filter") && !doc["filter"].isString())) {
            return adminError(400, "'callback_url' and 'filter' must be strings");
        }
        auto id = engine_.addSniffer(doc["filter"].getString(), doc["callback_url"].stringValue);
        if (id.isError()) {
            return adminError(400, id.error().toString());
        }
        core::JsonWriter w;
        w.beginObject().key("id").value(id.value()).endObject();
        return http::HttpResponse::json(200, w.str());
    }

    const std::string prefix = std::string(SNIFFERS_PATH) + "/";
    if (path.compare(0, prefix.size(), prefix) == 0) {
        if (method != "DELETE") {
            return adminError(405, "method not allowed");
        }
        std::string idText = path.substr(prefix.size());
        if (idText.empty() || idText.size() > 19 ||
            idText.find_first_not_of("0123456789") != std::string::npos) {
            return adminError(400, "invalid sniffer id '" + idText + "'");
        }
        if (!engine_.removeSniffer(std::stoull(idText))) {
            return adminError(404, "no sniffer with id " + idText);
        }
        return http::HttpResponse::json(200, "{}");
    }

    return adminError(404, "no route for " + method + " " + path);
}

} // namespace proxy
} // namespace faultline
