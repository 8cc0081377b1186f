// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Test-side client of the reverse proxy admin API

#include "faultline/harness/proxy_controller.hpp"

#include "faultline/core/json.hpp"
#include "faultline/proxy/rule_codec.hpp"

#include <optional>
#include <variant>

namespace faultline {
namespace harness {

namespace {
const char* const CATEGORY = "ProxyController";
}

constexpr std::chrono::milliseconds ProxyController::DEFAULT_TIMEOUT;

ProxyController::ProxyController(std::string adminUrl,
                                 std::shared_ptr<http::IHttpClient> client,
                                 std::shared_ptr<core::StructuredLogger> logger,
                                 std::chrono::milliseconds timeout)
    : adminUrl_(std::move(adminUrl))
    , client_(std::move(client))
    , logger_(logger ? std::move(logger) : core::defaultLogger())
    , timeout_(timeout) {
    while (!adminUrl_.empty() && adminUrl_.back() == '/') {
        adminUrl_.pop_back();
    }
}

bool ProxyController::isTerminated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminated_;
}

core::Result<void, core::Error> ProxyController::checkUsableLocked() const {
    if (terminated_) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::InvalidState, "controller already terminated", adminUrl_));
    }
    return core::Result<void, core::Error>::success();
}

core::Result<std::string, core::Error> ProxyController::callLocked(
    const std::string& method,
    const std::string& path,
    const std::string& body
) {
    using Res = core::Result<std::string, core::Error>;

    http::HttpRequest request;
    request.method = method;
    request.target = path;
    request.body = body;
    if (!body.empty()) {
        request.headers.emplace_back("Content-Type", "application/json");
    }

    auto result = client_->send(adminUrl_ + path, request, timeout_);
    if (result.isError()) {
        return Res::error(core::Error(core::ErrorCode::RulePushFailed,
            result.error().toString(), method + " " + adminUrl_ + path));
    }

    const http::HttpResponse& response = result.value();
    if (response.status < 200 || response.status >= 300) {
        return Res::error(core::Error(core::ErrorCode::RulePushRejected,
            "HTTP " + std::to_string(response.status) + ": " + response.body,
            method + " " + adminUrl_ + path));
    }
    return Res::success(response.body);
}

core::Result<void, core::Error> ProxyController::setRules(const proxy::RuleSet& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto usable = checkUsableLocked();
    if (usable.isError()) {
        return usable;
    }

    for (const auto& rule : rules) {
        if (std::holds_alternative<proxy::Sniff>(rule.action)) {
            return core::Result<void, core::Error>::error(core::Error(core::ErrorCode::InvalidRule,
                "sniff rules are registered with addSniffer", adminUrl_));
        }
    }

    auto result = callLocked("POST", "/rules", proxy::encodeRuleSet(rules));
    if (result.isError()) {
        logger_->error("rule push failed: " + result.error().toString(), CATEGORY);
        return core::Result<void, core::Error>::error(result.error());
    }
    logger_->info("pushed " + std::to_string(rules.size()) + " rule(s)", CATEGORY);
    return core::Result<void, core::Error>::success();
}

core::Result<void, core::Error> ProxyController::clearRules() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto usable = checkUsableLocked();
    if (usable.isError()) {
        return usable;
    }

    auto result = callLocked("DELETE", "/rules", "");
    if (result.isError()) {
        logger_->error("clearing rules failed: " + result.error().toString(), CATEGORY);
        return core::Result<void, core::Error>::error(result.error());
    }
    logger_->debug("cleared rules", CATEGORY);
    return core::Result<void, core::Error>::success();
}

core::Result<uint64_t, core::Error> ProxyController::addSniffer(const std::string& filter,
                                                                const std::string& callbackUrl) {
    using Res = core::Result<uint64_t, core::Error>;

    std::lock_guard<std::mutex> lock(mutex_);
    auto usable = checkUsableLocked();
    if (usable.isError()) {
        return Res::error(usable.error());
    }

    core::JsonWriter w;
    w.beginObject().key("filter").value(filter).key("callback_url").value(callbackUrl).endObject();

    auto result = callLocked("POST", "/sniffers", w.str());
    if (result.isError()) {
        logger_->error("sniffer registration failed: " + result.error().toString(), CATEGORY);
        return Res::error(result.error());
    }

    auto parsed = core::parseJson(result.value());
    if (parsed.isError() || !parsed.value()["id"].isInteger() || parsed.value()["id"].numberValue < 0) {
        return Res::error(core::Error(core::ErrorCode::RulePushRejected,
            "unexpected sniffer registration answer: " + result.value(), adminUrl_));
    }

    uint64_t id = static_cast<uint64_t>(parsed.value()["id"].numberValue);
    sniffers_.insert(id);
    logger_->debug("sniffer " + std::to_string(id) + " on '" + filter + "'", CATEGORY);
    return Res::success(id);
}

core::Result<void, core::Error> ProxyController::removeSniffer(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto usable = checkUsableLocked();
    if (usable.isError()) {
        return usable;
    }

    auto result = callLocked("DELETE", "/sniffers/" + std::to_string(id), "");
    sniffers_.erase(id);
    if (result.isError()) {
        logger_->warning("removing sniffer " + std::to_string(id) + " failed: " +
                         result.error().toString(), CATEGORY);
        return core::Result<void, core::Error>::error(result.error());
    }
    return core::Result<void, core::Error>::success();
}

core::Result<void, core::Error> ProxyController::terminate() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminated_) {
        return core::Result<void, core::Error>::success();
    }

    std::optional<core::Error> firstError;
    auto cleared = callLocked("DELETE", "/rules", "");
    if (cleared.isError()) {
        firstError = cleared.error();
    }
    for (uint64_t id : sniffers_) {
        auto removed = callLocked("DELETE", "/sniffers/" + std::to_string(id), "");
        if (removed.isError() && !firstError) {
            firstError = removed.error();
        }
    }
    sniffers_.clear();
    terminated_ = true;

    if (firstError) {
        logger_->warning("terminate incomplete: " + firstError->toString(), CATEGORY);
        return core::Result<void, core::Error>::error(*firstError);
    }
    logger_->debug("terminated", CATEGORY);
    return core::Result<void, core::Error>::success();
}

// =============================================================================
// Scoped rules
// =============================================================================

void withRules(ProxyController& controller,
               ITestReporter& reporter,
               const proxy::RuleSet& rules,
               const std::function<void()>& action) {
    auto pushed = controller.setRules(rules);
    if (pushed.isError()) {
        reporter.fatal("failed to push rules: " + pushed.error().toString());
    }

    struct ClearOnExit {
        ProxyController& controller;
        ITestReporter& reporter;

        ~ClearOnExit() {
            auto cleared = controller.clearRules();
            if (cleared.isError()) {
                reporter.error("failed to clear rules: " + cleared.error().toString());
            }
        }
    } guard{controller, reporter};

    action();
}

} // namespace harness
} // namespace faultline
