// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// JSON wire format of rule sets and callback events

#include "faultline/proxy/rule_codec.hpp"

#include <functional>
#include <limits>

namespace faultline {
namespace proxy {

const char* actionName(const Action& action) {
    struct Visitor {
        const char* operator()(const StatusOverride&) const { return "status_override"; }
        const char* operator()(const Block&) const { return "block"; }
        const char* operator()(const Callback&) const { return "callback"; }
        const char* operator()(const Sniff&) const { return "sniff"; }
    };
    return std::visit(Visitor{}, action);
}

namespace {

constexpr const char* KEY_STATUSCODE = "statuscode";
constexpr const char* KEY_CALLBACK = "callback";

core::Error ruleError(const std::string& message, const std::string& where) {
    return core::Error(core::ErrorCode::InvalidRule, message, where);
}

using EntryDecoder = std::function<core::Result<Rule, core::Error>(const core::JsonValue&, const std::string&)>;

/**
 * @brief Apply a decoder to an object or to each object of an array.
 */
core::Result<void, core::Error> decodeEntries(
    const core::JsonValue& value,
    const std::string& key,
    const EntryDecoder& decode,
    RuleSet& out
) {
    using Res = core::Result<void, core::Error>;

    if (value.isObject()) {
        auto rule = decode(value, key);
        if (rule.isError()) {
            return Res::error(rule.error());
        }
        out.push_back(std::move(rule.value()));
        return Res::success();
    }

    if (value.isArray()) {
        for (size_t i = 0; i < value.arrayValue.size(); ++i) {
            std::string where = key + "[" + std::to_string(i) + "]";
            if (!value.arrayValue[i].isObject()) {
                return Res::error(ruleError("expected an object", where));
            }
            auto rule = decode(value.arrayValue[i], where);
            if (rule.isError()) {
                return Res::error(rule.error());
            }
            out.push_back(std::move(rule.value()));
        }
        return Res::success();
    }

    return Res::error(ruleError("expected an object or an array of objects", key));
}

core::Result<std::string, core::Error> optionalFilter(const core::JsonValue& entry, const std::string& where) {
    using Res = core::Result<std::string, core::Error>;
    if (!entry.contains("filter")) {
        return Res::success("");
    }
    const auto& filter = entry["filter"];
    if (!filter.isString()) {
        return Res::error(ruleError("'filter' must be a string", where));
    }
    return Res::success(filter.stringValue);
}

core::Result<Rule, core::Error> decodeStatusCode(const core::JsonValue& entry, const std::string& where) {
    using Res = core::Result<Rule, core::Error>;

    for (const auto& member : entry.objectValue) {
        const std::string& name = member.first;
        if (name != "return_status" && name != "filter" &&
            name != "block_request" && name != "count") {
            return Res::error(ruleError("unknown field '" + name + "'", where));
        }
    }

    if (!entry.contains("return_status")) {
        return Res::error(ruleError("'return_status' is required", where));
    }
    const auto& status = entry["return_status"];
    if (!status.isInteger() || status.numberValue < 100 || status.numberValue > 599) {
        return Res::error(ruleError("'return_status' must be an integer in 100-599", where));
    }

    bool block = false;
    if (entry.contains("block_request")) {
        if (!entry["block_request"].isBool()) {
            return Res::error(ruleError("'block_request' must be a boolean", where));
        }
        block = entry["block_request"].boolValue;
    }

    std::optional<uint32_t> budget;
    if (entry.contains("count")) {
        const auto& count = entry["count"];
        if (!count.isInteger() || count.numberValue < 1 ||
            count.numberValue > static_cast<double>(std::numeric_limits<uint32_t>::max())) {
            return Res::error(ruleError("'count' must be a positive integer", where));
        }
        budget = static_cast<uint32_t>(count.numberValue);
    }

    auto filter = optionalFilter(entry, where);
    if (filter.isError()) {
        return Res::error(filter.error());
    }

    int code = static_cast<int>(status.numberValue);
    Rule rule;
    rule.filter = filter.value();
    rule.budget = budget;
    if (block) {
        rule.action = Block{code};
    } else {
        rule.action = StatusOverride{code};
    }
    return Res::success(std::move(rule));
}

core::Result<Rule, core::Error> decodeCallback(const core::JsonValue& entry, const std::string& where) {
    using Res = core::Result<Rule, core::Error>;

    for (const auto& member : entry.objectValue) {
        const std::string& name = member.first;
        if (name == "count") {
            return Res::error(ruleError("'count' is only allowed for statuscode rules", where));
        }
        if (name != "callback_url" && name != "filter") {
            return Res::error(ruleError("unknown field '" + name + "'", where));
        }
    }

    const auto& url = entry["callback_url"];
    if (!url.isString() || url.stringValue.empty()) {
        return Res::error(ruleError("'callback_url' must be a non-empty string", where));
    }

    auto filter = optionalFilter(entry, where);
    if (filter.isError()) {
        return Res::error(filter.error());
    }

    return Res::success(Rule::callback(filter.value(), url.stringValue));
}

void writeHeaders(core::JsonWriter& w, const core::HeaderList& headers) {
    w.beginArray();
    for (const auto& h : headers) {
        w.beginArray().value(h.first).value(h.second).endArray();
    }
    w.endArray();
}

} // anonymous namespace

// =============================================================================
// Rule sets
// =============================================================================

core::Result<RuleSet, core::Error> decodeRuleSet(const std::string& json) {
    auto parsed = core::parseJson(json);
    if (parsed.isError()) {
        return core::Result<RuleSet, core::Error>::error(
            ruleError("invalid JSON: " + parsed.error().toString(), "rules"));
    }
    return decodeRuleSet(parsed.value());
}

core::Result<RuleSet, core::Error> decodeRuleSet(const core::JsonValue& document) {
    using Res = core::Result<RuleSet, core::Error>;

    if (!document.isObject()) {
        return Res::error(ruleError("rule document must be an object", "rules"));
    }
    for (const auto& member : document.objectValue) {
        if (member.first != KEY_STATUSCODE && member.first != KEY_CALLBACK) {
            return Res::error(ruleError("unknown rule kind '" + member.first + "'", "rules"));
        }
    }

    RuleSet rules;
    if (document.contains(KEY_STATUSCODE)) {
        auto r = decodeEntries(document[KEY_STATUSCODE], KEY_STATUSCODE, decodeStatusCode, rules);
        if (r.isError()) {
            return Res::error(r.error());
        }
    }
    if (document.contains(KEY_CALLBACK)) {
        auto r = decodeEntries(document[KEY_CALLBACK], KEY_CALLBACK, decodeCallback, rules);
        if (r.isError()) {
            return Res::error(r.error());
        }
    }
    return Res::success(std::move(rules));
}

std::string encodeRuleSet(const RuleSet& rules) {
    core::JsonWriter w;
    w.beginObject();

    bool anyStatus = false;
    bool anyCallback = false;
    for (const auto& rule : rules) {
        anyStatus = anyStatus || isIntercept(rule.action);
        anyCallback = anyCallback || !isIntercept(rule.action);
    }

    if (anyStatus) {
        w.key(KEY_STATUSCODE).beginArray();
        for (const auto& rule : rules) {
            if (!isIntercept(rule.action)) {
                continue;
            }
            const auto* block = std::get_if<Block>(&rule.action);
            int status = block ? block->status : std::get<StatusOverride>(rule.action).status;

            w.beginObject();
            w.key("return_status").value(status);
            if (!rule.filter.empty()) {
                w.key("filter").value(rule.filter);
            }
            if (block) {
                w.key("block_request").value(true);
            }
            if (rule.budget) {
                w.key("count").value(static_cast<uint64_t>(*rule.budget));
            }
            w.endObject();
        }
        w.endArray();
    }

    if (anyCallback) {
        w.key(KEY_CALLBACK).beginArray();
        for (const auto& rule : rules) {
            if (isIntercept(rule.action)) {
                continue;
            }
            const auto* callback = std::get_if<Callback>(&rule.action);
            const std::string& url = callback ? callback->url : std::get<Sniff>(rule.action).url;

            w.beginObject();
            w.key("callback_url").value(url);
            if (!rule.filter.empty()) {
                w.key("filter").value(rule.filter);
            }
            w.endObject();
        }
        w.endArray();
    }

    w.endObject();
    return w.str();
}

// =============================================================================
// Callback events
// =============================================================================

std::string encodeCallbackEvent(const core::CallbackEvent& event) {
    core::JsonWriter w;
    w.beginObject()
        .key("method").value(event.method)
        .key("url").value(event.url)
        .key("path").value(event.path)
        .key("access_token").value(event.accessToken)
        .key("response_code").value(event.responseCode)
        .key("request_body").value(event.requestBody)
        .key("response_body").value(event.responseBody)
        .key("request_headers");
    writeHeaders(w, event.requestHeaders);
    w.endObject();
    return w.str();
}

core::Result<core::CallbackEvent, core::Error> decodeCallbackEvent(const std::string& json) {
    using Res = core::Result<core::CallbackEvent, core::Error>;

    auto parsed = core::parseJson(json);
    if (parsed.isError()) {
        return Res::error(core::Error(core::ErrorCode::MalformedRequest,
            "invalid JSON: " + parsed.error().toString(), "callback event"));
    }
    const auto& doc = parsed.value();
    if (!doc.isObject()) {
        return Res::error(core::Error(core::ErrorCode::MalformedRequest,
            "callback event must be an object", "callback event"));
    }

    const auto& method = doc["method"];
    const auto& url = doc["url"];
    const auto& code = doc["response_code"];
    if (!method.isString() || !url.isString() || !code.isInteger()) {
        return Res::error(core::Error(core::ErrorCode::MalformedRequest,
            "'method', 'url' and 'response_code' are required", "callback event"));
    }

    core::CallbackEvent event;
    event.method = method.stringValue;
    event.url = url.stringValue;
    event.path = doc["path"].getString();
    event.accessToken = doc["access_token"].getString();
    event.responseCode = static_cast<int>(code.numberValue);
    event.requestBody = doc["request_body"].getString();
    event.responseBody = doc["response_body"].getString();

    const auto& headers = doc["request_headers"];
    if (headers.isArray()) {
        for (const auto& pair : headers.arrayValue) {
            if (pair.isArray() && pair.arrayValue.size() == 2 &&
                pair.arrayValue[0].isString() && pair.arrayValue[1].isString()) {
                event.requestHeaders.emplace_back(pair.arrayValue[0].stringValue,
                                                  pair.arrayValue[1].stringValue);
            }
        }
    }
    return Res::success(std::move(event));
}

} // namespace proxy
} // namespace faultline
