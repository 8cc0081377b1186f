// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Rule table and sniffer registry of the reverse proxy

#include "faultline/proxy/rule_engine.hpp"

#include "faultline/core/json.hpp"

namespace faultline {
namespace proxy {

namespace {

const char* const CATEGORY = "RuleEngine";

std::string describe(const Rule& rule, const FilterExpression& filter) {
    std::string text = actionName(rule.action);
    if (const auto* s = std::get_if<StatusOverride>(&rule.action)) {
        text += " " + std::to_string(s->status);
    } else if (const auto* b = std::get_if<Block>(&rule.action)) {
        text += " " + std::to_string(b->status);
    }
    if (filter.matchesEverything()) {
        text += " on every request";
    } else {
        text += " filter='" + rule.filter + "'";
    }
    if (rule.budget) {
        text += " count=" + std::to_string(*rule.budget);
    }
    return text;
}

} // anonymous namespace

bool RuleEngine::CompiledRule::tryConsume() const {
    if (!rule.budget) {
        return true;
    }
    uint32_t current = remaining.load();
    while (current > 0) {
        if (remaining.compare_exchange_weak(current, current - 1)) {
            return true;
        }
    }
    return false;
}

std::string EngineSnapshot::toJson() const {
    core::JsonWriter w;
    w.beginObject().key("rules").beginArray();
    for (const auto& r : rules) {
        w.beginObject()
            .key("index").value(static_cast<uint64_t>(r.index))
            .key("action").value(r.action)
            .key("filter").value(r.filter);
        if (r.status != 0) {
            w.key("status").value(r.status);
        }
        if (!r.url.empty()) {
            w.key("url").value(r.url);
        }
        w.key("remaining");
        if (r.remaining) {
            w.value(static_cast<uint64_t>(*r.remaining));
        } else {
            w.nullValue();
        }
        w.endObject();
    }
    w.endArray().key("sniffers").value(static_cast<uint64_t>(snifferCount)).endObject();
    return w.str();
}

RuleEngine::RuleEngine(std::shared_ptr<core::StructuredLogger> logger)
    : logger_(logger ? std::move(logger) : core::defaultLogger())
    , table_(std::make_shared<const RuleTable>()) {}

// =============================================================================
// Rule table
// =============================================================================

core::Result<void, core::Error> RuleEngine::replaceRules(const RuleSet& rules) {
    auto table = std::make_shared<RuleTable>();
    table->reserve(rules.size());

    for (size_t i = 0; i < rules.size(); ++i) {
        auto filter = FilterExpression::parse(rules[i].filter);
        if (filter.isError()) {
            core::Error err = filter.error();
            err.context = "rule " + std::to_string(i) + ", " + err.context;
            logger_->warning("rejected rule set: " + err.toString(), CATEGORY);
            return core::Result<void, core::Error>::error(err);
        }
        table->push_back(std::make_unique<CompiledRule>(rules[i], std::move(filter.value())));
    }

    std::shared_ptr<const RuleTable> applied = std::move(table);
    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        table_ = applied;
    }

    logger_->info("applied " + std::to_string(applied->size()) + " rule(s)", CATEGORY);
    for (size_t i = 0; i < applied->size(); ++i) {
        const CompiledRule& compiled = *(*applied)[i];
        logger_->debug("  [" + std::to_string(i) + "] " + describe(compiled.rule, compiled.filter), CATEGORY);
    }
    return core::Result<void, core::Error>::success();
}

void RuleEngine::clearRules() {
    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        table_ = std::make_shared<const RuleTable>();
    }
    logger_->info("cleared rules", CATEGORY);
}

std::shared_ptr<const RuleEngine::RuleTable> RuleEngine::currentTable() const {
    std::lock_guard<std::mutex> lock(tableMutex_);
    return table_;
}

size_t RuleEngine::ruleCount() const {
    return currentTable()->size();
}

Decision RuleEngine::evaluate(const http::HttpRequest& request) {
    auto table = currentTable();

    Decision decision;
    for (size_t i = 0; i < table->size(); ++i) {
        const CompiledRule& compiled = *(*table)[i];
        const Action& action = compiled.rule.action;

        if (isIntercept(action)) {
            if (decision.intercepted || !compiled.filter.matches(request)) {
                continue;
            }
            if (!compiled.tryConsume()) {
                continue;
            }
            decision.intercepted = true;
            decision.ruleIndex = static_cast<int>(i);
            if (const auto* block = std::get_if<Block>(&action)) {
                decision.block = true;
                decision.status = block->status;
            } else {
                decision.status = std::get<StatusOverride>(action).status;
            }
            continue;
        }

        if (!compiled.filter.matches(request) || !compiled.tryConsume()) {
            continue;
        }
        if (const auto* callback = std::get_if<Callback>(&action)) {
            decision.callbackUrls.push_back(callback->url);
        } else {
            decision.callbackUrls.push_back(std::get<Sniff>(action).url);
        }
    }
    return decision;
}

// =============================================================================
// Sniffers
// =============================================================================

core::Result<uint64_t, core::Error> RuleEngine::addSniffer(const std::string& filter, const std::string& url) {
    if (url.empty()) {
        return core::Result<uint64_t, core::Error>::error(
            core::Error(core::ErrorCode::InvalidRule, "sniffer needs a callback URL", "sniffer"));
    }
    auto compiled = FilterExpression::parse(filter);
    if (compiled.isError()) {
        return core::Result<uint64_t, core::Error>::error(compiled.error());
    }

    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(sniffersMutex_);
        id = nextSnifferId_++;
        sniffers_.emplace(id, Sniffer{std::move(compiled.value()), url});
    }
    logger_->info("sniffer " + std::to_string(id) + " added for '" + filter + "' -> " + url, CATEGORY);
    return core::Result<uint64_t, core::Error>::success(id);
}

bool RuleEngine::removeSniffer(uint64_t id) {
    size_t removed;
    {
        std::lock_guard<std::mutex> lock(sniffersMutex_);
        removed = sniffers_.erase(id);
    }
    if (removed > 0) {
        logger_->info("sniffer " + std::to_string(id) + " removed", CATEGORY);
    }
    return removed > 0;
}

std::vector<std::string> RuleEngine::matchingSniffers(const http::HttpRequest& request) const {
    std::vector<std::string> urls;
    std::lock_guard<std::mutex> lock(sniffersMutex_);
    for (const auto& entry : sniffers_) {
        if (entry.second.filter.matches(request)) {
            urls.push_back(entry.second.url);
        }
    }
    return urls;
}

EngineSnapshot RuleEngine::snapshot() const {
    auto table = currentTable();

    EngineSnapshot snap;
    for (size_t i = 0; i < table->size(); ++i) {
        const CompiledRule& compiled = *(*table)[i];
        RuleStatus status;
        status.index = i;
        status.filter = compiled.rule.filter;
        status.action = actionName(compiled.rule.action);
        if (const auto* s = std::get_if<StatusOverride>(&compiled.rule.action)) {
            status.status = s->status;
        } else if (const auto* b = std::get_if<Block>(&compiled.rule.action)) {
            status.status = b->status;
        } else if (const auto* c = std::get_if<Callback>(&compiled.rule.action)) {
            status.url = c->url;
        } else {
            status.url = std::get<Sniff>(compiled.rule.action).url;
        }
        if (compiled.rule.budget) {
            status.remaining = compiled.remaining.load();
        }
        snap.rules.push_back(std::move(status));
    }
    {
        std::lock_guard<std::mutex> lock(sniffersMutex_);
        snap.snifferCount = sniffers_.size();
    }
    return snap;
}

} // namespace proxy
} // namespace faultline
