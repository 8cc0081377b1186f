// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Rule table and sniffer registry of the reverse proxy

#ifndef FAULTLINE_PROXY_RULE_ENGINE_HPP
#define FAULTLINE_PROXY_RULE_ENGINE_HPP

#include "faultline/core/error_codes.hpp"
#include "faultline/core/result.hpp"
#include "faultline/core/structured_logger.hpp"
#include "faultline/http/http_message.hpp"
#include "faultline/proxy/filter_expression.hpp"
#include "faultline/proxy/rule.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace faultline {
namespace proxy {

/**
 * @brief What the proxy does with one request.
 */
struct Decision {
    bool intercepted = false;             ///< An intercept rule fired
    bool block = false;                   ///< Short-circuit; do not contact the upstream
    int status = 0;                       ///< Status to answer with or rewrite to
    int ruleIndex = -1;                   ///< Index of the firing rule in its set
    std::vector<std::string> callbackUrls;///< Every matching callback/sniff rule
};

struct RuleStatus {
    size_t index = 0;
    std::string filter;
    std::string action;
    int status = 0;                       ///< 0 for observing actions
    std::string url;                      ///< Empty for intercept actions
    std::optional<uint32_t> remaining;    ///< Absent = unlimited
};

struct EngineSnapshot {
    std::vector<RuleStatus> rules;
    size_t snifferCount = 0;

    std::string toJson() const;
};

/**
 * @brief Thread-safe rule evaluation.
 *
 * The active rule table is an immutable snapshot; replaceRules() compiles a
 * new table and swaps it in under a lock, so evaluate() never sees a
 * partially applied push. Budgets are per-rule atomic counters decremented
 * with compare-and-swap, so N concurrent matches against a budget of K < N
 * fire exactly K times.
 *
 * Sniffers are kept apart from the rule table and survive rule pushes.
 */
class RuleEngine {
public:
    explicit RuleEngine(std::shared_ptr<core::StructuredLogger> logger = nullptr);

    /**
     * @brief Replace the active rule set.
     *
     * Every filter is compiled before the swap. On error the previous set
     * stays active.
     */
    core::Result<void, core::Error> replaceRules(const RuleSet& rules);

    void clearRules();

    /**
     * @brief Decide the fate of a request and consume budget.
     *
     * Intercept rules are tried in order; the first that matches and still
     * has budget fires and is the only one charged. Callback and sniff rules
     * with a matching filter are all reported.
     */
    Decision evaluate(const http::HttpRequest& request);

    core::Result<uint64_t, core::Error> addSniffer(const std::string& filter, const std::string& url);

    /**
     * @return false if no sniffer has this id
     */
    bool removeSniffer(uint64_t id);

    std::vector<std::string> matchingSniffers(const http::HttpRequest& request) const;

    EngineSnapshot snapshot() const;

    size_t ruleCount() const;

private:
    struct CompiledRule {
        Rule rule;
        FilterExpression filter;
        mutable std::atomic<uint32_t> remaining{0};

        CompiledRule(Rule r, FilterExpression f)
            : rule(std::move(r)), filter(std::move(f)) {
            if (rule.budget) {
                remaining.store(*rule.budget);
            }
        }

        /**
         * @brief Take one unit of budget; always succeeds for unlimited rules.
         */
        bool tryConsume() const;
    };

    struct Sniffer {
        FilterExpression filter;
        std::string url;
    };

    using RuleTable = std::vector<std::unique_ptr<CompiledRule>>;

    std::shared_ptr<const RuleTable> currentTable() const;

    std::shared_ptr<core::StructuredLogger> logger_;

    mutable std::mutex tableMutex_;
    std::shared_ptr<const RuleTable> table_;

    mutable std::mutex sniffersMutex_;
    std::map<uint64_t, Sniffer> sniffers_;
    uint64_t nextSnifferId_ = 1;
};

} // namespace proxy
} // namespace faultline

#endif // FAULTLINE_PROXY_RULE_ENGINE_HPP
