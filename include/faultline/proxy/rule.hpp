// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Routing rules pushed to the reverse proxy

#ifndef FAULTLINE_PROXY_RULE_HPP
#define FAULTLINE_PROXY_RULE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace faultline {
namespace proxy {

// =============================================================================
// Actions
// =============================================================================

/**
 * @brief Forward the request, then replace the upstream status code.
 */
struct StatusOverride {
    int status = 0;
};

/**
 * @brief Answer with the status without contacting the upstream.
 */
struct Block {
    int status = 0;
};

/**
 * @brief Report the exchange to a callback URL.
 */
struct Callback {
    std::string url;
};

/**
 * @brief Observe the exchange without altering it.
 */
struct Sniff {
    std::string url;
};

using Action = std::variant<StatusOverride, Block, Callback, Sniff>;

/**
 * @brief True for actions that alter the exchange (StatusOverride, Block).
 */
inline bool isIntercept(const Action& action) {
    return std::holds_alternative<StatusOverride>(action) ||
           std::holds_alternative<Block>(action);
}

const char* actionName(const Action& action);

// =============================================================================
// Rule
// =============================================================================

struct Rule {
    std::string filter;                 ///< Filter expression; empty matches all
    Action action;
    std::optional<uint32_t> budget;     ///< Matches left; absent = unlimited

    static Rule statusOverride(std::string filter, int status,
                               std::optional<uint32_t> budget = std::nullopt) {
        return Rule{std::move(filter), StatusOverride{status}, budget};
    }

    static Rule block(std::string filter, int status,
                      std::optional<uint32_t> budget = std::nullopt) {
        return Rule{std::move(filter), Block{status}, budget};
    }

    static Rule callback(std::string filter, std::string url) {
        return Rule{std::move(filter), Callback{std::move(url)}, std::nullopt};
    }
};

/**
 * @brief The complete set of rules active on the proxy.
 *
 * Pushes replace the active set; they are never merged. Order matters: the
 * first matching intercept rule wins.
 */
using RuleSet = std::vector<Rule>;

} // namespace proxy
} // namespace faultline

#endif // FAULTLINE_PROXY_RULE_HPP
