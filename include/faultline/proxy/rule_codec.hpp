// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// JSON wire format of rule sets and callback events

#ifndef FAULTLINE_PROXY_RULE_CODEC_HPP
#define FAULTLINE_PROXY_RULE_CODEC_HPP

#include "faultline/core/error_codes.hpp"
#include "faultline/core/json.hpp"
#include "faultline/core/result.hpp"
#include "faultline/core/types.hpp"
#include "faultline/proxy/rule.hpp"

#include <string>

namespace faultline {
namespace proxy {

/**
 * @brief Decode the admin API rule document.
 *
 * @code
 * {
 *   "statuscode": {"return_status": 504, "block_request": true, "count": 3,
 *                  "filter": "~u /keys/query"},
 *   "callback":   {"callback_url": "http://host:41234", "filter": "~u /keys/query"}
 * }
 * @endcode
 *
 * Each top-level key may hold one object or an array of objects. Rules keep
 * document order within a key; statuscode entries come before callback
 * entries. Unknown keys and wrongly typed fields are rejected with
 * ErrorCode::InvalidRule.
 */
core::Result<RuleSet, core::Error> decodeRuleSet(const std::string& json);

core::Result<RuleSet, core::Error> decodeRuleSet(const core::JsonValue& document);

/**
 * @brief Encode a rule set in the admin API format.
 *
 * Sniff rules are encoded as callback entries.
 */
std::string encodeRuleSet(const RuleSet& rules);

/**
 * @brief JSON body POSTed to callback URLs.
 *
 * Keys: method, url, path, access_token, response_code, request_body,
 * response_body, request_headers (array of [name, value] pairs).
 */
std::string encodeCallbackEvent(const core::CallbackEvent& event);

core::Result<core::CallbackEvent, core::Error> decodeCallbackEvent(const std::string& json);

} // namespace proxy
} // namespace faultline

#endif // FAULTLINE_PROXY_RULE_CODEC_HPP
