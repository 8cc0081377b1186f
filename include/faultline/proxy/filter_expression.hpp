// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Request filter expressions

#ifndef FAULTLINE_PROXY_FILTER_EXPRESSION_HPP
#define FAULTLINE_PROXY_FILTER_EXPRESSION_HPP

#include "faultline/core/error_codes.hpp"
#include "faultline/core/result.hpp"
#include "faultline/http/http_message.hpp"

#include <regex>
#include <string>
#include <vector>

namespace faultline {
namespace proxy {

/**
 * @brief A compiled request filter.
 *
 * Syntax: whitespace-separated predicates, all of which must match.
 *
 * | Predicate      | Matches when                                          |
 * |----------------|-------------------------------------------------------|
 * | `~u <regex>`   | regex is found in the request path and query          |
 * | `~hq <regex>`  | regex is found in any request header "Name: value"    |
 * | `~m <method>`  | request method equals the argument, ignoring case      |
 *
 * Arguments may be wrapped in single or double quotes to include spaces.
 * The empty expression matches every request.
 *
 * @code
 * auto filter = FilterExpression::parse("~u keys/query ~hq syt_bob_token");
 * @endcode
 */
class FilterExpression {
public:
    static core::Result<FilterExpression, core::Error> parse(const std::string& text);

    /**
     * @brief Match-everything filter.
     */
    FilterExpression() = default;

    bool matches(const http::HttpRequest& request) const;

    const std::string& text() const { return text_; }

    bool matchesEverything() const { return predicates_.empty(); }

private:
    struct Predicate {
        enum class Kind { Url, RequestHeader, Method };

        Kind kind;
        std::string argument;
        std::regex pattern;
    };

    std::string text_;
    std::vector<Predicate> predicates_;
};

/**
 * @brief Filter selecting requests whose path contains the given fragment.
 *
 * Regex metacharacters in the fragment are escaped.
 */
std::string endpointFilter(const std::string& partialPath);

} // namespace proxy
} // namespace faultline

#endif // FAULTLINE_PROXY_FILTER_EXPRESSION_HPP
