// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Request filter expressions

#include "faultline/proxy/filter_expression.hpp"

#include <cctype>

namespace faultline {
namespace proxy {

namespace {

core::Error filterError(const std::string& text, const std::string& message) {
    return core::Error(core::ErrorCode::InvalidFilter, message, "filter '" + text + "'");
}

/**
 * @brief Split on whitespace, honouring single and double quotes.
 */
core::Result<std::vector<std::string>, std::string> tokenize(const std::string& text) {
    using Res = core::Result<std::vector<std::string>, std::string>;

    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        if (i >= text.size()) {
            break;
        }

        std::string token;
        if (text[i] == '"' || text[i] == '\'') {
            char quote = text[i++];
            size_t end = text.find(quote, i);
            if (end == std::string::npos) {
                return Res::error("unterminated quote");
            }
            token = text.substr(i, end - i);
            i = end + 1;
            if (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) {
                return Res::error("unexpected character after closing quote");
            }
        } else {
            size_t start = i;
            while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) {
                ++i;
            }
            token = text.substr(start, i - start);
        }
        tokens.push_back(std::move(token));
    }
    return Res::success(std::move(tokens));
}

} // anonymous namespace

core::Result<FilterExpression, core::Error> FilterExpression::parse(const std::string& text) {
    using Res = core::Result<FilterExpression, core::Error>;

    auto tokens = tokenize(text);
    if (tokens.isError()) {
        return Res::error(filterError(text, tokens.error()));
    }

    FilterExpression filter;
    filter.text_ = text;

    const auto& list = tokens.value();
    for (size_t i = 0; i < list.size(); i += 2) {
        const std::string& op = list[i];

        Predicate predicate;
        if (op == "~u") {
            predicate.kind = Predicate::Kind::Url;
        } else if (op == "~hq") {
            predicate.kind = Predicate::Kind::RequestHeader;
        } else if (op == "~m") {
            predicate.kind = Predicate::Kind::Method;
        } else {
            return Res::error(filterError(text, "unknown predicate '" + op + "'"));
        }

        if (i + 1 >= list.size() || list[i + 1].empty()) {
            return Res::error(filterError(text, "predicate " + op + " needs an argument"));
        }
        predicate.argument = list[i + 1];

        if (predicate.kind != Predicate::Kind::Method) {
            try {
                predicate.pattern = std::regex(predicate.argument, std::regex::ECMAScript);
            } catch (const std::regex_error& e) {
                return Res::error(filterError(text,
                    "invalid regex '" + predicate.argument + "': " + e.what()));
            }
        }
        filter.predicates_.push_back(std::move(predicate));
    }

    return Res::success(std::move(filter));
}

bool FilterExpression::matches(const http::HttpRequest& request) const {
    for (const auto& predicate : predicates_) {
        bool matched = false;
        switch (predicate.kind) {
            case Predicate::Kind::Url:
                matched = std::regex_search(request.target, predicate.pattern);
                break;

            case Predicate::Kind::RequestHeader:
                for (const auto& header : request.headers) {
                    if (std::regex_search(header.first + ": " + header.second, predicate.pattern)) {
                        matched = true;
                        break;
                    }
                }
                break;

            case Predicate::Kind::Method:
                matched = http::equalsIgnoreCase(request.method, predicate.argument);
                break;
        }
        if (!matched) {
            return false;
        }
    }
    return true;
}

std::string endpointFilter(const std::string& partialPath) {
    static const std::string kSpecial = "\\^$.|?*+()[]{}";

    std::string escaped;
    for (char c : partialPath) {
        if (kSpecial.find(c) != std::string::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return "~u .*" + escaped + ".*";
}

} // namespace proxy
} // namespace faultline
