// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// JSON parser and writer implementation

#include "faultline/core/json.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace faultline {
namespace core {

bool JsonValue::isInteger() const {
    return isNumber() && std::isfinite(numberValue) &&
           std::floor(numberValue) == numberValue;
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    static const JsonValue nullValue;
    if (!isObject()) return nullValue;
    auto it = objectValue.find(key);
    return it != objectValue.end() ? it->second : nullValue;
}

// =============================================================================
// Parser
// =============================================================================

namespace {

constexpr int kMaxDepth = 128;

void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

class JsonParser {
public:
    explicit JsonParser(const std::string& input) : input_(input), pos_(0) {}

    Result<JsonValue, JsonError> parse() {
        skipWhitespace();
        auto result = parseValue(0);
        if (result.isError()) {
            return result;
        }
        skipWhitespace();
        if (pos_ < input_.size()) {
            return fail("Unexpected characters after JSON value");
        }
        return result;
    }

private:
    const std::string& input_;
    size_t pos_;

    Result<JsonValue, JsonError> fail(const std::string& message) const {
        return Result<JsonValue, JsonError>::error(JsonError(pos_, message));
    }

    void skipWhitespace() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
            pos_++;
        }
    }

    char peek() const {
        return pos_ < input_.size() ? input_[pos_] : '\0';
    }

    char consume() {
        return pos_ < input_.size() ? input_[pos_++] : '\0';
    }

    bool match(char c) {
        if (pos_ < input_.size() && input_[pos_] == c) {
            pos_++;
            return true;
        }
        return false;
    }

    Result<JsonValue, JsonError> parseValue(int depth) {
        if (depth > kMaxDepth) {
            return fail("Nesting too deep");
        }
        skipWhitespace();
        char c = peek();

        if (c == '"') return parseString();
        if (c == '{') return parseObject(depth);
        if (c == '[') return parseArray(depth);
        if (c == 't' || c == 'f') return parseBool();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();

        if (pos_ >= input_.size()) {
            return fail("Unexpected end of input");
        }
        return fail("Unexpected character: " + std::string(1, c));
    }

    bool parseHex4(uint32_t& out) {
        if (pos_ + 4 > input_.size()) {
            return false;
        }
        out = 0;
        for (int i = 0; i < 4; ++i) {
            char h = input_[pos_++];
            out <<= 4;
            if (h >= '0' && h <= '9') out |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') out |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') out |= static_cast<uint32_t>(h - 'A' + 10);
            else return false;
        }
        return true;
    }

    Result<JsonValue, JsonError> parseString() {
        if (!match('"')) {
            return fail("Expected '\"'");
        }

        std::string result;
        while (pos_ < input_.size() && peek() != '"') {
            char c = consume();
            if (static_cast<unsigned char>(c) < 0x20) {
                return fail("Control character in string");
            }
            if (c != '\\') {
                result += c;
                continue;
            }
            char escaped = consume();
            switch (escaped) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    uint32_t cp = 0;
                    if (!parseHex4(cp)) {
                        return fail("Invalid \\u escape");
                    }
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        uint32_t low = 0;
                        if (!match('\\') || !match('u') || !parseHex4(low) ||
                            low < 0xDC00 || low > 0xDFFF) {
                            return fail("Invalid surrogate pair");
                        }
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    appendUtf8(result, cp);
                    break;
                }
                default:
                    return fail("Invalid escape sequence");
            }
        }

        if (!match('"')) {
            return fail("Unterminated string");
        }

        JsonValue value;
        value.type = JsonType::String;
        value.stringValue = std::move(result);
        return Result<JsonValue, JsonError>::success(std::move(value));
    }

    Result<JsonValue, JsonError> parseNumber() {
        size_t start = pos_;
        if (peek() == '-') consume();

        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            return fail("Invalid number");
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) consume();

        if (peek() == '.') {
            consume();
            if (!std::isdigit(static_cast<unsigned char>(peek()))) {
                return fail("Invalid number");
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        if (peek() == 'e' || peek() == 'E') {
            consume();
            if (peek() == '+' || peek() == '-') consume();
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        std::string numStr = input_.substr(start, pos_ - start);
        try {
            JsonValue value;
            value.type = JsonType::Number;
            value.numberValue = std::stod(numStr);
            return Result<JsonValue, JsonError>::success(std::move(value));
        } catch (const std::exception&) {
            return fail("Invalid number: " + numStr);
        }
    }

    Result<JsonValue, JsonError> parseBool() {
        JsonValue value;
        value.type = JsonType::Boolean;
        if (input_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            value.boolValue = true;
            return Result<JsonValue, JsonError>::success(std::move(value));
        }
        if (input_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return Result<JsonValue, JsonError>::success(std::move(value));
        }
        return fail("Expected 'true' or 'false'");
    }

    Result<JsonValue, JsonError> parseNull() {
        if (input_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return Result<JsonValue, JsonError>::success(JsonValue{});
        }
        return fail("Expected 'null'");
    }

    Result<JsonValue, JsonError> parseArray(int depth) {
        match('[');

        JsonValue value;
        value.type = JsonType::Array;

        skipWhitespace();
        if (match(']')) {
            return Result<JsonValue, JsonError>::success(std::move(value));
        }

        while (true) {
            auto element = parseValue(depth + 1);
            if (element.isError()) {
                return element;
            }
            value.arrayValue.push_back(std::move(element).value());

            skipWhitespace();
            if (match(']')) break;
            if (!match(',')) {
                return fail("Expected ',' or ']' in array");
            }
        }

        return Result<JsonValue, JsonError>::success(std::move(value));
    }

    Result<JsonValue, JsonError> parseObject(int depth) {
        match('{');

        JsonValue value;
        value.type = JsonType::Object;

        skipWhitespace();
        if (match('}')) {
            return Result<JsonValue, JsonError>::success(std::move(value));
        }

        while (true) {
            skipWhitespace();
            if (peek() != '"') {
                return fail("Expected string key in object");
            }
            auto keyResult = parseString();
            if (keyResult.isError()) {
                return keyResult;
            }
            std::string key = keyResult.value().stringValue;

            skipWhitespace();
            if (!match(':')) {
                return fail("Expected ':' after key");
            }

            auto member = parseValue(depth + 1);
            if (member.isError()) {
                return member;
            }
            value.objectValue[key] = std::move(member).value();

            skipWhitespace();
            if (match('}')) break;
            if (!match(',')) {
                return fail("Expected ',' or '}' in object");
            }
        }

        return Result<JsonValue, JsonError>::success(std::move(value));
    }
};

} // namespace

Result<JsonValue, JsonError> parseJson(const std::string& text) {
    JsonParser parser(text);
    return parser.parse();
}

// =============================================================================
// Writer
// =============================================================================

std::string escapeJsonString(const std::string& input) {
    std::string out;
    out.reserve(input.size() + 8);
    for (char c : input) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

void JsonWriter::separate() {
    if (afterKey_) {
        afterKey_ = false;
        return;
    }
    if (!first_.empty()) {
        if (!first_.back()) {
            out_ += ',';
        }
        first_.back() = false;
    }
}

JsonWriter& JsonWriter::beginObject() {
    separate();
    out_ += '{';
    first_.push_back(true);
    return *this;
}

JsonWriter& JsonWriter::endObject() {
    out_ += '}';
    if (!first_.empty()) first_.pop_back();
    return *this;
}

JsonWriter& JsonWriter::beginArray() {
    separate();
    out_ += '[';
    first_.push_back(true);
    return *this;
}

JsonWriter& JsonWriter::endArray() {
    out_ += ']';
    if (!first_.empty()) first_.pop_back();
    return *this;
}

JsonWriter& JsonWriter::key(const std::string& name) {
    separate();
    out_ += '"';
    out_ += escapeJsonString(name);
    out_ += "\":";
    afterKey_ = true;
    return *this;
}

JsonWriter& JsonWriter::value(const std::string& v) {
    separate();
    out_ += '"';
    out_ += escapeJsonString(v);
    out_ += '"';
    return *this;
}

JsonWriter& JsonWriter::value(const char* v) {
    return value(std::string(v ? v : ""));
}

JsonWriter& JsonWriter::value(bool v) {
    separate();
    out_ += v ? "true" : "false";
    return *this;
}

JsonWriter& JsonWriter::value(int v) {
    return value(static_cast<int64_t>(v));
}

JsonWriter& JsonWriter::value(int64_t v) {
    separate();
    out_ += std::to_string(v);
    return *this;
}

JsonWriter& JsonWriter::value(uint64_t v) {
    separate();
    out_ += std::to_string(v);
    return *this;
}

JsonWriter& JsonWriter::nullValue() {
    separate();
    out_ += "null";
    return *this;
}

} // namespace core
} // namespace faultline
