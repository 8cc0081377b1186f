// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Minimal JSON document model, parser and writer
//
// Used for the configuration file, the proxy administrative API and the
// callback delivery payload.

#ifndef FAULTLINE_CORE_JSON_HPP
#define FAULTLINE_CORE_JSON_HPP

#include "faultline/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace faultline {
namespace core {

enum class JsonType {
    Null,
    Boolean,
    Number,
    String,
    Array,
    Object
};

/**
 * @brief A parsed JSON value.
 *
 * Object members are kept in a sorted map; duplicate keys keep the last
 * occurrence.
 */
struct JsonValue {
    JsonType type = JsonType::Null;
    bool boolValue = false;
    double numberValue = 0.0;
    std::string stringValue;
    std::vector<JsonValue> arrayValue;
    std::map<std::string, JsonValue> objectValue;

    bool isNull() const { return type == JsonType::Null; }
    bool isBool() const { return type == JsonType::Boolean; }
    bool isNumber() const { return type == JsonType::Number; }
    bool isString() const { return type == JsonType::String; }
    bool isArray() const { return type == JsonType::Array; }
    bool isObject() const { return type == JsonType::Object; }

    /**
     * @brief True for numbers without a fractional part.
     */
    bool isInteger() const;

    bool getBool(bool defaultVal = false) const {
        return isBool() ? boolValue : defaultVal;
    }

    int64_t getInt(int64_t defaultVal = 0) const {
        return isNumber() ? static_cast<int64_t>(numberValue) : defaultVal;
    }

    std::string getString(const std::string& defaultVal = "") const {
        return isString() ? stringValue : defaultVal;
    }

    bool contains(const std::string& key) const {
        return isObject() && objectValue.find(key) != objectValue.end();
    }

    /**
     * @brief Member lookup; returns a null value for missing keys or non-objects.
     */
    const JsonValue& operator[](const std::string& key) const;
};

/**
 * @brief Position and description of a JSON syntax error.
 */
struct JsonError {
    size_t offset = 0;
    std::string message;

    JsonError() = default;
    JsonError(size_t off, std::string msg) : offset(off), message(std::move(msg)) {}

    std::string toString() const {
        return message + " at offset " + std::to_string(offset);
    }
};

/**
 * @brief Parse a complete JSON document.
 *
 * Trailing non-whitespace input, unterminated strings, unknown escapes and
 * raw control characters inside strings are rejected. \\uXXXX escapes,
 * including surrogate pairs, are decoded to UTF-8.
 */
Result<JsonValue, JsonError> parseJson(const std::string& text);

/**
 * @brief Escape a string for inclusion between JSON double quotes.
 *
 * Bytes >= 0x80 are copied through unchanged.
 */
std::string escapeJsonString(const std::string& input);

/**
 * @brief Streaming writer producing compact JSON.
 *
 * @code
 * JsonWriter w;
 * w.beginObject();
 * w.key("id").value(uint64_t{3});
 * w.endObject();
 * std::string body = w.str();   // {"id":3}
 * @endcode
 */
class JsonWriter {
public:
    JsonWriter& beginObject();
    JsonWriter& endObject();
    JsonWriter& beginArray();
    JsonWriter& endArray();

    JsonWriter& key(const std::string& name);

    JsonWriter& value(const std::string& v);
    JsonWriter& value(const char* v);
    JsonWriter& value(bool v);
    JsonWriter& value(int v);
    JsonWriter& value(int64_t v);
    JsonWriter& value(uint64_t v);
    JsonWriter& nullValue();

    const std::string& str() const { return out_; }

private:
    void separate();

    std::string out_;
    std::vector<bool> first_;
    bool afterKey_ = false;
};

} // namespace core
} // namespace faultline

#endif // FAULTLINE_CORE_JSON_HPP
