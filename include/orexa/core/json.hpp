// Orexa - Game Server Supervisor
// Minimal JSON document model, parser and writer
//
// Used for the instance registry file and for configuration files. A small
// YAML subset (nested mappings and scalars) parses into the same model.

#ifndef OREXA_CORE_JSON_HPP
#define OREXA_CORE_JSON_HPP

#include "orexa/core/result.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace orexa {
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
 * @brief Parse failure with the byte offset (JSON) or line (YAML) it occurred at.
 */
struct JsonError {
    std::string message;
    int line = -1;

    JsonError() = default;
    explicit JsonError(std::string msg, int l = -1)
        : message(std::move(msg)), line(l) {}
};

/**
 * @brief A JSON value.
 *
 * Object members are kept in a std::map, so serialization emits keys in
 * sorted order.
 */
struct JsonValue {
    JsonType type = JsonType::Null;
    bool boolValue = false;
    double numberValue = 0.0;
    std::string stringValue;
    std::vector<JsonValue> arrayValue;
    std::map<std::string, JsonValue> objectValue;

    static JsonValue makeBool(bool v);
    static JsonValue makeNumber(double v);
    static JsonValue makeString(std::string v);
    static JsonValue makeArray();
    static JsonValue makeObject();

    bool isNull() const { return type == JsonType::Null; }
    bool isBool() const { return type == JsonType::Boolean; }
    bool isNumber() const { return type == JsonType::Number; }
    bool isString() const { return type == JsonType::String; }
    bool isArray() const { return type == JsonType::Array; }
    bool isObject() const { return type == JsonType::Object; }

    bool getBool(bool defaultVal = false) const {
        return isBool() ? boolValue : defaultVal;
    }

    int64_t getInt(int64_t defaultVal = 0) const {
        return isNumber() ? static_cast<int64_t>(numberValue) : defaultVal;
    }

    double getDouble(double defaultVal = 0.0) const {
        return isNumber() ? numberValue : defaultVal;
    }

    std::string getString(const std::string& defaultVal = "") const {
        return isString() ? stringValue : defaultVal;
    }

    bool contains(const std::string& key) const {
        return isObject() && objectValue.find(key) != objectValue.end();
    }

    const JsonValue& operator[](const std::string& key) const;

    /**
     * @brief Insert or replace an object member. Converts Null to Object.
     */
    JsonValue& set(const std::string& key, JsonValue value);

    /**
     * @brief Append an array element. Converts Null to Array.
     */
    JsonValue& push(JsonValue value);
};

/**
 * @brief Parse a complete JSON document.
 */
Result<JsonValue, JsonError> parseJson(const std::string& input);

/**
 * @brief Parse the YAML subset used by configuration files.
 *
 * Supports nested mappings by indentation, scalars (quoted or bare strings,
 * numbers, booleans, null) and '#' comments.
 */
Result<JsonValue, JsonError> parseYaml(const std::string& input);

/**
 * @brief Serialize a value.
 *
 * @param indent Spaces per nesting level; 0 produces a single line
 */
std::string toJson(const JsonValue& value, int indent = 0);

/**
 * @brief Escape a string for embedding inside JSON quotes.
 */
std::string escapeJsonString(const std::string& str);

} // namespace core
} // namespace orexa

#endif // OREXA_CORE_JSON_HPP
