#pragma once

#include <string>
#include <unordered_map>
#include <vector>

struct JsonValue {
    enum class Type { Null, Bool, Number, String, Array, Object };

    Type type = Type::Null;
    bool booleanValue = false;
    double numberValue = 0.0;
    std::string stringValue;
    std::vector<JsonValue> arrayValue;
    std::unordered_map<std::string, JsonValue> objectValue;

    bool isNull() const noexcept { return type == Type::Null; }
    bool isBool() const noexcept { return type == Type::Bool; }
    bool isObject() const noexcept { return type == Type::Object; }
    bool isArray() const noexcept { return type == Type::Array; }
    bool isString() const noexcept { return type == Type::String; }
    bool isNumber() const noexcept { return type == Type::Number; }
    bool isInteger() const noexcept; // number with no fractional part

    // Member lookup; nullptr when absent or when this is not an object.
    const JsonValue* find(const std::string& key) const;
};

/**
 * @brief Parses one complete JSON document.
 * @throws Keyprint::RequestException on malformed input, trailing content or
 * nesting deeper than the parser accepts.
 */
JsonValue parseJsonText(const std::string& text);

std::string escapeJsonString(const std::string& value);

// 15 significant digits; non-finite values become null.
std::string formatDouble(double value);
