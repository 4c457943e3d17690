#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#ifdef STREAMGATE_HAS_SIMDJSON
#include <simdjson.h>
#endif

#include "streamgate/core/error.hpp"
#include "streamgate/util/expected.hpp"

namespace streamgate {

// ============================================================================
// JSON Value Type
// ============================================================================

class JsonValue;

using JsonNull = std::nullptr_t;
using JsonBool = bool;
using JsonNumber = double;
using JsonString = std::string;
using JsonArray = std::vector<JsonValue>;
// Insertion ordered, so serialized output is stable
using JsonObject = std::vector<std::pair<std::string, JsonValue>>;

class JsonValue {
public:
    using Variant = std::variant<JsonNull, JsonBool, JsonNumber, JsonString, JsonArray, JsonObject>;

private:
    Variant value_;

public:
    JsonValue() : value_(nullptr) {}
    JsonValue(std::nullptr_t) : value_(nullptr) {}
    JsonValue(bool b) : value_(b) {}
    JsonValue(int i) : value_(static_cast<double>(i)) {}
    JsonValue(int64_t i) : value_(static_cast<double>(i)) {}
    JsonValue(double d) : value_(d) {}
    JsonValue(const char* s) : value_(std::string(s)) {}
    JsonValue(std::string s) : value_(std::move(s)) {}
    JsonValue(std::string_view s) : value_(std::string(s)) {}
    JsonValue(JsonArray arr) : value_(std::move(arr)) {}
    JsonValue(JsonObject obj) : value_(std::move(obj)) {}

    static JsonValue object() { return JsonValue(JsonObject{}); }
    static JsonValue array() { return JsonValue(JsonArray{}); }

    bool is_null() const { return std::holds_alternative<JsonNull>(value_); }
    bool is_bool() const { return std::holds_alternative<JsonBool>(value_); }
    bool is_number() const { return std::holds_alternative<JsonNumber>(value_); }
    bool is_string() const { return std::holds_alternative<JsonString>(value_); }
    bool is_array() const { return std::holds_alternative<JsonArray>(value_); }
    bool is_object() const { return std::holds_alternative<JsonObject>(value_); }

    // Accessors (throw std::bad_variant_access on type mismatch)
    bool as_bool() const { return std::get<JsonBool>(value_); }
    double as_number() const { return std::get<JsonNumber>(value_); }
    int64_t as_int() const { return static_cast<int64_t>(std::get<JsonNumber>(value_)); }
    const std::string& as_string() const { return std::get<JsonString>(value_); }
    const JsonArray& as_array() const { return std::get<JsonArray>(value_); }
    const JsonObject& as_object() const { return std::get<JsonObject>(value_); }

    JsonArray& as_array() { return std::get<JsonArray>(value_); }
    JsonObject& as_object() { return std::get<JsonObject>(value_); }

    std::optional<double> get_number() const {
        if (is_number()) return as_number();
        return std::nullopt;
    }

    std::optional<std::string_view> get_string() const {
        if (is_string()) return std::string_view(as_string());
        return std::nullopt;
    }

    // Inserts a null member when the key is missing
    JsonValue& operator[](std::string_view key);

    const JsonValue* get(std::string_view key) const;

    bool contains(std::string_view key) const {
        return get(key) != nullptr;
    }

    const JsonValue& operator[](size_t index) const {
        return std::get<JsonArray>(value_)[index];
    }

    size_t size() const {
        if (is_array()) return std::get<JsonArray>(value_).size();
        if (is_object()) return std::get<JsonObject>(value_).size();
        return 0;
    }

    void push_back(JsonValue val) {
        if (!is_array()) {
            value_ = JsonArray{};
        }
        std::get<JsonArray>(value_).push_back(std::move(val));
    }

    std::string dump(int indent = -1) const;

    bool operator==(const JsonValue& other) const { return value_ == other.value_; }
    bool operator!=(const JsonValue& other) const { return !(*this == other); }
};

// ============================================================================
// JSON Parsing
// ============================================================================

namespace json {

expected<JsonValue, Error> parse(std::string_view json);

bool using_simdjson() noexcept;

} // namespace json

} // namespace streamgate
