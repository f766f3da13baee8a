//! # JSON Values
//!
//! The JSON document model used for the capability protocol, run reports and
//! the `analyze` dump.
//!
//! - Objects keep keys sorted (`std::map`) so serialized output is stable.
//! - Integers and floats are kept apart so counts round-trip without a
//!   decimal point.
//! - Arrays and objects are boxed, which makes values move-only. Use
//!   `clone()` for deep copies.
//!
//! ```cpp
//! auto obj = json_object();
//! obj.set("name", JsonValue("Parser.parse"));
//! obj.set("confidence", JsonValue(0.92));
//! std::string text = obj.to_string();
//! ```

#ifndef DOCFORGE_JSON_VALUE_HPP
#define DOCFORGE_JSON_VALUE_HPP

#include "common.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace docforge::json {

struct JsonValue;

using JsonArray = std::vector<JsonValue>;
using JsonObject = std::map<std::string, JsonValue>;

/// A parse failure with its 1-based position.
struct JsonError {
    std::string message;
    size_t line = 0;
    size_t column = 0;

    [[nodiscard]] auto to_string() const -> std::string;
};

struct JsonValue {
    using Null = std::monostate;
    using ValueVariant =
        std::variant<Null, bool, int64_t, double, std::string, Box<JsonArray>, Box<JsonObject>>;

    ValueVariant data;

    // ========================================================================
    // Constructors
    // ========================================================================

    JsonValue() : data(Null{}) {}
    explicit JsonValue(std::nullptr_t) : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(int value) : data(static_cast<int64_t>(value)) {}
    explicit JsonValue(int64_t value) : data(value) {}
    explicit JsonValue(size_t value) : data(static_cast<int64_t>(value)) {}
    explicit JsonValue(double value) : data(value) {}
    explicit JsonValue(const char* value) : data(std::string(value)) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(std::string_view value) : data(std::string(value)) {}
    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

    JsonValue(JsonValue&&) noexcept = default;
    auto operator=(JsonValue&&) noexcept -> JsonValue& = default;
    JsonValue(const JsonValue&) = delete;
    auto operator=(const JsonValue&) -> JsonValue& = delete;

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }
    [[nodiscard]] auto is_integer() const -> bool {
        return std::holds_alternative<int64_t>(data);
    }
    [[nodiscard]] auto is_float() const -> bool {
        return std::holds_alternative<double>(data);
    }
    [[nodiscard]] auto is_number() const -> bool {
        return is_integer() || is_float();
    }
    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }
    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    // ========================================================================
    // Accessors
    // ========================================================================
    //
    // The as_* accessors throw std::bad_variant_access on a type mismatch.

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }
    [[nodiscard]] auto as_i64() const -> int64_t {
        if (is_float()) {
            return static_cast<int64_t>(std::get<double>(data));
        }
        return std::get<int64_t>(data);
    }
    [[nodiscard]] auto as_f64() const -> double {
        if (is_integer()) {
            return static_cast<double>(std::get<int64_t>(data));
        }
        return std::get<double>(data);
    }
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }
    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }
    [[nodiscard]] auto as_array_mut() -> JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto as_object_mut() -> JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    // ========================================================================
    // Object Access
    // ========================================================================

    /// Value for `key`, or `nullptr` if absent or not an object.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue* {
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            auto it = (*obj)->find(key);
            if (it != (*obj)->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    [[nodiscard]] auto contains(const std::string& key) const -> bool {
        return get(key) != nullptr;
    }

    /// String member `key`, or nullopt when absent or of another type.
    [[nodiscard]] auto get_string(const std::string& key) const -> std::optional<std::string>;

    /// Numeric member `key`, or nullopt when absent or of another type.
    [[nodiscard]] auto get_number(const std::string& key) const -> std::optional<double>;

    /// String elements of array member `key`. Non-string elements are skipped.
    [[nodiscard]] auto get_string_array(const std::string& key) const -> std::vector<std::string>;

    [[nodiscard]] auto size() const -> size_t {
        if (auto* arr = std::get_if<Box<JsonArray>>(&data)) {
            return (*arr)->size();
        }
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            return (*obj)->size();
        }
        return 0;
    }

    [[nodiscard]] auto operator[](size_t index) const -> const JsonValue& {
        return as_array().at(index);
    }

    // ========================================================================
    // Mutation
    // ========================================================================

    void push(JsonValue value) {
        as_array_mut().push_back(std::move(value));
    }

    void set(const std::string& key, JsonValue value) {
        as_object_mut()[key] = std::move(value);
    }

    // ========================================================================
    // Serialization
    // ========================================================================

    [[nodiscard]] auto to_string() const -> std::string;
    [[nodiscard]] auto to_string_pretty(int indent = 2) const -> std::string;

    [[nodiscard]] auto clone() const -> JsonValue;
    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;
};

// ============================================================================
// Factory Functions
// ============================================================================

inline auto json_null() -> JsonValue {
    return JsonValue();
}

inline auto json_array() -> JsonValue {
    return JsonValue(JsonArray{});
}

inline auto json_object() -> JsonValue {
    return JsonValue(JsonObject{});
}

/// Array of string values.
auto json_string_array(const std::vector<std::string>& items) -> JsonValue;

// ============================================================================
// Parsing
// ============================================================================

/// Parses a complete JSON document. Trailing non-whitespace is an error.
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

/// Escapes a string for inclusion between JSON double quotes.
[[nodiscard]] auto escape_string(std::string_view input) -> std::string;

} // namespace docforge::json

#endif // DOCFORGE_JSON_VALUE_HPP
