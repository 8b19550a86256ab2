//! # JSON Value Types
//!
//! Minimal JSON value type used for cache entries, the spec manifest, the
//! command-backend protocol and `--json` CLI output.
//!
//! ## Number Handling
//!
//! | JSON Input | Storage Type |
//! |------------|--------------|
//! | `42`       | `int64_t`    |
//! | `3.14`     | `double`     |
//! | `1e10`     | `double`     |
//!
//! ## Example
//!
//! ```cpp
//! JsonValue entry(JsonObject{{"source", JsonValue("def f(): ...")},
//!                            {"prompt_tokens", JsonValue(120)}});
//! std::string text = entry.to_string(); // keys are emitted sorted
//! ```

#pragma once

#include "common.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace forge::json {

struct JsonValue;

using JsonArray = std::vector<JsonValue>;

/// Ordered by key, so serialization is canonical.
using JsonObject = std::map<std::string, JsonValue>;

struct JsonValue {
    using Null = std::monostate;

    using ValueVariant = std::variant<Null,             // null
                                      bool,             // boolean
                                      int64_t,          // integer
                                      double,           // float
                                      std::string,      // string
                                      Box<JsonArray>,   // array (boxed)
                                      Box<JsonObject>>; // object (boxed)

    ValueVariant data;

    JsonValue() : data(Null{}) {}
    explicit JsonValue(std::nullptr_t) : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(int value) : data(static_cast<int64_t>(value)) {}
    explicit JsonValue(int64_t value) : data(value) {}
    explicit JsonValue(uint64_t value) : data(static_cast<int64_t>(value)) {}
    explicit JsonValue(double value) : data(value) {}
    explicit JsonValue(const char* value) : data(std::string(value)) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(std::string_view value) : data(std::string(value)) {}
    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

    JsonValue(const JsonValue& other);
    JsonValue(JsonValue&& other) noexcept = default;
    JsonValue& operator=(const JsonValue& other);
    JsonValue& operator=(JsonValue&& other) noexcept = default;

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
    [[nodiscard]] auto is_number() const -> bool {
        return is_integer() || std::holds_alternative<double>(data);
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

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }
    [[nodiscard]] auto as_i64() const -> int64_t;
    [[nodiscard]] auto as_f64() const -> double;
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

    /// Returns the member `key`, or nullptr if this is not an object or the
    /// key is missing.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue*;

    /// Typed member lookups; nullopt when missing or of another type.
    [[nodiscard]] auto get_string(const std::string& key) const -> std::optional<std::string>;
    [[nodiscard]] auto get_i64(const std::string& key) const -> std::optional<int64_t>;
    [[nodiscard]] auto get_f64(const std::string& key) const -> std::optional<double>;

    [[nodiscard]] auto size() const -> size_t;

    void push(JsonValue value) {
        as_array_mut().push_back(std::move(value));
    }

    void set(const std::string& key, JsonValue value) {
        as_object_mut()[key] = std::move(value);
    }

    // ========================================================================
    // Serialization
    // ========================================================================

    /// Compact form, object keys sorted, no whitespace.
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto to_string_pretty(int indent = 2) const -> std::string;

    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;
};

[[nodiscard]] inline auto json_object() -> JsonValue {
    return JsonValue(JsonObject{});
}

[[nodiscard]] inline auto json_array() -> JsonValue {
    return JsonValue(JsonArray{});
}

/// Builds a JSON array of strings.
[[nodiscard]] auto json_string_array(const std::vector<std::string>& items) -> JsonValue;

/// Escapes a string for embedding in JSON (without the surrounding quotes).
[[nodiscard]] auto escape_json_string(std::string_view s) -> std::string;

} // namespace forge::json
