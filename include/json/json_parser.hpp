//! # JSON Parser
//!
//! Recursive descent parser producing a `JsonValue`.
//!
//! ```cpp
//! auto result = parse_json(text);
//! if (is_err(result)) {
//!     FORGE_LOG_DEBUG("cache", "corrupt entry: " << unwrap_err(result).to_string());
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_value.hpp"

#include <string_view>

namespace forge::json {

class JsonParser {
public:
    explicit JsonParser(std::string_view input) : input_(input) {}

    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    size_t depth_ = 0;
    static constexpr size_t MAX_DEPTH = 512;

    [[nodiscard]] auto peek() const -> char;
    auto advance() -> char;
    void skip_whitespace();
    [[nodiscard]] auto make_error(const std::string& msg) const -> JsonError;

    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
    auto parse_string() -> Result<std::string, JsonError>;
    auto parse_number() -> Result<JsonValue, JsonError>;
    auto parse_keyword(std::string_view word, JsonValue value) -> Result<JsonValue, JsonError>;
};

[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

} // namespace forge::json
