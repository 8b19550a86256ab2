//! # JSON Parser Implementation
//!
//! Single-pass recursive descent parser over the input text. Tracks line
//! and column for error messages and limits nesting depth to `MAX_DEPTH`.
//!
//! ## Grammar
//!
//! ```text
//! value   = object | array | string | number | "true" | "false" | "null"
//! object  = "{" [ string ":" value { "," string ":" value } ] "}"
//! array   = "[" [ value { "," value } ] "]"
//! ```
//!
//! Duplicate object keys keep the last value.

#include "json/json_parser.hpp"

#include <cerrno>
#include <cstdlib>

namespace forge::json {

namespace {

void append_utf8(std::string& out, uint32_t cp) {
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

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

auto JsonParser::peek() const -> char {
    return pos_ < input_.size() ? input_[pos_] : '\0';
}

auto JsonParser::advance() -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void JsonParser::skip_whitespace() {
    while (pos_ < input_.size()) {
        char c = input_[pos_];
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            break;
        }
        advance();
    }
}

auto JsonParser::make_error(const std::string& msg) const -> JsonError {
    return JsonError::make(msg, line_, column_);
}

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    skip_whitespace();
    auto value = parse_value();
    if (is_err(value)) {
        return value;
    }
    skip_whitespace();
    if (pos_ < input_.size()) {
        return make_error("Unexpected trailing characters after JSON value");
    }
    return value;
}

auto JsonParser::parse_value() -> Result<JsonValue, JsonError> {
    skip_whitespace();
    char c = peek();
    switch (c) {
    case '{':
        return parse_object();
    case '[':
        return parse_array();
    case '"': {
        auto s = parse_string();
        if (is_err(s)) {
            return unwrap_err(s);
        }
        return JsonValue(std::move(unwrap(s)));
    }
    case 't':
        return parse_keyword("true", JsonValue(true));
    case 'f':
        return parse_keyword("false", JsonValue(false));
    case 'n':
        return parse_keyword("null", JsonValue());
    case '\0':
        if (pos_ >= input_.size()) {
            return make_error("Unexpected end of input");
        }
        break;
    default:
        if (c == '-' || (c >= '0' && c <= '9')) {
            return parse_number();
        }
        break;
    }
    return make_error(std::string("Unexpected character '") + c + "'");
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return make_error("Maximum nesting depth exceeded");
    }
    advance(); // '{'

    JsonObject obj;
    skip_whitespace();
    if (peek() == '}') {
        advance();
        --depth_;
        return JsonValue(std::move(obj));
    }

    while (true) {
        skip_whitespace();
        if (peek() != '"') {
            return make_error("Expected string key in object");
        }
        auto key = parse_string();
        if (is_err(key)) {
            return unwrap_err(key);
        }

        skip_whitespace();
        if (peek() != ':') {
            return make_error("Expected ':' after object key");
        }
        advance();

        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        obj[std::move(unwrap(key))] = std::move(unwrap(value));

        skip_whitespace();
        char c = advance();
        if (c == '}') {
            break;
        }
        if (c != ',') {
            return make_error("Expected ',' or '}' in object");
        }
    }

    --depth_;
    return JsonValue(std::move(obj));
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return make_error("Maximum nesting depth exceeded");
    }
    advance(); // '['

    JsonArray arr;
    skip_whitespace();
    if (peek() == ']') {
        advance();
        --depth_;
        return JsonValue(std::move(arr));
    }

    while (true) {
        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        arr.push_back(std::move(unwrap(value)));

        skip_whitespace();
        char c = advance();
        if (c == ']') {
            break;
        }
        if (c != ',') {
            return make_error("Expected ',' or ']' in array");
        }
    }

    --depth_;
    return JsonValue(std::move(arr));
}

auto JsonParser::parse_string() -> Result<std::string, JsonError> {
    advance(); // opening quote

    std::string out;
    while (true) {
        if (pos_ >= input_.size()) {
            return make_error("Unterminated string");
        }
        char c = advance();
        if (c == '"') {
            break;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            return make_error("Control character in string");
        }
        if (c != '\\') {
            out += c;
            continue;
        }

        char esc = advance();
        switch (esc) {
        case '"':
            out += '"';
            break;
        case '\\':
            out += '\\';
            break;
        case '/':
            out += '/';
            break;
        case 'b':
            out += '\b';
            break;
        case 'f':
            out += '\f';
            break;
        case 'n':
            out += '\n';
            break;
        case 'r':
            out += '\r';
            break;
        case 't':
            out += '\t';
            break;
        case 'u': {
            auto read_hex4 = [this]() -> int32_t {
                int32_t value = 0;
                for (int i = 0; i < 4; ++i) {
                    int h = hex_value(advance());
                    if (h < 0) {
                        return -1;
                    }
                    value = (value << 4) | h;
                }
                return value;
            };
            int32_t cp = read_hex4();
            if (cp < 0) {
                return make_error("Invalid \\u escape");
            }
            // Surrogate pair
            if (cp >= 0xD800 && cp <= 0xDBFF) {
                if (advance() != '\\' || advance() != 'u') {
                    return make_error("Unpaired surrogate in \\u escape");
                }
                int32_t low = read_hex4();
                if (low < 0xDC00 || low > 0xDFFF) {
                    return make_error("Invalid low surrogate in \\u escape");
                }
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            }
            append_utf8(out, static_cast<uint32_t>(cp));
            break;
        }
        default:
            return make_error(std::string("Invalid escape sequence '\\") + esc + "'");
        }
    }
    return out;
}

auto JsonParser::parse_number() -> Result<JsonValue, JsonError> {
    size_t start = pos_;
    bool is_float = false;

    if (peek() == '-') {
        advance();
    }
    if (!(peek() >= '0' && peek() <= '9')) {
        return make_error("Invalid number");
    }
    while (peek() >= '0' && peek() <= '9') {
        advance();
    }
    if (peek() == '.') {
        is_float = true;
        advance();
        if (!(peek() >= '0' && peek() <= '9')) {
            return make_error("Expected digit after decimal point");
        }
        while (peek() >= '0' && peek() <= '9') {
            advance();
        }
    }
    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!(peek() >= '0' && peek() <= '9')) {
            return make_error("Expected digit in exponent");
        }
        while (peek() >= '0' && peek() <= '9') {
            advance();
        }
    }

    std::string text(input_.substr(start, pos_ - start));
    if (!is_float) {
        errno = 0;
        long long value = std::strtoll(text.c_str(), nullptr, 10);
        if (errno != ERANGE) {
            return JsonValue(static_cast<int64_t>(value));
        }
        // Out of int64 range: fall through to double
    }
    return JsonValue(std::strtod(text.c_str(), nullptr));
}

auto JsonParser::parse_keyword(std::string_view word, JsonValue value)
    -> Result<JsonValue, JsonError> {
    if (input_.substr(pos_, word.size()) != word) {
        return make_error("Invalid literal, expected '" + std::string(word) + "'");
    }
    for (size_t i = 0; i < word.size(); ++i) {
        advance();
    }
    return value;
}

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

} // namespace forge::json
