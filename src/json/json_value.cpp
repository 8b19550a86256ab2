//! # JSON Value Implementation
//!
//! Copy semantics for the boxed containers, typed accessors and the
//! compact/pretty serializers.
//!
//! ## String Escaping
//!
//! | Character | Escape Sequence |
//! |-----------|-----------------|
//! | `"` | `\"` |
//! | `\` | `\\` |
//! | Line feed | `\n` |
//! | Carriage return | `\r` |
//! | Tab | `\t` |
//! | Other control (0x00-0x1F) | `\uXXXX` |
//!
//! Bytes >= 0x80 are emitted unchanged (UTF-8 passes through).

#include "json/json_value.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace forge::json {

namespace {

auto format_double(double value) -> std::string {
    // JSON has no NaN or Infinity
    if (std::isnan(value) || std::isinf(value)) {
        return "null";
    }

    std::ostringstream oss;
    oss << std::setprecision(17) << value;
    std::string result = oss.str();

    if (result.find('.') == std::string::npos && result.find('e') == std::string::npos &&
        result.find('E') == std::string::npos) {
        result += ".0";
    }
    return result;
}

void serialize_scalar(const JsonValue& value, std::string& out) {
    if (value.is_null()) {
        out += "null";
    } else if (value.is_bool()) {
        out += value.as_bool() ? "true" : "false";
    } else if (value.is_integer()) {
        out += std::to_string(std::get<int64_t>(value.data));
    } else if (std::holds_alternative<double>(value.data)) {
        out += format_double(std::get<double>(value.data));
    } else if (value.is_string()) {
        out += '"';
        out += escape_json_string(value.as_string());
        out += '"';
    }
}

void serialize_compact(const JsonValue& value, std::string& out) {
    if (value.is_array()) {
        out += '[';
        const auto& arr = value.as_array();
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) {
                out += ',';
            }
            serialize_compact(arr[i], out);
        }
        out += ']';
        return;
    }

    if (value.is_object()) {
        out += '{';
        bool first = true;
        for (const auto& [key, val] : value.as_object()) {
            if (!first) {
                out += ',';
            }
            first = false;
            out += '"';
            out += escape_json_string(key);
            out += "\":";
            serialize_compact(val, out);
        }
        out += '}';
        return;
    }

    serialize_scalar(value, out);
}

void serialize_pretty(const JsonValue& value, std::string& out, int indent, int depth) {
    std::string indent_str(static_cast<size_t>(depth * indent), ' ');
    std::string next_indent(static_cast<size_t>((depth + 1) * indent), ' ');

    if (value.is_array()) {
        const auto& arr = value.as_array();
        if (arr.empty()) {
            out += "[]";
            return;
        }
        out += "[\n";
        for (size_t i = 0; i < arr.size(); ++i) {
            out += next_indent;
            serialize_pretty(arr[i], out, indent, depth + 1);
            if (i + 1 < arr.size()) {
                out += ',';
            }
            out += '\n';
        }
        out += indent_str;
        out += ']';
        return;
    }

    if (value.is_object()) {
        const auto& obj = value.as_object();
        if (obj.empty()) {
            out += "{}";
            return;
        }
        out += "{\n";
        size_t i = 0;
        for (const auto& [key, val] : obj) {
            out += next_indent;
            out += '"';
            out += escape_json_string(key);
            out += "\": ";
            serialize_pretty(val, out, indent, depth + 1);
            if (++i < obj.size()) {
                out += ',';
            }
            out += '\n';
        }
        out += indent_str;
        out += '}';
        return;
    }

    serialize_scalar(value, out);
}

} // namespace

// ============================================================================
// Copy Semantics
// ============================================================================

JsonValue::JsonValue(const JsonValue& other) {
    if (other.is_array()) {
        data = make_box<JsonArray>(other.as_array());
    } else if (other.is_object()) {
        data = make_box<JsonObject>(other.as_object());
    } else if (other.is_null()) {
        data = Null{};
    } else if (other.is_bool()) {
        data = other.as_bool();
    } else if (other.is_integer()) {
        data = std::get<int64_t>(other.data);
    } else if (std::holds_alternative<double>(other.data)) {
        data = std::get<double>(other.data);
    } else {
        data = other.as_string();
    }
}

JsonValue& JsonValue::operator=(const JsonValue& other) {
    if (this != &other) {
        JsonValue copy(other);
        data = std::move(copy.data);
    }
    return *this;
}

// ============================================================================
// Accessors
// ============================================================================

auto JsonValue::as_i64() const -> int64_t {
    if (is_integer()) {
        return std::get<int64_t>(data);
    }
    return static_cast<int64_t>(std::get<double>(data));
}

auto JsonValue::as_f64() const -> double {
    if (is_integer()) {
        return static_cast<double>(std::get<int64_t>(data));
    }
    return std::get<double>(data);
}

auto JsonValue::get(const std::string& key) const -> const JsonValue* {
    if (!is_object()) {
        return nullptr;
    }
    const auto& obj = as_object();
    auto it = obj.find(key);
    return it == obj.end() ? nullptr : &it->second;
}

auto JsonValue::get_string(const std::string& key) const -> std::optional<std::string> {
    const JsonValue* v = get(key);
    if (v == nullptr || !v->is_string()) {
        return std::nullopt;
    }
    return v->as_string();
}

auto JsonValue::get_i64(const std::string& key) const -> std::optional<int64_t> {
    const JsonValue* v = get(key);
    if (v == nullptr || !v->is_number()) {
        return std::nullopt;
    }
    return v->as_i64();
}

auto JsonValue::get_f64(const std::string& key) const -> std::optional<double> {
    const JsonValue* v = get(key);
    if (v == nullptr || !v->is_number()) {
        return std::nullopt;
    }
    return v->as_f64();
}

auto JsonValue::size() const -> size_t {
    if (is_array()) {
        return as_array().size();
    }
    if (is_object()) {
        return as_object().size();
    }
    return 0;
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (is_number() && other.is_number()) {
        if (is_integer() && other.is_integer()) {
            return as_i64() == other.as_i64();
        }
        return as_f64() == other.as_f64();
    }
    if (data.index() != other.data.index()) {
        return false;
    }
    if (is_null()) {
        return true;
    }
    if (is_bool()) {
        return as_bool() == other.as_bool();
    }
    if (is_string()) {
        return as_string() == other.as_string();
    }
    if (is_array()) {
        return as_array() == other.as_array();
    }
    return as_object() == other.as_object();
}

// ============================================================================
// Serialization
// ============================================================================

auto JsonValue::to_string() const -> std::string {
    std::string out;
    serialize_compact(*this, out);
    return out;
}

auto JsonValue::to_string_pretty(int indent) const -> std::string {
    std::string out;
    serialize_pretty(*this, out, indent, 0);
    return out;
}

auto json_string_array(const std::vector<std::string>& items) -> JsonValue {
    JsonArray arr;
    arr.reserve(items.size());
    for (const auto& item : items) {
        arr.emplace_back(item);
    }
    return JsonValue(std::move(arr));
}

auto escape_json_string(std::string_view s) -> std::string {
    std::string result;
    result.reserve(s.size() + 2);

    for (char c : s) {
        switch (c) {
        case '"':
            result += "\\\"";
            break;
        case '\\':
            result += "\\\\";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                std::ostringstream oss;
                oss << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                    << static_cast<int>(static_cast<unsigned char>(c));
                result += oss.str();
            } else {
                result += c;
            }
            break;
        }
    }

    return result;
}

} // namespace forge::json
