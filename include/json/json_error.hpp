//! # JSON Error Types
//!
//! Errors from JSON parsing, with the line and column where parsing stopped.

#pragma once

#include <cstddef>
#include <string>

namespace forge::json {

struct JsonError {
    std::string message;

    /// 1-based line (0 if unknown).
    size_t line = 0;

    /// 1-based column (0 if unknown).
    size_t column = 0;

    static auto make(std::string msg) -> JsonError {
        return JsonError{std::move(msg), 0, 0};
    }

    static auto make(std::string msg, size_t line, size_t column) -> JsonError {
        return JsonError{std::move(msg), line, column};
    }

    /// "line X, column Y: message", or just the message without location.
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + message;
        }
        return message;
    }
};

} // namespace forge::json
