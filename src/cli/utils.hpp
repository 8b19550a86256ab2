//! # CLI Utilities Interface
//!
//! This header defines shared utility functions for the CLI.
//!
//! ## Functions
//!
//! | Function               | Description                          |
//! |------------------------|--------------------------------------|
//! | `print_usage()`        | Print CLI help text                  |
//! | `print_version()`      | Print tool version                   |
//! | `emit_json()`          | Pretty JSON document on stdout       |
//! | `format_size()`        | Human-readable byte size             |
//! | `format_build_failures()` | Failure listing for stderr        |

#pragma once

#include "json/json_value.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace forge::cli {

// Exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_CONFIG_OR_DISCOVERY = 2;
constexpr int EXIT_GENERATION_ERROR = 3;

// Help text
void print_usage();
void print_version();

// Output
void emit_json(const json::JsonValue& value);
std::string format_size(uintmax_t bytes);
std::string format_build_failures(const std::map<std::string, std::vector<std::string>>& failed);

/// Prints `error: <message>` on stderr and, in JSON mode, the failure
/// document on stdout. Returns `exit_code`.
int report_command_error(const std::string& command, bool json_mode, const std::string& message,
                         int exit_code);

/// True when stderr is attached to a terminal.
bool stderr_is_terminal();

} // namespace forge::cli
