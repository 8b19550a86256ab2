//! # Build and Status Command Interface
//!
//! | Function               | Description                              |
//! |------------------------|------------------------------------------|
//! | `run_build_command()`  | Regenerate stale modules                 |
//! | `run_status_command()` | Report stale and fresh modules           |
//!
//! Both return `EXIT_OK`, `EXIT_CONFIG_OR_DISCOVERY` or
//! `EXIT_GENERATION_ERROR` from `cli/utils.hpp`.

#pragma once

#include "cli/project.hpp"

namespace forge::cli {

int run_build_command(const CommandOptions& options);
int run_status_command(const CommandOptions& options);

} // namespace forge::cli
