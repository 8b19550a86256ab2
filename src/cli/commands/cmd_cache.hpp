//! # Cache Command Interface
//!
//! | Command       | Description                          |
//! |---------------|--------------------------------------|
//! | `cache info`  | Entry count, size and location       |
//! | `cache clear` | Remove every cached response         |

#pragma once

#include "cli/project.hpp"

namespace forge::cli {

int run_cache_command(const CommandOptions& options);

} // namespace forge::cli
