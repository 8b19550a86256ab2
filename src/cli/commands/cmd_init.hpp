//! # Init Command Interface
//!
//! `forge init [--force]` scaffolds a project: `forge.toml`, an empty spec
//! manifest and the `src/` and `tests/` directories.

#pragma once

#include "cli/project.hpp"

namespace forge::cli {

/// Config written by `forge init`.
extern const char* const INIT_CONFIG_TEMPLATE;

int run_init_command(const CommandOptions& options);

} // namespace forge::cli
