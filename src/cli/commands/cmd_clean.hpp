//! # Clean Command Interface
//!
//! `forge clean [--dry-run]` removes every directory named like the
//! configured generated dir under the source roots.

#pragma once

#include "cli/project.hpp"

#include <filesystem>
#include <vector>

namespace forge::cli {

int run_clean_command(const CommandOptions& options);

/// Generated directories under `roots`, sorted. Does not descend into a
/// directory once it matched.
std::vector<fs::path> find_generated_dirs(const std::vector<fs::path>& roots,
                                          const std::string& generated_dir);

} // namespace forge::cli
