//! # Artifact Writer
//!
//! Maps spec modules to generated modules and writes generated sources
//! atomically.
//!
//! ## Path Mapping
//!
//! | Spec module | Generated module | Relative path |
//! |-------------|------------------|---------------|
//! | `pkg.mod` | `pkg.__generated__.mod` | `pkg/__generated__/mod.py` |
//! | `mod` | `__generated__.mod` | `__generated__/mod.py` |
//!
//! ## Write Discipline
//!
//! The content goes to a temp file in the destination directory, is flushed
//! and fsync'd, then renamed over the target. Readers see either the old file
//! or the complete new one.

#ifndef FORGE_BUILD_ARTIFACT_WRITER_HPP
#define FORGE_BUILD_ARTIFACT_WRITER_HPP

#include "build/errors.hpp"
#include "build/header.hpp"
#include "common.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace forge::build {

namespace fs = std::filesystem;

[[nodiscard]] auto spec_module_to_generated_module(const std::string& module,
                                                   const std::string& generated_dir)
    -> std::string;

[[nodiscard]] auto generated_module_to_relpath(const std::string& generated_module) -> fs::path;

/// `generated_module_to_relpath(spec_module_to_generated_module(...))`.
[[nodiscard]] auto generated_relpath(const std::string& module, const std::string& generated_dir)
    -> fs::path;

/// Writes `header + "\n" + source (trailing whitespace stripped) + "\n"`.
///
/// Refuses module names with empty components and any path that resolves
/// outside `package_dir`. Creates `__init__.py` in every parent package
/// directory of the artifact and the agent docs in its generated root.
[[nodiscard]] auto write_generated_module(const fs::path& package_dir,
                                          const std::string& generated_dir,
                                          const std::string& module, const std::string& source,
                                          const HeaderFields& header)
    -> Result<fs::path, WriteError>;

/// Writes `AGENTS.md` (plus a `CLAUDE.md` symlink to it) into a generated
/// root telling coding agents to edit specs instead. Existing files are left
/// alone; a missing `generated_root` is a no-op.
[[nodiscard]] auto ensure_agent_docs(const fs::path& generated_root) -> std::optional<WriteError>;

/// Atomically replaces `path` with `content` (temp file + fsync + rename).
[[nodiscard]] auto atomic_write_file(const fs::path& path, const std::string& content)
    -> std::optional<WriteError>;

/// Reads a previously generated artifact; nullopt if missing or unreadable.
[[nodiscard]] auto read_generated_module(const fs::path& package_dir,
                                         const std::string& generated_dir,
                                         const std::string& module) -> std::optional<std::string>;

} // namespace forge::build

#endif // FORGE_BUILD_ARTIFACT_WRITER_HPP
