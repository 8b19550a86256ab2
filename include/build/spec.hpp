//! # Spec Discovery
//!
//! A spec entry is one declared function or class stub that forge generates
//! an implementation for. Entries are discovered by an explicit pass over a
//! JSON manifest (`forge-specs.json`) and returned as a `SpecRegistry`;
//! nothing is registered globally.
//!
//! ## Manifest Format
//!
//! ```json
//! {"specs": [{"module": "pkg.a", "qualname": "A",
//!             "source_file": "src/pkg/a.py", "start_line": 1, "end_line": 3,
//!             "deps": ["pkg.b:B"], "prompt": "keep it pure"}]}
//! ```
//!
//! `source` may be given inline instead of `source_file`. Line ranges are
//! 1-based and inclusive; without a range the whole file is used.

#ifndef FORGE_BUILD_SPEC_HPP
#define FORGE_BUILD_SPEC_HPP

#include "build/errors.hpp"
#include "build/graph.hpp"
#include "common.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace forge::build {

namespace fs = std::filesystem;

/// `"module:qualname"`.
using SpecRef = std::string;

/// Trims whitespace and checks for exactly one ':' with non-empty sides.
[[nodiscard]] auto normalize_spec_ref(std::string_view raw) -> std::optional<SpecRef>;

/// Module part of a normalized ref.
[[nodiscard]] auto spec_ref_module(const SpecRef& ref) -> std::string;

struct SpecEntry {
    SpecRef spec_ref;
    std::string module;
    std::string qualname;
    std::string source_file; ///< Relative to the project root; empty for inline specs
    std::string source;      ///< The spec's source segment, resolved at load time
    std::vector<SpecRef> deps;
    std::string prompt;                ///< Optional generation guidance
    std::optional<bool> infer_deps;    ///< Per-spec override of `[build] infer_deps`
};

/// The result of discovery: every spec, keyed by ref.
struct SpecRegistry {
    std::map<SpecRef, SpecEntry> specs;

    /// module -> entries, each list sorted by qualname.
    [[nodiscard]] auto by_module() const -> std::map<std::string, std::vector<SpecEntry>>;

    [[nodiscard]] auto modules() const -> std::set<std::string>;

    /// Adds an entry; false if its ref is already present.
    auto add(SpecEntry entry) -> bool;
};

/// Reads and validates the manifest. Source files are resolved against
/// `project_root`.
[[nodiscard]] auto load_spec_manifest(const fs::path& manifest_path, const fs::path& project_root)
    -> Result<SpecRegistry, ConfigError>;

/// Parses manifest text (no file access for inline-only manifests).
[[nodiscard]] auto parse_spec_manifest(const std::string& text, const fs::path& project_root,
                                       const std::string& origin)
    -> Result<SpecRegistry, ConfigError>;

/// Resolves `--target MODULE[:QUALNAME]` arguments to the target modules plus
/// their dependency closure in `module_dag`.
[[nodiscard]] auto resolve_targets(const std::vector<std::string>& targets,
                                   const SpecRegistry& registry, const Graph& module_dag)
    -> Result<std::set<std::string>, ConfigError>;

} // namespace forge::build

#endif // FORGE_BUILD_SPEC_HPP
