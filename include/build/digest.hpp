//! # Digest Service
//!
//! Content digests that decide staleness. All digests are SHA-256, rendered
//! as 64 lowercase hex characters.
//!
//! | Digest | Inputs |
//! |--------|--------|
//! | `local_digest` | spec ref, source segment, sorted explicit deps, prompt |
//! | `graph_digest` | local digest + graph digests of direct deps (sorted) |
//! | `module_digest` | `(ref, graph_digest)` of every entry, sorted by ref |
//!
//! Fields are NUL-separated so adjacent values cannot run together.

#ifndef FORGE_BUILD_DIGEST_HPP
#define FORGE_BUILD_DIGEST_HPP

#include "build/graph.hpp"
#include "build/spec.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace forge::build {

/// spec ref -> refs it depends on
using SpecGraph = Graph;

/// SHA-256 of `data` as lowercase hex (OpenSSL EVP).
[[nodiscard]] auto sha256_hex(std::string_view data) -> std::string;

/// SHA-256 over `<length>:<part>` for each part, so no two part lists collide.
[[nodiscard]] auto sha256_fields(const std::vector<std::string>& parts) -> std::string;

[[nodiscard]] auto local_digest(const SpecEntry& entry) -> std::string;

/// Transitive digest of `ref`. Unknown dependency refs contribute their ref
/// only; a back edge on a cycle contributes its ref only.
[[nodiscard]] auto graph_digest(const SpecRef& ref, const std::map<SpecRef, SpecEntry>& specs,
                                const SpecGraph& spec_graph) -> std::string;

/// Order-independent digest of a module's entries.
[[nodiscard]] auto module_digest(const std::string& module, const std::vector<SpecEntry>& entries,
                                 const std::map<SpecRef, SpecEntry>& specs,
                                 const SpecGraph& spec_graph) -> std::string;

/// Explicit deps plus, when `infer_deps`, refs whose leading qualname
/// component appears as an identifier in the spec's source. Every spec is a
/// key.
[[nodiscard]] auto build_spec_graph(const SpecRegistry& registry, bool infer_deps) -> SpecGraph;

/// Module-level DAG: a module depends on the modules of its specs' deps.
/// Self edges are dropped and every registry module is a key.
[[nodiscard]] auto collapse_to_module_dag(const SpecGraph& spec_graph,
                                          const SpecRegistry& registry) -> Graph;

} // namespace forge::build

#endif // FORGE_BUILD_DIGEST_HPP
