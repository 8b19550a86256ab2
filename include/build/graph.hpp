//! # Dependency Graph Utilities
//!
//! Algorithms over a directed graph of named nodes, where `graph[n]` is the
//! set of nodes `n` depends on. Used for module DAGs and for spec-level
//! graphs (whose nodes are `"module:qualname"` refs).
//!
//! | Function | Purpose |
//! |----------|---------|
//! | `topological_order` | dependencies before dependents, or the cycle |
//! | `find_cycles` | every simple cycle, for diagnostics |
//! | `induced_subgraph` | restrict to a node set |
//! | `invert` | dependents map |
//! | `expand_stale_modules` | close a stale set over dependents |
//! | `critical_path_lengths` | longest dependent chain per node |
//!
//! Nodes that only appear as edge targets are treated as nodes with no
//! dependencies. Every function is deterministic for a fixed input.

#ifndef FORGE_BUILD_GRAPH_HPP
#define FORGE_BUILD_GRAPH_HPP

#include "build/errors.hpp"
#include "common.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace forge::build {

/// node -> nodes it depends on
using Graph = std::map<std::string, std::set<std::string>>;

/// Returns every node in dependency order (dependencies first).
///
/// Ties are broken by name. On a cycle the error lists one cycle's
/// participants in cycle order, starting at the smallest name.
[[nodiscard]] auto topological_order(const Graph& graph)
    -> Result<std::vector<std::string>, DependencyCycleError>;

/// Enumerates all simple cycles (Johnson's algorithm).
///
/// Each cycle is rotated to start at its smallest node and the list is
/// sorted. Self-loops are reported as one-node cycles.
[[nodiscard]] auto find_cycles(const Graph& graph) -> std::vector<std::vector<std::string>>;

/// Restricts `graph` to `nodes`, dropping edges to excluded nodes. Every node
/// in `nodes` is present as a key.
[[nodiscard]] auto induced_subgraph(const Graph& graph, const std::set<std::string>& nodes)
    -> Graph;

/// Returns node -> nodes that depend on it. Every node of `graph` is a key.
[[nodiscard]] auto invert(const Graph& graph) -> Graph;

/// Closes `stale` under "depends on a stale node". Terminates on cyclic
/// graphs.
[[nodiscard]] auto expand_stale_modules(const Graph& module_dag,
                                        const std::set<std::string>& stale)
    -> std::set<std::string>;

/// For each node of `working_set`: 0 when no node of the working set depends
/// on it, else 1 + the maximum over its dependents in the working set.
///
/// Iterative, so arbitrarily long chains do not exhaust the stack. A node
/// met again while still being visited contributes 0; that only happens
/// when the working set itself is cyclic.
[[nodiscard]] auto critical_path_lengths(const std::set<std::string>& working_set,
                                         const Graph& full_dag) -> std::map<std::string, int>;

/// All nodes of `graph`: keys plus edge targets.
[[nodiscard]] auto graph_nodes(const Graph& graph) -> std::set<std::string>;

/// `roots` plus everything they transitively depend on.
[[nodiscard]] auto dependency_closure(const Graph& graph, const std::set<std::string>& roots)
    -> std::set<std::string>;

} // namespace forge::build

#endif // FORGE_BUILD_GRAPH_HPP
