//! # Dependency Graph Utilities
//!
//! Kahn's algorithm for ordering, Johnson's circuit enumeration for cycle
//! diagnostics, and the stale-set / critical-path passes used by the
//! scheduler.

#include "build/graph.hpp"

#include <algorithm>
#include <deque>
#include <utility>

namespace forge::build {

namespace {

/// Johnson's algorithm state for one start node.
class CircuitFinder {
public:
    CircuitFinder(const Graph& graph, std::vector<std::vector<std::string>>& out)
        : graph_(graph), out_(out) {}

    void run(const std::string& start) {
        start_ = start;
        blocked_.clear();
        blocked_by_.clear();
        path_.clear();
        circuit(start);
    }

private:
    const Graph& graph_;
    std::vector<std::vector<std::string>>& out_;
    std::string start_;
    std::set<std::string> blocked_;
    std::map<std::string, std::set<std::string>> blocked_by_;
    std::vector<std::string> path_;

    /// Successors restricted to nodes not smaller than the start node.
    auto successors(const std::string& node) const -> std::vector<std::string> {
        std::vector<std::string> result;
        auto it = graph_.find(node);
        if (it == graph_.end()) {
            return result;
        }
        for (const auto& next : it->second) {
            if (next >= start_) {
                result.push_back(next);
            }
        }
        return result;
    }

    void unblock(const std::string& node) {
        blocked_.erase(node);
        auto it = blocked_by_.find(node);
        if (it == blocked_by_.end()) {
            return;
        }
        std::set<std::string> waiting = std::move(it->second);
        blocked_by_.erase(it);
        for (const auto& w : waiting) {
            if (blocked_.count(w) > 0) {
                unblock(w);
            }
        }
    }

    auto circuit(const std::string& node) -> bool {
        bool found = false;
        path_.push_back(node);
        blocked_.insert(node);

        for (const auto& next : successors(node)) {
            if (next == start_) {
                out_.push_back(path_);
                found = true;
            } else if (blocked_.count(next) == 0 && circuit(next)) {
                found = true;
            }
        }

        if (found) {
            unblock(node);
        } else {
            for (const auto& next : successors(node)) {
                blocked_by_[next].insert(node);
            }
        }

        path_.pop_back();
        return found;
    }
};

} // namespace

auto graph_nodes(const Graph& graph) -> std::set<std::string> {
    std::set<std::string> nodes;
    for (const auto& [node, deps] : graph) {
        nodes.insert(node);
        nodes.insert(deps.begin(), deps.end());
    }
    return nodes;
}

auto topological_order(const Graph& graph)
    -> Result<std::vector<std::string>, DependencyCycleError> {
    std::set<std::string> nodes = graph_nodes(graph);
    Graph dependents = invert(graph);

    std::map<std::string, size_t> pending;
    std::set<std::string> ready;
    for (const auto& node : nodes) {
        auto it = graph.find(node);
        size_t count = it == graph.end() ? 0 : it->second.size();
        pending[node] = count;
        if (count == 0) {
            ready.insert(node);
        }
    }

    std::vector<std::string> order;
    order.reserve(nodes.size());
    while (!ready.empty()) {
        std::string node = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(node);
        for (const auto& dependent : dependents[node]) {
            if (--pending[dependent] == 0) {
                ready.insert(dependent);
            }
        }
    }

    if (order.size() == nodes.size()) {
        return order;
    }

    // Whatever is left sits on or behind a cycle
    std::set<std::string> remaining;
    for (const auto& [node, count] : pending) {
        if (count > 0) {
            remaining.insert(node);
        }
    }
    auto cycles = find_cycles(induced_subgraph(graph, remaining));
    if (!cycles.empty()) {
        return DependencyCycleError{cycles.front(), ""};
    }
    return DependencyCycleError{std::vector<std::string>(remaining.begin(), remaining.end()), ""};
}

auto find_cycles(const Graph& graph) -> std::vector<std::vector<std::string>> {
    std::vector<std::vector<std::string>> cycles;
    CircuitFinder finder(graph, cycles);
    for (const auto& node : graph_nodes(graph)) {
        finder.run(node);
    }
    std::sort(cycles.begin(), cycles.end());
    return cycles;
}

auto induced_subgraph(const Graph& graph, const std::set<std::string>& nodes) -> Graph {
    Graph result;
    for (const auto& node : nodes) {
        auto& deps = result[node];
        auto it = graph.find(node);
        if (it == graph.end()) {
            continue;
        }
        for (const auto& dep : it->second) {
            if (nodes.count(dep) > 0) {
                deps.insert(dep);
            }
        }
    }
    return result;
}

auto invert(const Graph& graph) -> Graph {
    Graph dependents;
    for (const auto& node : graph_nodes(graph)) {
        dependents[node];
    }
    for (const auto& [node, deps] : graph) {
        for (const auto& dep : deps) {
            dependents[dep].insert(node);
        }
    }
    return dependents;
}

auto expand_stale_modules(const Graph& module_dag, const std::set<std::string>& stale)
    -> std::set<std::string> {
    Graph dependents = invert(module_dag);
    std::set<std::string> visited;
    std::deque<std::string> queue(stale.begin(), stale.end());

    while (!queue.empty()) {
        std::string node = std::move(queue.front());
        queue.pop_front();
        if (!visited.insert(node).second) {
            continue;
        }
        auto it = dependents.find(node);
        if (it == dependents.end()) {
            continue;
        }
        for (const auto& dependent : it->second) {
            if (visited.count(dependent) == 0) {
                queue.push_back(dependent);
            }
        }
    }
    return visited;
}

auto critical_path_lengths(const std::set<std::string>& working_set, const Graph& full_dag)
    -> std::map<std::string, int> {
    Graph dependents = invert(induced_subgraph(full_dag, working_set));

    std::map<std::string, int> lengths;
    std::set<std::string> on_stack;

    for (const auto& root : working_set) {
        if (lengths.count(root) > 0) {
            continue;
        }

        // Post-order walk: (node, children expanded?)
        std::vector<std::pair<std::string, bool>> stack;
        stack.emplace_back(root, false);
        while (!stack.empty()) {
            auto [node, expanded] = stack.back();
            stack.pop_back();

            if (expanded) {
                int best = -1;
                for (const auto& dependent : dependents[node]) {
                    auto it = lengths.find(dependent);
                    int value = it == lengths.end() ? 0 : it->second;
                    best = std::max(best, value);
                }
                lengths[node] = best < 0 ? 0 : best + 1;
                on_stack.erase(node);
                continue;
            }

            if (lengths.count(node) > 0 || on_stack.count(node) > 0) {
                continue;
            }
            on_stack.insert(node);
            stack.emplace_back(node, true);
            for (const auto& dependent : dependents[node]) {
                if (lengths.count(dependent) == 0 && on_stack.count(dependent) == 0) {
                    stack.emplace_back(dependent, false);
                }
            }
        }
    }
    return lengths;
}

auto dependency_closure(const Graph& graph, const std::set<std::string>& roots)
    -> std::set<std::string> {
    std::set<std::string> visited;
    std::vector<std::string> stack(roots.begin(), roots.end());
    while (!stack.empty()) {
        std::string node = std::move(stack.back());
        stack.pop_back();
        if (!visited.insert(node).second) {
            continue;
        }
        auto it = graph.find(node);
        if (it == graph.end()) {
            continue;
        }
        for (const auto& dep : it->second) {
            if (visited.count(dep) == 0) {
                stack.push_back(dep);
            }
        }
    }
    return visited;
}

} // namespace forge::build
