/**
 * @file dependency_graph.cpp
 * @brief DependencyGraph implementation: DFS ordering and graph building.
 *
 * Ordering is an iterative depth-first search with white/gray/black
 * colouring, so deep chains do not grow the call stack. Complexity O(V+E).
 */

#include "planner/dependency_graph.hpp"

#include <algorithm>
#include <deque>
#include <stack>
#include <unordered_set>

namespace tool_chain {

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

void DependencyGraph::add_node(const ItemName& name) {
    if (deps_.contains(name)) return;
    order_.push_back(name);
    deps_[name];
}

void DependencyGraph::add_dependency(const ItemName& item, const ItemName& depends_on) {
    add_node(item);
    add_node(depends_on);

    auto& deps = deps_[item];
    if (std::find(deps.begin(), deps.end(), depends_on) != deps.end()) return;
    deps.push_back(depends_on);
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

bool DependencyGraph::contains(const ItemName& name) const {
    return deps_.contains(name);
}

std::vector<ItemName> DependencyGraph::dependencies(const ItemName& name) const {
    auto it = deps_.find(name);
    if (it == deps_.end()) return {};
    return it->second;
}

bool DependencyGraph::has_cycle() const {
    auto ordered = leveled_order();
    return !ordered.has_value() && ordered.error().code == ErrorCode::CircularDependency;
}

// ─────────────────────────────────────────────
// Topological Ordering (three-colour DFS)
// ─────────────────────────────────────────────

Result<std::vector<LeveledItem>> DependencyGraph::leveled_order() const {
    enum class Color : uint8_t { White, Gray, Black };
    std::unordered_map<ItemName, Color> color;
    std::unordered_map<ItemName, uint32_t> level;

    for (const auto& name : order_) {
        color[name] = Color::White;
    }

    std::vector<LeveledItem> sorted;
    sorted.reserve(order_.size());

    struct Frame {
        ItemName node;
        size_t dep_idx;
    };

    for (const auto& start : order_) {
        if (color[start] != Color::White) continue;

        std::stack<Frame> dfs_stack;
        dfs_stack.push({start, 0});
        color[start] = Color::Gray;

        while (!dfs_stack.empty()) {
            auto& [node, idx] = dfs_stack.top();
            const auto& deps = deps_.at(node);

            if (idx >= deps.size()) {
                // All dependencies finished: the node's level is now known.
                uint32_t node_level = 0;
                for (const auto& dep : deps) {
                    node_level = std::max(node_level, level[dep] + 1);
                }
                level[node] = node_level;
                color[node] = Color::Black;
                sorted.push_back(LeveledItem{node, node_level});
                dfs_stack.pop();
                continue;
            }

            const auto& dep = deps[idx];
            ++idx;

            if (color[dep] == Color::Gray) {
                return Error{ErrorCode::CircularDependency,
                             "Circular dependency detected: " + dep};
            }
            if (color[dep] == Color::White) {
                color[dep] = Color::Gray;
                dfs_stack.push({dep, 0});
            }
        }
    }

    return sorted;
}

// ─────────────────────────────────────────────
// Graph Builder
// ─────────────────────────────────────────────

Result<DependencyGraph> build_dependency_graph(const std::vector<ItemRequest>& requests,
                                               const ItemRegistry& registry) {
    DependencyGraph graph;
    std::unordered_set<ItemName> expanded;
    std::deque<ItemName> pending;

    for (const auto& request : requests) {
        if (!registry.contains(request.name)) {
            return Error{ErrorCode::ItemNotFound, "Item not found: " + request.name};
        }
        graph.add_node(request.name);
        pending.push_back(request.name);
    }

    // Breadth-first expansion pulls in unrequested transitive dependencies.
    while (!pending.empty()) {
        auto name = std::move(pending.front());
        pending.pop_front();
        if (!expanded.insert(name).second) continue;

        auto definition = registry.get(name);
        if (!definition) {
            return Error{ErrorCode::ItemNotFound, "Item not found: " + name};
        }

        for (const auto& dep : definition->dependencies) {
            if (!registry.contains(dep)) {
                return Error{ErrorCode::ItemNotFound,
                             "Item not found: " + dep + " (required by " + name + ")"};
            }
            graph.add_dependency(name, dep);
            if (!expanded.contains(dep)) {
                pending.push_back(dep);
            }
        }
    }

    return graph;
}

}  // namespace tool_chain
