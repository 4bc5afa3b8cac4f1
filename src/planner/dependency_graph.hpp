/**
 * @file dependency_graph.hpp
 * @brief Dependency graph of requested work items.
 *
 * Built fresh for each plan request from the ItemRegistry. Nodes map an
 * item name to the names it depends on. Provides DFS topological ordering
 * with parallel-level assignment and cycle detection.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "planner/plan.hpp"
#include "registry/item_registry.hpp"

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace tool_chain {

/**
 * @brief An item placed in topological order with its parallel level.
 */
struct LeveledItem {
    ItemName name;
    uint32_t level{0};
};

/**
 * @brief Adjacency structure: item → items it depends on.
 */
class DependencyGraph {
public:
    DependencyGraph() = default;

    // ── Construction ──────────────────────────
    void add_node(const ItemName& name);
    void add_dependency(const ItemName& item, const ItemName& depends_on);

    // ── Queries ───────────────────────────────
    [[nodiscard]] bool contains(const ItemName& name) const;
    [[nodiscard]] const std::vector<ItemName>& nodes() const noexcept { return order_; }
    [[nodiscard]] std::vector<ItemName> dependencies(const ItemName& name) const;
    [[nodiscard]] size_t node_count() const noexcept { return order_.size(); }
    [[nodiscard]] bool has_cycle() const;

    /**
     * @brief Depth-first topological order with level assignment.
     *
     * Uses three-colour marking. level(item) is 0 without dependencies,
     * otherwise 1 + max(level(dep)). Items appear in DFS post-order
     * starting from nodes in insertion order. Fails with
     * CircularDependency naming the item that closes the cycle.
     */
    [[nodiscard]] Result<std::vector<LeveledItem>> leveled_order() const;

    /// Map form, as carried by ExecutionPlan.
    [[nodiscard]] std::unordered_map<ItemName, std::vector<ItemName>> adjacency() const {
        return deps_;
    }

private:
    std::vector<ItemName> order_;                                  // insertion order
    std::unordered_map<ItemName, std::vector<ItemName>> deps_;  // item → dependencies
};

/**
 * @brief Build the dependency graph for the requested items.
 *
 * Transitive dependencies are pulled in from the registry even when not
 * requested. Any unregistered name fails the whole build with ItemNotFound.
 */
Result<DependencyGraph> build_dependency_graph(const std::vector<ItemRequest>& requests,
                                               const ItemRegistry& registry);

}  // namespace tool_chain
