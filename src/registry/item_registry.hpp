/**
 * @file item_registry.hpp
 * @brief Store of declared work-item definitions.
 *
 * The registry is a plain keyed store: it validates and holds definitions
 * and answers lookups. It carries no scheduling behaviour. Instances are
 * created by the caller and injected into the Coordinator.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tool_chain {

/**
 * @brief Declaration of a schedulable work item.
 */
struct ItemDefinition {
    ItemName name;
    std::string description;
    ItemCategory category = ItemCategory::Orchestration;
    std::vector<ItemName> dependencies;
    Duration estimated_duration{from_ms(1000)};
    double cost_per_execution = 0.01;
    double reliability = 0.95;                ///< Probability of success in [0, 1]
    bool parallelizable = true;
    bool cache_enabled = false;
    std::string version = "1.0.0";

    bool operator==(const ItemDefinition&) const = default;
};

/**
 * @brief Thread-safe registry of item definitions keyed by name.
 */
class ItemRegistry {
public:
    explicit ItemRegistry(bool strict = false);

    /**
     * @brief Register or overwrite a definition.
     *
     * Fails with InvalidConfig for an empty name or a reliability outside
     * [0, 1]; with DuplicateName when strict and the name already exists.
     */
    Result<void> register_item(ItemDefinition definition);

    [[nodiscard]] std::optional<ItemDefinition> get(const ItemName& name) const;
    [[nodiscard]] bool contains(const ItemName& name) const;
    [[nodiscard]] std::vector<ItemName> names() const;
    [[nodiscard]] size_t size() const;

    void set_strict(bool strict);
    [[nodiscard]] bool strict() const;

    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<ItemName, ItemDefinition> items_;
    std::vector<ItemName> order_;             // registration order, for stable listing
    bool strict_;
};

}  // namespace tool_chain
