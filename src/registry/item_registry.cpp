/**
 * @file item_registry.cpp
 * @brief ItemRegistry implementation.
 */

#include "registry/item_registry.hpp"

namespace tool_chain {

ItemRegistry::ItemRegistry(bool strict) : strict_(strict) {}

Result<void> ItemRegistry::register_item(ItemDefinition definition) {
    if (definition.name.empty()) {
        return Error{ErrorCode::InvalidConfig, "Item name must not be empty"};
    }
    if (definition.reliability < 0.0 || definition.reliability > 1.0) {
        return Error{ErrorCode::InvalidConfig,
                     "Reliability of " + definition.name + " must be in [0, 1]"};
    }
    if (definition.estimated_duration.count() < 0 || definition.cost_per_execution < 0.0) {
        return Error{ErrorCode::InvalidConfig,
                     "Estimates of " + definition.name + " must not be negative"};
    }

    std::unique_lock lock(mutex_);
    auto it = items_.find(definition.name);
    if (it != items_.end()) {
        if (strict_) {
            return Error{ErrorCode::DuplicateName,
                         "Item already registered: " + definition.name};
        }
        it->second = std::move(definition);
        return {};
    }

    order_.push_back(definition.name);
    auto name = definition.name;
    items_.emplace(std::move(name), std::move(definition));
    return {};
}

std::optional<ItemDefinition> ItemRegistry::get(const ItemName& name) const {
    std::shared_lock lock(mutex_);
    auto it = items_.find(name);
    if (it == items_.end()) return std::nullopt;
    return it->second;
}

bool ItemRegistry::contains(const ItemName& name) const {
    std::shared_lock lock(mutex_);
    return items_.contains(name);
}

std::vector<ItemName> ItemRegistry::names() const {
    std::shared_lock lock(mutex_);
    return order_;
}

size_t ItemRegistry::size() const {
    std::shared_lock lock(mutex_);
    return items_.size();
}

void ItemRegistry::set_strict(bool strict) {
    std::unique_lock lock(mutex_);
    strict_ = strict;
}

bool ItemRegistry::strict() const {
    std::shared_lock lock(mutex_);
    return strict_;
}

void ItemRegistry::clear() {
    std::unique_lock lock(mutex_);
    items_.clear();
    order_.clear();
}

}  // namespace tool_chain
