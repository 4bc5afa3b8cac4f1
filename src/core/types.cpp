/**
 * @file types.cpp
 * @brief Parsing helpers for vocabulary types.
 */

#include "core/types.hpp"

#include <algorithm>
#include <array>

namespace tool_chain {

std::optional<ItemCategory> parse_category(std::string_view text) noexcept {
    static constexpr std::array kAll{
        ItemCategory::Planning,
        ItemCategory::Generation,
        ItemCategory::Analysis,
        ItemCategory::Transformation,
        ItemCategory::Validation,
        ItemCategory::Orchestration
    };
    for (auto category : kAll) {
        if (to_string(category) == text) return category;
    }
    return std::nullopt;
}

bool RetryPolicy::triggers_on(std::string_view condition) const noexcept {
    return std::any_of(retry_on.begin(), retry_on.end(),
                       [condition](const std::string& c) { return c == condition; });
}

}  // namespace tool_chain
