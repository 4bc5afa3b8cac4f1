/**
 * @file catalog.hpp
 * @brief Built-in item set and TOML item catalogs.
 */

#pragma once

#include "core/result.hpp"
#include "registry/item_registry.hpp"

#include <filesystem>
#include <vector>

namespace tool_chain {

/**
 * @brief The built-in project workflow items.
 *
 *   smart_plan ──> smart_write ──> smart_finish
 *   smart_begin and smart_orchestrate have no dependencies.
 */
std::vector<ItemDefinition> builtin_catalog();

/**
 * @brief Load item definitions from a TOML file of [[item]] tables.
 *
 * Recognised keys: name (required), description, category, dependencies,
 * estimated_duration_ms, cost, reliability, parallelizable, cache_enabled,
 * version.
 */
Result<std::vector<ItemDefinition>> load_catalog(const std::filesystem::path& path);

}  // namespace tool_chain
