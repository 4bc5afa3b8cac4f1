/**
 * @file catalog.cpp
 * @brief Built-in catalog and TOML catalog loading using toml++.
 */

#include "registry/catalog.hpp"

#include <toml++/toml.hpp>

namespace tool_chain {

namespace {

ItemDefinition make_item(std::string name, std::string description, ItemCategory category,
                         std::vector<ItemName> deps, int64_t duration_ms, double cost,
                         double reliability, bool parallelizable, bool cache_enabled) {
    ItemDefinition def;
    def.name = std::move(name);
    def.description = std::move(description);
    def.category = category;
    def.dependencies = std::move(deps);
    def.estimated_duration = from_ms(duration_ms);
    def.cost_per_execution = cost;
    def.reliability = reliability;
    def.parallelizable = parallelizable;
    def.cache_enabled = cache_enabled;
    return def;
}

}  // namespace

std::vector<ItemDefinition> builtin_catalog() {
    return {
        make_item("smart_begin", "Initialize a new project with smart planning",
                  ItemCategory::Planning, {}, 2000, 0.02, 0.95, false, true),
        make_item("smart_plan", "Create detailed project plans",
                  ItemCategory::Planning, {}, 3000, 0.03, 0.92, false, true),
        make_item("smart_write", "Generate code and documentation",
                  ItemCategory::Generation, {"smart_plan"}, 4000, 0.05, 0.88, true, true),
        make_item("smart_finish", "Finalize and validate project deliverables",
                  ItemCategory::Validation, {"smart_write"}, 2500, 0.025, 0.94, false, false),
        make_item("smart_orchestrate", "Orchestrate complex multi-tool workflows",
                  ItemCategory::Orchestration, {}, 1500, 0.015, 0.96, true, true),
    };
}

Result<std::vector<ItemDefinition>> load_catalog(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::InvalidConfig, "Catalog file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        std::vector<ItemDefinition> items;

        auto* entries = tbl["item"].as_array();
        if (!entries) return items;

        for (const auto& node : *entries) {
            const auto* entry = node.as_table();
            if (!entry) {
                return Error{ErrorCode::InvalidConfig, "Catalog entry is not a table"};
            }
            toml::node_view<const toml::node> view{entry};

            ItemDefinition def;
            def.name = view["name"].value_or(std::string{});
            if (def.name.empty()) {
                return Error{ErrorCode::InvalidConfig, "Catalog entry without a name"};
            }
            def.description = view["description"].value_or(std::string{});

            auto category = view["category"].value_or(std::string{"orchestration"});
            auto parsed = parse_category(category);
            if (!parsed) {
                return Error{ErrorCode::InvalidConfig,
                             "Unknown category '" + category + "' for " + def.name};
            }
            def.category = *parsed;

            if (const auto* deps = view["dependencies"].as_array()) {
                for (const auto& dep : *deps) {
                    auto dep_name = dep.value<std::string>();
                    if (!dep_name) {
                        return Error{ErrorCode::InvalidConfig,
                                     "Non-string dependency in " + def.name};
                    }
                    def.dependencies.push_back(*dep_name);
                }
            }

            def.estimated_duration = from_ms(view["estimated_duration_ms"].value_or(int64_t{1000}));
            def.cost_per_execution = view["cost"].value_or(0.01);
            def.reliability = view["reliability"].value_or(0.95);
            def.parallelizable = view["parallelizable"].value_or(true);
            def.cache_enabled = view["cache_enabled"].value_or(false);
            def.version = view["version"].value_or(std::string{"1.0.0"});

            items.push_back(std::move(def));
        }

        return items;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidConfig,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

}  // namespace tool_chain
