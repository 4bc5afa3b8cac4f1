/**
 * @file test_registry.cpp
 * @brief Unit tests for ItemRegistry and item catalogs.
 */

#include "registry/catalog.hpp"
#include "registry/item_registry.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace tool_chain;

// ─── Helper ──────────────────────────────────

static ItemDefinition make_item(const std::string& name,
                                std::vector<ItemName> deps = {},
                                double reliability = 0.95) {
    ItemDefinition def;
    def.name = name;
    def.description = "Item " + name;
    def.dependencies = std::move(deps);
    def.reliability = reliability;
    return def;
}

// ─── Registration ────────────────────────────

TEST(ItemRegistryTest, RegisterAndGet) {
    ItemRegistry registry;
    ASSERT_TRUE(registry.register_item(make_item("a")).has_value());

    auto def = registry.get("a");
    ASSERT_TRUE(def.has_value());
    EXPECT_EQ(def->description, "Item a");
    EXPECT_TRUE(registry.contains("a"));
    EXPECT_EQ(registry.size(), 1u);
}

TEST(ItemRegistryTest, GetUnknown) {
    ItemRegistry registry;
    EXPECT_FALSE(registry.get("missing").has_value());
    EXPECT_FALSE(registry.contains("missing"));
}

TEST(ItemRegistryTest, NamesInRegistrationOrder) {
    ItemRegistry registry;
    for (const auto* name : {"zeta", "alpha", "mid"}) {
        ASSERT_TRUE(registry.register_item(make_item(name)).has_value());
    }
    EXPECT_EQ(registry.names(), (std::vector<ItemName>{"zeta", "alpha", "mid"}));
}

TEST(ItemRegistryTest, OverwriteWhenNotStrict) {
    ItemRegistry registry;
    ASSERT_TRUE(registry.register_item(make_item("a", {}, 0.5)).has_value());
    ASSERT_TRUE(registry.register_item(make_item("a", {}, 0.99)).has_value());

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_DOUBLE_EQ(registry.get("a")->reliability, 0.99);
    EXPECT_EQ(registry.names().size(), 1u);
}

TEST(ItemRegistryTest, StrictRejectsDuplicate) {
    ItemRegistry registry(true);
    ASSERT_TRUE(registry.register_item(make_item("a", {}, 0.5)).has_value());

    auto again = registry.register_item(make_item("a", {}, 0.99));
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::DuplicateName);
    EXPECT_DOUBLE_EQ(registry.get("a")->reliability, 0.5);
}

TEST(ItemRegistryTest, ToggleStrict) {
    ItemRegistry registry;
    EXPECT_FALSE(registry.strict());
    registry.set_strict(true);
    EXPECT_TRUE(registry.strict());
}

TEST(ItemRegistryTest, RejectsInvalidDefinitions) {
    ItemRegistry registry;

    auto unnamed = registry.register_item(make_item(""));
    ASSERT_FALSE(unnamed.has_value());
    EXPECT_EQ(unnamed.error().code, ErrorCode::InvalidConfig);

    auto unreliable = registry.register_item(make_item("x", {}, 1.2));
    ASSERT_FALSE(unreliable.has_value());
    EXPECT_EQ(unreliable.error().code, ErrorCode::InvalidConfig);

    auto negative = make_item("y");
    negative.cost_per_execution = -1.0;
    EXPECT_FALSE(registry.register_item(negative).has_value());

    EXPECT_EQ(registry.size(), 0u);
}

TEST(ItemRegistryTest, UnknownDependencyIsAcceptedAtRegistration) {
    // Dependencies are resolved when a plan is built, not when registering.
    ItemRegistry registry;
    EXPECT_TRUE(registry.register_item(make_item("a", {"not_yet"})).has_value());
}

TEST(ItemRegistryTest, Clear) {
    ItemRegistry registry;
    ASSERT_TRUE(registry.register_item(make_item("a")).has_value());
    registry.clear();
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(registry.names().empty());
}

TEST(ItemRegistryTest, ConcurrentRegistration) {
    ItemRegistry registry;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&registry, t] {
            for (int i = 0; i < 50; ++i) {
                auto r = registry.register_item(
                    make_item("item_" + std::to_string(t) + "_" + std::to_string(i)));
                EXPECT_TRUE(r.has_value());
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(registry.size(), 200u);
}

// ─── Built-in catalog ────────────────────────

TEST(CatalogTest, BuiltinItems) {
    auto items = builtin_catalog();
    ASSERT_EQ(items.size(), 5u);

    ItemRegistry registry;
    for (const auto& item : items) {
        ASSERT_TRUE(registry.register_item(item).has_value());
    }

    auto write = registry.get("smart_write");
    ASSERT_TRUE(write.has_value());
    EXPECT_EQ(write->dependencies, (std::vector<ItemName>{"smart_plan"}));
    EXPECT_EQ(write->category, ItemCategory::Generation);
    EXPECT_DOUBLE_EQ(write->reliability, 0.88);
    EXPECT_TRUE(write->parallelizable);

    auto finish = registry.get("smart_finish");
    ASSERT_TRUE(finish.has_value());
    EXPECT_EQ(finish->dependencies, (std::vector<ItemName>{"smart_write"}));
    EXPECT_FALSE(finish->cache_enabled);
    EXPECT_EQ(finish->estimated_duration, from_ms(2500));
}

// ─── TOML catalog ────────────────────────────

class CatalogFileTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "tco_test_catalog";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "catalog.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(CatalogFileTest, LoadItems) {
    auto path = write_toml(R"(
        [[item]]
        name = "fetch"
        category = "analysis"
        estimated_duration_ms = 800
        cost = 0.005
        reliability = 0.97
        cache_enabled = true

        [[item]]
        name = "report"
        description = "Compile the report"
        category = "transformation"
        dependencies = ["fetch"]
        parallelizable = false
        version = "2.1.0"
    )");

    auto items = load_catalog(path);
    ASSERT_TRUE(items.has_value()) << items.error().message;
    ASSERT_EQ(items->size(), 2u);

    const auto& fetch = (*items)[0];
    EXPECT_EQ(fetch.name, "fetch");
    EXPECT_EQ(fetch.category, ItemCategory::Analysis);
    EXPECT_EQ(fetch.estimated_duration, from_ms(800));
    EXPECT_DOUBLE_EQ(fetch.cost_per_execution, 0.005);
    EXPECT_TRUE(fetch.cache_enabled);

    const auto& report = (*items)[1];
    EXPECT_EQ(report.dependencies, (std::vector<ItemName>{"fetch"}));
    EXPECT_FALSE(report.parallelizable);
    EXPECT_EQ(report.version, "2.1.0");
    // Defaults for omitted keys
    EXPECT_DOUBLE_EQ(report.reliability, 0.95);
    EXPECT_EQ(report.estimated_duration, from_ms(1000));
}

TEST_F(CatalogFileTest, EmptyFileHasNoItems) {
    auto items = load_catalog(write_toml("# nothing here\n"));
    ASSERT_TRUE(items.has_value());
    EXPECT_TRUE(items->empty());
}

TEST_F(CatalogFileTest, MissingNameIsRejected) {
    auto items = load_catalog(write_toml("[[item]]\ncost = 0.1\n"));
    ASSERT_FALSE(items.has_value());
    EXPECT_EQ(items.error().code, ErrorCode::InvalidConfig);
}

TEST_F(CatalogFileTest, UnknownCategoryIsRejected) {
    auto items = load_catalog(write_toml("[[item]]\nname = \"x\"\ncategory = \"magic\"\n"));
    ASSERT_FALSE(items.has_value());
    EXPECT_EQ(items.error().code, ErrorCode::InvalidConfig);
}

TEST_F(CatalogFileTest, MissingFile) {
    auto items = load_catalog(temp_dir_ / "absent.toml");
    ASSERT_FALSE(items.has_value());
    EXPECT_EQ(items.error().code, ErrorCode::InvalidConfig);
}
