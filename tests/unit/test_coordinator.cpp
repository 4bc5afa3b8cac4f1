/**
 * @file test_coordinator.cpp
 * @brief Unit tests for the Coordinator facade.
 */

#include "coordinator/coordinator.hpp"
#include "executor/dispatch_executor.hpp"
#include "registry/catalog.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>

using namespace tool_chain;

// ─── Fixture ─────────────────────────────────

class CoordinatorTest : public ::testing::Test {
protected:
    std::atomic<int> calls_{0};

    Config base_config() {
        Config config = default_config();
        config.catalog.builtin = true;
        config.catalog.path.clear();
        config.telemetry.log_dir.clear();
        config.planner.backoff_ms = 1;
        config.executor.thread_count = 2;
        return config;
    }

    /// A coordinator whose executor succeeds for every item.
    std::unique_ptr<Coordinator> make_coordinator(Config config,
                                                  std::shared_ptr<ItemRegistry> registry = nullptr,
                                                  std::shared_ptr<PerformanceTracker> tracker = nullptr) {
        auto executor = std::make_unique<DispatchExecutor>();
        for (const auto& def : builtin_catalog()) {
            executor->register_handler(def.name, [this, name = def.name](
                                                     const Payload& input, std::stop_token) -> Result<Payload> {
                ++calls_;
                return Payload{{"item", name}, {"input", input}};
            });
        }

        Coordinator::Options options;
        options.config = std::move(config);
        options.log_level = LogLevel::Error;
        options.executor = std::move(executor);
        options.registry = std::move(registry);
        options.tracker = std::move(tracker);
        return std::make_unique<Coordinator>(std::move(options));
    }

    static PlanRequest request_for(std::vector<ItemName> names) {
        PlanRequest request;
        request.name = "test";
        for (auto& n : names) request.items.push_back(ItemRequest{std::move(n), Payload::object()});
        return request;
    }
};

// ─── Registration ────────────────────────────

TEST_F(CoordinatorTest, LoadsBuiltinItems) {
    auto coordinator = make_coordinator(base_config());
    ASSERT_TRUE(coordinator->load_items().has_value());

    EXPECT_EQ(coordinator->registry().size(), 5u);
    EXPECT_EQ(coordinator->tracker().profiles().size(), 5u);
    EXPECT_EQ(coordinator->executor().name(), "dispatch");
}

TEST_F(CoordinatorTest, BuiltinDisabledLeavesRegistryEmpty) {
    auto config = base_config();
    config.catalog.builtin = false;
    auto coordinator = make_coordinator(config);
    ASSERT_TRUE(coordinator->load_items().has_value());
    EXPECT_EQ(coordinator->registry().size(), 0u);
}

TEST_F(CoordinatorTest, LoadsCatalogFile) {
    auto dir = std::filesystem::temp_directory_path() / "tco_test_coordinator";
    std::filesystem::create_directories(dir);
    auto path = dir / "catalog.toml";
    {
        std::ofstream out(path);
        out << "[[item]]\nname = \"lint\"\ncategory = \"validation\"\n"
            << "dependencies = [\"smart_write\"]\n";
    }

    auto config = base_config();
    config.catalog.path = path;
    auto coordinator = make_coordinator(config);
    ASSERT_TRUE(coordinator->load_items().has_value());
    EXPECT_TRUE(coordinator->registry().contains("lint"));
    EXPECT_EQ(coordinator->registry().size(), 6u);

    std::filesystem::remove_all(dir);
}

TEST_F(CoordinatorTest, MissingCatalogFileFails) {
    auto config = base_config();
    config.catalog.path = "/nonexistent/catalog.toml";
    auto coordinator = make_coordinator(config);

    auto loaded = coordinator->load_items();
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::InvalidConfig);
}

TEST_F(CoordinatorTest, InvalidItemRejectedWithoutProfile) {
    auto coordinator = make_coordinator(base_config());

    ItemDefinition bad;
    bad.name = "bad";
    bad.reliability = 1.5;
    EXPECT_FALSE(coordinator->register_item(bad).has_value());
    EXPECT_FALSE(coordinator->tracker().profile("bad").has_value());
}

TEST_F(CoordinatorTest, StrictRegistrationRejectsDuplicates) {
    auto config = base_config();
    config.planner.strict_registration = true;
    auto coordinator = make_coordinator(config);
    ASSERT_TRUE(coordinator->load_items().has_value());

    ItemDefinition again;
    again.name = "smart_begin";
    auto r = coordinator->register_item(again);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::DuplicateName);
}

TEST_F(CoordinatorTest, InjectedRegistryAndTrackerOutliveCoordinator) {
    auto registry = std::make_shared<ItemRegistry>();
    auto tracker = std::make_shared<PerformanceTracker>();

    ItemDefinition begin;
    begin.name = "smart_begin";
    ASSERT_TRUE(registry->register_item(begin).has_value());

    {
        auto config = base_config();
        config.catalog.builtin = false;
        auto coordinator = make_coordinator(config, registry, tracker);
        EXPECT_EQ(&coordinator->registry(), registry.get());
        EXPECT_EQ(&coordinator->tracker(), tracker.get());

        auto plan = coordinator->create_plan(request_for({"smart_begin"}));
        ASSERT_TRUE(plan.has_value()) << plan.error().message;
        EXPECT_TRUE(coordinator->execute_plan(*plan).success);
    }

    EXPECT_EQ(tracker->history_size(), 1u);
    ASSERT_TRUE(tracker->profile("smart_begin").has_value());
    EXPECT_EQ(tracker->profile("smart_begin")->sample_count, 1u);

    // A second coordinator sees the state left by the first.
    auto next = make_coordinator(base_config(), registry, tracker);
    EXPECT_TRUE(next->registry().contains("smart_begin"));
    EXPECT_EQ(next->performance_metrics().total_executions, 1u);
}

// ─── Planning & Execution ────────────────────

TEST_F(CoordinatorTest, PlanAndExecute) {
    auto coordinator = make_coordinator(base_config());
    ASSERT_TRUE(coordinator->load_items().has_value());

    auto plan = coordinator->create_plan(request_for({"smart_finish", "smart_orchestrate"}));
    ASSERT_TRUE(plan.has_value()) << plan.error().message;
    EXPECT_EQ(plan->steps.size(), 4u);

    auto result = coordinator->execute_plan(*plan);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.step_results.size(), 4u);
    EXPECT_EQ(calls_.load(), 4);

    auto report = coordinator->performance_metrics();
    EXPECT_EQ(report.total_executions, 1u);
    EXPECT_DOUBLE_EQ(report.error_rate, 0.0);
    EXPECT_EQ(coordinator->tracker().profile("smart_write")->sample_count, 1u);
}

TEST_F(CoordinatorTest, UnknownItemPlanFails) {
    auto coordinator = make_coordinator(base_config());
    ASSERT_TRUE(coordinator->load_items().has_value());

    auto plan = coordinator->create_plan(request_for({"ghost"}));
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().code, ErrorCode::ItemNotFound);
}

TEST_F(CoordinatorTest, SuggestionsForBuiltinPlan) {
    auto coordinator = make_coordinator(base_config());
    ASSERT_TRUE(coordinator->load_items().has_value());

    auto plan = coordinator->create_plan(request_for({"smart_finish", "smart_orchestrate"}));
    ASSERT_TRUE(plan.has_value());
    EXPECT_FALSE(coordinator->suggest_optimizations(*plan).empty());
}

TEST_F(CoordinatorTest, SecondRunHitsCache) {
    auto coordinator = make_coordinator(base_config());
    ASSERT_TRUE(coordinator->load_items().has_value());
    auto plan = coordinator->create_plan(request_for({"smart_begin", "smart_finish"}));
    ASSERT_TRUE(plan.has_value());

    coordinator->execute_plan(*plan);
    const int first_calls = calls_.load();
    auto second = coordinator->execute_plan(*plan);

    // smart_finish is the only builtin without caching.
    EXPECT_EQ(second.summary.cache_hits, plan->steps.size() - 1);
    EXPECT_EQ(calls_.load(), first_calls + 1);
    EXPECT_GT(coordinator->cache_stats().size, 0u);
}

TEST_F(CoordinatorTest, CacheDisabledByConfig) {
    auto config = base_config();
    config.engine.cache_enabled = false;
    auto coordinator = make_coordinator(config);
    ASSERT_TRUE(coordinator->load_items().has_value());
    auto plan = coordinator->create_plan(request_for({"smart_begin"}));
    ASSERT_TRUE(plan.has_value());

    coordinator->execute_plan(*plan);
    auto second = coordinator->execute_plan(*plan);
    EXPECT_EQ(second.summary.cache_hits, 0u);
}

// ─── Maintenance ─────────────────────────────

TEST_F(CoordinatorTest, ClearCacheForcesReexecution) {
    auto coordinator = make_coordinator(base_config());
    ASSERT_TRUE(coordinator->load_items().has_value());
    auto plan = coordinator->create_plan(request_for({"smart_begin"}));
    ASSERT_TRUE(plan.has_value());

    coordinator->execute_plan(*plan);
    coordinator->clear_cache();
    EXPECT_EQ(coordinator->cache_stats().size, 0u);

    auto again = coordinator->execute_plan(*plan);
    EXPECT_EQ(again.summary.cache_hits, 0u);
    EXPECT_EQ(calls_.load(), 2);
}

TEST_F(CoordinatorTest, ClearAllResetsHistoryAndProfiles) {
    auto coordinator = make_coordinator(base_config());
    ASSERT_TRUE(coordinator->load_items().has_value());
    auto plan = coordinator->create_plan(request_for({"smart_begin"}));
    ASSERT_TRUE(plan.has_value());

    coordinator->execute_plan(*plan);
    ASSERT_EQ(coordinator->tracker().history_size(), 1u);

    coordinator->clear_all();
    EXPECT_EQ(coordinator->tracker().history_size(), 0u);
    EXPECT_EQ(coordinator->cache_stats().size, 0u);

    auto profile = coordinator->tracker().profile("smart_begin");
    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(profile->sample_count, 0u);
    EXPECT_DOUBLE_EQ(profile->success_rate, 0.95);
    EXPECT_EQ(coordinator->registry().size(), 5u);
}

// ─── make_executor ───────────────────────────

TEST(MakeExecutorTest, BuildsConfiguredKind) {
    ItemRegistry registry;
    ExecutorConfig config;

    config.kind = "simulated";
    EXPECT_EQ(make_executor(config, registry)->name(), "simulated");

    config.kind = "dispatch";
    EXPECT_EQ(make_executor(config, registry)->name(), "dispatch");
}

TEST(MakeExecutorTest, DefaultCoordinatorUsesSimulatedExecutor) {
    Coordinator::Options options;
    options.config = default_config();
    options.config.telemetry.log_dir.clear();
    options.config.executor.time_scale = 0.0;
    Coordinator coordinator(std::move(options));
    EXPECT_EQ(coordinator.executor().name(), "simulated");
}
