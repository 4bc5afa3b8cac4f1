/**
 * @file simulated_executor.hpp
 * @brief Deterministic simulated executor for demos, benchmarks and tests.
 */

#pragma once

#include "executor/item_executor.hpp"
#include "registry/item_registry.hpp"

#include <atomic>
#include <mutex>
#include <random>

namespace tool_chain {

/**
 * @brief Simulates item execution from the registry's declared estimates.
 *
 * Each invocation waits estimated_duration plus up to 200 ms of jitter,
 * scaled by time_scale (0 makes invocations instantaneous), then fails
 * with a transient "service_unavailable" error with probability
 * 1 - reliability. The generator is seeded, so a given seed and call
 * sequence always produce the same outcomes.
 */
class SimulatedExecutor : public IItemExecutor {
public:
    SimulatedExecutor(const ItemRegistry& registry, uint64_t seed, double time_scale = 1.0);

    Result<Payload> invoke(const ItemName& item,
                           const Payload& input,
                           std::stop_token stop) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "simulated"; }

    [[nodiscard]] uint64_t invocation_count() const noexcept { return invocations_.load(); }

private:
    const ItemRegistry& registry_;
    double time_scale_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
    std::atomic<uint64_t> invocations_{0};
};

}  // namespace tool_chain
