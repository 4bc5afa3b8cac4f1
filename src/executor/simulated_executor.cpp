/**
 * @file simulated_executor.cpp
 * @brief SimulatedExecutor implementation.
 */

#include "executor/simulated_executor.hpp"

#include "executor/thread_pool.hpp"

#include <chrono>

namespace tool_chain {

namespace {
constexpr double kMaxJitterUs = 200'000.0;
}  // namespace

SimulatedExecutor::SimulatedExecutor(const ItemRegistry& registry, uint64_t seed, double time_scale)
    : registry_(registry), time_scale_(time_scale), rng_(seed) {}

Result<Payload> SimulatedExecutor::invoke(const ItemName& item,
                                          const Payload& input,
                                          std::stop_token stop) {
    invocations_.fetch_add(1, std::memory_order_relaxed);

    auto definition = registry_.get(item);
    if (!definition) {
        return Error::permanent("Item " + item + " not found in registry");
    }

    double jitter_fraction = 0.0;
    double roll = 0.0;
    {
        std::lock_guard lock(rng_mutex_);
        std::uniform_real_distribution<double> unit(0.0, 1.0);
        jitter_fraction = unit(rng_);
        roll = unit(rng_);
    }

    const double simulated_us = static_cast<double>(definition->estimated_duration.count())
                              + jitter_fraction * kMaxJitterUs;
    const Duration wait{static_cast<int64_t>(simulated_us * time_scale_)};

    if (!sleep_interruptible(wait, stop)) {
        return Error::transient(std::string{kConditionTimeout},
                                "Simulated execution of " + item + " was cancelled");
    }

    if (roll >= definition->reliability) {
        return Error::transient(std::string{kConditionUnavailable},
                                "Simulated failure for " + item);
    }

    return Payload{
        {"item", item},
        {"input", input},
        {"output", "Simulated output from " + item},
        {"simulated_duration_ms", simulated_us / 1000.0},
        {"version", definition->version}
    };
}

}  // namespace tool_chain
