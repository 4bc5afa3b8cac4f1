/**
 * @file item_executor.hpp
 * @brief Work executor strategy consumed by the ExecutionEngine.
 *
 * The engine knows nothing about what an item does; it hands the item name
 * and input payload to an IItemExecutor and classifies the outcome.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <stop_token>
#include <string_view>

namespace tool_chain {

/**
 * @brief Abstract interface for invoking a work item.
 *
 * Implementations report failure with Error::transient(condition, ...) when
 * a retry may succeed (the condition is matched against the step's retry
 * policy) and Error::permanent(...) otherwise. invoke() is called
 * concurrently from the engine's worker threads.
 */
class IItemExecutor {
public:
    virtual ~IItemExecutor() = default;

    virtual Result<Payload> invoke(const ItemName& item,
                                   const Payload& input,
                                   std::stop_token stop) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace tool_chain
