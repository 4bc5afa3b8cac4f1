/**
 * @file dispatch_executor.hpp
 * @brief Executor that routes each item to a registered handler.
 */

#pragma once

#include "executor/item_executor.hpp"

#include <functional>
#include <shared_mutex>
#include <unordered_map>

namespace tool_chain {

/**
 * @brief Production executor: item name → handler callable.
 *
 * Handlers are supplied by the embedding application. An item with no
 * handler fails permanently.
 */
class DispatchExecutor : public IItemExecutor {
public:
    using Handler = std::function<Result<Payload>(const Payload& input, std::stop_token stop)>;

    void register_handler(const ItemName& item, Handler handler);

    Result<Payload> invoke(const ItemName& item,
                           const Payload& input,
                           std::stop_token stop) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "dispatch"; }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<ItemName, Handler> handlers_;
};

}  // namespace tool_chain
