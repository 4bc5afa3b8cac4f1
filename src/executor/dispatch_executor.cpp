/**
 * @file dispatch_executor.cpp
 * @brief DispatchExecutor implementation.
 */

#include "executor/dispatch_executor.hpp"

#include <mutex>

namespace tool_chain {

void DispatchExecutor::register_handler(const ItemName& item, Handler handler) {
    std::unique_lock lock(mutex_);
    handlers_[item] = std::move(handler);
}


Result<Payload> DispatchExecutor::invoke(const ItemName& item,
                                         const Payload& input,
                                         std::stop_token stop) {
    Handler handler;
    {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(item);
        if (it == handlers_.end()) {
            return Error::permanent("No handler registered for " + item);
        }
        handler = it->second;
    }
    // Called outside the lock so handlers may run concurrently.
    return handler(input, stop);
}

}  // namespace tool_chain
