/**
 * @file execution_result.cpp
 * @brief Bottleneck rendering.
 */

#include "engine/execution_result.hpp"

#include <sstream>

namespace tool_chain {

std::string Bottleneck::describe() const {
    std::ostringstream oss;
    oss << item << ": ";
    if (kind == Kind::SlowExecution) {
        oss << std::chrono::duration_cast<std::chrono::milliseconds>(duration).count()
            << "ms (slow execution)";
    } else {
        oss << retry_count << (retry_count == 1 ? " retry" : " retries")
            << " (reliability issue)";
    }
    return oss.str();
}

}  // namespace tool_chain
