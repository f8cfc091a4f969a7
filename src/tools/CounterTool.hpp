#pragma once

#include "core/ToolHandler.hpp"
#include "core/ToolRegistry.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace toolrpc {

/**
 * @brief Counter shared by the counter tools
 *
 * Thread-safe; tools may be invoked concurrently.
 */
class Counter {
public:
    /// @throws std::overflow_error if the result leaves int64 range; the value is unchanged
    std::int64_t increment(std::int64_t quantity);
    std::int64_t decrement(std::int64_t quantity);
    std::int64_t value() const;

private:
    mutable std::mutex mutex_;
    std::int64_t value_ = 0;
};

/**
 * @brief One of the counter operations exposed as a tool
 *
 * increment and decrement take a non-negative "quantity" and return the new
 * value; get_value takes no arguments.
 */
class CounterTool : public ToolHandler {
public:
    enum class Operation {
        INCREMENT,
        DECREMENT,
        GET_VALUE
    };

    /**
     * @brief Construct tool over shared counter state
     * @param counter Counter instance (must not be null)
     * @param operation Operation performed by this tool
     */
    CounterTool(std::shared_ptr<Counter> counter, Operation operation);

    /**
     * @brief Descriptors for increment, decrement and get_value over one counter
     */
    static std::vector<ToolDescriptor> descriptors(const std::shared_ptr<Counter>& counter);

    ToolResult invoke(const json& args) override;

private:
    std::shared_ptr<Counter> counter_;
    Operation operation_;
};

} // namespace toolrpc
