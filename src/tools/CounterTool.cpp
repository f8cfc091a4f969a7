#include "CounterTool.hpp"
#include "CheckedMath.hpp"
#include <spdlog/spdlog.h>
#include <limits>
#include <stdexcept>

namespace toolrpc {

std::int64_t Counter::increment(std::int64_t quantity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!checked::add(value_, quantity, value_)) {
        throw std::overflow_error("Counter overflow on increment");
    }
    return value_;
}

std::int64_t Counter::decrement(std::int64_t quantity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!checked::subtract(value_, quantity, value_)) {
        throw std::overflow_error("Counter overflow on decrement");
    }
    return value_;
}

std::int64_t Counter::value() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return value_;
}

CounterTool::CounterTool(std::shared_ptr<Counter> counter, Operation operation)
    : counter_(std::move(counter)), operation_(operation) {
    if (!counter_) {
        throw std::invalid_argument("Counter cannot be null");
    }
}

std::vector<ToolDescriptor> CounterTool::descriptors(const std::shared_ptr<Counter>& counter) {
    auto quantity_schema = [](const std::string& verb) {
        return Schema::object()
            .property("quantity", Schema::integer("How much to " + verb + " the counter by"), true)
            .closed();
    };

    std::vector<ToolDescriptor> tools;
    tools.push_back({
        "increment",
        "Increment the counter by a specified quantity",
        quantity_schema("increment"),
        std::make_shared<CounterTool>(counter, Operation::INCREMENT)
    });
    tools.push_back({
        "decrement",
        "Decrement the counter by a specified quantity",
        quantity_schema("decrement"),
        std::make_shared<CounterTool>(counter, Operation::DECREMENT)
    });
    tools.push_back({
        "get_value",
        "Get current value of counter",
        Schema::object().closed(),
        std::make_shared<CounterTool>(counter, Operation::GET_VALUE)
    });
    return tools;
}

ToolResult CounterTool::invoke(const json& args) {
    if (operation_ == Operation::GET_VALUE) {
        return ToolResult::success(counter_->value());
    }

    if (!args.contains("quantity") || !args["quantity"].is_number_integer()) {
        return ToolResult::failure(ToolError::invalid_argument("Missing required parameter: quantity"));
    }

    const json& quantity_value = args["quantity"];
    if (!quantity_value.is_number_unsigned() && quantity_value.get<std::int64_t>() < 0) {
        return ToolResult::failure(ToolError::invalid_argument("quantity must not be negative"));
    }
    if (quantity_value.get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
        return ToolResult::failure(ToolError::invalid_argument("quantity is too large"));
    }

    const auto quantity = static_cast<std::int64_t>(quantity_value.get<std::uint64_t>());
    std::int64_t value = 0;
    try {
        value = operation_ == Operation::INCREMENT
            ? counter_->increment(quantity)
            : counter_->decrement(quantity);
    } catch (const std::overflow_error& e) {
        spdlog::warn("CounterTool: {}", e.what());
        return ToolResult::failure(ToolError::execution_failure(e.what()));
    }

    spdlog::debug("CounterTool: counter is now {}", value);
    return ToolResult::success(value);
}

} // namespace toolrpc
