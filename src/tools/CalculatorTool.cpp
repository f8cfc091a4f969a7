#include "CalculatorTool.hpp"
#include "CheckedMath.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <limits>
#include <memory>

namespace toolrpc {

namespace {

bool fits_int64(const json& value) {
    return !value.is_number_unsigned() ||
        value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
}

} // namespace

ToolDescriptor CalculatorTool::descriptor() {
    return {
        "calculator",
        "Perform basic arithmetic operations",
        Schema::from_json({
            {"type", "object"},
            {"properties", {
                {"x", {
                    {"type", "integer"},
                    {"description", "First number in the calculation"}
                }},
                {"y", {
                    {"type", "integer"},
                    {"description", "Second number in the calculation"}
                }},
                {"operation", {
                    {"type", "string"},
                    {"enum", json::array({"add", "subtract", "multiply", "divide"})},
                    {"description", "The operation to perform (add, subtract, multiply, divide)"}
                }}
            }},
            {"required", json::array({"x", "y", "operation"})}
        }),
        std::make_shared<CalculatorTool>()
    };
}

ToolResult CalculatorTool::invoke(const json& args) {
    if (!args.contains("x") || !args.contains("y") || !args.contains("operation")) {
        return ToolResult::failure(
            ToolError::invalid_argument("Missing required parameter: x, y and operation are required"));
    }

    if (!fits_int64(args["x"]) || !fits_int64(args["y"])) {
        return ToolResult::failure(ToolError::invalid_argument("Operands must fit in a signed 64-bit integer"));
    }

    const auto x = args["x"].get<std::int64_t>();
    const auto y = args["y"].get<std::int64_t>();
    const auto operation = args["operation"].get<std::string>();

    spdlog::debug("CalculatorTool: {} {} {}", x, operation, y);

    std::int64_t result = 0;
    bool in_range = true;

    if (operation == "add") {
        in_range = checked::add(x, y, result);
    } else if (operation == "subtract") {
        in_range = checked::subtract(x, y, result);
    } else if (operation == "multiply") {
        in_range = checked::multiply(x, y, result);
    } else if (operation == "divide") {
        if (y == 0) {
            return ToolResult::failure(ToolError::execution_failure("Division by zero"));
        }
        in_range = checked::divide(x, y, result);
    } else {
        return ToolResult::failure(ToolError::invalid_argument("Unknown operation: " + operation));
    }

    if (!in_range) {
        return ToolResult::failure(
            ToolError::execution_failure("Integer overflow in " + operation));
    }
    return ToolResult::success(result);
}

} // namespace toolrpc
