#pragma once

#include "core/ToolHandler.hpp"
#include "core/ToolRegistry.hpp"

namespace toolrpc {

/**
 * @brief Tool performing integer arithmetic on two operands
 *
 * Arguments: x, y (integers), operation (add, subtract, multiply, divide).
 * Division truncates toward zero. Division by zero and 64-bit overflow are
 * execution failures.
 */
class CalculatorTool : public ToolHandler {
public:
    /**
     * @brief Get tool descriptor with a fresh handler
     * @return ToolDescriptor with name, description, input schema and handler
     */
    static ToolDescriptor descriptor();

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with "x", "y" and "operation"
     * @return Integer result or ToolError
     */
    ToolResult invoke(const json& args) override;
};

} // namespace toolrpc
