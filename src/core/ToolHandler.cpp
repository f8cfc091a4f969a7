#include "ToolHandler.hpp"

namespace toolrpc {

ToolError::ToolError(ToolErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

ToolError ToolError::invalid_argument(const std::string& message) {
    return ToolError(ToolErrorKind::INVALID_ARGUMENT, message);
}

ToolError ToolError::execution_failure(const std::string& message) {
    return ToolError(ToolErrorKind::EXECUTION_FAILURE, message);
}

ToolResult::ToolResult(json value, std::optional<ToolError> error)
    : value_(std::move(value)), error_(std::move(error)) {}

ToolResult ToolResult::success(json value) {
    return ToolResult(std::move(value), std::nullopt);
}

ToolResult ToolResult::failure(ToolError error) {
    return ToolResult(json(), std::move(error));
}

FunctionTool::FunctionTool(Function function)
    : function_(std::move(function)) {
    if (!function_) {
        throw std::invalid_argument("Tool function cannot be null");
    }
}

ToolResult FunctionTool::invoke(const json& arguments) {
    return function_(arguments);
}

} // namespace toolrpc
