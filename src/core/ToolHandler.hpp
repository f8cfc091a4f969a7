#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace toolrpc {

using json = nlohmann::json;

/**
 * @brief Who is at fault when a tool fails
 */
enum class ToolErrorKind {
    INVALID_ARGUMENT,   // Caller supplied bad arguments (-32602)
    EXECUTION_FAILURE   // Tool could not complete the operation (-32000)
};

/**
 * @brief Failure reported by a tool handler
 *
 * Handlers either return it inside a ToolResult or throw it.
 */
class ToolError : public std::runtime_error {
public:
    ToolError(ToolErrorKind kind, const std::string& message);

    static ToolError invalid_argument(const std::string& message);
    static ToolError execution_failure(const std::string& message);

    ToolErrorKind kind() const { return kind_; }

private:
    ToolErrorKind kind_;
};

/**
 * @brief Outcome of a tool invocation: a JSON value or a ToolError
 */
class ToolResult {
public:
    static ToolResult success(json value);
    static ToolResult failure(ToolError error);

    bool is_ok() const { return !error_.has_value(); }

    /**
     * @brief Returned value (null for failures)
     */
    const json& value() const { return value_; }

    /**
     * @brief Reported error
     * @throws std::bad_optional_access if the invocation succeeded
     */
    const ToolError& error() const { return error_.value(); }

private:
    ToolResult(json value, std::optional<ToolError> error);

    json value_;
    std::optional<ToolError> error_;
};

/**
 * @brief Callable behind a registered tool
 *
 * Implementations may be invoked from several threads at once and must
 * guard any state they own.
 */
class ToolHandler {
public:
    virtual ~ToolHandler() = default;

    /**
     * @brief Run the tool
     * @param arguments Arguments object, already validated against the tool schema
     * @return Tool value or error
     */
    virtual ToolResult invoke(const json& arguments) = 0;
};

/**
 * @brief Adapts a plain function or lambda to ToolHandler
 */
class FunctionTool : public ToolHandler {
public:
    using Function = std::function<ToolResult(const json& arguments)>;

    explicit FunctionTool(Function function);

    ToolResult invoke(const json& arguments) override;

private:
    Function function_;
};

} // namespace toolrpc
