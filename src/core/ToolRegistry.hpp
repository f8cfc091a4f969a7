#pragma once

#include "Schema.hpp"
#include "ToolHandler.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolrpc {

/**
 * @brief Everything the server knows about one tool
 */
struct ToolDescriptor {
    std::string name;
    std::string description;
    Schema input_schema;
    std::shared_ptr<ToolHandler> handler;
};

enum class RegistryErrorKind {
    DUPLICATE_NAME,
    INVALID_DESCRIPTOR
};

/**
 * @brief Error raised when a tool cannot be registered
 */
class RegistryError : public std::runtime_error {
public:
    RegistryError(RegistryErrorKind kind, const std::string& message);

    RegistryErrorKind kind() const { return kind_; }

private:
    RegistryErrorKind kind_;
};

/**
 * @brief Ordered set of tools, keyed by unique name
 *
 * Filled once at startup, then shared read-only with the Dispatcher
 * (as std::shared_ptr<const ToolRegistry>), so lookups need no locking.
 */
class ToolRegistry {
public:
    /**
     * @brief Add a tool
     * @param descriptor Tool name, description, schema and handler
     * @throws RegistryError DUPLICATE_NAME if the name is taken (the first tool is kept),
     *         INVALID_DESCRIPTOR for an empty name, null handler or non-object schema
     */
    void register_tool(ToolDescriptor descriptor);

    /**
     * @brief Convenience overload wrapping a lambda in FunctionTool
     */
    void register_tool(const std::string& name, const std::string& description,
                       Schema input_schema, FunctionTool::Function function);

    /**
     * @brief Find a tool by name
     * @return Descriptor or nullptr when no such tool is registered
     */
    const ToolDescriptor* lookup(const std::string& name) const;

    /**
     * @brief Tool metadata in registration order
     * @return JSON array of {name, description, inputSchema}
     */
    json list() const;

    std::size_t size() const { return tools_.size(); }
    bool empty() const { return tools_.empty(); }

private:
    std::vector<ToolDescriptor> tools_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace toolrpc
