#include "ToolRegistry.hpp"
#include <spdlog/spdlog.h>

namespace toolrpc {

RegistryError::RegistryError(RegistryErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

void ToolRegistry::register_tool(ToolDescriptor descriptor) {
    if (descriptor.name.empty()) {
        throw RegistryError(RegistryErrorKind::INVALID_DESCRIPTOR, "Tool name cannot be empty");
    }
    if (!descriptor.handler) {
        throw RegistryError(RegistryErrorKind::INVALID_DESCRIPTOR,
            "Tool handler cannot be null: " + descriptor.name);
    }
    if (descriptor.input_schema.kind() != SchemaKind::OBJECT) {
        throw RegistryError(RegistryErrorKind::INVALID_DESCRIPTOR,
            "Tool input schema must describe an object: " + descriptor.name);
    }
    if (index_.count(descriptor.name) > 0) {
        spdlog::warn("Rejected duplicate tool registration: {}", descriptor.name);
        throw RegistryError(RegistryErrorKind::DUPLICATE_NAME,
            "Tool already registered: " + descriptor.name);
    }

    index_.emplace(descriptor.name, tools_.size());
    tools_.push_back(std::move(descriptor));
    spdlog::info("Registered tool: {}", tools_.back().name);
}

void ToolRegistry::register_tool(const std::string& name, const std::string& description,
                                 Schema input_schema, FunctionTool::Function function) {
    register_tool(ToolDescriptor{
        name,
        description,
        std::move(input_schema),
        std::make_shared<FunctionTool>(std::move(function))
    });
}

const ToolDescriptor* ToolRegistry::lookup(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &tools_[it->second];
}

json ToolRegistry::list() const {
    json tools_array = json::array();

    for (const auto& tool : tools_) {
        tools_array.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.input_schema.to_json()}
        });
    }

    return tools_array;
}

} // namespace toolrpc
