#pragma once

#include "Message.hpp"
#include "MessageCodec.hpp"
#include "ToolRegistry.hpp"
#include <memory>
#include <optional>
#include <string>

namespace toolrpc {

/**
 * @brief Server identity and result rendering reported by the Dispatcher
 */
struct DispatcherOptions {
    std::string server_name = "toolrpc";
    std::string server_version = "1.0.0";
    std::string instructions;

    // Render tools/call results as MCP content blocks instead of raw values
    bool wrap_content = false;
};

/**
 * @brief Routes JSON-RPC requests to the built-in methods and registered tools
 *
 * Stateless: every call works only on its own request and the immutable
 * registry, so dispatch() and handle() may run on many threads at once.
 *
 * Supported methods: initialize, notifications/initialized, ping,
 * tools/list, tools/call.
 */
class Dispatcher {
public:
    /**
     * @brief Construct dispatcher over a finished registry
     * @param registry Tools to expose (must not be null)
     * @param options Server identity and result rendering
     */
    explicit Dispatcher(std::shared_ptr<const ToolRegistry> registry,
                        DispatcherOptions options = {});

    /**
     * @brief Process one decoded request
     * @param request Request or notification
     * @return Response, or empty for notifications
     */
    std::optional<Response> dispatch(const Request& request) const;

    /**
     * @brief Run the full pipeline on one raw frame
     *
     * Decodes the frame (single message or batch), dispatches every request
     * and encodes the replies.
     *
     * @param bytes Complete frame text
     * @return Encoded reply, or empty when nothing must be written
     */
    std::optional<std::string> handle(const std::string& bytes) const;

    const ToolRegistry& registry() const { return *registry_; }
    const DispatcherOptions& options() const { return options_; }

private:
    Response route(const Request& request) const;

    Response handle_initialize(const Request& request) const;
    Response handle_tools_list(const Request& request) const;
    Response handle_tools_call(const Request& request) const;

    Response invoke_tool(const Request& request, const ToolDescriptor& tool,
                         const json& arguments) const;

    /**
     * @brief Render a tool value as MCP content blocks
     */
    static json to_content(const json& value);

    std::shared_ptr<const ToolRegistry> registry_;
    DispatcherOptions options_;
};

} // namespace toolrpc
