#include "Dispatcher.hpp"
#include "ArgumentValidator.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <vector>

namespace toolrpc {

namespace {

constexpr const char* PROTOCOL_VERSION = "2024-11-05";

bool is_content_block(const json& value) {
    return value.is_object() && value.contains("type") && value["type"].is_string();
}

} // namespace

Dispatcher::Dispatcher(std::shared_ptr<const ToolRegistry> registry, DispatcherOptions options)
    : registry_(std::move(registry)), options_(std::move(options)) {
    if (!registry_) {
        throw std::invalid_argument("Registry cannot be null");
    }
    spdlog::info("Dispatcher initialized with {} tools", registry_->size());
}

std::optional<std::string> Dispatcher::handle(const std::string& bytes) const {
    DecodedMessage message;
    try {
        message = MessageCodec::decode_message(bytes);
    } catch (const CodecError& e) {
        spdlog::warn("Rejected frame: {}", e.what());
        return MessageCodec::encode(e.to_response());
    }

    std::vector<Response> responses;
    responses.reserve(message.entries.size());

    for (const auto& entry : message.entries) {
        if (const auto* error = std::get_if<CodecError>(&entry)) {
            spdlog::warn("Invalid request: {}", error->what());
            if (!error->is_notification()) {
                responses.push_back(error->to_response());
            }
            continue;
        }

        if (auto response = dispatch(std::get<Request>(entry))) {
            responses.push_back(std::move(*response));
        }
    }

    if (responses.empty()) {
        return std::nullopt;
    }
    if (!message.is_batch) {
        return MessageCodec::encode(responses.front());
    }
    return MessageCodec::encode_batch(responses);
}

std::optional<Response> Dispatcher::dispatch(const Request& request) const {
    spdlog::debug("Handling request: method={}, id={}", request.method, id_to_string(request.id));

    Response response = [&]() -> Response {
        try {
            return route(request);
        } catch (const std::exception& e) {
            spdlog::error("Error handling method {}: {}", request.method, e.what());
            return Response::failure(request.id, error_code::INTERNAL_ERROR, "Internal error",
                json{{"reason", e.what()}});
        } catch (...) {
            spdlog::error("Unknown error handling method {}", request.method);
            return Response::failure(request.id, error_code::INTERNAL_ERROR, "Internal error");
        }
    }();

    if (request.is_notification()) {
        if (response.is_error()) {
            spdlog::debug("Dropping error for notification {}: {}",
                request.method, response.error().message);
        }
        return std::nullopt;
    }
    return response;
}

Response Dispatcher::route(const Request& request) const {
    if (request.method == "tools/list") {
        return handle_tools_list(request);
    }
    if (request.method == "tools/call") {
        return handle_tools_call(request);
    }
    if (request.method == "initialize") {
        return handle_initialize(request);
    }
    if (request.method == "ping") {
        return Response::success(request.id, json::object());
    }
    if (request.method == "notifications/initialized") {
        spdlog::info("Client sent initialized notification");
        return Response::success(request.id, json::object());
    }

    spdlog::debug("Method not found: {}", request.method);
    return Response::failure(request.id, error_code::METHOD_NOT_FOUND,
        "Method not found: " + request.method);
}

Response Dispatcher::handle_initialize(const Request& request) const {
    if (request.params && request.params->is_object() && request.params->contains("clientInfo")) {
        const json& client = (*request.params)["clientInfo"];
        if (client.is_object()) {
            spdlog::info("Client: {} version {}",
                client.value("name", "unknown"), client.value("version", "unknown"));
        }
    }

    json result = {
        {"protocolVersion", PROTOCOL_VERSION},
        {"capabilities", {
            {"tools", json::object()}
        }},
        {"serverInfo", {
            {"name", options_.server_name},
            {"version", options_.server_version}
        }}
    };
    if (!options_.instructions.empty()) {
        result["instructions"] = options_.instructions;
    }
    return Response::success(request.id, std::move(result));
}

Response Dispatcher::handle_tools_list(const Request& request) const {
    json tools = registry_->list();
    spdlog::debug("Returning {} tools", tools.size());
    return Response::success(request.id, {{"tools", std::move(tools)}});
}

Response Dispatcher::handle_tools_call(const Request& request) const {
    if (!request.params || !request.params->is_object()) {
        return Response::failure(request.id, error_code::INVALID_PARAMS,
            "Invalid params: tools/call expects an object with name and arguments");
    }

    const json& params = *request.params;
    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        return Response::failure(request.id, error_code::INVALID_PARAMS,
            "Invalid params: missing tool name", json{{"path", "name"}});
    }
    const std::string tool_name = name_it->get<std::string>();

    json arguments = json::object();
    auto args_it = params.find("arguments");
    if (args_it != params.end() && !args_it->is_null()) {
        if (!args_it->is_object()) {
            return Response::failure(request.id, error_code::INVALID_PARAMS,
                "Invalid params: arguments must be an object", json{{"path", "arguments"}});
        }
        arguments = *args_it;
    }

    const ToolDescriptor* tool = registry_->lookup(tool_name);
    if (!tool) {
        spdlog::debug("Unknown tool requested: {}", tool_name);
        return Response::failure(request.id, error_code::INVALID_PARAMS,
            "Unknown tool: " + tool_name, json{{"name", tool_name}});
    }

    if (auto error = ArgumentValidator::validate(tool->input_schema, arguments)) {
        spdlog::debug("Arguments for {} rejected at '{}': {}", tool_name, error->path, error->message);
        return Response::failure(request.id, error_code::INVALID_PARAMS,
            "Invalid arguments for tool " + tool_name + ": " + error->message,
            error->to_json());
    }

    return invoke_tool(request, *tool, arguments);
}

Response Dispatcher::invoke_tool(const Request& request, const ToolDescriptor& tool,
                                 const json& arguments) const {
    spdlog::debug("Calling tool: {} with args: {}", tool.name, arguments.dump());

    std::optional<ToolResult> result;
    try {
        result = tool.handler->invoke(arguments);
    } catch (const ToolError& e) {
        result = ToolResult::failure(e);
    }

    if (!result->is_ok()) {
        const ToolError& error = result->error();
        if (error.kind() == ToolErrorKind::INVALID_ARGUMENT) {
            spdlog::debug("Tool {} rejected arguments: {}", tool.name, error.what());
            return Response::failure(request.id, error_code::INVALID_PARAMS, error.what(),
                json{{"tool", tool.name}});
        }
        spdlog::warn("Tool {} failed: {}", tool.name, error.what());
        return Response::failure(request.id, error_code::TOOL_EXECUTION_ERROR, error.what(),
            json{{"tool", tool.name}});
    }

    if (options_.wrap_content) {
        return Response::success(request.id, {{"content", to_content(result->value())}});
    }
    return Response::success(request.id, result->value());
}

json Dispatcher::to_content(const json& value) {
    auto text_block = [](const std::string& text) {
        return json{{"type", "text"}, {"text", text}};
    };

    if (value.is_null()) {
        return json::array();
    }
    if (value.is_string()) {
        return json::array({text_block(value.get<std::string>())});
    }
    if (value.is_array() && !value.empty()) {
        bool all_blocks = true;
        for (const auto& element : value) {
            all_blocks = all_blocks && is_content_block(element);
        }
        if (all_blocks) {
            return value;
        }
    }
    return json::array({text_block(value.dump())});
}

} // namespace toolrpc
