#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace toolrpc {

using json = nlohmann::json;

/**
 * @brief JSON-RPC 2.0 error codes used by the server
 */
namespace error_code {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
    constexpr int TOOL_EXECUTION_ERROR = -32000;
} // namespace error_code

/**
 * @brief Request identifier: integer or string, echoed verbatim in replies
 */
using RequestId = std::variant<std::int64_t, std::string>;

/**
 * @brief Convert a request id to its JSON form
 */
json id_to_json(const RequestId& id);

/**
 * @brief Convert an optional request id to JSON (null when absent)
 */
json id_to_json(const std::optional<RequestId>& id);

/**
 * @brief Render a request id for log lines
 */
std::string id_to_string(const std::optional<RequestId>& id);

/**
 * @brief Decoded JSON-RPC request or notification
 *
 * A request without an id is a notification and is never answered.
 */
struct Request {
    std::optional<RequestId> id;
    std::string method;
    std::optional<json> params;

    bool is_notification() const { return !id.has_value(); }
};

/**
 * @brief JSON-RPC error object
 */
struct ErrorObject {
    int code = error_code::INTERNAL_ERROR;
    std::string message;
    std::optional<json> data;

    json to_json() const;
};

/**
 * @brief JSON-RPC response carrying exactly one of result or error
 *
 * The id is empty only for errors raised before an id could be read,
 * which serialize with "id": null.
 */
class Response {
public:
    static Response success(std::optional<RequestId> id, json result);
    static Response failure(std::optional<RequestId> id, ErrorObject error);
    static Response failure(std::optional<RequestId> id, int code, std::string message,
                            std::optional<json> data = std::nullopt);

    const std::optional<RequestId>& id() const { return id_; }
    bool is_error() const { return std::holds_alternative<ErrorObject>(body_); }

    /**
     * @brief Result payload
     * @throws std::bad_variant_access if this is an error response
     */
    const json& result() const { return std::get<json>(body_); }

    /**
     * @brief Error payload
     * @throws std::bad_variant_access if this is a success response
     */
    const ErrorObject& error() const { return std::get<ErrorObject>(body_); }

    json to_json() const;

private:
    Response(std::optional<RequestId> id, std::variant<json, ErrorObject> body);

    std::optional<RequestId> id_;
    std::variant<json, ErrorObject> body_;
};

} // namespace toolrpc
