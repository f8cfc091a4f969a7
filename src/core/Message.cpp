#include "Message.hpp"

namespace toolrpc {

json id_to_json(const RequestId& id) {
    if (const auto* number = std::get_if<std::int64_t>(&id)) {
        return *number;
    }
    return std::get<std::string>(id);
}

json id_to_json(const std::optional<RequestId>& id) {
    if (!id) {
        return nullptr;
    }
    return id_to_json(*id);
}

std::string id_to_string(const std::optional<RequestId>& id) {
    return id_to_json(id).dump();
}

json ErrorObject::to_json() const {
    json error = {
        {"code", code},
        {"message", message}
    };
    if (data) {
        error["data"] = *data;
    }
    return error;
}

Response::Response(std::optional<RequestId> id, std::variant<json, ErrorObject> body)
    : id_(std::move(id)), body_(std::move(body)) {}

Response Response::success(std::optional<RequestId> id, json result) {
    return Response(std::move(id), std::move(result));
}

Response Response::failure(std::optional<RequestId> id, ErrorObject error) {
    return Response(std::move(id), std::move(error));
}

Response Response::failure(std::optional<RequestId> id, int code, std::string message,
                           std::optional<json> data) {
    return failure(std::move(id), ErrorObject{code, std::move(message), std::move(data)});
}

json Response::to_json() const {
    json message = {
        {"jsonrpc", "2.0"},
        {"id", id_to_json(id_)}
    };
    if (is_error()) {
        message["error"] = error().to_json();
    } else {
        message["result"] = result();
    }
    return message;
}

} // namespace toolrpc
