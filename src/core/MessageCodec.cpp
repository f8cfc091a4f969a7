#include "MessageCodec.hpp"
#include <spdlog/spdlog.h>
#include <limits>

namespace toolrpc {

CodecError::CodecError(CodecErrorKind kind, const std::string& message,
                       std::optional<RequestId> id, bool notification)
    : std::runtime_error(message), kind_(kind), id_(std::move(id)), notification_(notification) {}

int CodecError::code() const {
    return kind_ == CodecErrorKind::PARSE_ERROR ? error_code::PARSE_ERROR
                                                : error_code::INVALID_REQUEST;
}

Response CodecError::to_response() const {
    const char* title = kind_ == CodecErrorKind::PARSE_ERROR ? "Parse error" : "Invalid Request";
    return Response::failure(id_, code(), title, json{{"reason", what()}});
}

std::optional<RequestId> MessageCodec::read_id(const json& value) {
    auto it = value.find("id");
    if (it == value.end()) {
        return std::nullopt;
    }

    const json& id = *it;
    if (id.is_string()) {
        return RequestId{id.get<std::string>()};
    }
    if (id.is_number_unsigned()) {
        auto number = id.get<std::uint64_t>();
        if (number > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw CodecError(CodecErrorKind::INVALID_ENVELOPE, "id is out of range");
        }
        return RequestId{static_cast<std::int64_t>(number)};
    }
    if (id.is_number_integer()) {
        return RequestId{id.get<std::int64_t>()};
    }
    throw CodecError(CodecErrorKind::INVALID_ENVELOPE, "id must be a string or an integer");
}

Request MessageCodec::decode_value(const json& value) {
    if (!value.is_object()) {
        throw CodecError(CodecErrorKind::INVALID_ENVELOPE, "message must be a JSON object");
    }

    // Validate the id first so later envelope errors can still be answered with it
    std::optional<RequestId> id = read_id(value);

    auto version = value.find("jsonrpc");
    if (version == value.end() || !version->is_string() || *version != "2.0") {
        throw CodecError(CodecErrorKind::INVALID_ENVELOPE,
            "missing or invalid jsonrpc field (expected \"2.0\")", id);
    }

    // From here on a 2.0 envelope without an id member is a notification
    const bool notification = value.find("id") == value.end();

    auto method = value.find("method");
    if (method == value.end() || !method->is_string()) {
        throw CodecError(CodecErrorKind::INVALID_ENVELOPE, "method must be a string", id, notification);
    }

    Request request;
    request.id = std::move(id);
    request.method = method->get<std::string>();
    if (request.method.empty()) {
        throw CodecError(CodecErrorKind::INVALID_ENVELOPE, "method must not be empty",
            request.id, notification);
    }

    auto params = value.find("params");
    if (params != value.end()) {
        if (!params->is_object() && !params->is_array()) {
            throw CodecError(CodecErrorKind::INVALID_ENVELOPE,
                "params must be an object or an array", request.id, notification);
        }
        request.params = *params;
    }

    return request;
}

Request MessageCodec::decode(const std::string& bytes) {
    json value;
    try {
        value = json::parse(bytes);
    } catch (const json::parse_error& e) {
        throw CodecError(CodecErrorKind::PARSE_ERROR, e.what());
    }

    if (value.is_array()) {
        throw CodecError(CodecErrorKind::INVALID_ENVELOPE, "batch is not allowed here");
    }
    return decode_value(value);
}

DecodedMessage MessageCodec::decode_message(const std::string& bytes) {
    json value;
    try {
        value = json::parse(bytes);
    } catch (const json::parse_error& e) {
        throw CodecError(CodecErrorKind::PARSE_ERROR, e.what());
    }

    DecodedMessage message;
    if (!value.is_array()) {
        try {
            message.entries.emplace_back(decode_value(value));
        } catch (const CodecError& e) {
            message.entries.emplace_back(e);
        }
        return message;
    }

    if (value.empty()) {
        throw CodecError(CodecErrorKind::INVALID_ENVELOPE, "batch must not be empty");
    }

    message.is_batch = true;
    message.entries.reserve(value.size());
    for (const auto& element : value) {
        try {
            message.entries.emplace_back(decode_value(element));
        } catch (const CodecError& e) {
            spdlog::debug("Rejected batch element: {}", e.what());
            message.entries.emplace_back(e);
        }
    }

    spdlog::trace("Decoded batch of {} entries", message.entries.size());
    return message;
}

std::string MessageCodec::encode(const Response& response) {
    return response.to_json().dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string MessageCodec::encode_batch(const std::vector<Response>& responses) {
    json batch = json::array();
    for (const auto& response : responses) {
        batch.push_back(response.to_json());
    }
    return batch.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace toolrpc
