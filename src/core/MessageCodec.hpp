#pragma once

#include "Message.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace toolrpc {

/**
 * @brief Reasons a frame cannot be turned into a request
 */
enum class CodecErrorKind {
    PARSE_ERROR,       // Not valid JSON
    INVALID_ENVELOPE   // Valid JSON, but not a JSON-RPC 2.0 request
};

/**
 * @brief Error raised while decoding a JSON-RPC frame
 *
 * Carries the request id when it could be recovered from the envelope,
 * so the error reply can be matched by the caller. A JSON-RPC 2.0 envelope
 * without an id member is a notification and is never answered, even when
 * the rest of it is invalid.
 */
class CodecError : public std::runtime_error {
public:
    CodecError(CodecErrorKind kind, const std::string& message,
               std::optional<RequestId> id = std::nullopt, bool notification = false);

    CodecErrorKind kind() const { return kind_; }
    const std::optional<RequestId>& id() const { return id_; }
    bool is_notification() const { return notification_; }

    /**
     * @brief JSON-RPC error code for this failure (-32700 or -32600)
     */
    int code() const;

    /**
     * @brief Error response describing this failure
     */
    Response to_response() const;

private:
    CodecErrorKind kind_;
    std::optional<RequestId> id_;
    bool notification_;
};

/**
 * @brief One element of a decoded frame: a request or the reason it was rejected
 */
using DecodedEntry = std::variant<Request, CodecError>;

/**
 * @brief Result of decoding a frame that may hold a batch
 */
struct DecodedMessage {
    bool is_batch = false;
    std::vector<DecodedEntry> entries;
};

/**
 * @brief Encoder/decoder for JSON-RPC 2.0 envelopes
 *
 * Decoding is strict about the envelope ("jsonrpc" must be "2.0", method a
 * non-empty string, id a string or integer, params structured) and
 * ignores unknown fields.
 */
class MessageCodec {
public:
    /**
     * @brief Decode a single (non-batch) request or notification
     * @param bytes Complete message text
     * @return Decoded request
     * @throws CodecError on malformed JSON or an invalid envelope
     */
    static Request decode(const std::string& bytes);

    /**
     * @brief Decode a frame that may be a single message or a batch
     *
     * Element-level envelope errors are reported as entries so that the
     * rest of a batch can still be served.
     *
     * @param bytes Complete frame text
     * @return Decoded entries in input order
     * @throws CodecError on malformed JSON or an empty batch
     */
    static DecodedMessage decode_message(const std::string& bytes);

    /**
     * @brief Decode an already parsed JSON value into a request
     * @throws CodecError with kind INVALID_ENVELOPE
     */
    static Request decode_value(const json& value);

    static std::string encode(const Response& response);

    /**
     * @brief Encode batch replies as a JSON array, preserving order
     */
    static std::string encode_batch(const std::vector<Response>& responses);

private:
    static std::optional<RequestId> read_id(const json& value);
};

} // namespace toolrpc
