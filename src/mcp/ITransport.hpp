#pragma once

#include <optional>
#include <string>

namespace toolrpc {

/**
 * @brief Abstract interface for JSON-RPC transport mechanisms
 *
 * Implementations frame the byte stream into complete messages and write
 * replies back whole. They do not parse JSON; decoding belongs to the
 * MessageCodec.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read the next complete message from the transport
     * @return Message text, or empty on EOF/close
     */
    virtual std::optional<std::string> read_message() = 0;

    /**
     * @brief Write one complete encoded message
     *
     * May be called from several threads; implementations must not
     * interleave partial writes of different messages.
     *
     * @param message Encoded JSON-RPC reply
     */
    virtual void write_message(const std::string& message) = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;

    /**
     * @brief Close the transport; later reads return empty, writes are dropped
     */
    virtual void close() = 0;
};

} // namespace toolrpc
