#pragma once

#include "ITransport.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace toolrpc {

/**
 * @brief Transport using standard input/output streams
 *
 * Reads one JSON-RPC frame per line from stdin, skipping blank lines.
 * Writes one frame per line to stdout with flush.
 */
class StdioTransport : public ITransport {
public:
    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     */
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    std::optional<std::string> read_message() override;
    void write_message(const std::string& message) override;
    bool is_open() const override;
    void close() override;

private:
    std::istream& in_;
    std::ostream& out_;
    std::mutex write_mutex_;
    std::atomic<bool> closed_{false};
};

} // namespace toolrpc
