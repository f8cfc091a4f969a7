#include "StdioTransport.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace toolrpc {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
    spdlog::debug("StdioTransport initialized");
}

std::optional<std::string> StdioTransport::read_message() {
    std::string line;

    while (!closed_) {
        if (!std::getline(in_, line)) {
            if (in_.eof()) {
                spdlog::debug("Reached end of input stream");
            } else {
                spdlog::error("Error reading from input stream");
            }
            return std::nullopt;
        }

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            spdlog::trace("Skipping blank line");
            continue;
        }

        spdlog::debug("Read message: {}", line);
        return line;
    }
    return std::nullopt;
}

void StdioTransport::write_message(const std::string& message) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_) {
        spdlog::debug("Transport closed, dropping message: {}", message);
        return;
    }
    out_ << message << std::endl;  // std::endl flushes automatically
    spdlog::debug("Wrote message: {}", message);
}

bool StdioTransport::is_open() const {
    return !closed_ && in_.good() && out_.good();
}

void StdioTransport::close() {
    closed_ = true;
}

} // namespace toolrpc
