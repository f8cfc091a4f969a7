#pragma once

#include <cstddef>
#include <string>
#include <spdlog/common.h>

#define TOOLRPC_VERSION "1.0.0"

namespace toolrpc {

/**
 * @brief Settings of the stdio server, filled from the command line
 */
struct ServerConfig {
    std::string name = "toolrpc";
    std::string log_level = "info";
    std::string log_file;          // Empty: log to stderr only
    std::size_t workers = 1;
    std::string tools = "all";     // all, calculator or counter
    bool wrap_content = false;

    /**
     * @brief Check option values
     * @throws std::invalid_argument describing the first bad value
     */
    void validate() const;

    bool enables_calculator() const { return tools == "all" || tools == "calculator"; }
    bool enables_counter() const { return tools == "all" || tools == "counter"; }
};

/**
 * @brief Parse a log level name (trace, debug, info, warn, error, critical)
 * @throws std::invalid_argument for unknown names
 */
spdlog::level::level_enum parse_log_level(const std::string& name);

/**
 * @brief Install the default logger
 *
 * Logs go to stderr, since stdout carries protocol messages, and
 * additionally to config.log_file when set.
 */
void configure_logging(const ServerConfig& config);

} // namespace toolrpc
