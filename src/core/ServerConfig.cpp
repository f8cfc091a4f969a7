#include "ServerConfig.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <stdexcept>
#include <vector>

namespace toolrpc {

void ServerConfig::validate() const {
    if (name.empty()) {
        throw std::invalid_argument("Server name cannot be empty");
    }
    if (workers == 0) {
        throw std::invalid_argument("Worker count must be at least 1");
    }
    if (tools != "all" && tools != "calculator" && tools != "counter") {
        throw std::invalid_argument("Unknown tool set: " + tools);
    }
    parse_log_level(log_level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    if (name == "trace") {
        return spdlog::level::trace;
    } else if (name == "debug") {
        return spdlog::level::debug;
    } else if (name == "info") {
        return spdlog::level::info;
    } else if (name == "warn") {
        return spdlog::level::warn;
    } else if (name == "error") {
        return spdlog::level::err;
    } else if (name == "critical") {
        return spdlog::level::critical;
    }
    throw std::invalid_argument("Invalid log level: " + name);
}

void configure_logging(const ServerConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!config.log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file));
    }

    auto logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    logger->set_level(parse_log_level(config.log_level));
    spdlog::set_default_logger(logger);
}

} // namespace toolrpc
