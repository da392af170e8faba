#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace agentpool::util {

// Initialize logging with console output
void init_logger(spdlog::level::level_enum level = spdlog::level::info);

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Parse "trace|debug|info|warn|error|critical|off", falls back to info
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace agentpool::util
