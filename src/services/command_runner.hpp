#pragma once
#include <string>
#include <vector>

namespace agentpool::services {

struct CommandResult {
    bool success = false;
    int exit_code = -1;
    std::string output;  // stdout and stderr interleaved
};

// Runs argv through the shell with every argument single-quoted
CommandResult run_command(const std::vector<std::string>& argv, const std::string& cwd = "");

std::string shell_quote(const std::string& arg);

} // namespace agentpool::services
