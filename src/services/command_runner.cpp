#include "services/command_runner.hpp"
#include <spdlog/spdlog.h>
#include <cstdio>
#include <sys/wait.h>

namespace agentpool::services {

std::string shell_quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

CommandResult run_command(const std::vector<std::string>& argv, const std::string& cwd) {
    CommandResult result;
    if (argv.empty()) {
        result.output = "empty command";
        return result;
    }

    std::string command;
    for (const auto& arg : argv) {
        if (!command.empty()) command += ' ';
        command += shell_quote(arg);
    }

    std::string full_command = command;
    if (!cwd.empty()) {
        full_command = "cd " + shell_quote(cwd) + " && " + command;
    }
    full_command += " 2>&1";

    spdlog::debug("Running: {}", full_command);

    FILE* pipe = popen(full_command.c_str(), "r");
    if (!pipe) {
        result.output = "failed to execute command";
        return result;
    }

    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        result.output += buffer;
    }

    int status = pclose(pipe);
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    result.success = (result.exit_code == 0);
    return result;
}

} // namespace agentpool::services
