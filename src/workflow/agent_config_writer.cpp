#include "workflow/agent_config_writer.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace agentpool::workflow {

AgentConfigWriter::AgentConfigWriter(std::string default_model)
    : default_model_(std::move(default_model)) {}

json AgentConfigWriter::create_default_config(const std::optional<std::string>& model) const {
    return json{
        {"$schema", SCHEMA_URL},
        {"model", model.value_or(default_model_)},
        {"permission", {
            {"edit", "allow"},
            {"bash", "allow"},
            {"write", "allow"},
            {"read", "allow"},
            {"webfetch", "allow"}
        }},
        {"autoupdate", false},
        {"compaction", {{"auto", true}, {"prune", true}}}
    };
}

std::string AgentConfigWriter::write(const std::string& worktree_path, const json& config) const {
    std::error_code ec;
    if (!fs::is_directory(worktree_path, ec)) {
        throw ConfigWriteFailure("Worktree does not exist: " + worktree_path);
    }

    fs::path path = fs::path(worktree_path) / CONFIG_FILE;
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw ConfigWriteFailure("Cannot open " + path.string() + ": " + std::strerror(errno));
    }
    out << config.dump(2) << "\n";
    out.close();
    if (!out) {
        throw ConfigWriteFailure("Failed writing " + path.string());
    }

    spdlog::info("Generated agent config at {}", path.string());
    return path.string();
}

} // namespace agentpool::workflow
