#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace agentpool::workflow {

// Writes the agent's opencode.json into a worktree before the server starts
class AgentConfigWriter {
public:
    static constexpr const char* CONFIG_FILE = "opencode.json";
    static constexpr const char* SCHEMA_URL = "https://opencode.ai/config.json";

    explicit AgentConfigWriter(std::string default_model);

    // model, else the configured default
    nlohmann::json create_default_config(const std::optional<std::string>& model = std::nullopt) const;

    const std::string& default_model() const { return default_model_; }

    // Throws ConfigWriteFailure
    std::string write(const std::string& worktree_path, const nlohmann::json& config) const;

private:
    std::string default_model_;
};

} // namespace agentpool::workflow
