#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace agentpool::core {

// Daemon configuration
struct AgentPoolConfig {
    // Agent process pool
    std::string agent_executable = "opencode";
    int base_port = 4096;
    int max_concurrent_servers = 10;
    int server_start_timeout_ms = 15000;
    int stop_timeout_ms = 5000;
    std::string default_model = "anthropic/claude-opus-4-5";

    // Proxy / listener
    std::string proxy_base_path = "/agent";
    std::string listen_host = "0.0.0.0";
    int listen_port = 8080;
    std::optional<std::string> external_hostname;  // e.g. "host.tailnet.ts.net"
    int external_port = 80;

    // Completion detection
    int pr_detection_retry_count = 3;
    int pr_detection_retry_delay_ms = 2000;

    // Reference collaborators
    std::string state_file = "agentpool-state.json";
    std::string log_level = "info";

    // Load from JSON file (missing keys keep defaults), then apply env overrides.
    // Throws std::runtime_error on unreadable or malformed files.
    static AgentPoolConfig load_file(const std::string& path);

    // AGENTPOOL_AGENT_EXECUTABLE, AGENTPOOL_EXTERNAL_HOSTNAME
    void apply_env_overrides();
};

void from_json(const nlohmann::json& j, AgentPoolConfig& config);
void to_json(nlohmann::json& j, const AgentPoolConfig& config);

} // namespace agentpool::core
