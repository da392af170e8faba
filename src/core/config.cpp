#include "core/config.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace agentpool::core {

void from_json(const json& j, AgentPoolConfig& c) {
    c.agent_executable = j.value("agent_executable", c.agent_executable);
    c.base_port = j.value("base_port", c.base_port);
    c.max_concurrent_servers = j.value("max_concurrent_servers", c.max_concurrent_servers);
    c.server_start_timeout_ms = j.value("server_start_timeout_ms", c.server_start_timeout_ms);
    c.stop_timeout_ms = j.value("stop_timeout_ms", c.stop_timeout_ms);
    c.default_model = j.value("default_model", c.default_model);
    c.proxy_base_path = j.value("proxy_base_path", c.proxy_base_path);
    c.listen_host = j.value("listen_host", c.listen_host);
    c.listen_port = j.value("listen_port", c.listen_port);
    if (j.contains("external_hostname") && j["external_hostname"].is_string()) {
        c.external_hostname = j["external_hostname"].get<std::string>();
    }
    c.external_port = j.value("external_port", c.external_port);
    c.pr_detection_retry_count = j.value("pr_detection_retry_count", c.pr_detection_retry_count);
    c.pr_detection_retry_delay_ms = j.value("pr_detection_retry_delay_ms", c.pr_detection_retry_delay_ms);
    c.state_file = j.value("state_file", c.state_file);
    c.log_level = j.value("log_level", c.log_level);
}

void to_json(json& j, const AgentPoolConfig& c) {
    j = json{
        {"agent_executable", c.agent_executable},
        {"base_port", c.base_port},
        {"max_concurrent_servers", c.max_concurrent_servers},
        {"server_start_timeout_ms", c.server_start_timeout_ms},
        {"stop_timeout_ms", c.stop_timeout_ms},
        {"default_model", c.default_model},
        {"proxy_base_path", c.proxy_base_path},
        {"listen_host", c.listen_host},
        {"listen_port", c.listen_port},
        {"external_port", c.external_port},
        {"pr_detection_retry_count", c.pr_detection_retry_count},
        {"pr_detection_retry_delay_ms", c.pr_detection_retry_delay_ms},
        {"state_file", c.state_file},
        {"log_level", c.log_level}
    };
    if (c.external_hostname) {
        j["external_hostname"] = *c.external_hostname;
    }
}

AgentPoolConfig AgentPoolConfig::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open config file: " + path);
    }

    AgentPoolConfig config;
    try {
        json j = json::parse(in);
        config = j.get<AgentPoolConfig>();
    } catch (const json::exception& e) {
        throw std::runtime_error("invalid config file " + path + ": " + e.what());
    }

    config.apply_env_overrides();
    spdlog::debug("Loaded config from {}", path);
    return config;
}

void AgentPoolConfig::apply_env_overrides() {
    if (const char* exe = std::getenv("AGENTPOOL_AGENT_EXECUTABLE")) {
        agent_executable = exe;
    }
    if (const char* host = std::getenv("AGENTPOOL_EXTERNAL_HOSTNAME")) {
        if (*host != '\0') {
            external_hostname = std::string(host);
        }
    }
}

} // namespace agentpool::core
