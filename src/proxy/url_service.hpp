#pragma once
#include <optional>
#include <string>
#include "core/config.hpp"

namespace agentpool::proxy {

// Builds the URLs under which an agent is reachable from outside the host
class UrlService {
public:
    explicit UrlService(const core::AgentPoolConfig& config);

    // "http://{host}[:{port}]{base}/{agentPort}" when an external hostname is
    // configured, otherwise the agent's loopback base URL
    std::string external_base_url(int agent_port) const;

    // external_base_url + "/{base64url(worktree)}/session/{session}"
    std::string web_view_url(int agent_port, const std::string& worktree_path,
                             const std::string& session_id) const;

    bool has_external_hostname() const { return external_hostname_.has_value(); }

    static std::string base64url(const std::string& input);

private:
    std::optional<std::string> external_hostname_;
    int external_port_;
    std::string base_path_;
};

} // namespace agentpool::proxy
