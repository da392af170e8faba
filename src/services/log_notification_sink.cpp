#include "services/log_notification_sink.hpp"
#include <spdlog/spdlog.h>

namespace agentpool::services {

void LogNotificationSink::servers_changed(const std::vector<workflow::ServerSummary>& servers) {
    spdlog::info("Agent servers changed: {} running", servers.size());
    for (const auto& s : servers) {
        spdlog::debug("  {} port={} status={} url={}", s.entity_id, s.port, s.status, s.external_url);
    }
}

void LogNotificationSink::startup_state_changed(const workflow::AgentStartupInfo& info) {
    if (info.error_message) {
        spdlog::warn("Agent startup for {}: {} ({})", info.entity_id,
                     workflow::startup_state_to_string(info.state), *info.error_message);
    } else {
        spdlog::info("Agent startup for {}: {}", info.entity_id,
                     workflow::startup_state_to_string(info.state));
    }
}

} // namespace agentpool::services
