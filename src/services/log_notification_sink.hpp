#pragma once
#include "workflow/collaborators.hpp"

namespace agentpool::services {

// Notification sink for headless runs: every event becomes a log line
class LogNotificationSink : public workflow::NotificationSink {
public:
    void servers_changed(const std::vector<workflow::ServerSummary>& servers) override;
    void startup_state_changed(const workflow::AgentStartupInfo& info) override;
};

} // namespace agentpool::services
