/**
 * agentpool daemon
 *
 * Wires every subsystem onto one HTTP listener:
 * - ServerManager (agent process pool)
 * - RouteManager + ProxyServer ({base}/{port}/** to each agent)
 * - Orchestrator + CompletionMonitor (work-item lifecycle)
 * - ControlApi (/api)
 */
#pragma once
#include <atomic>
#include <memory>
#include <string>
#include "core/config.hpp"

namespace httplib {
class Server;
}

namespace agentpool::agent {
class AgentApi;
}

namespace agentpool::runtime {
class ServerManager;
class ServerListener;
}

namespace agentpool::proxy {
class RouteManager;
class ProxyServer;
class UrlService;
}

namespace agentpool::workflow {
class AgentConfigWriter;
class CompletionMonitor;
class NotificationSink;
class Orchestrator;
class PullRequestService;
class StartupTracker;
class WorkItemRepository;
class WorkItemTransitionService;
class WorktreeService;
}

namespace agentpool::services {
class JsonWorkItemStore;
}

namespace agentpool::api {
class ControlApi;
}

namespace agentpool::daemon {

class Daemon {
public:
    using Config = core::AgentPoolConfig;

    // Anything left null is built from the config
    struct Dependencies {
        std::unique_ptr<agent::AgentApi> agent_api;
        std::unique_ptr<services::JsonWorkItemStore> work_items;
        std::unique_ptr<workflow::PullRequestService> pull_requests;
        std::unique_ptr<workflow::WorktreeService> worktrees;
        std::unique_ptr<workflow::NotificationSink> notifications;
    };

    explicit Daemon(const Config& config);
    Daemon(const Config& config, Dependencies deps);
    ~Daemon();

    // Non-copyable
    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    // Mount handlers, install signal handlers
    bool init();

    // Serve until shutdown (blocks)
    void run();

    // Request shutdown; run() returns once the listener has stopped
    void shutdown();

    bool is_running() const { return running_; }

    const Config& get_config() const { return config_; }
    workflow::Orchestrator& orchestrator() { return *orchestrator_; }

private:
    Config config_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};

    std::unique_ptr<agent::AgentApi> agent_api_;
    std::unique_ptr<services::JsonWorkItemStore> work_items_;
    std::unique_ptr<workflow::PullRequestService> pull_requests_;
    std::unique_ptr<workflow::WorktreeService> worktrees_;
    std::unique_ptr<workflow::NotificationSink> notifications_;

    std::unique_ptr<runtime::ServerManager> servers_;
    std::unique_ptr<proxy::RouteManager> routes_;
    std::unique_ptr<proxy::UrlService> urls_;
    std::unique_ptr<proxy::ProxyServer> proxy_;
    std::unique_ptr<workflow::StartupTracker> tracker_;
    std::unique_ptr<workflow::AgentConfigWriter> config_writer_;
    std::unique_ptr<workflow::CompletionMonitor> monitor_;
    std::unique_ptr<workflow::Orchestrator> orchestrator_;
    std::unique_ptr<runtime::ServerListener> server_notifier_;
    std::unique_ptr<api::ControlApi> control_api_;
    std::unique_ptr<httplib::Server> http_;

    // Cancel monitors and stop every agent (once)
    void teardown();
};

} // namespace agentpool::daemon
