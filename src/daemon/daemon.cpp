#include "daemon/daemon.hpp"
#include "agent/http_agent_client.hpp"
#include "api/control_api.hpp"
#include "proxy/proxy_server.hpp"
#include "proxy/route_manager.hpp"
#include "proxy/url_service.hpp"
#include "runtime/server_manager.hpp"
#include "services/gh_pull_request_service.hpp"
#include "services/git_worktree_service.hpp"
#include "services/json_work_item_store.hpp"
#include "services/log_notification_sink.hpp"
#include "workflow/agent_config_writer.hpp"
#include "workflow/completion_monitor.hpp"
#include "workflow/orchestrator.hpp"
#include "workflow/startup_tracker.hpp"
#include <spdlog/spdlog.h>
#include <httplib.h>
#include <csignal>

namespace agentpool::daemon {

// Global daemon pointer for signal handling
static Daemon* g_daemon = nullptr;

static void signal_handler(int signum) {
    spdlog::info("Received signal {}, shutting down...", signum);
    if (g_daemon) {
        g_daemon->shutdown();
    }
}

namespace {

// Pushes the live server list to the notification sink on every change
class ServerListNotifier : public runtime::ServerListener {
public:
    ServerListNotifier(runtime::ServerManager& servers, const proxy::UrlService& urls,
                       workflow::NotificationSink& sink)
        : servers_(servers), urls_(urls), sink_(sink) {}

    void on_server_started(const runtime::AgentServer&) override { publish(); }
    void on_server_stopped(const std::string&, int) override { publish(); }

private:
    runtime::ServerManager& servers_;
    const proxy::UrlService& urls_;
    workflow::NotificationSink& sink_;

    void publish() {
        std::vector<workflow::ServerSummary> summaries;
        for (const auto& server : servers_.get_running_servers()) {
            if (server->status() == runtime::ServerStatus::RUNNING) {
                summaries.push_back(api::summarize(*server, urls_));
            }
        }
        sink_.servers_changed(summaries);
    }
};

} // namespace

Daemon::Daemon(const Config& config)
    : Daemon(config, Dependencies{}) {}

Daemon::Daemon(const Config& config, Dependencies deps)
    : config_(config)
{
    agent_api_ = std::move(deps.agent_api);
    work_items_ = std::move(deps.work_items);
    pull_requests_ = std::move(deps.pull_requests);
    worktrees_ = std::move(deps.worktrees);
    notifications_ = std::move(deps.notifications);

    if (!agent_api_) {
        agent_api_ = std::make_unique<agent::HttpAgentClient>();
    }
    if (!work_items_) {
        work_items_ = std::make_unique<services::JsonWorkItemStore>(config_.state_file);
    }
    if (!pull_requests_) {
        pull_requests_ = std::make_unique<services::GhPullRequestService>(*work_items_);
    }
    if (!worktrees_) {
        worktrees_ = std::make_unique<services::GitWorktreeService>();
    }
    if (!notifications_) {
        notifications_ = std::make_unique<services::LogNotificationSink>();
    }

    servers_ = std::make_unique<runtime::ServerManager>(
        runtime::ServerManagerOptions::from_config(config_), *agent_api_);
    routes_ = std::make_unique<proxy::RouteManager>(config_.proxy_base_path);
    urls_ = std::make_unique<proxy::UrlService>(config_);
    proxy_ = std::make_unique<proxy::ProxyServer>(*routes_);
    tracker_ = std::make_unique<workflow::StartupTracker>();
    config_writer_ = std::make_unique<workflow::AgentConfigWriter>(config_.default_model);

    workflow::CompletionMonitorOptions monitor_options;
    monitor_options.pr_retry_count = config_.pr_detection_retry_count;
    monitor_options.pr_retry_delay_ms = config_.pr_detection_retry_delay_ms;
    monitor_ = std::make_unique<workflow::CompletionMonitor>(*agent_api_, *pull_requests_, monitor_options);

    orchestrator_ = std::make_unique<workflow::Orchestrator>(workflow::OrchestratorDependencies{
        *servers_,
        *agent_api_,
        *monitor_,
        *tracker_,
        *config_writer_,
        *work_items_,
        *work_items_,
        *pull_requests_,
        *worktrees_
    });

    server_notifier_ = std::make_unique<ServerListNotifier>(*servers_, *urls_, *notifications_);
    control_api_ = std::make_unique<api::ControlApi>(*orchestrator_, *tracker_, *urls_);
    http_ = std::make_unique<httplib::Server>();
}

Daemon::~Daemon() {
    shutdown();
    teardown();
    servers_->remove_listener(routes_.get());
    servers_->remove_listener(server_notifier_.get());
    if (g_daemon == this) {
        g_daemon = nullptr;
    }
}

bool Daemon::init() {
    spdlog::info("Initializing agentpool daemon...");

    servers_->add_listener(routes_.get());
    servers_->add_listener(server_notifier_.get());
    tracker_->subscribe([this](const workflow::AgentStartupInfo& info) {
        notifications_->startup_state_changed(info);
    });

    proxy_->mount(*http_);
    control_api_->mount(*http_);

    if (!urls_->has_external_hostname()) {
        spdlog::warn("No external hostname configured, agent URLs will use localhost. "
                     "Set AGENTPOOL_EXTERNAL_HOSTNAME or external_hostname to configure.");
    }

    // Set up signal handlers
    g_daemon = this;
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    spdlog::info("Agent pool: {} (ports {}-{})", servers_->executable(), config_.base_port,
                 config_.base_port + config_.max_concurrent_servers - 1);
    return true;
}

void Daemon::run() {
    running_ = true;
    spdlog::info("Listening on {}:{}", config_.listen_host, config_.listen_port);

    if (!http_->listen(config_.listen_host, config_.listen_port) && running_) {
        spdlog::error("Failed to listen on {}:{}", config_.listen_host, config_.listen_port);
    }

    running_ = false;
    teardown();
    spdlog::info("agentpool daemon stopped");
}

void Daemon::shutdown() {
    running_ = false;
    if (http_) {
        http_->stop();
    }
}

void Daemon::teardown() {
    if (stopped_.exchange(true)) {
        return;
    }

    spdlog::info("Shutting down agents...");
    control_api_->drain();
    orchestrator_->shutdown();
}

} // namespace agentpool::daemon
