#pragma once
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "agent/agent_api.hpp"
#include "core/cancellation.hpp"
#include "core/concurrent_map.hpp"
#include "runtime/server_manager.hpp"
#include "workflow/agent_config_writer.hpp"
#include "workflow/collaborators.hpp"
#include "workflow/completion_monitor.hpp"
#include "workflow/startup_tracker.hpp"

namespace agentpool::workflow {

struct AgentStatus {
    std::string entity_id;
    runtime::AgentServerPtr server;
    std::optional<agent::Session> active_session;
    std::vector<agent::Session> sessions;
};

// Everything the orchestrator drives; all owned elsewhere
struct OrchestratorDependencies {
    runtime::ServerManager& servers;
    agent::AgentApi& api;
    CompletionMonitor& monitor;
    StartupTracker& tracker;
    const AgentConfigWriter& config_writer;
    WorkItemRepository& items;
    WorkItemTransitionService& transitions;
    PullRequestService& pull_requests;
    WorktreeService& worktrees;
};

// Ties agent lifecycle to the work-item state machine:
// Pending -> InProgress on start, back to Pending if the start fails,
// then AwaitingPR or Complete once the agent is done.
class Orchestrator {
public:
    explicit Orchestrator(OrchestratorDependencies deps);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Starts (or returns) the agent for an item without touching its status.
    // Throws NotFound, InvalidOperation, ConfigWriteFailure and the server start errors.
    AgentStatus start_for_existing_item(const std::string& item_id,
                                        const std::optional<std::string>& model = std::nullopt);

    // Pending -> InProgress, start, prompt, monitor. Any failure after the
    // transition rolls the item back to Pending before rethrowing.
    AgentStatus start_for_planned_item(const std::string& project_id,
                                       const std::string& change_id,
                                       const std::optional<std::string>& model = std::nullopt);

    // Cancels monitoring, stops the server, then resolves the item once
    void stop(const std::string& item_id);

    // Requires a running server with an active session
    agent::Message send_prompt(const std::string& item_id, const std::string& text);

    std::optional<AgentStatus> get_status(const std::string& entity_id);
    std::vector<runtime::AgentServerPtr> get_running_agents() const;
    bool is_monitoring(const std::string& entity_id) const;

    // Resolves an InProgress item: promote if its branch has a PR, else AwaitingPR
    void handle_completion(const std::string& project_id, const std::string& item_id);

    // Cancels every monitor without mutating items, then stops every server
    void shutdown();

private:
    struct MonitoringTask {
        std::string entity_id;
        std::string project_id;
        std::string branch_name;
        std::string base_url;
        core::CancellationSource cancel;
        std::mutex mutex;   // guards thread
        std::thread thread;
    };
    using MonitoringTaskPtr = std::shared_ptr<MonitoringTask>;

    OrchestratorDependencies deps_;
    core::ConcurrentMap<std::string, MonitoringTaskPtr> monitors_;

    std::mutex active_mutex_;
    std::condition_variable active_cv_;
    int active_monitors_ = 0;
    bool shut_down_ = false;

    Project require_project(const std::string& project_id);
    std::string ensure_worktree(const Project& project, WorkItem& item);
    std::optional<std::string> effective_model(const Project& project,
                                               const std::optional<std::string>& model) const;
    AgentStatus launch_agent(const Project& project, const WorkItem& item,
                             const std::string& worktree_path,
                             const std::optional<std::string>& model);
    AgentStatus build_status(const runtime::AgentServerPtr& server);
    void attach_session(AgentStatus& status, const std::string& title);

    void start_monitoring(const std::string& project_id, const std::string& entity_id,
                          const std::string& branch_name, const std::string& base_url);
    void run_monitor(const MonitoringTaskPtr& task);
    void finish_monitor(const MonitoringTaskPtr& task);
    static void cancel_and_join(const MonitoringTaskPtr& task);

    void apply_result(const std::string& project_id, const std::string& item_id,
                      const CompletionResult& result);
    void promote(const std::string& project_id, const std::string& item_id, int pr_number);
    void mark_awaiting_pr(const std::string& project_id, const std::string& item_id);
    void clear_agent_reference(const std::string& project_id, const std::string& item_id);
    std::optional<std::string> find_project_for_in_progress_item(const std::string& item_id);
};

} // namespace agentpool::workflow
