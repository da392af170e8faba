#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentpool::workflow {

// ============================================================================
// Work items
// ============================================================================

enum class WorkItemStatus {
    PENDING,
    IN_PROGRESS,
    AWAITING_PR,
    COMPLETE
};

const char* work_item_status_to_string(WorkItemStatus status);
std::optional<WorkItemStatus> work_item_status_from_string(const std::string& name);

struct Project {
    std::string id;
    std::string name;
    std::string local_path;
    std::string default_branch = "main";
    std::optional<std::string> default_model;
};

struct WorkItem {
    std::string id;
    std::string project_id;
    std::string title;
    std::string description;
    std::string instructions;
    std::string branch_name;                  // empty: the item id is the branch
    std::vector<std::string> parents;         // planning tree; first parent is the PR base
    WorkItemStatus status = WorkItemStatus::PENDING;
    std::optional<std::string> worktree_path;
    std::optional<int> pr_number;
    std::optional<std::string> active_agent;  // entity id of the supervising agent
    std::optional<int64_t> agent_started_at;  // unix ms

    const std::string& branch() const { return branch_name.empty() ? id : branch_name; }
};

struct TransitionResult {
    bool success = false;
    std::string error;
    std::optional<WorkItemStatus> previous_status;
    std::optional<WorkItemStatus> new_status;

    static TransitionResult ok(WorkItemStatus from, WorkItemStatus to) {
        return {true, "", from, to};
    }
    static TransitionResult fail(std::string error, std::optional<WorkItemStatus> from = std::nullopt) {
        return {false, std::move(error), from, std::nullopt};
    }
};

// ============================================================================
// Pull requests
// ============================================================================

struct PullRequestInfo {
    std::string branch_name;
    int number = 0;
    std::string html_url;
};

// ============================================================================
// Collaborator interfaces
// ============================================================================

class WorkItemRepository {
public:
    virtual ~WorkItemRepository() = default;

    virtual std::vector<Project> list_projects() = 0;
    virtual std::optional<Project> get_project(const std::string& project_id) = 0;

    // Item ids are unique across projects
    virtual std::optional<WorkItem> get_item(const std::string& item_id) = 0;
    virtual std::optional<WorkItem> find_item(const std::string& project_id,
                                              const std::string& item_id) = 0;
    virtual std::vector<WorkItem> list_items(const std::string& project_id) = 0;

    // Persists non-status fields (worktree path, agent reference)
    virtual void update_item(const WorkItem& item) = 0;
};

class WorkItemTransitionService {
public:
    virtual ~WorkItemTransitionService() = default;

    virtual TransitionResult transition_to_in_progress(const std::string& project_id,
                                                       const std::string& item_id) = 0;
    virtual TransitionResult transition_to_awaiting_pr(const std::string& project_id,
                                                       const std::string& item_id) = 0;

    // InProgress -> Pending after a failed start
    virtual TransitionResult handle_start_failure(const std::string& project_id,
                                                  const std::string& item_id,
                                                  const std::string& error) = 0;

    // Records the PR, marks the item Complete and drops it from the planning tree
    virtual TransitionResult promote_to_tracked_pr(const std::string& project_id,
                                                   const std::string& item_id,
                                                   int pr_number) = 0;
};

class PullRequestService {
public:
    virtual ~PullRequestService() = default;

    virtual std::vector<PullRequestInfo> list_open(const std::string& project_id) = 0;

    // Case-insensitive branch match over list_open
    virtual std::optional<PullRequestInfo> find_by_branch(const std::string& project_id,
                                                          const std::string& branch_name);

    // Refresh cached PR metadata
    virtual void sync(const std::string& project_id) = 0;
};

class WorktreeService {
public:
    virtual ~WorktreeService() = default;

    // Returns the worktree path, or nothing on failure
    virtual std::optional<std::string> create_worktree(const std::string& repo_path,
                                                       const std::string& branch_name,
                                                       const std::string& base_branch) = 0;
    virtual bool pull_latest(const std::string& worktree_path) = 0;
};

struct ServerSummary {
    std::string entity_id;
    int port = 0;
    std::string base_url;
    std::string external_url;
    std::string worktree_path;
    std::string status;
    std::optional<std::string> active_session_id;
    std::optional<std::string> web_view_url;
    int64_t started_at_ms = 0;
};

enum class StartupState {
    NOT_STARTED,
    STARTING,
    STARTED,
    FAILED
};

const char* startup_state_to_string(StartupState state);

struct AgentStartupInfo {
    std::string entity_id;
    StartupState state = StartupState::NOT_STARTED;
    std::optional<std::string> error_message;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual void servers_changed(const std::vector<ServerSummary>& servers) = 0;
    virtual void startup_state_changed(const AgentStartupInfo& info) = 0;
};

void to_json(nlohmann::json& j, const Project& p);
void from_json(const nlohmann::json& j, Project& p);
void to_json(nlohmann::json& j, const WorkItem& item);
void from_json(const nlohmann::json& j, WorkItem& item);
void to_json(nlohmann::json& j, const ServerSummary& s);
void to_json(nlohmann::json& j, const AgentStartupInfo& info);

} // namespace agentpool::workflow
