#include "workflow/orchestrator.hpp"
#include "core/errors.hpp"
#include "workflow/prompt_builder.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace agentpool::workflow {

static int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

Orchestrator::Orchestrator(OrchestratorDependencies deps)
    : deps_(deps) {}

Orchestrator::~Orchestrator() {
    shutdown();
}

// ============================================================================
// Start
// ============================================================================

Project Orchestrator::require_project(const std::string& project_id) {
    auto project = deps_.items.get_project(project_id);
    if (!project) {
        throw NotFound("Project " + project_id + " not found");
    }
    return *project;
}

std::string Orchestrator::ensure_worktree(const Project& project, WorkItem& item) {
    std::error_code ec;
    if (item.worktree_path && fs::is_directory(*item.worktree_path, ec)) {
        return *item.worktree_path;
    }

    spdlog::info("Creating worktree for {} on branch {}", item.id, item.branch());
    auto path = deps_.worktrees.create_worktree(project.local_path, item.branch(), project.default_branch);
    if (!path) {
        throw InvalidOperation("Failed to create worktree for " + item.id +
                               " (branch: " + item.branch() + ")");
    }

    item.worktree_path = *path;
    deps_.items.update_item(item);
    return *path;
}

std::optional<std::string> Orchestrator::effective_model(const Project& project,
                                                         const std::optional<std::string>& model) const {
    if (model && !model->empty()) {
        return model;
    }
    return project.default_model;
}

AgentStatus Orchestrator::launch_agent(const Project& project, const WorkItem& item,
                                       const std::string& worktree_path,
                                       const std::optional<std::string>& model) {
    spdlog::info("Pulling latest changes for {}", item.id);
    if (!deps_.worktrees.pull_latest(worktree_path)) {
        spdlog::warn("Failed to pull latest changes for {}, continuing anyway", item.id);
    }

    auto config = deps_.config_writer.create_default_config(effective_model(project, model));
    deps_.config_writer.write(worktree_path, config);

    auto server = deps_.servers.start_server(item.id, worktree_path, false);
    AgentStatus status = build_status(server);
    attach_session(status, item.title);

    spdlog::info("Agent started for {} on port {}, session {}", item.id, server->port(),
                 status.active_session ? status.active_session->id : "(none)");
    return status;
}

AgentStatus Orchestrator::build_status(const runtime::AgentServerPtr& server) {
    AgentStatus status;
    status.entity_id = server->entity_id();
    status.server = server;

    try {
        status.sessions = deps_.api.list_sessions(server->base_url());
    } catch (const AgentApiError& e) {
        spdlog::warn("Could not list sessions for {}: {}", server->entity_id(), e.what());
        return status;
    }

    auto active = server->active_session_id();
    if (active) {
        for (const auto& session : status.sessions) {
            if (session.id == *active) {
                status.active_session = session;
                break;
            }
        }
    }
    return status;
}

void Orchestrator::attach_session(AgentStatus& status, const std::string& title) {
    if (status.active_session) {
        return;
    }

    if (status.sessions.empty()) {
        auto session = deps_.api.create_session(status.server->base_url(), title);
        status.sessions.push_back(session);
        status.active_session = session;
    } else {
        auto most_recent = std::max_element(status.sessions.begin(), status.sessions.end(),
            [](const agent::Session& a, const agent::Session& b) {
                return a.last_activity_ms() < b.last_activity_ms();
            });
        status.active_session = *most_recent;
    }
    status.server->set_active_session_id(status.active_session->id);
}

AgentStatus Orchestrator::start_for_existing_item(const std::string& item_id,
                                                  const std::optional<std::string>& model) {
    auto item = deps_.items.get_item(item_id);
    if (!item) {
        throw NotFound("Work item " + item_id + " not found");
    }
    Project project = require_project(item->project_id);

    auto worktree_path = ensure_worktree(project, *item);

    auto existing = deps_.servers.get_server_for_entity(item_id);
    if (existing && existing->status() == runtime::ServerStatus::RUNNING) {
        spdlog::info("Agent already running for {}", item_id);
        AgentStatus status = build_status(existing);
        attach_session(status, item->title);
        return status;
    }

    deps_.tracker.mark_starting(item_id);
    try {
        AgentStatus status = launch_agent(project, *item, worktree_path, model);
        deps_.tracker.mark_started(item_id);
        return status;
    } catch (const std::exception& e) {
        deps_.tracker.mark_failed(item_id, e.what());
        throw;
    }
}

AgentStatus Orchestrator::start_for_planned_item(const std::string& project_id,
                                                 const std::string& change_id,
                                                 const std::optional<std::string>& model) {
    Project project = require_project(project_id);
    auto item = deps_.items.find_item(project_id, change_id);
    if (!item) {
        throw NotFound("Work item " + change_id + " not found in project " + project_id);
    }

    auto transition = deps_.transitions.transition_to_in_progress(project_id, change_id);
    if (!transition.success) {
        throw InvalidOperation("Failed to transition " + change_id + " to InProgress: " + transition.error);
    }

    deps_.tracker.mark_starting(change_id);
    bool already_running = false;
    try {
        auto existing = deps_.servers.get_server_for_entity(change_id);
        already_running = existing && existing->status() == runtime::ServerStatus::RUNNING;

        auto worktree_path = ensure_worktree(project, *item);
        AgentStatus status = launch_agent(project, *item, worktree_path, model);
        const auto& server = status.server;

        auto prompt = agent::PromptRequest::from_text(
            build_initial_prompt(*item, project.default_branch),
            effective_model(project, model).value_or(deps_.config_writer.default_model()));
        deps_.api.send_prompt_async(server->base_url(), status.active_session->id, prompt);
        spdlog::info("Sent initial prompt for {} to session {}", change_id, status.active_session->id);

        item->active_agent = change_id;
        item->agent_started_at = now_ms();
        deps_.items.update_item(*item);

        start_monitoring(project_id, change_id, item->branch(), server->base_url());
        deps_.tracker.mark_started(change_id);
        return status;
    } catch (const std::exception& e) {
        spdlog::error("Failed to start agent for {}: {}", change_id, e.what());

        if (!already_running) {
            deps_.servers.stop_server(change_id);
        }
        auto rollback = deps_.transitions.handle_start_failure(project_id, change_id, e.what());
        if (!rollback.success) {
            spdlog::error("Failed to roll {} back to Pending: {}", change_id, rollback.error);
        }
        deps_.tracker.mark_failed(change_id, e.what());
        throw;
    }
}

// ============================================================================
// Monitoring
// ============================================================================

void Orchestrator::start_monitoring(const std::string& project_id, const std::string& entity_id,
                                    const std::string& branch_name, const std::string& base_url) {
    if (auto previous = monitors_.erase(entity_id)) {
        spdlog::debug("Replacing existing monitor for {}", entity_id);
        cancel_and_join(*previous);
    }

    auto task = std::make_shared<MonitoringTask>();
    task->entity_id = entity_id;
    task->project_id = project_id;
    task->branch_name = branch_name;
    task->base_url = base_url;

    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        if (shut_down_) {
            throw InvalidOperation("Orchestrator is shutting down");
        }
        ++active_monitors_;
    }

    std::lock_guard<std::mutex> lock(task->mutex);
    monitors_.insert_or_assign(entity_id, task);
    try {
        task->thread = std::thread([this, task]() { run_monitor(task); });
    } catch (const std::system_error&) {
        monitors_.erase_if(entity_id, [&task](const MonitoringTaskPtr& t) { return t == task; });
        {
            std::lock_guard<std::mutex> active_lock(active_mutex_);
            --active_monitors_;
        }
        active_cv_.notify_all();
        throw;
    }
    spdlog::info("Started completion monitor for {}", entity_id);
}

void Orchestrator::run_monitor(const MonitoringTaskPtr& task) {
    auto token = task->cancel.token();

    try {
        auto result = deps_.monitor.monitor_for_completion(
            task->base_url, task->project_id, task->branch_name, token);

        if (result.outcome == CompletionOutcome::CANCELLED || token.is_cancelled()) {
            spdlog::info("Completion monitor for {} cancelled", task->entity_id);
        } else {
            spdlog::info("Completion monitor for {} finished: {}", task->entity_id,
                         completion_outcome_to_string(result.outcome));
            apply_result(task->project_id, task->entity_id, result);
            deps_.servers.stop_server(task->entity_id);
        }
    } catch (const std::exception& e) {
        spdlog::error("Completion monitor for {} failed: {}", task->entity_id, e.what());
        if (!token.is_cancelled()) {
            try {
                mark_awaiting_pr(task->project_id, task->entity_id);
                clear_agent_reference(task->project_id, task->entity_id);
                deps_.servers.stop_server(task->entity_id);
            } catch (const std::exception& inner) {
                spdlog::error("Could not resolve {} after monitor failure: {}",
                              task->entity_id, inner.what());
            }
        }
    }

    finish_monitor(task);
}

void Orchestrator::finish_monitor(const MonitoringTaskPtr& task) {
    auto mine = monitors_.erase_if(task->entity_id,
        [&task](const MonitoringTaskPtr& t) { return t == task; });
    {
        // Nobody else will join us once our record is gone
        std::lock_guard<std::mutex> lock(task->mutex);
        if (mine && task->thread.joinable()) {
            task->thread.detach();
        }
    }

    std::lock_guard<std::mutex> lock(active_mutex_);
    --active_monitors_;
    active_cv_.notify_all();
}

void Orchestrator::cancel_and_join(const MonitoringTaskPtr& task) {
    task->cancel.cancel();

    std::thread thread;
    {
        std::lock_guard<std::mutex> lock(task->mutex);
        thread = std::move(task->thread);
    }
    if (thread.joinable()) {
        thread.join();
    }
}

bool Orchestrator::is_monitoring(const std::string& entity_id) const {
    return monitors_.contains(entity_id);
}

// ============================================================================
// Completion handling
// ============================================================================

void Orchestrator::apply_result(const std::string& project_id, const std::string& item_id,
                                const CompletionResult& result) {
    auto item = deps_.items.find_item(project_id, item_id);
    if (!item) {
        spdlog::warn("Work item {} not found when handling agent completion", item_id);
        return;
    }
    if (item->status != WorkItemStatus::IN_PROGRESS) {
        spdlog::debug("Work item {} is {}, skipping completion handling",
                      item_id, work_item_status_to_string(item->status));
        return;
    }

    if (result.success && result.pr_number) {
        promote(project_id, item_id, *result.pr_number);
    } else {
        spdlog::info("No PR detected for {} ({}), transitioning to AwaitingPR", item_id, result.reason);
        mark_awaiting_pr(project_id, item_id);
    }
    clear_agent_reference(project_id, item_id);
}

void Orchestrator::handle_completion(const std::string& project_id, const std::string& item_id) {
    auto item = deps_.items.find_item(project_id, item_id);
    if (!item) {
        spdlog::warn("Work item {} not found when handling agent completion", item_id);
        return;
    }
    if (item->status != WorkItemStatus::IN_PROGRESS) {
        spdlog::debug("Work item {} is {}, skipping completion handling",
                      item_id, work_item_status_to_string(item->status));
        return;
    }

    spdlog::info("Handling agent completion for {}", item_id);
    try {
        auto pr = deps_.pull_requests.find_by_branch(project_id, item->branch());
        if (pr) {
            spdlog::info("Found PR #{} for {}", pr->number, item_id);
            promote(project_id, item_id, pr->number);
        } else {
            spdlog::info("No PR found for {}, transitioning to AwaitingPR", item_id);
            mark_awaiting_pr(project_id, item_id);
        }
    } catch (const std::exception& e) {
        spdlog::error("Error checking for a PR on {}: {}", item_id, e.what());
        mark_awaiting_pr(project_id, item_id);
    }
    clear_agent_reference(project_id, item_id);
}

void Orchestrator::promote(const std::string& project_id, const std::string& item_id, int pr_number) {
    auto result = deps_.transitions.promote_to_tracked_pr(project_id, item_id, pr_number);
    if (!result.success) {
        spdlog::error("Failed to promote {} to PR #{}: {}", item_id, pr_number, result.error);
        return;
    }

    try {
        deps_.pull_requests.sync(project_id);
    } catch (const std::exception& e) {
        spdlog::warn("PR sync after promoting {} failed: {}", item_id, e.what());
    }
    spdlog::info("Work item {} promoted to PR #{}", item_id, pr_number);
}

void Orchestrator::mark_awaiting_pr(const std::string& project_id, const std::string& item_id) {
    auto result = deps_.transitions.transition_to_awaiting_pr(project_id, item_id);
    if (!result.success) {
        spdlog::warn("Failed to transition {} to AwaitingPR: {}", item_id, result.error);
    }
}

void Orchestrator::clear_agent_reference(const std::string& project_id, const std::string& item_id) {
    auto item = deps_.items.find_item(project_id, item_id);
    if (!item || (!item->active_agent && !item->agent_started_at)) {
        return;
    }
    item->active_agent.reset();
    item->agent_started_at.reset();
    deps_.items.update_item(*item);
}

std::optional<std::string> Orchestrator::find_project_for_in_progress_item(const std::string& item_id) {
    for (const auto& project : deps_.items.list_projects()) {
        auto item = deps_.items.find_item(project.id, item_id);
        if (item && item->status == WorkItemStatus::IN_PROGRESS) {
            return project.id;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Stop / prompt / queries
// ============================================================================

void Orchestrator::stop(const std::string& item_id) {
    std::optional<std::string> project_id;
    if (auto task = monitors_.erase(item_id)) {
        project_id = (*task)->project_id;
        cancel_and_join(*task);
    }

    deps_.servers.stop_server(item_id);
    spdlog::info("Agent stopped for {}", item_id);

    if (!project_id) {
        project_id = find_project_for_in_progress_item(item_id);
    }
    if (project_id) {
        handle_completion(*project_id, item_id);
    } else {
        spdlog::debug("No in-progress work item for {}", item_id);
    }
}

agent::Message Orchestrator::send_prompt(const std::string& item_id, const std::string& text) {
    auto server = deps_.servers.get_server_for_entity(item_id);
    if (!server || server->status() != runtime::ServerStatus::RUNNING) {
        throw NotFound("No agent running for " + item_id);
    }
    auto session_id = server->active_session_id();
    if (!session_id) {
        throw InvalidOperation("Agent for " + item_id + " has no active session");
    }

    spdlog::info("Sending prompt to {} ({} chars)", item_id, text.size());
    auto reply = deps_.api.send_prompt(server->base_url(), *session_id,
                                       agent::PromptRequest::from_text(text));
    spdlog::info("Prompt to {} answered with message {}", item_id, reply.id);
    return reply;
}

std::optional<AgentStatus> Orchestrator::get_status(const std::string& entity_id) {
    auto server = deps_.servers.get_server_for_entity(entity_id);
    if (!server || server->status() != runtime::ServerStatus::RUNNING) {
        return std::nullopt;
    }
    return build_status(server);
}

std::vector<runtime::AgentServerPtr> Orchestrator::get_running_agents() const {
    auto servers = deps_.servers.get_running_servers();
    servers.erase(std::remove_if(servers.begin(), servers.end(),
        [](const runtime::AgentServerPtr& s) { return s->status() != runtime::ServerStatus::RUNNING; }),
        servers.end());
    return servers;
}

void Orchestrator::shutdown() {
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
    }

    auto tasks = monitors_.take_all();
    spdlog::info("Shutting down orchestrator ({} monitors)", tasks.size());
    for (const auto& task : tasks) {
        task->cancel.cancel();
    }
    for (const auto& task : tasks) {
        cancel_and_join(task);
    }

    {
        std::unique_lock<std::mutex> lock(active_mutex_);
        active_cv_.wait(lock, [this]() { return active_monitors_ == 0; });
    }

    deps_.servers.stop_all();
}

} // namespace agentpool::workflow
