#include "workflow/collaborators.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

using json = nlohmann::json;

namespace agentpool::workflow {

static bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

const char* work_item_status_to_string(WorkItemStatus status) {
    switch (status) {
        case WorkItemStatus::PENDING:     return "pending";
        case WorkItemStatus::IN_PROGRESS: return "in_progress";
        case WorkItemStatus::AWAITING_PR: return "awaiting_pr";
        case WorkItemStatus::COMPLETE:    return "complete";
    }
    return "unknown";
}

std::optional<WorkItemStatus> work_item_status_from_string(const std::string& name) {
    if (name == "pending") return WorkItemStatus::PENDING;
    if (name == "in_progress") return WorkItemStatus::IN_PROGRESS;
    if (name == "awaiting_pr") return WorkItemStatus::AWAITING_PR;
    if (name == "complete") return WorkItemStatus::COMPLETE;
    return std::nullopt;
}

const char* startup_state_to_string(StartupState state) {
    switch (state) {
        case StartupState::NOT_STARTED: return "not_started";
        case StartupState::STARTING:    return "starting";
        case StartupState::STARTED:     return "started";
        case StartupState::FAILED:      return "failed";
    }
    return "unknown";
}

std::optional<PullRequestInfo> PullRequestService::find_by_branch(const std::string& project_id,
                                                                  const std::string& branch_name) {
    for (const auto& pr : list_open(project_id)) {
        if (pr.number > 0 && iequals(pr.branch_name, branch_name)) {
            return pr;
        }
    }
    return std::nullopt;
}

// ============================================================================
// JSON
// ============================================================================

void to_json(json& j, const Project& p) {
    j = json{
        {"id", p.id},
        {"name", p.name},
        {"local_path", p.local_path},
        {"default_branch", p.default_branch}
    };
    if (p.default_model) {
        j["default_model"] = *p.default_model;
    }
}

void from_json(const json& j, Project& p) {
    p.id = j.at("id").get<std::string>();
    p.name = j.value("name", p.id);
    p.local_path = j.at("local_path").get<std::string>();
    p.default_branch = j.value("default_branch", "main");
    if (j.contains("default_model") && j["default_model"].is_string()) {
        p.default_model = j["default_model"].get<std::string>();
    }
}

void to_json(json& j, const WorkItem& item) {
    j = json{
        {"id", item.id},
        {"project_id", item.project_id},
        {"title", item.title},
        {"description", item.description},
        {"instructions", item.instructions},
        {"branch_name", item.branch_name},
        {"parents", item.parents},
        {"status", work_item_status_to_string(item.status)}
    };
    if (item.worktree_path) j["worktree_path"] = *item.worktree_path;
    if (item.pr_number) j["pr_number"] = *item.pr_number;
    if (item.active_agent) j["active_agent"] = *item.active_agent;
    if (item.agent_started_at) j["agent_started_at"] = *item.agent_started_at;
}

void from_json(const json& j, WorkItem& item) {
    item.id = j.at("id").get<std::string>();
    item.project_id = j.value("project_id", "");
    item.title = j.value("title", "");
    item.description = j.value("description", "");
    item.instructions = j.value("instructions", "");
    item.branch_name = j.value("branch_name", "");
    item.parents = j.value("parents", std::vector<std::string>{});

    auto status = work_item_status_from_string(j.value("status", "pending"));
    if (!status) {
        throw std::invalid_argument("unknown work item status for " + item.id);
    }
    item.status = *status;

    item.worktree_path.reset();
    item.pr_number.reset();
    item.active_agent.reset();
    item.agent_started_at.reset();
    if (j.contains("worktree_path") && j["worktree_path"].is_string()) {
        item.worktree_path = j["worktree_path"].get<std::string>();
    }
    if (j.contains("pr_number") && j["pr_number"].is_number_integer()) {
        item.pr_number = j["pr_number"].get<int>();
    }
    if (j.contains("active_agent") && j["active_agent"].is_string()) {
        item.active_agent = j["active_agent"].get<std::string>();
    }
    if (j.contains("agent_started_at") && j["agent_started_at"].is_number_integer()) {
        item.agent_started_at = j["agent_started_at"].get<int64_t>();
    }
}

void to_json(json& j, const ServerSummary& s) {
    j = json{
        {"entity_id", s.entity_id},
        {"port", s.port},
        {"base_url", s.base_url},
        {"external_url", s.external_url},
        {"worktree_path", s.worktree_path},
        {"status", s.status},
        {"started_at", s.started_at_ms},
        {"active_session_id", s.active_session_id ? json(*s.active_session_id) : json(nullptr)},
        {"web_view_url", s.web_view_url ? json(*s.web_view_url) : json(nullptr)}
    };
}

void to_json(json& j, const AgentStartupInfo& info) {
    j = json{
        {"entity_id", info.entity_id},
        {"state", startup_state_to_string(info.state)},
        {"error", info.error_message ? json(*info.error_message) : json(nullptr)},
        {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
            info.timestamp.time_since_epoch()).count()}
    };
}

} // namespace agentpool::workflow
