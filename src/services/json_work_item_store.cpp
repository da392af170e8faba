#include "services/json_work_item_store.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;
using agentpool::workflow::TransitionResult;
using agentpool::workflow::WorkItemStatus;

namespace agentpool::services {

static void to_json(json& j, const TrackedPullRequest& pr) {
    j = json{
        {"project_id", pr.project_id},
        {"item_id", pr.item_id},
        {"title", pr.title},
        {"branch_name", pr.branch_name},
        {"pr_number", pr.pr_number}
    };
    if (pr.worktree_path) {
        j["worktree_path"] = *pr.worktree_path;
    }
}

static void from_json(const json& j, TrackedPullRequest& pr) {
    pr.project_id = j.value("project_id", "");
    pr.item_id = j.value("item_id", "");
    pr.title = j.value("title", "");
    pr.branch_name = j.value("branch_name", "");
    pr.pr_number = j.value("pr_number", 0);
    if (j.contains("worktree_path") && j["worktree_path"].is_string()) {
        pr.worktree_path = j["worktree_path"].get<std::string>();
    }
}

JsonWorkItemStore::JsonWorkItemStore(std::string path)
    : path_(std::move(path)) {
    load();
}

void JsonWorkItemStore::load() {
    std::error_code ec;
    if (path_.empty() || !fs::exists(path_, ec)) {
        return;
    }

    std::ifstream in(path_);
    if (!in) {
        throw std::runtime_error("Cannot open state file " + path_);
    }

    try {
        json j = json::parse(in);
        projects_ = j.value("projects", json::array()).get<std::vector<workflow::Project>>();
        items_ = j.value("items", json::array()).get<std::vector<workflow::WorkItem>>();
        for (const auto& entry : j.value("tracked_pull_requests", json::array())) {
            tracked_.push_back(entry.get<TrackedPullRequest>());
        }
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid state file " + path_ + ": " + e.what());
    }

    spdlog::info("Loaded {} projects and {} work items from {}", projects_.size(), items_.size(), path_);
}

void JsonWorkItemStore::save() {
    if (path_.empty()) {
        return;
    }

    json tracked = json::array();
    for (const auto& pr : tracked_) {
        json entry;
        to_json(entry, pr);
        tracked.push_back(entry);
    }
    json j = {
        {"projects", projects_},
        {"items", items_},
        {"tracked_pull_requests", tracked}
    };

    std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot write state file " + tmp);
        }
        out << j.dump(2) << "\n";
        if (!out) {
            throw std::runtime_error("Failed writing state file " + tmp);
        }
    }

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        throw std::runtime_error("Cannot replace state file " + path_ + ": " + ec.message());
    }
}

workflow::WorkItem* JsonWorkItemStore::locate(const std::string& project_id, const std::string& item_id) {
    for (auto& item : items_) {
        if (item.id == item_id && item.project_id == project_id) {
            return &item;
        }
    }
    return nullptr;
}

void JsonWorkItemStore::add_project(const workflow::Project& project) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(projects_.begin(), projects_.end(),
                           [&](const workflow::Project& p) { return p.id == project.id; });
    if (it != projects_.end()) {
        *it = project;
    } else {
        projects_.push_back(project);
    }
    save();
}

void JsonWorkItemStore::add_item(const workflow::WorkItem& item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* existing = locate(item.project_id, item.id)) {
        *existing = item;
    } else {
        items_.push_back(item);
    }
    save();
}

std::vector<TrackedPullRequest> JsonWorkItemStore::tracked_pull_requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracked_;
}

// ============================================================================
// Repository
// ============================================================================

std::vector<workflow::Project> JsonWorkItemStore::list_projects() {
    std::lock_guard<std::mutex> lock(mutex_);
    return projects_;
}

std::optional<workflow::Project> JsonWorkItemStore::get_project(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& project : projects_) {
        if (project.id == project_id) {
            return project;
        }
    }
    return std::nullopt;
}

std::optional<workflow::WorkItem> JsonWorkItemStore::get_item(const std::string& item_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& item : items_) {
        if (item.id == item_id) {
            return item;
        }
    }
    return std::nullopt;
}

std::optional<workflow::WorkItem> JsonWorkItemStore::find_item(const std::string& project_id,
                                                               const std::string& item_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* item = locate(project_id, item_id)) {
        return *item;
    }
    return std::nullopt;
}

std::vector<workflow::WorkItem> JsonWorkItemStore::list_items(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<workflow::WorkItem> out;
    for (const auto& item : items_) {
        if (item.project_id == project_id) {
            out.push_back(item);
        }
    }
    return out;
}

void JsonWorkItemStore::update_item(const workflow::WorkItem& item) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* existing = locate(item.project_id, item.id);
    if (!existing) {
        throw std::runtime_error("Work item " + item.id + " not found in project " + item.project_id);
    }
    // Status only moves through the transition methods
    WorkItemStatus status = existing->status;
    *existing = item;
    existing->status = status;
    save();
}

// ============================================================================
// Transitions
// ============================================================================

TransitionResult JsonWorkItemStore::transition_to_in_progress(const std::string& project_id,
                                                              const std::string& item_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* item = locate(project_id, item_id);
    if (!item) {
        return TransitionResult::fail("Work item " + item_id + " not found");
    }
    if (item->status != WorkItemStatus::PENDING) {
        return TransitionResult::fail(std::string("Cannot start work on an item that is ") +
                                      workflow::work_item_status_to_string(item->status), item->status);
    }

    item->status = WorkItemStatus::IN_PROGRESS;
    save();
    spdlog::info("Work item {} -> in_progress", item_id);
    return TransitionResult::ok(WorkItemStatus::PENDING, WorkItemStatus::IN_PROGRESS);
}

TransitionResult JsonWorkItemStore::transition_to_awaiting_pr(const std::string& project_id,
                                                              const std::string& item_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* item = locate(project_id, item_id);
    if (!item) {
        return TransitionResult::fail("Work item " + item_id + " not found");
    }
    if (item->status != WorkItemStatus::IN_PROGRESS) {
        return TransitionResult::fail(std::string("Cannot await a PR for an item that is ") +
                                      workflow::work_item_status_to_string(item->status), item->status);
    }

    item->status = WorkItemStatus::AWAITING_PR;
    save();
    spdlog::info("Work item {} -> awaiting_pr", item_id);
    return TransitionResult::ok(WorkItemStatus::IN_PROGRESS, WorkItemStatus::AWAITING_PR);
}

TransitionResult JsonWorkItemStore::handle_start_failure(const std::string& project_id,
                                                         const std::string& item_id,
                                                         const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* item = locate(project_id, item_id);
    if (!item) {
        return TransitionResult::fail("Work item " + item_id + " not found");
    }
    if (item->status != WorkItemStatus::IN_PROGRESS) {
        return TransitionResult::fail(std::string("Cannot roll back an item that is ") +
                                      workflow::work_item_status_to_string(item->status), item->status);
    }

    item->status = WorkItemStatus::PENDING;
    item->active_agent.reset();
    item->agent_started_at.reset();
    save();
    spdlog::warn("Work item {} -> pending after failed start: {}", item_id, error);
    return TransitionResult::ok(WorkItemStatus::IN_PROGRESS, WorkItemStatus::PENDING);
}

TransitionResult JsonWorkItemStore::promote_to_tracked_pr(const std::string& project_id,
                                                          const std::string& item_id,
                                                          int pr_number) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* item = locate(project_id, item_id);
    if (!item) {
        return TransitionResult::fail("Work item " + item_id + " not found");
    }
    if (item->status != WorkItemStatus::IN_PROGRESS && item->status != WorkItemStatus::AWAITING_PR) {
        return TransitionResult::fail(std::string("Cannot complete an item that is ") +
                                      workflow::work_item_status_to_string(item->status), item->status);
    }

    WorkItemStatus previous = item->status;
    TrackedPullRequest tracked;
    tracked.project_id = project_id;
    tracked.item_id = item_id;
    tracked.title = item->title;
    tracked.branch_name = item->branch();
    tracked.worktree_path = item->worktree_path;
    tracked.pr_number = pr_number;
    tracked_.push_back(tracked);

    item->status = WorkItemStatus::COMPLETE;
    item->pr_number = pr_number;
    item->active_agent.reset();
    item->agent_started_at.reset();

    // Drop the completed item from the planning tree
    for (auto& other : items_) {
        if (other.project_id != project_id) continue;
        other.parents.erase(std::remove(other.parents.begin(), other.parents.end(), item_id),
                            other.parents.end());
    }

    save();
    spdlog::info("Work item {} -> complete (PR #{})", item_id, pr_number);
    return TransitionResult::ok(previous, WorkItemStatus::COMPLETE);
}

} // namespace agentpool::services
