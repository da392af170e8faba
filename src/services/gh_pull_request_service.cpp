#include "services/gh_pull_request_service.hpp"
#include "services/command_runner.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace agentpool::services {

GhPullRequestService::GhPullRequestService(workflow::WorkItemRepository& items, std::string gh)
    : items_(items), gh_(std::move(gh)) {}

std::vector<workflow::PullRequestInfo> GhPullRequestService::parse_pr_list(const std::string& output) {
    json j;
    try {
        j = json::parse(output);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("invalid gh output: ") + e.what());
    }
    if (!j.is_array()) {
        throw std::runtime_error("gh pr list did not return an array");
    }

    std::vector<workflow::PullRequestInfo> prs;
    for (const auto& entry : j) {
        workflow::PullRequestInfo pr;
        pr.number = entry.value("number", 0);
        pr.branch_name = entry.value("headRefName", "");
        pr.html_url = entry.value("url", "");
        prs.push_back(pr);
    }
    return prs;
}

std::vector<workflow::PullRequestInfo> GhPullRequestService::list_open(const std::string& project_id) {
    auto project = items_.get_project(project_id);
    if (!project) {
        throw std::runtime_error("Project " + project_id + " not found");
    }

    auto result = run_command({gh_, "pr", "list", "--state", "open",
                               "--json", "number,headRefName,url", "--limit", "200"},
                              project->local_path);
    if (!result.success) {
        throw std::runtime_error("gh pr list failed (exit " + std::to_string(result.exit_code) +
                                 "): " + result.output);
    }
    return parse_pr_list(result.output);
}

void GhPullRequestService::sync(const std::string& project_id) {
    auto prs = list_open(project_id);
    spdlog::info("Synced {} open pull requests for {}", prs.size(), project_id);
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_[project_id] = std::move(prs);
}

std::vector<workflow::PullRequestInfo> GhPullRequestService::cached(const std::string& project_id) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = cache_.find(project_id);
    return it == cache_.end() ? std::vector<workflow::PullRequestInfo>{} : it->second;
}

} // namespace agentpool::services
