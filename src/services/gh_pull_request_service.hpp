#pragma once
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "workflow/collaborators.hpp"

namespace agentpool::services {

// Lists open PRs with the GitHub CLI inside the project's checkout
class GhPullRequestService : public workflow::PullRequestService {
public:
    explicit GhPullRequestService(workflow::WorkItemRepository& items, std::string gh = "gh");

    // Throws std::runtime_error when gh fails or prints something unparseable
    std::vector<workflow::PullRequestInfo> list_open(const std::string& project_id) override;
    void sync(const std::string& project_id) override;

    std::vector<workflow::PullRequestInfo> cached(const std::string& project_id) const;

    static std::vector<workflow::PullRequestInfo> parse_pr_list(const std::string& output);

private:
    workflow::WorkItemRepository& items_;
    std::string gh_;

    mutable std::mutex cache_mutex_;
    std::map<std::string, std::vector<workflow::PullRequestInfo>> cache_;
};

} // namespace agentpool::services
