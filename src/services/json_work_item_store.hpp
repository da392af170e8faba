#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "workflow/collaborators.hpp"

namespace agentpool::services {

struct TrackedPullRequest {
    std::string project_id;
    std::string item_id;
    std::string title;
    std::string branch_name;
    std::optional<std::string> worktree_path;
    int pr_number = 0;
};

// Projects, work items and tracked PRs persisted as one JSON document.
// Serves as both repository and transition service; every mutation is
// validated against the work-item state machine and saved immediately.
class JsonWorkItemStore : public workflow::WorkItemRepository,
                          public workflow::WorkItemTransitionService {
public:
    // Empty path keeps everything in memory. Throws std::runtime_error if an
    // existing file cannot be parsed.
    explicit JsonWorkItemStore(std::string path = "");

    void add_project(const workflow::Project& project);
    void add_item(const workflow::WorkItem& item);
    std::vector<TrackedPullRequest> tracked_pull_requests() const;

    // WorkItemRepository
    std::vector<workflow::Project> list_projects() override;
    std::optional<workflow::Project> get_project(const std::string& project_id) override;
    std::optional<workflow::WorkItem> get_item(const std::string& item_id) override;
    std::optional<workflow::WorkItem> find_item(const std::string& project_id,
                                                const std::string& item_id) override;
    std::vector<workflow::WorkItem> list_items(const std::string& project_id) override;
    void update_item(const workflow::WorkItem& item) override;

    // WorkItemTransitionService
    workflow::TransitionResult transition_to_in_progress(const std::string& project_id,
                                                         const std::string& item_id) override;
    workflow::TransitionResult transition_to_awaiting_pr(const std::string& project_id,
                                                         const std::string& item_id) override;
    workflow::TransitionResult handle_start_failure(const std::string& project_id,
                                                    const std::string& item_id,
                                                    const std::string& error) override;
    workflow::TransitionResult promote_to_tracked_pr(const std::string& project_id,
                                                     const std::string& item_id,
                                                     int pr_number) override;

private:
    std::string path_;
    mutable std::mutex mutex_;
    std::vector<workflow::Project> projects_;
    std::vector<workflow::WorkItem> items_;
    std::vector<TrackedPullRequest> tracked_;

    void load();
    void save();   // caller holds mutex_
    workflow::WorkItem* locate(const std::string& project_id, const std::string& item_id);
};

} // namespace agentpool::services
