#pragma once
#include <optional>
#include <string>
#include "workflow/collaborators.hpp"

namespace agentpool::services {

// Worktrees live beside the repository: "{repo}-worktrees/{branch with / -> -}"
class GitWorktreeService : public workflow::WorktreeService {
public:
    std::optional<std::string> create_worktree(const std::string& repo_path,
                                               const std::string& branch_name,
                                               const std::string& base_branch) override;
    bool pull_latest(const std::string& worktree_path) override;

    static std::string worktree_path_for(const std::string& repo_path, const std::string& branch_name);
};

} // namespace agentpool::services
