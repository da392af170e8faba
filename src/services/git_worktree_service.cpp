#include "services/git_worktree_service.hpp"
#include "services/command_runner.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>

namespace fs = std::filesystem;

namespace agentpool::services {

std::string GitWorktreeService::worktree_path_for(const std::string& repo_path,
                                                  const std::string& branch_name) {
    std::string dir = branch_name;
    for (auto& c : dir) {
        if (c == '/' || c == '\\' || c == ' ') c = '-';
    }
    fs::path repo = fs::path(repo_path).lexically_normal();
    if (repo.filename().empty()) {
        repo = repo.parent_path();
    }
    return (repo.parent_path() / (repo.filename().string() + "-worktrees") / dir).string();
}

std::optional<std::string> GitWorktreeService::create_worktree(const std::string& repo_path,
                                                               const std::string& branch_name,
                                                               const std::string& base_branch) {
    std::string path = worktree_path_for(repo_path, branch_name);
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        spdlog::debug("Worktree for {} already exists at {}", branch_name, path);
        return path;
    }

    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        spdlog::error("Cannot create worktree parent for {}: {}", path, ec.message());
        return std::nullopt;
    }

    auto exists = run_command({"git", "rev-parse", "--verify", "--quiet", "refs/heads/" + branch_name},
                              repo_path);
    CommandResult result;
    if (exists.success) {
        result = run_command({"git", "worktree", "add", path, branch_name}, repo_path);
    } else {
        result = run_command({"git", "worktree", "add", "-b", branch_name, path, base_branch}, repo_path);
    }

    if (!result.success) {
        spdlog::error("git worktree add for {} failed: {}", branch_name, result.output);
        return std::nullopt;
    }

    spdlog::info("Created worktree for {} at {}", branch_name, path);
    return path;
}

bool GitWorktreeService::pull_latest(const std::string& worktree_path) {
    auto result = run_command({"git", "pull", "--ff-only"}, worktree_path);
    if (!result.success) {
        spdlog::warn("git pull in {} failed: {}", worktree_path, result.output);
    }
    return result.success;
}

} // namespace agentpool::services
