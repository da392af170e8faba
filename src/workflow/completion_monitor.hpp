#pragma once
#include <optional>
#include <regex>
#include <string>
#include "agent/agent_api.hpp"
#include "core/cancellation.hpp"
#include "workflow/collaborators.hpp"

namespace agentpool::workflow {

enum class CompletionOutcome {
    PR_DETECTED,
    STREAM_ENDED,
    PR_LOOKUP_EXHAUSTED,
    CANCELLED
};

const char* completion_outcome_to_string(CompletionOutcome outcome);

struct CompletionResult {
    bool success = false;
    CompletionOutcome outcome = CompletionOutcome::STREAM_ENDED;
    std::optional<int> pr_number;
    std::optional<std::string> pr_url;
    std::string branch_name;
    std::string reason;
};

struct PrUrl {
    std::string url;
    int number = 0;
};

struct CompletionMonitorOptions {
    int pr_retry_count = 3;
    int pr_retry_delay_ms = 2000;
};

// Watches an agent's event stream for the shell command that opens a pull
// request, then resolves the PR number from the command output or, failing
// that, from the PR listing.
class CompletionMonitor {
public:
    CompletionMonitor(agent::AgentApi& api, PullRequestService& pull_requests,
                      CompletionMonitorOptions options = {});

    // Blocks until a PR is detected, the stream ends, or token is cancelled.
    // PR listing failures count as a miss for that attempt.
    CompletionResult monitor_for_completion(const std::string& base_url,
                                            const std::string& project_id,
                                            const std::string& branch_name,
                                            core::CancellationToken token);

    // Bounded-retry lookup by branch; the delay precedes every attempt but the first
    CompletionResult find_pr_by_branch(const std::string& project_id,
                                       const std::string& branch_name,
                                       const core::CancellationToken& token);

    // Text to search for the PR URL when ev signals PR creation
    std::optional<std::string> pr_creation_output(const agent::AgentEvent& ev) const;
    bool is_pr_creation_event(const agent::AgentEvent& ev) const {
        return pr_creation_output(ev).has_value();
    }

    std::optional<PrUrl> parse_pr_url(const std::string& text) const;

private:
    agent::AgentApi& api_;
    PullRequestService& pull_requests_;
    CompletionMonitorOptions options_;
    std::regex pr_url_;
};

} // namespace agentpool::workflow
