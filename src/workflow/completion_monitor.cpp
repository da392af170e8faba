#include "workflow/completion_monitor.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>

using json = nlohmann::json;

namespace agentpool::workflow {

static const char* PR_CREATE_COMMAND = "gh pr create";

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool contains_ci(const std::string& haystack, const std::string& needle) {
    return lowercase(haystack).find(lowercase(needle)) != std::string::npos;
}

// Flattens a tool input (string or {"command": ...} object) to searchable text
static std::string json_text(const json& j) {
    if (j.is_string()) {
        return j.get<std::string>();
    }
    if (j.is_null()) {
        return "";
    }
    return j.dump();
}

const char* completion_outcome_to_string(CompletionOutcome outcome) {
    switch (outcome) {
        case CompletionOutcome::PR_DETECTED:         return "pr_detected";
        case CompletionOutcome::STREAM_ENDED:        return "stream_ended";
        case CompletionOutcome::PR_LOOKUP_EXHAUSTED: return "pr_lookup_exhausted";
        case CompletionOutcome::CANCELLED:           return "cancelled";
    }
    return "unknown";
}

CompletionMonitor::CompletionMonitor(agent::AgentApi& api, PullRequestService& pull_requests,
                                     CompletionMonitorOptions options)
    : api_(api)
    , pull_requests_(pull_requests)
    , options_(options)
    , pr_url_(R"(https://github\.com/[^/\s]+/[^/\s]+/pull/(\d+))", std::regex::icase) {}

std::optional<std::string> CompletionMonitor::pr_creation_output(const agent::AgentEvent& ev) const {
    if (ev.type == agent::event_types::TOOL_COMPLETE) {
        auto tool = ev.tool_name();
        auto content = ev.content();
        if (!tool || !content || content->empty()) {
            return std::nullopt;
        }
        if (lowercase(*tool) == "bash" && contains_ci(*content, PR_CREATE_COMMAND)) {
            return content;
        }
        return std::nullopt;
    }

    if (ev.type == agent::event_types::MESSAGE_PART_UPDATED) {
        if (!ev.properties.contains("part") || !ev.properties["part"].is_object()) {
            return std::nullopt;
        }
        const json& part = ev.properties["part"];
        if (part.value("type", "") != "tool" || lowercase(part.value("tool", "")) != "bash") {
            return std::nullopt;
        }
        if (!part.contains("state") || !part["state"].is_object()) {
            return std::nullopt;
        }
        const json& state = part["state"];
        if (state.value("status", "") != "completed") {
            return std::nullopt;
        }

        std::string input = state.contains("input") ? json_text(state["input"]) : "";
        std::string output = state.contains("output") ? json_text(state["output"]) : "";
        if (contains_ci(input, PR_CREATE_COMMAND) || contains_ci(output, PR_CREATE_COMMAND)) {
            return output.empty() ? input : output;
        }
    }
    return std::nullopt;
}

std::optional<PrUrl> CompletionMonitor::parse_pr_url(const std::string& text) const {
    std::smatch match;
    if (!std::regex_search(text, match, pr_url_)) {
        return std::nullopt;
    }
    try {
        return PrUrl{match[0].str(), std::stoi(match[1].str())};
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

CompletionResult CompletionMonitor::monitor_for_completion(const std::string& base_url,
                                                           const std::string& project_id,
                                                           const std::string& branch_name,
                                                           core::CancellationToken token) {
    CompletionResult cancelled;
    cancelled.outcome = CompletionOutcome::CANCELLED;
    cancelled.branch_name = branch_name;
    cancelled.reason = "Monitoring cancelled";

    spdlog::info("Monitoring {} for PR creation on branch {}", base_url, branch_name);
    auto events = api_.subscribe_events(base_url, token);

    while (auto ev = events->next()) {
        if (token.is_cancelled()) {
            return cancelled;
        }

        auto output = pr_creation_output(*ev);
        if (!output) {
            continue;
        }

        spdlog::info("Detected PR creation for branch {}", branch_name);
        if (auto pr = parse_pr_url(*output)) {
            spdlog::info("PR URL found: {} (PR #{})", pr->url, pr->number);
            CompletionResult result;
            result.success = true;
            result.outcome = CompletionOutcome::PR_DETECTED;
            result.pr_number = pr->number;
            result.pr_url = pr->url;
            result.branch_name = branch_name;
            return result;
        }

        // gh sometimes prints the URL elsewhere; ask the PR listing instead
        return find_pr_by_branch(project_id, branch_name, token);
    }

    if (token.is_cancelled()) {
        return cancelled;
    }

    CompletionResult ended;
    ended.outcome = CompletionOutcome::STREAM_ENDED;
    ended.branch_name = branch_name;
    ended.reason = "stream ended: agent server stopped without creating a PR";
    return ended;
}

CompletionResult CompletionMonitor::find_pr_by_branch(const std::string& project_id,
                                                      const std::string& branch_name,
                                                      const core::CancellationToken& token) {
    for (int attempt = 0; attempt < options_.pr_retry_count; ++attempt) {
        if (attempt > 0) {
            spdlog::debug("Retrying PR detection for {} (attempt {}/{})",
                          branch_name, attempt + 1, options_.pr_retry_count);
            if (!token.sleep_for(std::chrono::milliseconds(options_.pr_retry_delay_ms))) {
                CompletionResult cancelled;
                cancelled.outcome = CompletionOutcome::CANCELLED;
                cancelled.branch_name = branch_name;
                cancelled.reason = "Monitoring cancelled";
                return cancelled;
            }
        }

        std::optional<PullRequestInfo> pr;
        try {
            pr = pull_requests_.find_by_branch(project_id, branch_name);
        } catch (const std::exception& e) {
            spdlog::warn("PR lookup for {} failed: {}", branch_name, e.what());
        }

        if (pr) {
            spdlog::info("Found PR #{} for branch {}", pr->number, branch_name);
            CompletionResult result;
            result.success = true;
            result.outcome = CompletionOutcome::PR_DETECTED;
            result.pr_number = pr->number;
            result.pr_url = pr->html_url;
            result.branch_name = branch_name;
            return result;
        }
    }

    CompletionResult exhausted;
    exhausted.outcome = CompletionOutcome::PR_LOOKUP_EXHAUSTED;
    exhausted.branch_name = branch_name;
    exhausted.reason = "PR not found after " + std::to_string(options_.pr_retry_count) + " retries";
    return exhausted;
}

} // namespace agentpool::workflow
