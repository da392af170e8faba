#include <catch2/catch_all.hpp>
#include "fakes.hpp"
#include "workflow/completion_monitor.hpp"
#include <chrono>
#include <future>
#include <thread>

using namespace agentpool;
using namespace agentpool::workflow;
using namespace std::chrono_literals;
using agentpool::testing::FakeAgentApi;
using agentpool::testing::FakePullRequestService;
using json = nlohmann::json;

static const char* BASE_URL = "http://127.0.0.1:4096";

static agent::AgentEvent tool_complete(const std::string& tool, const std::string& content) {
    agent::AgentEvent ev;
    ev.type = agent::event_types::TOOL_COMPLETE;
    ev.properties = json{{"toolName", tool}, {"content", content}};
    return ev;
}

static agent::AgentEvent bash_part(const std::string& status, const std::string& command,
                                   const std::string& output) {
    agent::AgentEvent ev;
    ev.type = agent::event_types::MESSAGE_PART_UPDATED;
    ev.properties = json{{"part", {
        {"type", "tool"},
        {"tool", "bash"},
        {"state", {{"status", status}, {"input", {{"command", command}}}, {"output", output}}}
    }}};
    return ev;
}

static CompletionMonitorOptions fast_retries(int count = 3) {
    CompletionMonitorOptions options;
    options.pr_retry_count = count;
    options.pr_retry_delay_ms = 10;
    return options;
}

TEST_CASE("PR url in tool output completes monitoring") {
    FakeAgentApi api;
    FakePullRequestService prs;
    CompletionMonitor monitor(api, prs, fast_retries());

    auto channel = api.events(BASE_URL);
    channel->push(tool_complete("bash", "ls -la"));
    channel->push(tool_complete("Bash",
        "$ gh pr create --base main --title x\nhttps://github.com/acme/widgets/pull/42\n"));

    core::CancellationSource cancel;
    auto result = monitor.monitor_for_completion(BASE_URL, "p1", "feature-x", cancel.token());

    REQUIRE(result.success);
    REQUIRE(result.outcome == CompletionOutcome::PR_DETECTED);
    REQUIRE(result.pr_number == std::optional<int>(42));
    REQUIRE(result.pr_url == std::optional<std::string>("https://github.com/acme/widgets/pull/42"));
    REQUIRE(result.branch_name == "feature-x");
    REQUIRE(prs.list_calls() == 0);
}

TEST_CASE("completed bash part is recognised") {
    FakeAgentApi api;
    FakePullRequestService prs;
    CompletionMonitor monitor(api, prs, fast_retries());

    auto channel = api.events(BASE_URL);
    channel->push(bash_part("running", "gh pr create --title x", ""));
    channel->push(bash_part("completed", "gh pr create --title x",
                            "https://github.com/acme/widgets/pull/7"));

    core::CancellationSource cancel;
    auto result = monitor.monitor_for_completion(BASE_URL, "p1", "feature-x", cancel.token());
    REQUIRE(result.success);
    REQUIRE(result.pr_number == std::optional<int>(7));
}

TEST_CASE("PR creation without url falls back to branch lookup") {
    FakeAgentApi api;
    FakePullRequestService prs;
    prs.open_prs = {{"Feature-X", 15, "https://github.com/acme/widgets/pull/15"}};
    prs.misses_before_visible = 1;
    CompletionMonitor monitor(api, prs, fast_retries(3));

    auto channel = api.events(BASE_URL);
    channel->push(tool_complete("bash", "gh pr create --title x\nWarning: 2 uncommitted changes"));

    core::CancellationSource cancel;
    auto result = monitor.monitor_for_completion(BASE_URL, "p1", "feature-x", cancel.token());

    REQUIRE(result.success);
    REQUIRE(result.pr_number == std::optional<int>(15));
    REQUIRE(prs.list_calls() == 2);
}

TEST_CASE("branch lookup gives up after the retry budget") {
    FakeAgentApi api;
    FakePullRequestService prs;
    CompletionMonitor monitor(api, prs, fast_retries(3));

    core::CancellationSource cancel;
    auto result = monitor.find_pr_by_branch("p1", "feature-x", cancel.token());

    REQUIRE_FALSE(result.success);
    REQUIRE(result.outcome == CompletionOutcome::PR_LOOKUP_EXHAUSTED);
    REQUIRE(result.reason == "PR not found after 3 retries");
    REQUIRE(prs.list_calls() == 3);
}

TEST_CASE("listing failures count as misses") {
    FakeAgentApi api;
    FakePullRequestService prs;
    prs.fail_listing = true;
    CompletionMonitor monitor(api, prs, fast_retries(2));

    core::CancellationSource cancel;
    auto result = monitor.find_pr_by_branch("p1", "feature-x", cancel.token());
    REQUIRE(result.outcome == CompletionOutcome::PR_LOOKUP_EXHAUSTED);
    REQUIRE(prs.list_calls() == 2);
}

TEST_CASE("stream end without PR reports stream ended") {
    FakeAgentApi api;
    FakePullRequestService prs;
    CompletionMonitor monitor(api, prs, fast_retries());

    auto channel = api.events(BASE_URL);
    channel->push(tool_complete("bash", "git push"));
    channel->close();

    core::CancellationSource cancel;
    auto result = monitor.monitor_for_completion(BASE_URL, "p1", "feature-x", cancel.token());
    REQUIRE_FALSE(result.success);
    REQUIRE(result.outcome == CompletionOutcome::STREAM_ENDED);
    REQUIRE(result.reason.find("stream ended") != std::string::npos);
}

TEST_CASE("cancellation stops a blocked monitor") {
    FakeAgentApi api;
    FakePullRequestService prs;
    CompletionMonitor monitor(api, prs, fast_retries());

    core::CancellationSource cancel;
    auto pending = std::async(std::launch::async, [&]() {
        return monitor.monitor_for_completion(BASE_URL, "p1", "feature-x", cancel.token());
    });

    std::this_thread::sleep_for(50ms);
    cancel.cancel();

    REQUIRE(pending.wait_for(5s) == std::future_status::ready);
    auto result = pending.get();
    REQUIRE_FALSE(result.success);
    REQUIRE(result.outcome == CompletionOutcome::CANCELLED);
}

TEST_CASE("cancellation during retry delay stops the lookup") {
    FakeAgentApi api;
    FakePullRequestService prs;
    CompletionMonitorOptions options;
    options.pr_retry_count = 5;
    options.pr_retry_delay_ms = 10000;
    CompletionMonitor monitor(api, prs, options);

    core::CancellationSource cancel;
    auto pending = std::async(std::launch::async, [&]() {
        return monitor.find_pr_by_branch("p1", "feature-x", cancel.token());
    });

    std::this_thread::sleep_for(50ms);
    cancel.cancel();

    REQUIRE(pending.wait_for(5s) == std::future_status::ready);
    REQUIRE(pending.get().outcome == CompletionOutcome::CANCELLED);
    REQUIRE(prs.list_calls() == 1);
}

TEST_CASE("PR creation detection rules") {
    FakeAgentApi api;
    FakePullRequestService prs;
    CompletionMonitor monitor(api, prs);

    REQUIRE(monitor.is_pr_creation_event(tool_complete("bash", "GH PR CREATE --fill")));
    REQUIRE_FALSE(monitor.is_pr_creation_event(tool_complete("edit", "gh pr create")));
    REQUIRE_FALSE(monitor.is_pr_creation_event(tool_complete("bash", "")));
    REQUIRE_FALSE(monitor.is_pr_creation_event(tool_complete("bash", "gh pr list")));
    REQUIRE_FALSE(monitor.is_pr_creation_event(bash_part("error", "gh pr create", "")));

    agent::AgentEvent other;
    other.type = agent::event_types::SESSION_IDLE;
    REQUIRE_FALSE(monitor.is_pr_creation_event(other));
}

TEST_CASE("PR url parsing") {
    FakeAgentApi api;
    FakePullRequestService prs;
    CompletionMonitor monitor(api, prs);

    auto pr = monitor.parse_pr_url("Created https://GitHub.com/acme/widgets/pull/123 ok");
    REQUIRE(pr.has_value());
    REQUIRE(pr->number == 123);
    REQUIRE_FALSE(monitor.parse_pr_url("https://github.com/acme/widgets/issues/5").has_value());
    REQUIRE_FALSE(monitor.parse_pr_url("https://gitlab.com/acme/widgets/pull/5").has_value());
}
