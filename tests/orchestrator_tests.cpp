#include <catch2/catch_all.hpp>
#include "core/errors.hpp"
#include "orchestrator_harness.hpp"
#include <fstream>

using namespace agentpool;
using namespace agentpool::workflow;
using agentpool::testing::Harness;
using agentpool::testing::pr_created;
using agentpool::testing::wait_until;
using json = nlohmann::json;
namespace fs = std::filesystem;

TEST_CASE("planned start moves the item in progress and begins monitoring") {
    Harness h("orch_start", 7200);

    auto status = h.orchestrator.start_for_planned_item("p1", "item-1");
    REQUIRE(status.server->status() == runtime::ServerStatus::RUNNING);
    REQUIRE(status.active_session.has_value());
    REQUIRE(status.server->active_session_id() == std::optional<std::string>(status.active_session->id));

    auto item = *h.store.find_item("p1", "item-1");
    REQUIRE(item.status == WorkItemStatus::IN_PROGRESS);
    REQUIRE(item.active_agent == std::optional<std::string>("item-1"));
    REQUIRE(item.agent_started_at.has_value());
    REQUIRE(item.worktree_path.has_value());
    REQUIRE(fs::exists(fs::path(*item.worktree_path) / "opencode.json"));

    auto prompts = h.api.prompts();
    REQUIRE(prompts.size() == 1);
    REQUIRE(prompts[0].first == status.active_session->id);
    REQUIRE(prompts[0].second.model.has_value());
    REQUIRE(prompts[0].second.model->provider_id == "anthropic");
    REQUIRE(prompts[0].second.parts[0].text->find("gh pr create --base main") != std::string::npos);

    REQUIRE(h.orchestrator.is_monitoring("item-1"));
    REQUIRE(h.tracker.get_state("item-1").state == StartupState::STARTED);
    REQUIRE(wait_until([&h]() { return h.api.subscriptions() == 1; }));
    REQUIRE(h.orchestrator.get_running_agents().size() == 1);
}

TEST_CASE("detected PR completes the item and stops the agent") {
    Harness h("orch_pr", 7210);
    auto status = h.orchestrator.start_for_planned_item("p1", "item-1");

    h.emit(status.server, pr_created("https://github.com/acme/widgets/pull/42"));

    REQUIRE(wait_until([&h]() { return h.status_of("item-1") == WorkItemStatus::COMPLETE; }));
    REQUIRE(wait_until([&h]() { return !h.orchestrator.is_monitoring("item-1"); }));
    REQUIRE(wait_until([&h]() { return h.servers.get_server_for_entity("item-1") == nullptr; }));

    auto item = *h.store.find_item("p1", "item-1");
    REQUIRE(item.pr_number == std::optional<int>(42));
    REQUIRE_FALSE(item.active_agent.has_value());
    REQUIRE(h.store.find_item("p1", "item-2")->parents.empty());
    REQUIRE(h.prs.sync_calls() == 1);
    REQUIRE(h.servers.ports().outstanding() == 0);
}

TEST_CASE("stream end without PR leaves the item awaiting a PR") {
    Harness h("orch_stream_end", 7220);
    auto status = h.orchestrator.start_for_planned_item("p1", "item-1");

    h.end_stream(status.server);

    REQUIRE(wait_until([&h]() { return h.status_of("item-1") == WorkItemStatus::AWAITING_PR; }));
    REQUIRE(wait_until([&h]() { return h.servers.get_server_for_entity("item-1") == nullptr; }));
    REQUIRE_FALSE(h.store.find_item("p1", "item-1")->active_agent.has_value());
}

TEST_CASE("PR found by branch after a bare PR command") {
    Harness h("orch_pr_lookup", 7230);
    h.prs.open_prs = {{"item-1", 51, "https://github.com/acme/widgets/pull/51"}};
    h.prs.misses_before_visible = 1;
    auto status = h.orchestrator.start_for_planned_item("p1", "item-1");

    h.emit(status.server, pr_created("Creating pull request for item-1 into main"));

    REQUIRE(wait_until([&h]() { return h.status_of("item-1") == WorkItemStatus::COMPLETE; }));
    REQUIRE(h.store.find_item("p1", "item-1")->pr_number == std::optional<int>(51));
}

TEST_CASE("failed start rolls the item back to pending") {
    Harness h("orch_rollback", 7240);
    h.api.fail_prompt = true;

    REQUIRE_THROWS_AS(h.orchestrator.start_for_planned_item("p1", "item-1"), AgentApiError);

    auto item = *h.store.find_item("p1", "item-1");
    REQUIRE(item.status == WorkItemStatus::PENDING);
    REQUIRE_FALSE(item.active_agent.has_value());
    REQUIRE(h.servers.get_server_for_entity("item-1") == nullptr);
    REQUIRE(h.servers.ports().outstanding() == 0);
    REQUIRE_FALSE(h.orchestrator.is_monitoring("item-1"));
    REQUIRE(h.tracker.has_failed("item-1"));
}

TEST_CASE("worktree failure rolls back without starting a server") {
    Harness h("orch_worktree", 7250);
    h.worktrees.fail = true;

    REQUIRE_THROWS_AS(h.orchestrator.start_for_planned_item("p1", "item-1"), InvalidOperation);
    REQUIRE(h.status_of("item-1") == WorkItemStatus::PENDING);
    REQUIRE(h.servers.get_running_servers().empty());
}

TEST_CASE("planned start requires a pending item") {
    Harness h("orch_not_pending", 7260);
    REQUIRE(h.store.transition_to_in_progress("p1", "item-1").success);

    REQUIRE_THROWS_AS(h.orchestrator.start_for_planned_item("p1", "item-1"), InvalidOperation);
    REQUIRE_THROWS_AS(h.orchestrator.start_for_planned_item("p1", "missing"), InvalidOperation);
    REQUIRE_THROWS_AS(h.orchestrator.start_for_planned_item("p9", "item-1"), InvalidOperation);
    REQUIRE(h.status_of("item-1") == WorkItemStatus::IN_PROGRESS);
    REQUIRE(h.tracker.get_state("item-1").state == StartupState::NOT_STARTED);
}

TEST_CASE("manual stop promotes when the branch already has a PR") {
    Harness h("orch_stop_pr", 7270);
    h.orchestrator.start_for_planned_item("p1", "item-1");
    h.prs.open_prs = {{"item-1", 77, "https://github.com/acme/widgets/pull/77"}};

    h.orchestrator.stop("item-1");

    REQUIRE_FALSE(h.orchestrator.is_monitoring("item-1"));
    REQUIRE(h.servers.get_server_for_entity("item-1") == nullptr);
    REQUIRE(h.status_of("item-1") == WorkItemStatus::COMPLETE);
    REQUIRE(h.store.find_item("p1", "item-1")->pr_number == std::optional<int>(77));
}

TEST_CASE("manual stop without a PR leaves the item awaiting one") {
    Harness h("orch_stop", 7280);
    h.orchestrator.start_for_planned_item("p1", "item-1");

    h.orchestrator.stop("item-1");
    REQUIRE(h.status_of("item-1") == WorkItemStatus::AWAITING_PR);

    // Stopping again changes nothing
    h.orchestrator.stop("item-1");
    REQUIRE(h.status_of("item-1") == WorkItemStatus::AWAITING_PR);
}

TEST_CASE("existing item start attaches the most recent session") {
    Harness h("orch_existing", 7290);
    agent::Session older;
    older.id = "ses_old";
    older.created_ms = 100;
    agent::Session newer;
    newer.id = "ses_new";
    newer.created_ms = 50;
    newer.updated_ms = 500;
    h.api.set_sessions({older, newer});

    auto status = h.orchestrator.start_for_existing_item("item-2", std::string("openai/gpt"));
    REQUIRE(status.active_session->id == "ses_new");
    REQUIRE(status.sessions.size() == 2);
    REQUIRE(h.status_of("item-2") == WorkItemStatus::PENDING);
    REQUIRE_FALSE(h.orchestrator.is_monitoring("item-2"));
    REQUIRE(h.api.prompts().empty());

    std::ifstream in(fs::path(*h.store.find_item("p1", "item-2")->worktree_path) / "opencode.json");
    REQUIRE(json::parse(in)["model"].get<std::string>() == "openai/gpt");

    auto again = h.orchestrator.start_for_existing_item("item-2");
    REQUIRE(again.server == status.server);
    REQUIRE(h.worktrees.created == 1);

    REQUIRE_THROWS_AS(h.orchestrator.start_for_existing_item("missing"), InvalidOperation);
}

TEST_CASE("prompts need a running agent with a session") {
    Harness h("orch_prompt", 7300);
    REQUIRE_THROWS_AS(h.orchestrator.send_prompt("item-1", "hello"), InvalidOperation);
    REQUIRE_FALSE(h.orchestrator.get_status("item-1").has_value());

    auto status = h.orchestrator.start_for_existing_item("item-1");
    auto reply = h.orchestrator.send_prompt("item-1", "hello");
    REQUIRE(reply.session_id == status.active_session->id);

    auto current = h.orchestrator.get_status("item-1");
    REQUIRE(current.has_value());
    REQUIRE(current->active_session->id == status.active_session->id);
}

TEST_CASE("shutdown cancels monitors without touching items") {
    Harness h("orch_shutdown", 7310);
    h.orchestrator.start_for_planned_item("p1", "item-1");
    REQUIRE(wait_until([&h]() { return h.api.subscriptions() == 1; }));

    h.orchestrator.shutdown();

    REQUIRE_FALSE(h.orchestrator.is_monitoring("item-1"));
    REQUIRE(h.servers.get_running_servers().empty());
    REQUIRE(h.status_of("item-1") == WorkItemStatus::IN_PROGRESS);

    // Idempotent
    h.orchestrator.shutdown();
}
