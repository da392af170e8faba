#include <catch2/catch_all.hpp>
#include "core/errors.hpp"
#include "fakes.hpp"
#include "runtime/executable_resolver.hpp"
#include "workflow/agent_config_writer.hpp"
#include "workflow/prompt_builder.hpp"
#include <fstream>

using namespace agentpool;
using namespace agentpool::workflow;
using agentpool::testing::mkd;
using agentpool::testing::write_script;
using json = nlohmann::json;

TEST_CASE("initial prompt names the item and the PR command") {
    WorkItem item;
    item.id = "item-7";
    item.title = "Add retry";
    item.description = "Retry failed uploads";
    item.parents = {"item-3"};

    auto prompt = build_initial_prompt(item, "main");
    REQUIRE(prompt.find("**Title:** Add retry") != std::string::npos);
    REQUIRE(prompt.find("**Branch:** item-7") != std::string::npos);
    REQUIRE(prompt.find("Retry failed uploads") != std::string::npos);
    REQUIRE(prompt.find("**Instructions:**") == std::string::npos);
    REQUIRE(prompt.find("gh pr create --base item-3 --title \"Add retry\" --body \"Implements item-7\"") !=
            std::string::npos);
}

TEST_CASE("initial prompt falls back to the default base branch") {
    WorkItem item;
    item.id = "item-8";
    item.title = "Root change";
    item.branch_name = "feature/root";

    auto prompt = build_initial_prompt(item, "develop");
    REQUIRE(prompt.find("**Branch:** feature/root") != std::string::npos);
    REQUIRE(prompt.find("gh pr create --base develop") != std::string::npos);
}

TEST_CASE("agent config uses the given model or the default") {
    AgentConfigWriter writer("anthropic/default-model");

    auto fallback = writer.create_default_config();
    REQUIRE(fallback["model"].get<std::string>() == "anthropic/default-model");
    REQUIRE(fallback["permission"]["bash"].get<std::string>() == "allow");
    REQUIRE(fallback["autoupdate"].get<bool>() == false);

    auto chosen = writer.create_default_config(std::string("openai/gpt"));
    REQUIRE(chosen["model"].get<std::string>() == "openai/gpt");
}

TEST_CASE("agent config is written into the worktree") {
    auto dir = mkd("config_writer");
    AgentConfigWriter writer("anthropic/default-model");

    auto path = writer.write(dir.string(), writer.create_default_config());
    REQUIRE(path == (dir / "opencode.json").string());

    std::ifstream in(path);
    auto written = json::parse(in);
    REQUIRE(written["$schema"].get<std::string>() == AgentConfigWriter::SCHEMA_URL);

    REQUIRE_THROWS_AS(writer.write((dir / "missing").string(), json::object()), ConfigWriteFailure);
}

TEST_CASE("executable resolver honours explicit paths and home install dirs") {
    auto home = mkd("resolver_home");
    auto bin = home / ".local" / "bin";
    std::filesystem::create_directories(bin);
    auto agent = write_script(bin, "agentpool-test-agent", "exit 0");

    runtime::ExecutableResolver resolver(home.string());
    REQUIRE(resolver.resolve(agent) == std::optional<std::string>(agent));
    REQUIRE(resolver.resolve("agentpool-test-agent") == std::optional<std::string>(agent));
    REQUIRE_FALSE(resolver.resolve("agentpool-no-such-binary").has_value());
    REQUIRE_FALSE(resolver.resolve((home / "nope").string()).has_value());
}

TEST_CASE("work item status names round-trip") {
    REQUIRE(std::string(work_item_status_to_string(WorkItemStatus::AWAITING_PR)) == "awaiting_pr");
    REQUIRE(work_item_status_from_string("in_progress") == std::optional<WorkItemStatus>(WorkItemStatus::IN_PROGRESS));
    REQUIRE_FALSE(work_item_status_from_string("bogus").has_value());
}
