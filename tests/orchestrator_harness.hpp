#pragma once
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "fakes.hpp"
#include "runtime/server_manager.hpp"
#include "services/json_work_item_store.hpp"
#include "workflow/agent_config_writer.hpp"
#include "workflow/completion_monitor.hpp"
#include "workflow/orchestrator.hpp"
#include "workflow/startup_tracker.hpp"

namespace agentpool::testing {

using namespace agentpool::workflow;
using json = nlohmann::json;

inline runtime::ServerManagerOptions server_options(const std::string& executable, int base_port) {
    runtime::ServerManagerOptions options;
    options.executable = executable;
    options.base_port = base_port;
    options.max_concurrent_servers = 4;
    options.start_timeout_ms = 5000;
    options.stop_timeout_ms = 1000;
    return options;
}

inline CompletionMonitorOptions fast_retries() {
    CompletionMonitorOptions options;
    options.pr_retry_count = 2;
    options.pr_retry_delay_ms = 10;
    return options;
}

// Orchestrator wired to fakes, one project with a parent and a child item
struct Harness {
    Harness(const std::string& name, int base_port)
        : dir(mkd(name))
        , agent_path(write_script(dir, "agent.sh", "exec sleep 30"))
        , servers(server_options(agent_path, base_port), api)
        , monitor(api, prs, fast_retries())
        , writer("anthropic/default-model")
        , worktrees(dir / "worktrees")
        , orchestrator(OrchestratorDependencies{
              servers, api, monitor, tracker, writer, store, store, prs, worktrees}) {
        Project project;
        project.id = "p1";
        project.name = "widgets";
        project.local_path = (dir / "repo").string();
        store.add_project(project);

        WorkItem parent;
        parent.id = "item-1";
        parent.project_id = "p1";
        parent.title = "Add parser";
        store.add_item(parent);

        WorkItem child;
        child.id = "item-2";
        child.project_id = "p1";
        child.title = "Use parser";
        child.parents = {"item-1"};
        store.add_item(child);
    }

    WorkItemStatus status_of(const std::string& id) {
        return store.find_item("p1", id)->status;
    }

    void emit(const runtime::AgentServerPtr& server, agent::AgentEvent ev) {
        api.events(server->base_url())->push(std::move(ev));
    }

    void end_stream(const runtime::AgentServerPtr& server) {
        api.events(server->base_url())->close();
    }

    fs::path dir;
    std::string agent_path;
    FakeAgentApi api;
    runtime::ServerManager servers;
    FakePullRequestService prs;
    CompletionMonitor monitor;
    StartupTracker tracker;
    AgentConfigWriter writer;
    services::JsonWorkItemStore store;
    FakeWorktreeService worktrees;
    Orchestrator orchestrator;
};

inline agent::AgentEvent pr_created(const std::string& output) {
    agent::AgentEvent ev;
    ev.type = agent::event_types::TOOL_COMPLETE;
    ev.properties = json{{"toolName", "bash"}, {"content", "gh pr create --base main\n" + output}};
    return ev;
}

} // namespace agentpool::testing
