#pragma once
#include <future>
#include <list>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "proxy/url_service.hpp"
#include "runtime/agent_server.hpp"
#include "workflow/orchestrator.hpp"
#include "workflow/startup_tracker.hpp"

namespace httplib {
class Server;
}

namespace agentpool::api {

// Snapshot of one server for listings and notifications
workflow::ServerSummary summarize(const runtime::AgentServer& server, const proxy::UrlService& urls);

// JSON control surface over the orchestrator:
//   GET  /health
//   GET  /api/servers
//   GET  /api/startup
//   GET  /api/items/{id}/status
//   POST /api/items/{id}/start            {"model"?}
//   POST /api/items/{id}/stop
//   POST /api/items/{id}/prompt           {"text"}
//   POST /api/projects/{pid}/changes/{cid}/start   {"model"?}  (202, runs in background)
class ControlApi {
public:
    ControlApi(workflow::Orchestrator& orchestrator, workflow::StartupTracker& tracker,
               const proxy::UrlService& urls);
    ~ControlApi();

    ControlApi(const ControlApi&) = delete;
    ControlApi& operator=(const ControlApi&) = delete;

    void mount(httplib::Server& server);

    nlohmann::json list_servers() const;
    nlohmann::json status_json(const workflow::AgentStatus& status) const;

    // Waits for background starts still in flight
    void drain();

private:
    workflow::Orchestrator& orchestrator_;
    workflow::StartupTracker& tracker_;
    const proxy::UrlService& urls_;

    std::mutex background_mutex_;
    std::list<std::future<void>> background_;

    void start_in_background(std::string project_id, std::string change_id,
                             std::optional<std::string> model);
};

} // namespace agentpool::api
