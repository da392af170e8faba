#include "api/control_api.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <httplib.h>
#include <chrono>
#include <stdexcept>

using json = nlohmann::json;

namespace agentpool::api {

namespace {

struct BadRequest : std::runtime_error {
    using std::runtime_error::runtime_error;
};

void send_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void send_error(httplib::Response& res, int status, const std::string& message) {
    send_json(res, status, json{{"error", message}});
}

json parse_request_body(const httplib::Request& req) {
    if (req.body.empty()) {
        return json::object();
    }
    json body = json::parse(req.body);
    if (!body.is_object()) {
        throw BadRequest("request body must be a JSON object");
    }
    return body;
}

std::optional<std::string> optional_model(const json& body) {
    if (body.contains("model") && body["model"].is_string() &&
        !body["model"].get<std::string>().empty()) {
        return body["model"].get<std::string>();
    }
    return std::nullopt;
}

// Runs handler, mapping failures onto status codes
template <typename Handler>
void guarded(httplib::Response& res, Handler handler) {
    try {
        handler();
    } catch (const json::exception& e) {
        send_error(res, 400, std::string("Invalid request: ") + e.what());
    } catch (const BadRequest& e) {
        send_error(res, 400, e.what());
    } catch (const NotFound& e) {
        send_error(res, 404, e.what());
    } catch (const CapacityExceeded& e) {
        send_error(res, 409, e.what());
    } catch (const InvalidOperation& e) {
        send_error(res, 409, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Control API request failed: {}", e.what());
        send_error(res, 500, e.what());
    }
}

json session_json(const agent::Session& session) {
    return session;
}

} // namespace

workflow::ServerSummary summarize(const runtime::AgentServer& server, const proxy::UrlService& urls) {
    workflow::ServerSummary summary;
    summary.entity_id = server.entity_id();
    summary.port = server.port();
    summary.base_url = server.base_url();
    summary.external_url = urls.external_base_url(server.port());
    summary.worktree_path = server.worktree_path();
    summary.status = runtime::server_status_to_string(server.status());
    summary.active_session_id = server.active_session_id();
    if (summary.active_session_id) {
        summary.web_view_url = urls.web_view_url(server.port(), server.worktree_path(),
                                                 *summary.active_session_id);
    }
    summary.started_at_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        server.started_at().time_since_epoch()).count();
    return summary;
}

ControlApi::ControlApi(workflow::Orchestrator& orchestrator, workflow::StartupTracker& tracker,
                       const proxy::UrlService& urls)
    : orchestrator_(orchestrator), tracker_(tracker), urls_(urls) {}

ControlApi::~ControlApi() {
    drain();
}

void ControlApi::drain() {
    std::list<std::future<void>> pending;
    {
        std::lock_guard<std::mutex> lock(background_mutex_);
        pending.swap(background_);
    }
    for (auto& f : pending) {
        f.wait();
    }
}

json ControlApi::list_servers() const {
    json servers = json::array();
    for (const auto& server : orchestrator_.get_running_agents()) {
        servers.push_back(summarize(*server, urls_));
    }
    return servers;
}

json ControlApi::status_json(const workflow::AgentStatus& status) const {
    json sessions = json::array();
    for (const auto& session : status.sessions) {
        sessions.push_back(session_json(session));
    }

    json j = {
        {"entity_id", status.entity_id},
        {"server", summarize(*status.server, urls_)},
        {"sessions", sessions},
        {"active_session", status.active_session ? session_json(*status.active_session) : json(nullptr)}
    };
    return j;
}

void ControlApi::start_in_background(std::string project_id, std::string change_id,
                                     std::optional<std::string> model) {
    std::lock_guard<std::mutex> lock(background_mutex_);
    background_.remove_if([](std::future<void>& f) {
        return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    });

    background_.push_back(std::async(std::launch::async,
        [this, project_id, change_id, model]() {
            try {
                orchestrator_.start_for_planned_item(project_id, change_id, model);
            } catch (const std::exception& e) {
                // Already rolled back and reported through the startup tracker
                spdlog::error("Background start of {} failed: {}", change_id, e.what());
            }
        }));
}

void ControlApi::mount(httplib::Server& server) {
    server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        send_json(res, 200, json{{"status", "ok"}});
    });

    server.Get("/api/servers", [this](const httplib::Request&, httplib::Response& res) {
        guarded(res, [&]() { send_json(res, 200, list_servers()); });
    });

    server.Get("/api/startup", [this](const httplib::Request&, httplib::Response& res) {
        guarded(res, [&]() {
            json states = json::array();
            for (const auto& info : tracker_.get_all_states()) {
                states.push_back(info);
            }
            send_json(res, 200, states);
        });
    });

    server.Get(R"(/api/items/([^/]+)/status)", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&]() {
            std::string item_id = req.matches[1];
            auto status = orchestrator_.get_status(item_id);
            if (!status) {
                send_error(res, 404, "No agent running for " + item_id);
                return;
            }
            json body = status_json(*status);
            body["monitoring"] = orchestrator_.is_monitoring(item_id);
            send_json(res, 200, body);
        });
    });

    server.Post(R"(/api/items/([^/]+)/start)", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&]() {
            std::string item_id = req.matches[1];
            auto body = parse_request_body(req);
            auto status = orchestrator_.start_for_existing_item(item_id, optional_model(body));
            send_json(res, 200, status_json(status));
        });
    });

    server.Post(R"(/api/items/([^/]+)/stop)", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&]() {
            std::string item_id = req.matches[1];
            orchestrator_.stop(item_id);
            send_json(res, 200, json{{"stopped", item_id}});
        });
    });

    server.Post(R"(/api/items/([^/]+)/prompt)", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&]() {
            std::string item_id = req.matches[1];
            auto body = parse_request_body(req);
            if (!body.contains("text") || !body["text"].is_string() ||
                body["text"].get<std::string>().empty()) {
                send_error(res, 400, "text is required");
                return;
            }
            auto reply = orchestrator_.send_prompt(item_id, body["text"].get<std::string>());

            json parts = json::array();
            for (const auto& part : reply.parts) {
                json p = {{"type", part.type}};
                if (part.text) p["text"] = *part.text;
                if (part.tool) p["tool"] = *part.tool;
                parts.push_back(p);
            }
            send_json(res, 200, json{{"id", reply.id}, {"role", reply.role}, {"parts", parts}});
        });
    });

    server.Post(R"(/api/projects/([^/]+)/changes/([^/]+)/start)",
        [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, [&]() {
                std::string project_id = req.matches[1];
                std::string change_id = req.matches[2];
                auto body = parse_request_body(req);
                if (tracker_.is_starting(change_id)) {
                    send_error(res, 409, "Agent for " + change_id + " is already starting");
                    return;
                }
                start_in_background(project_id, change_id, optional_model(body));
                send_json(res, 202, json{{"entity_id", change_id}, {"state", "starting"}});
            });
        });

    spdlog::info("Control API mounted at /api");
}

} // namespace agentpool::api
