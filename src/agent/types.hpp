#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentpool::agent {

// GET /global/health
struct HealthResponse {
    bool healthy = false;
    std::string version;
};

struct Session {
    std::string id;
    std::string title;
    int64_t created_ms = 0;
    int64_t updated_ms = 0;
    std::optional<std::string> parent_id;

    // Most recent activity, falling back to creation time
    int64_t last_activity_ms() const { return updated_ms > 0 ? updated_ms : created_ms; }
};

struct MessagePart {
    std::string type;                   // "text", "tool", ...
    std::optional<std::string> text;
    std::optional<std::string> tool;
    std::optional<std::string> tool_status;
    std::optional<std::string> tool_output;
};

struct Message {
    std::string id;
    std::string session_id;
    std::string role;
    std::vector<MessagePart> parts;
};

struct PromptPart {
    std::string type = "text";
    std::optional<std::string> text;
    std::optional<std::string> path;
};

struct PromptModel {
    std::string provider_id;
    std::string model_id;
};

struct PromptRequest {
    std::vector<PromptPart> parts;
    std::optional<PromptModel> model;
    std::optional<std::string> agent;
    std::optional<bool> no_reply;
    std::optional<std::string> system;

    // "provider/model" selects a model; anything else is ignored
    static PromptRequest from_text(const std::string& text,
                                   const std::optional<std::string>& model = std::nullopt);
};

// Known event types on GET /event
namespace event_types {
constexpr const char* SERVER_CONNECTED = "server.connected";
constexpr const char* SESSION_CREATED = "session.created";
constexpr const char* SESSION_UPDATED = "session.updated";
constexpr const char* SESSION_DELETED = "session.deleted";
constexpr const char* SESSION_STATUS = "session.status";
constexpr const char* SESSION_IDLE = "session.idle";
constexpr const char* MESSAGE_CREATED = "message.created";
constexpr const char* MESSAGE_UPDATED = "message.updated";
constexpr const char* MESSAGE_PART_UPDATED = "message.part.updated";
constexpr const char* TOOL_START = "tool.start";
constexpr const char* TOOL_COMPLETE = "tool.complete";
} // namespace event_types

// One SSE frame from the agent
struct AgentEvent {
    std::string type;
    nlohmann::json properties = nlohmann::json::object();

    std::optional<std::string> session_id() const;
    std::optional<std::string> tool_name() const;
    std::optional<std::string> content() const;

    // "status" may be a plain string or {"type": "..."}
    std::optional<std::string> status_value() const;
};

void from_json(const nlohmann::json& j, HealthResponse& h);
void from_json(const nlohmann::json& j, Session& s);
void to_json(nlohmann::json& j, const Session& s);
void from_json(const nlohmann::json& j, MessagePart& p);
void from_json(const nlohmann::json& j, Message& m);
void to_json(nlohmann::json& j, const PromptRequest& r);
void from_json(const nlohmann::json& j, AgentEvent& e);

} // namespace agentpool::agent
