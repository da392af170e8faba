#include "agent/types.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace agentpool::agent {

static std::optional<std::string> optional_string(const json& j, const char* key) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

static int64_t timestamp_ms(const json& j) {
    if (j.is_number_integer() || j.is_number_unsigned()) {
        return j.get<int64_t>();
    }
    if (j.is_number_float()) {
        return static_cast<int64_t>(j.get<double>());
    }
    return 0;
}

PromptRequest PromptRequest::from_text(const std::string& text,
                                       const std::optional<std::string>& model) {
    PromptRequest request;
    PromptPart part;
    part.type = "text";
    part.text = text;
    request.parts.push_back(part);

    if (model) {
        auto slash = model->find('/');
        if (slash != std::string::npos && slash > 0 && slash + 1 < model->size() &&
            model->find('/', slash + 1) == std::string::npos) {
            request.model = PromptModel{model->substr(0, slash), model->substr(slash + 1)};
        }
    }
    return request;
}

void from_json(const json& j, HealthResponse& h) {
    h.healthy = j.value("healthy", false);
    h.version = j.value("version", "");
}

void from_json(const json& j, Session& s) {
    s.id = j.value("id", "");
    s.title = j.value("title", "");
    if (j.contains("time") && j["time"].is_object()) {
        const auto& t = j["time"];
        if (t.contains("created")) s.created_ms = timestamp_ms(t["created"]);
        if (t.contains("updated")) s.updated_ms = timestamp_ms(t["updated"]);
    }
    s.parent_id = optional_string(j, "parentID");
}

void to_json(json& j, const Session& s) {
    j = json{
        {"id", s.id},
        {"title", s.title},
        {"time", {{"created", s.created_ms}, {"updated", s.updated_ms}}}
    };
    if (s.parent_id) {
        j["parentID"] = *s.parent_id;
    }
}

void from_json(const json& j, MessagePart& p) {
    p.type = j.value("type", "");
    p.text = optional_string(j, "text");
    p.tool = optional_string(j, "tool");
    if (j.contains("state") && j["state"].is_object()) {
        p.tool_status = optional_string(j["state"], "status");
        p.tool_output = optional_string(j["state"], "output");
    }
}

void from_json(const json& j, Message& m) {
    const json& info = j.contains("info") && j["info"].is_object() ? j["info"] : j;
    m.id = info.value("id", "");
    m.session_id = info.value("sessionID", "");
    m.role = info.value("role", "");
    m.parts.clear();
    if (j.contains("parts") && j["parts"].is_array()) {
        for (const auto& part : j["parts"]) {
            m.parts.push_back(part.get<MessagePart>());
        }
    }
}

void to_json(json& j, const PromptRequest& r) {
    json parts = json::array();
    for (const auto& p : r.parts) {
        json part;
        part["type"] = p.type;
        if (p.text) part["text"] = *p.text;
        if (p.path) part["path"] = *p.path;
        parts.push_back(part);
    }
    j = json{{"parts", parts}};
    if (r.model) {
        j["model"] = {{"providerID", r.model->provider_id}, {"modelID", r.model->model_id}};
    }
    if (r.agent) j["agent"] = *r.agent;
    if (r.no_reply) j["noReply"] = *r.no_reply;
    if (r.system) j["system"] = *r.system;
}

void from_json(const json& j, AgentEvent& e) {
    if (!j.is_object()) {
        throw std::invalid_argument("event payload must be an object");
    }
    e.type = j.value("type", "");
    if (j.contains("properties") && j["properties"].is_object()) {
        e.properties = j["properties"];
    } else {
        e.properties = json::object();
    }
}

std::optional<std::string> AgentEvent::session_id() const {
    if (auto id = optional_string(properties, "sessionID")) {
        return id;
    }
    if (properties.contains("part") && properties["part"].is_object()) {
        return optional_string(properties["part"], "sessionID");
    }
    return std::nullopt;
}

std::optional<std::string> AgentEvent::tool_name() const {
    return optional_string(properties, "toolName");
}

std::optional<std::string> AgentEvent::content() const {
    return optional_string(properties, "content");
}

std::optional<std::string> AgentEvent::status_value() const {
    if (!properties.contains("status")) {
        return std::nullopt;
    }
    const auto& status = properties["status"];
    if (status.is_string()) {
        return status.get<std::string>();
    }
    if (status.is_object()) {
        return optional_string(status, "type");
    }
    return std::nullopt;
}

} // namespace agentpool::agent
