#include "agent/http_agent_client.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <httplib.h>

using json = nlohmann::json;

namespace agentpool::agent {

namespace {

std::unique_ptr<httplib::Client> make_client(const std::string& base_url,
                                             int connect_seconds, int read_seconds) {
    auto cli = std::make_unique<httplib::Client>(base_url);
    cli->set_connection_timeout(connect_seconds);
    cli->set_read_timeout(read_seconds);
    cli->set_write_timeout(connect_seconds);
    return cli;
}

void check_result(const httplib::Result& result, const std::string& what) {
    if (!result) {
        throw AgentApiError(what + " failed: " + httplib::to_string(result.error()));
    }
    if (result->status < 200 || result->status >= 300) {
        std::string message = what + " returned HTTP " + std::to_string(result->status);
        if (!result->body.empty()) {
            message += ": " + result->body.substr(0, 512);
        }
        throw AgentApiError(message, result->status);
    }
}

json parse_body(const std::string& body, const std::string& what) {
    try {
        return json::parse(body);
    } catch (const json::exception& e) {
        throw AgentApiError(what + " returned invalid JSON: " + e.what());
    }
}

template <typename T>
T decode(const std::string& body, const std::string& what) {
    try {
        return parse_body(body, what).get<T>();
    } catch (const json::exception& e) {
        throw AgentApiError(what + " returned unexpected JSON: " + e.what());
    }
}

} // namespace

// ============================================================================
// HttpAgentClient
// ============================================================================

HttpAgentClient::HttpAgentClient(HttpClientTimeouts timeouts)
    : timeouts_(timeouts) {}

std::string HttpAgentClient::get(const std::string& base_url, const std::string& path,
                                 int timeout_seconds) {
    auto cli = make_client(base_url, timeouts_.connect_seconds, timeout_seconds);
    auto result = cli->Get(path);
    check_result(result, "GET " + path);
    return result->body;
}

std::string HttpAgentClient::post(const std::string& base_url, const std::string& path,
                                  const std::string& body, int timeout_seconds) {
    auto cli = make_client(base_url, timeouts_.connect_seconds, timeout_seconds);
    auto result = cli->Post(path, body, "application/json");
    check_result(result, "POST " + path);
    return result->body;
}

std::string HttpAgentClient::del(const std::string& base_url, const std::string& path) {
    auto cli = make_client(base_url, timeouts_.connect_seconds, timeouts_.request_seconds);
    auto result = cli->Delete(path);
    check_result(result, "DELETE " + path);
    return result->body;
}

HealthResponse HttpAgentClient::get_health(const std::string& base_url) {
    auto body = get(base_url, "/global/health", timeouts_.connect_seconds);
    return decode<HealthResponse>(body, "GET /global/health");
}

std::optional<std::string> HttpAgentClient::get_current_path(const std::string& base_url) {
    return parse_path_response(get(base_url, "/path", timeouts_.request_seconds));
}

std::optional<std::string> HttpAgentClient::parse_path_response(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception&) {
        return std::nullopt;
    }

    if (j.is_string()) {
        return j.get<std::string>();
    }
    if (!j.is_object()) {
        return std::nullopt;
    }
    for (const char* key : {"directory", "worktree", "path", "cwd"}) {
        if (j.contains(key) && j[key].is_string()) {
            return j[key].get<std::string>();
        }
    }
    return std::nullopt;
}

std::vector<Session> HttpAgentClient::list_sessions(const std::string& base_url) {
    auto body = get(base_url, "/session", timeouts_.request_seconds);
    return decode<std::vector<Session>>(body, "GET /session");
}

Session HttpAgentClient::get_session(const std::string& base_url, const std::string& session_id) {
    auto path = "/session/" + session_id;
    return decode<Session>(get(base_url, path, timeouts_.request_seconds), "GET " + path);
}

Session HttpAgentClient::create_session(const std::string& base_url,
                                        const std::optional<std::string>& title) {
    json request = json::object();
    if (title) {
        request["title"] = *title;
    }
    auto body = post(base_url, "/session", request.dump(), timeouts_.request_seconds);
    return decode<Session>(body, "POST /session");
}

bool HttpAgentClient::delete_session(const std::string& base_url, const std::string& session_id) {
    auto body = del(base_url, "/session/" + session_id);
    try {
        auto j = json::parse(body);
        return j.is_boolean() ? j.get<bool>() : true;
    } catch (const json::exception&) {
        return true;
    }
}

bool HttpAgentClient::abort_session(const std::string& base_url, const std::string& session_id) {
    auto body = post(base_url, "/session/" + session_id + "/abort", "{}", timeouts_.request_seconds);
    try {
        auto j = json::parse(body);
        return j.is_boolean() ? j.get<bool>() : true;
    } catch (const json::exception&) {
        return true;
    }
}

std::vector<Message> HttpAgentClient::get_messages(const std::string& base_url,
                                                   const std::string& session_id) {
    auto path = "/session/" + session_id + "/message";
    return decode<std::vector<Message>>(get(base_url, path, timeouts_.request_seconds), "GET " + path);
}

Message HttpAgentClient::send_prompt(const std::string& base_url, const std::string& session_id,
                                     const PromptRequest& request) {
    auto path = "/session/" + session_id + "/message";
    json j = request;
    spdlog::debug("Sending prompt to {} session {}", base_url, session_id);
    return decode<Message>(post(base_url, path, j.dump(), timeouts_.prompt_seconds), "POST " + path);
}

void HttpAgentClient::send_prompt_async(const std::string& base_url, const std::string& session_id,
                                        const PromptRequest& request) {
    json j = request;
    spdlog::debug("Sending async prompt to {} session {}", base_url, session_id);
    post(base_url, "/session/" + session_id + "/prompt_async", j.dump(), timeouts_.request_seconds);
}

std::unique_ptr<EventSource> HttpAgentClient::subscribe_events(const std::string& base_url,
                                                               core::CancellationToken token) {
    return std::make_unique<HttpEventStream>(base_url, std::move(token), timeouts_);
}

// ============================================================================
// HttpEventStream
// ============================================================================

HttpEventStream::HttpEventStream(const std::string& base_url, core::CancellationToken token,
                                 const HttpClientTimeouts& timeouts)
    : client_(make_client(base_url, timeouts.connect_seconds, timeouts.event_idle_seconds)),
      idle_timeout_(timeouts.event_idle_seconds),
      token_(std::move(token)) {
    reader_ = std::thread(&HttpEventStream::read_loop, this);
    cancel_registration_ = token_.on_cancel([this]() { stop(); });
}

HttpEventStream::~HttpEventStream() {
    token_.remove_callback(cancel_registration_);
    stop();
    if (reader_.joinable()) {
        reader_.join();
    }
}

void HttpEventStream::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    client_->stop();
    cv_.notify_all();
}

void HttpEventStream::read_loop() {
    using clock = std::chrono::steady_clock;

    SseParser::EventHandler enqueue = [this](AgentEvent event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(std::move(event));
        }
        cv_.notify_one();
    };
    SseParser parser(enqueue);

    httplib::Headers headers = {{"Accept", "text/event-stream"}};
    while (!stopping_) {
        auto last_data = clock::now();
        auto result = client_->Get("/event", headers,
            [this, &parser, &last_data](const char* data, size_t length) {
                if (stopping_) {
                    return false;
                }
                last_data = clock::now();
                parser.feed(data, length);
                return true;
            });

        if (stopping_) {
            break;
        }
        if (!result && clock::now() - last_data >= idle_timeout_ - std::chrono::milliseconds(100)) {
            // Read timeout on a quiet agent; a partial event cannot span connections
            spdlog::debug("Event stream idle for {}s, reconnecting", idle_timeout_.count());
            parser = SseParser(enqueue);
            continue;
        }

        parser.finish();
        if (!result) {
            spdlog::warn("Event stream ended: {}", httplib::to_string(result.error()));
        } else if (result->status != 200) {
            spdlog::warn("Event stream returned HTTP {}", result->status);
        } else {
            spdlog::debug("Event stream closed by agent");
        }
        break;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    cv_.notify_all();
}

std::optional<AgentEvent> HttpEventStream::next() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return !queue_.empty() || finished_ || stopping_; });

    if (stopping_ || queue_.empty()) {
        return std::nullopt;
    }
    AgentEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

} // namespace agentpool::agent
