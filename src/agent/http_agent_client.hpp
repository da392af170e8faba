#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "agent/agent_api.hpp"
#include "agent/sse_parser.hpp"

namespace httplib {
class Client;
}

namespace agentpool::agent {

struct HttpClientTimeouts {
    int connect_seconds = 5;
    int request_seconds = 30;
    int prompt_seconds = 600;      // synchronous prompts wait for the model
    int event_idle_seconds = 300;  // silent /event reads reconnect after this
};

// AgentApi over cpp-httplib
class HttpAgentClient : public AgentApi {
public:
    explicit HttpAgentClient(HttpClientTimeouts timeouts = {});

    HealthResponse get_health(const std::string& base_url) override;
    std::optional<std::string> get_current_path(const std::string& base_url) override;

    std::vector<Session> list_sessions(const std::string& base_url) override;
    Session get_session(const std::string& base_url, const std::string& session_id) override;
    Session create_session(const std::string& base_url,
                           const std::optional<std::string>& title = std::nullopt) override;
    bool delete_session(const std::string& base_url, const std::string& session_id) override;
    bool abort_session(const std::string& base_url, const std::string& session_id) override;

    std::vector<Message> get_messages(const std::string& base_url,
                                      const std::string& session_id) override;
    Message send_prompt(const std::string& base_url, const std::string& session_id,
                        const PromptRequest& request) override;
    void send_prompt_async(const std::string& base_url, const std::string& session_id,
                           const PromptRequest& request) override;

    std::unique_ptr<EventSource> subscribe_events(const std::string& base_url,
                                                  core::CancellationToken token) override;

    // Accepts a bare JSON string or an object carrying one of
    // directory / worktree / path / cwd
    static std::optional<std::string> parse_path_response(const std::string& body);

private:
    HttpClientTimeouts timeouts_;

    std::string get(const std::string& base_url, const std::string& path, int timeout_seconds);
    std::string post(const std::string& base_url, const std::string& path,
                     const std::string& body, int timeout_seconds);
    std::string del(const std::string& base_url, const std::string& path);
};

// GET /event consumed on a reader thread; events are queued for next().
// The stream only ends when the agent closes it or the token is cancelled:
// a read that stays silent for event_idle_seconds is reopened.
class HttpEventStream : public EventSource {
public:
    HttpEventStream(const std::string& base_url, core::CancellationToken token,
                    const HttpClientTimeouts& timeouts);
    ~HttpEventStream() override;

    HttpEventStream(const HttpEventStream&) = delete;
    HttpEventStream& operator=(const HttpEventStream&) = delete;

    std::optional<AgentEvent> next() override;

private:
    std::unique_ptr<httplib::Client> client_;
    std::chrono::seconds idle_timeout_;
    core::CancellationToken token_;
    uint64_t cancel_registration_ = 0;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<AgentEvent> queue_;
    bool finished_ = false;
    std::atomic<bool> stopping_{false};

    std::thread reader_;

    void read_loop();
    void stop();
};

} // namespace agentpool::agent
