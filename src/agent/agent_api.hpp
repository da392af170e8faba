#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "agent/types.hpp"
#include "core/cancellation.hpp"

namespace agentpool::agent {

// Pull-based event stream. next() blocks until an event arrives and returns
// nullopt once the stream has ended, failed, or been cancelled.
class EventSource {
public:
    virtual ~EventSource() = default;
    virtual std::optional<AgentEvent> next() = 0;
};

// HTTP surface of one agent server, addressed by base URL.
// Every call throws AgentApiError on transport failure or a non-2xx status.
class AgentApi {
public:
    virtual ~AgentApi() = default;

    virtual HealthResponse get_health(const std::string& base_url) = 0;

    // Working directory the agent reports, if it reports one
    virtual std::optional<std::string> get_current_path(const std::string& base_url) = 0;

    virtual std::vector<Session> list_sessions(const std::string& base_url) = 0;
    virtual Session get_session(const std::string& base_url, const std::string& session_id) = 0;
    virtual Session create_session(const std::string& base_url,
                                   const std::optional<std::string>& title = std::nullopt) = 0;
    virtual bool delete_session(const std::string& base_url, const std::string& session_id) = 0;
    virtual bool abort_session(const std::string& base_url, const std::string& session_id) = 0;

    virtual std::vector<Message> get_messages(const std::string& base_url,
                                              const std::string& session_id) = 0;

    // Blocks until the agent replies
    virtual Message send_prompt(const std::string& base_url, const std::string& session_id,
                                const PromptRequest& request) = 0;

    // Returns once the agent has accepted the prompt
    virtual void send_prompt_async(const std::string& base_url, const std::string& session_id,
                                   const PromptRequest& request) = 0;

    virtual std::unique_ptr<EventSource> subscribe_events(const std::string& base_url,
                                                          core::CancellationToken token) = 0;
};

} // namespace agentpool::agent
