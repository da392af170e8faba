#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "core/concurrent_map.hpp"
#include "workflow/collaborators.hpp"

namespace agentpool::workflow {

// Latest startup state per entity, broadcast to subscribers on every change.
// Subscribers run on the caller's thread after the state is stored.
class StartupTracker {
public:
    using Listener = std::function<void(const AgentStartupInfo&)>;

    // NOT_STARTED for unknown entities
    AgentStartupInfo get_state(const std::string& entity_id) const;
    std::vector<AgentStartupInfo> get_all_states() const;

    void mark_starting(const std::string& entity_id);
    void mark_started(const std::string& entity_id);
    void mark_failed(const std::string& entity_id, const std::string& error_message);
    void clear_state(const std::string& entity_id);

    bool is_starting(const std::string& entity_id) const;
    bool has_failed(const std::string& entity_id) const;

    uint64_t subscribe(Listener listener);
    void unsubscribe(uint64_t id);

private:
    core::ConcurrentMap<std::string, AgentStartupInfo> states_;

    mutable std::mutex listeners_mutex_;
    std::map<uint64_t, Listener> listeners_;
    uint64_t next_listener_id_ = 1;

    void set_state(AgentStartupInfo info);
    void broadcast(const AgentStartupInfo& info);
};

} // namespace agentpool::workflow
