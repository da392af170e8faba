#include "workflow/startup_tracker.hpp"
#include <spdlog/spdlog.h>

namespace agentpool::workflow {

AgentStartupInfo StartupTracker::get_state(const std::string& entity_id) const {
    if (auto info = states_.find(entity_id)) {
        return *info;
    }
    AgentStartupInfo info;
    info.entity_id = entity_id;
    return info;
}

std::vector<AgentStartupInfo> StartupTracker::get_all_states() const {
    return states_.values();
}

void StartupTracker::mark_starting(const std::string& entity_id) {
    AgentStartupInfo info;
    info.entity_id = entity_id;
    info.state = StartupState::STARTING;
    set_state(std::move(info));
}

void StartupTracker::mark_started(const std::string& entity_id) {
    AgentStartupInfo info;
    info.entity_id = entity_id;
    info.state = StartupState::STARTED;
    set_state(std::move(info));
}

void StartupTracker::mark_failed(const std::string& entity_id, const std::string& error_message) {
    AgentStartupInfo info;
    info.entity_id = entity_id;
    info.state = StartupState::FAILED;
    info.error_message = error_message;
    set_state(std::move(info));
}

void StartupTracker::clear_state(const std::string& entity_id) {
    states_.erase(entity_id);
    AgentStartupInfo info;
    info.entity_id = entity_id;
    broadcast(info);
}

bool StartupTracker::is_starting(const std::string& entity_id) const {
    auto info = states_.find(entity_id);
    return info && info->state == StartupState::STARTING;
}

bool StartupTracker::has_failed(const std::string& entity_id) const {
    auto info = states_.find(entity_id);
    return info && info->state == StartupState::FAILED;
}

uint64_t StartupTracker::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    uint64_t id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void StartupTracker::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(id);
}

void StartupTracker::set_state(AgentStartupInfo info) {
    states_.insert_or_assign(info.entity_id, info);
    broadcast(info);
}

void StartupTracker::broadcast(const AgentStartupInfo& info) {
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto& entry : listeners_) {
            listeners.push_back(entry.second);
        }
    }

    for (const auto& listener : listeners) {
        try {
            listener(info);
        } catch (const std::exception& e) {
            spdlog::warn("Startup state listener failed for {}: {}", info.entity_id, e.what());
        }
    }
}

} // namespace agentpool::workflow
