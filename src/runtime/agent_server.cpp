#include "runtime/agent_server.hpp"

namespace agentpool::runtime {

const char* server_status_to_string(ServerStatus status) {
    switch (status) {
        case ServerStatus::STARTING: return "starting";
        case ServerStatus::RUNNING:  return "running";
        case ServerStatus::FAILED:   return "failed";
        case ServerStatus::STOPPED:  return "stopped";
    }
    return "unknown";
}

AgentServer::AgentServer(std::string entity_id, std::string worktree_path, bool continue_session)
    : entity_id_(std::move(entity_id))
    , worktree_path_(std::move(worktree_path))
    , continue_session_(continue_session)
    , started_at_(std::chrono::system_clock::now())
    , ready_future_(ready_promise_.get_future().share()) {}

int AgentServer::port() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return port_;
}

void AgentServer::set_port(int port) {
    std::lock_guard<std::mutex> lock(mutex_);
    port_ = port;
}

std::string AgentServer::base_url() const {
    return "http://127.0.0.1:" + std::to_string(port());
}

ServerStatus AgentServer::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

void AgentServer::set_status(ServerStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = status;
}

std::optional<std::string> AgentServer::active_session_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_session_id_;
}

void AgentServer::set_active_session_id(std::optional<std::string> session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_session_id_ = std::move(session_id);
}

pid_t AgentServer::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_ ? process_->pid() : -1;
}

void AgentServer::attach_process(std::unique_ptr<AgentProcess> process) {
    std::lock_guard<std::mutex> lock(mutex_);
    process_ = std::move(process);
}

std::unique_ptr<AgentProcess> AgentServer::take_process() {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::move(process_);
}

bool AgentServer::process_exited(std::optional<int>& exit_code) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!process_) {
        // Taken by a concurrent stop
        exit_code.reset();
        return true;
    }
    if (process_->has_exited()) {
        exit_code = process_->exit_code();
        return true;
    }
    return false;
}

std::optional<int> AgentServer::take_port() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (port_released_ || port_ == 0) {
        return std::nullopt;
    }
    port_released_ = true;
    return port_;
}

void AgentServer::mark_ready() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ready_set_) {
        ready_set_ = true;
        ready_promise_.set_value();
    }
}

} // namespace agentpool::runtime
