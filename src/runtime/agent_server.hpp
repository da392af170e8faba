#pragma once
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "runtime/agent/process.hpp"

namespace agentpool::runtime {

enum class ServerStatus {
    STARTING,
    RUNNING,
    FAILED,
    STOPPED
};

const char* server_status_to_string(ServerStatus status);

// One agent server per active work item. Immutable identity plus mutable
// lifecycle fields guarded by an internal mutex; shared between the server
// manager map and readers.
class AgentServer {
public:
    AgentServer(std::string entity_id, std::string worktree_path, bool continue_session);

    AgentServer(const AgentServer&) = delete;
    AgentServer& operator=(const AgentServer&) = delete;

    const std::string& entity_id() const { return entity_id_; }
    const std::string& worktree_path() const { return worktree_path_; }
    bool continue_session() const { return continue_session_; }
    std::chrono::system_clock::time_point started_at() const { return started_at_; }

    int port() const;
    void set_port(int port);
    std::string base_url() const;

    ServerStatus status() const;
    void set_status(ServerStatus status);

    std::optional<std::string> active_session_id() const;
    void set_active_session_id(std::optional<std::string> session_id);

    pid_t pid() const;

    // Ownership of the process handle transfers in on spawn and out exactly
    // once on teardown; whoever takes it is responsible for kill + wait.
    void attach_process(std::unique_ptr<AgentProcess> process);
    std::unique_ptr<AgentProcess> take_process();
    bool process_exited(std::optional<int>& exit_code);

    // Returns the port the first time only, so concurrent teardown paths
    // never release it twice.
    std::optional<int> take_port();

    // Resolved when startup finishes either way; concurrent starters wait on it
    std::shared_future<void> ready() const { return ready_future_; }
    void mark_ready();

private:
    const std::string entity_id_;
    const std::string worktree_path_;
    const bool continue_session_;
    const std::chrono::system_clock::time_point started_at_;

    mutable std::mutex mutex_;
    int port_ = 0;
    bool port_released_ = false;
    ServerStatus status_ = ServerStatus::STARTING;
    std::optional<std::string> active_session_id_;
    std::unique_ptr<AgentProcess> process_;

    std::promise<void> ready_promise_;
    std::shared_future<void> ready_future_;
    bool ready_set_ = false;
};

using AgentServerPtr = std::shared_ptr<AgentServer>;

} // namespace agentpool::runtime
