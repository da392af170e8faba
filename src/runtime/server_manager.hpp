#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "agent/agent_api.hpp"
#include "core/concurrent_map.hpp"
#include "core/config.hpp"
#include "runtime/agent_server.hpp"
#include "runtime/executable_resolver.hpp"
#include "runtime/port_allocator.hpp"

namespace agentpool::runtime {

// Observers of the live server set. Called outside any map lock, from the
// thread that started or stopped the server. Start and stop notifications
// are serialized, and a start is never reported for a server already
// removed. Listeners must not call back into the manager.
class ServerListener {
public:
    virtual ~ServerListener() = default;
    virtual void on_server_started(const AgentServer& server) = 0;
    virtual void on_server_stopped(const std::string& entity_id, int port) = 0;
};

struct ServerManagerOptions {
    std::string executable = "opencode";
    int base_port = 4096;
    int max_concurrent_servers = 10;
    int start_timeout_ms = 15000;
    int stop_timeout_ms = 5000;

    static ServerManagerOptions from_config(const core::AgentPoolConfig& config);
};

// Spawns, health-checks and terminates one agent process per entity.
// At most one record exists per entity id; concurrent starters of the same
// entity share the first starter's outcome.
class ServerManager {
public:
    ServerManager(ServerManagerOptions options, agent::AgentApi& api,
                  const ExecutableResolver& resolver = ExecutableResolver());
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    // Returns the existing server when one is already running for the entity.
    // Throws CapacityExceeded, PreflightFailure or StartupFailure; on failure
    // nothing of the attempt survives (no record, no process, no port).
    AgentServerPtr start_server(const std::string& entity_id,
                                const std::string& worktree_path,
                                bool continue_session = false);

    // Idempotent
    void stop_server(const std::string& entity_id);

    void stop_all();

    // nullptr when there is no record
    AgentServerPtr get_server_for_entity(const std::string& entity_id) const;

    // Every live record, including ones still starting
    std::vector<AgentServerPtr> get_running_servers() const;

    void add_listener(ServerListener* listener);
    void remove_listener(ServerListener* listener);

    // Replaces the default debug-log sink for agent output
    void set_output_callback(std::function<void(const std::string& entity_id,
                                                OutputStream stream,
                                                const std::string& line)> callback);

    const std::string& executable() const { return options_.executable; }
    PortAllocator& ports() { return ports_; }

private:
    ServerManagerOptions options_;
    agent::AgentApi& api_;
    PortAllocator ports_;
    core::ConcurrentMap<std::string, AgentServerPtr> servers_;

    mutable std::mutex listeners_mutex_;
    std::vector<ServerListener*> listeners_;
    std::mutex notify_mutex_;
    std::function<void(const std::string&, OutputStream, const std::string&)> output_callback_;

    void launch(const AgentServerPtr& server);
    void wait_for_healthy(AgentServer& server);
    void verify_working_directory(AgentServer& server);
    void rollback(const AgentServerPtr& server);
    void teardown(AgentServer& server);

    std::vector<ServerListener*> listeners_snapshot() const;
    bool notify_started(const AgentServerPtr& server);
    void notify_stopped(const std::string& entity_id, int port);
};

} // namespace agentpool::runtime
