#include "runtime/server_manager.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

namespace agentpool::runtime {

static std::string normalize_path(const std::string& path) {
    std::error_code ec;
    auto normalized = fs::weakly_canonical(fs::path(path), ec);
    std::string result = ec ? fs::path(path).lexically_normal().string() : normalized.string();
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

ServerManagerOptions ServerManagerOptions::from_config(const core::AgentPoolConfig& config) {
    ServerManagerOptions options;
    options.executable = config.agent_executable;
    options.base_port = config.base_port;
    options.max_concurrent_servers = config.max_concurrent_servers;
    options.start_timeout_ms = config.server_start_timeout_ms;
    options.stop_timeout_ms = config.stop_timeout_ms;
    return options;
}

ServerManager::ServerManager(ServerManagerOptions options, agent::AgentApi& api,
                             const ExecutableResolver& resolver)
    : options_(std::move(options))
    , api_(api)
    , ports_(options_.base_port, options_.max_concurrent_servers) {
    if (auto resolved = resolver.resolve(options_.executable)) {
        options_.executable = *resolved;
        spdlog::info("Using agent executable: {}", options_.executable);
    } else {
        spdlog::warn("Agent executable '{}' not found on PATH or in common install locations",
                     options_.executable);
    }
}

ServerManager::~ServerManager() {
    stop_all();
}

// ============================================================================
// Start
// ============================================================================

AgentServerPtr ServerManager::start_server(const std::string& entity_id,
                                           const std::string& worktree_path,
                                           bool continue_session) {
    while (true) {
        auto candidate = std::make_shared<AgentServer>(entity_id, worktree_path, continue_session);
        auto emplaced = servers_.try_emplace(entity_id, candidate);
        AgentServerPtr existing = emplaced.first;

        if (emplaced.second) {
            launch(candidate);
            if (!notify_started(candidate)) {
                throw StartupFailure("Agent server for " + entity_id + " was stopped during startup");
            }
            return candidate;
        }

        switch (existing->status()) {
            case ServerStatus::RUNNING:
                spdlog::debug("Agent server for {} already running on port {}",
                              entity_id, existing->port());
                return existing;

            case ServerStatus::STARTING:
                spdlog::debug("Agent server for {} is starting, waiting for it", entity_id);
                existing->ready().wait();
                if (existing->status() == ServerStatus::RUNNING) {
                    return existing;
                }
                throw StartupFailure("Concurrent start of agent server for " + entity_id + " failed");

            case ServerStatus::FAILED:
            case ServerStatus::STOPPED:
                // Stale record; drop it only if nobody replaced it meanwhile
                servers_.erase_if(entity_id,
                    [&existing](const AgentServerPtr& s) { return s == existing; });
                break;
        }
    }
}

void ServerManager::launch(const AgentServerPtr& server) {
    const std::string& entity_id = server->entity_id();

    try {
        int port = ports_.allocate_port();
        server->set_port(port);

        ProcessSpec spec;
        spec.name = entity_id;
        spec.executable = options_.executable;
        spec.args = {"serve", "--port", std::to_string(port), "--hostname", "127.0.0.1"};
        if (server->continue_session()) {
            spec.args.push_back("--continue");
        }
        spec.working_dir = server->worktree_path();

        std::function<void(const std::string&, OutputStream, const std::string&)> sink;
        {
            std::lock_guard<std::mutex> lock(listeners_mutex_);
            sink = output_callback_;
        }
        OutputCallback on_output;
        if (sink) {
            on_output = [sink, entity_id](OutputStream stream, const std::string& line) {
                sink(entity_id, stream, line);
            };
        }

        spdlog::info("Starting agent server for {} on port {} in {}",
                     entity_id, port, server->worktree_path());
        server->attach_process(AgentProcess::spawn(spec, on_output));

        wait_for_healthy(*server);
        verify_working_directory(*server);

        server->set_status(ServerStatus::RUNNING);
        if (get_server_for_entity(entity_id) != server) {
            throw StartupFailure("Agent server for " + entity_id + " was stopped during startup");
        }
        server->mark_ready();
        spdlog::info("Agent server for {} is running on port {} (pid={})",
                     entity_id, port, server->pid());
    } catch (const std::exception& e) {
        spdlog::error("Failed to start agent server for {}: {}", entity_id, e.what());
        rollback(server);
        throw;
    }
}

void ServerManager::wait_for_healthy(AgentServer& server) {
    using namespace std::chrono;

    const auto deadline = steady_clock::now() + milliseconds(options_.start_timeout_ms);
    const std::string base_url = server.base_url();
    auto delay = milliseconds(100);
    int attempts = 0;

    while (true) {
        std::optional<int> exit_code;
        if (server.process_exited(exit_code)) {
            if (exit_code) {
                throw StartupFailure("Agent server for " + server.entity_id() +
                                     " exited with code " + std::to_string(*exit_code) +
                                     " before becoming healthy");
            }
            throw StartupFailure("Agent server for " + server.entity_id() +
                                 " was stopped before becoming healthy");
        }

        ++attempts;
        try {
            if (api_.get_health(base_url).healthy) {
                spdlog::debug("Agent server for {} healthy after {} attempts",
                              server.entity_id(), attempts);
                return;
            }
        } catch (const AgentApiError& e) {
            spdlog::trace("Health check {} for {} failed: {}", attempts, server.entity_id(), e.what());
        }

        auto now = steady_clock::now();
        if (now >= deadline) {
            throw StartupFailure("Agent server for " + server.entity_id() +
                                 " did not become healthy within " +
                                 std::to_string(options_.start_timeout_ms) + "ms");
        }

        auto remaining = duration_cast<milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(delay, remaining));
        delay = std::min(delay * 2, milliseconds(1000));
    }
}

void ServerManager::verify_working_directory(AgentServer& server) {
    std::optional<std::string> actual;
    try {
        actual = api_.get_current_path(server.base_url());
    } catch (const AgentApiError& e) {
        spdlog::warn("Could not verify working directory of agent for {}: {}",
                     server.entity_id(), e.what());
        return;
    }

    if (!actual) {
        spdlog::warn("Agent for {} did not report a working directory", server.entity_id());
        return;
    }

    if (normalize_path(*actual) != normalize_path(server.worktree_path())) {
        spdlog::warn("Agent for {} is running in {} but expected {}",
                     server.entity_id(), *actual, server.worktree_path());
    }
}

void ServerManager::rollback(const AgentServerPtr& server) {
    server->set_status(ServerStatus::FAILED);
    servers_.erase_if(server->entity_id(),
        [&server](const AgentServerPtr& s) { return s == server; });
    teardown(*server);
    server->mark_ready();
}

// ============================================================================
// Stop
// ============================================================================

void ServerManager::stop_server(const std::string& entity_id) {
    // Held through teardown so an in-flight start notification sees a live server
    std::lock_guard<std::mutex> lock(notify_mutex_);
    auto removed = servers_.erase(entity_id);
    if (!removed) {
        spdlog::debug("No agent server to stop for {}", entity_id);
        return;
    }

    AgentServerPtr server = *removed;
    int port = server->port();
    spdlog::info("Stopping agent server for {} on port {}", entity_id, port);

    server->set_status(ServerStatus::STOPPED);
    teardown(*server);
    server->mark_ready();

    notify_stopped(entity_id, port);
}

void ServerManager::stop_all() {
    for (const auto& server : get_running_servers()) {
        stop_server(server->entity_id());
    }
}

void ServerManager::teardown(AgentServer& server) {
    if (auto process = server.take_process()) {
        if (!process->kill_tree(options_.stop_timeout_ms)) {
            spdlog::warn("Failed to kill agent process for {} (pid={}), it may have leaked",
                         server.entity_id(), process->pid());
        }
    }
    if (auto port = server.take_port()) {
        ports_.release_port(*port);
        spdlog::debug("Released port {} from {}", *port, server.entity_id());
    }
}

// ============================================================================
// Queries
// ============================================================================

AgentServerPtr ServerManager::get_server_for_entity(const std::string& entity_id) const {
    auto found = servers_.find(entity_id);
    return found ? *found : nullptr;
}

std::vector<AgentServerPtr> ServerManager::get_running_servers() const {
    return servers_.values();
}

// ============================================================================
// Listeners
// ============================================================================

void ServerManager::add_listener(ServerListener* listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(listener);
}

void ServerManager::remove_listener(ServerListener* listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

void ServerManager::set_output_callback(
        std::function<void(const std::string&, OutputStream, const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    output_callback_ = std::move(callback);
}

std::vector<ServerListener*> ServerManager::listeners_snapshot() const {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return listeners_;
}

bool ServerManager::notify_started(const AgentServerPtr& server) {
    std::lock_guard<std::mutex> lock(notify_mutex_);
    // A stop that got here first has already removed and reported it
    if (get_server_for_entity(server->entity_id()) != server) {
        return false;
    }
    for (auto* listener : listeners_snapshot()) {
        try {
            listener->on_server_started(*server);
        } catch (const std::exception& e) {
            spdlog::warn("Server listener failed on start of {}: {}", server->entity_id(), e.what());
        }
    }
    return true;
}

void ServerManager::notify_stopped(const std::string& entity_id, int port) {
    for (auto* listener : listeners_snapshot()) {
        try {
            listener->on_server_stopped(entity_id, port);
        } catch (const std::exception& e) {
            spdlog::warn("Server listener failed on stop of {}: {}", entity_id, e.what());
        }
    }
}

} // namespace agentpool::runtime
