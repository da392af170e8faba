#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/cancellation.hpp"
#include "runtime/server_manager.hpp"

namespace agentpool::proxy {

struct ProxyRoute {
    std::string route_id;     // "agent-{port}"
    int port = 0;
    std::string path_prefix;  // "{base}/{port}", removed when forwarding
    std::string origin;       // "http://127.0.0.1:{port}"
};

// Immutable routing table. change_token is cancelled as soon as a newer
// snapshot has been published.
struct RouteSnapshot {
    std::vector<ProxyRoute> routes;
    core::CancellationToken change_token;

    const ProxyRoute* find(int port) const;
    bool is_stale() const { return change_token.is_cancelled(); }
};

struct ResolvedRoute {
    ProxyRoute route;
    std::string forward_path;  // prefix stripped, always starts with '/'
};

// Publishes a fresh snapshot on every add/remove. Readers load the current
// snapshot without locking.
class RouteManager : public runtime::ServerListener {
public:
    explicit RouteManager(std::string base_path = "/agent");

    void add_route(int port);
    void remove_route(int port);

    std::shared_ptr<const RouteSnapshot> snapshot() const;

    // Maps "{base}/{port}/rest" onto the route for port, if one exists
    std::optional<ResolvedRoute> resolve(const std::string& path) const;

    const std::string& base_path() const { return base_path_; }
    std::string prefix_for(int port) const { return base_path_ + "/" + std::to_string(port); }

    void on_server_started(const runtime::AgentServer& server) override;
    void on_server_stopped(const std::string& entity_id, int port) override;

private:
    std::string base_path_;

    std::mutex write_mutex_;
    std::map<int, ProxyRoute> routes_;
    std::unique_ptr<core::CancellationSource> change_source_;
    std::shared_ptr<const RouteSnapshot> snapshot_;

    void rebuild();
};

} // namespace agentpool::proxy
