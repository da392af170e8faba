#include "proxy/route_manager.hpp"
#include <spdlog/spdlog.h>
#include <cctype>

namespace agentpool::proxy {

static std::string normalize_base_path(std::string path) {
    if (path.empty() || path.front() != '/') {
        path.insert(path.begin(), '/');
    }
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path == "/" ? "" : path;
}

const ProxyRoute* RouteSnapshot::find(int port) const {
    for (const auto& route : routes) {
        if (route.port == port) {
            return &route;
        }
    }
    return nullptr;
}

RouteManager::RouteManager(std::string base_path)
    : base_path_(normalize_base_path(std::move(base_path)))
    , change_source_(std::make_unique<core::CancellationSource>()) {
    auto initial = std::make_shared<RouteSnapshot>();
    initial->change_token = change_source_->token();
    snapshot_ = initial;
}

void RouteManager::add_route(int port) {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        ProxyRoute route;
        route.route_id = "agent-" + std::to_string(port);
        route.port = port;
        route.path_prefix = prefix_for(port);
        route.origin = "http://127.0.0.1:" + std::to_string(port);
        routes_[port] = route;
        rebuild();
    }
    spdlog::info("Added proxy route {}/* -> http://127.0.0.1:{}/*", prefix_for(port), port);
}

void RouteManager::remove_route(int port) {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (routes_.erase(port) == 0) {
            return;
        }
        rebuild();
    }
    spdlog::info("Removed proxy route for agent on port {}", port);
}

// Caller holds write_mutex_
void RouteManager::rebuild() {
    auto old_source = std::move(change_source_);
    change_source_ = std::make_unique<core::CancellationSource>();

    auto next = std::make_shared<RouteSnapshot>();
    next->routes.reserve(routes_.size());
    for (const auto& entry : routes_) {
        next->routes.push_back(entry.second);
    }
    next->change_token = change_source_->token();

    std::atomic_store(&snapshot_, std::shared_ptr<const RouteSnapshot>(next));
    old_source->cancel();
}

std::shared_ptr<const RouteSnapshot> RouteManager::snapshot() const {
    return std::atomic_load(&snapshot_);
}

std::optional<ResolvedRoute> RouteManager::resolve(const std::string& path) const {
    const std::string prefix = base_path_ + "/";
    if (path.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    size_t start = prefix.size();
    size_t end = path.find('/', start);
    std::string segment = path.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (segment.empty() || segment.size() > 5) {
        return std::nullopt;
    }
    for (char c : segment) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }

    auto current = snapshot();
    const ProxyRoute* route = current->find(std::stoi(segment));
    if (!route) {
        return std::nullopt;
    }

    ResolvedRoute resolved;
    resolved.route = *route;
    resolved.forward_path = end == std::string::npos ? "/" : path.substr(end);
    return resolved;
}

void RouteManager::on_server_started(const runtime::AgentServer& server) {
    add_route(server.port());
}

void RouteManager::on_server_stopped(const std::string& /*entity_id*/, int port) {
    remove_route(port);
}

} // namespace agentpool::proxy
