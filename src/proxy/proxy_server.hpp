#pragma once
#include <string>
#include "proxy/html_rewriter.hpp"
#include "proxy/route_manager.hpp"

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace agentpool::proxy {

// Forwards "{base}/{port}/**" requests to the agent listening on that port.
// Unknown routes answer 404, unreachable agents 502.
class ProxyServer {
public:
    ProxyServer(const RouteManager& routes, int upstream_timeout_seconds = 300);

    // Installs handlers for every method under the route base path
    void mount(httplib::Server& server);

    void handle(const httplib::Request& req, httplib::Response& res) const;

    static bool is_hop_by_hop(const std::string& header);

private:
    const RouteManager& routes_;
    HtmlRewriter rewriter_;
    int upstream_timeout_seconds_;

    void stream(const ResolvedRoute& route, const std::string& target,
                const httplib::Request& req, httplib::Response& res) const;
};

} // namespace agentpool::proxy
