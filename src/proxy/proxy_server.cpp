#include "proxy/proxy_server.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <httplib.h>
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace agentpool::proxy {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string escape_regex(const std::string& text) {
    std::string out;
    for (char c : text) {
        if (std::string("\\^$.|?*+()[]{}").find(c) != std::string::npos) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

void send_error(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    res.set_content(json{{"error", message}}.dump(), "application/json");
}

// Headers httplib adds to incoming requests for the handler's benefit
bool is_server_metadata(const std::string& lower) {
    return lower == "remote_addr" || lower == "remote_port" ||
           lower == "local_addr" || lower == "local_port";
}

} // namespace

ProxyServer::ProxyServer(const RouteManager& routes, int upstream_timeout_seconds)
    : routes_(routes)
    , upstream_timeout_seconds_(upstream_timeout_seconds) {}

bool ProxyServer::is_hop_by_hop(const std::string& header) {
    static const char* hop_by_hop[] = {
        "connection", "keep-alive", "proxy-authenticate", "proxy-authorization",
        "te", "trailer", "transfer-encoding", "upgrade"
    };
    std::string lower = lowercase(header);
    for (const char* h : hop_by_hop) {
        if (lower == h) {
            return true;
        }
    }
    return false;
}

void ProxyServer::mount(httplib::Server& server) {
    std::string pattern = escape_regex(routes_.base_path()) + "/(\\d+)(/.*)?";
    auto handler = [this](const httplib::Request& req, httplib::Response& res) {
        handle(req, res);
    };

    server.Get(pattern, handler);
    server.Post(pattern, handler);
    server.Put(pattern, handler);
    server.Patch(pattern, handler);
    server.Delete(pattern, handler);
    server.Options(pattern, handler);
    spdlog::info("Agent proxy mounted at {}/{{port}}/", routes_.base_path());
}

void ProxyServer::handle(const httplib::Request& req, httplib::Response& res) const {
    auto resolved = routes_.resolve(req.path);
    if (!resolved) {
        send_error(res, 404, "No agent route for " + req.path);
        return;
    }

    std::string target = resolved->forward_path;
    auto query = req.target.find('?');
    if (query != std::string::npos) {
        target += req.target.substr(query);
    }

    bool wants_stream = resolved->forward_path == "/event" ||
        req.get_header_value("Accept").find("text/event-stream") != std::string::npos;
    if (req.method == "GET" && wants_stream) {
        stream(*resolved, target, req, res);
        return;
    }

    httplib::Request upstream;
    upstream.method = req.method;
    upstream.path = target;
    upstream.body = req.body;
    for (const auto& [name, value] : req.headers) {
        std::string lower = lowercase(name);
        if (is_hop_by_hop(lower) || is_server_metadata(lower) || lower == "host" ||
            lower == "content-length" || lower == "accept-encoding") {
            continue;
        }
        upstream.headers.emplace(name, value);
    }
    upstream.headers.emplace("X-Forwarded-Prefix", resolved->route.path_prefix);

    httplib::Client cli(resolved->route.origin);
    cli.set_connection_timeout(5);
    cli.set_read_timeout(upstream_timeout_seconds_);
    cli.set_write_timeout(upstream_timeout_seconds_);

    auto result = cli.send(upstream);
    if (!result) {
        spdlog::warn("Proxy {} {} -> {} failed: {}", req.method, req.path,
                     resolved->route.origin, httplib::to_string(result.error()));
        send_error(res, 502, "Agent on port " + std::to_string(resolved->route.port) + " is unreachable");
        return;
    }

    res.status = result->status;
    for (const auto& [name, value] : result->headers) {
        std::string lower = lowercase(name);
        if (is_hop_by_hop(lower) || lower == "content-length" || lower == "content-type") {
            continue;
        }
        res.headers.emplace(name, value);
    }

    std::string content_type = result->get_header_value("Content-Type");
    if (HtmlRewriter::is_html(content_type)) {
        res.set_content(rewriter_.rewrite(result->body, resolved->route.path_prefix),
                        "text/html; charset=utf-8");
    } else {
        res.set_content(result->body, content_type.empty() ? "application/octet-stream" : content_type);
    }
}

void ProxyServer::stream(const ResolvedRoute& route, const std::string& target,
                         const httplib::Request& req, httplib::Response& res) const {
    httplib::Headers headers;
    for (const auto& [name, value] : req.headers) {
        std::string lower = lowercase(name);
        if (is_hop_by_hop(lower) || is_server_metadata(lower) || lower == "host" ||
            lower == "accept-encoding") {
            continue;
        }
        headers.emplace(name, value);
    }

    std::string origin = route.origin;
    int port = route.port;
    spdlog::debug("Streaming {} from agent on port {}", target, port);

    res.set_header("Cache-Control", "no-cache");
    res.set_chunked_content_provider("text/event-stream",
        [origin, target, headers, port](size_t /*offset*/, httplib::DataSink& sink) {
            httplib::Client cli(origin);
            cli.set_connection_timeout(5);
            cli.set_read_timeout(3600);

            auto result = cli.Get(target, headers,
                [&sink](const char* data, size_t length) {
                    return sink.write(data, length);
                });
            if (!result) {
                spdlog::debug("Event stream from port {} ended: {}", port,
                              httplib::to_string(result.error()));
            }
            sink.done();
            return true;
        });
}

} // namespace agentpool::proxy
