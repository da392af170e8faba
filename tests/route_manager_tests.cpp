#include <catch2/catch_all.hpp>
#include "proxy/html_rewriter.hpp"
#include "proxy/proxy_server.hpp"
#include "proxy/route_manager.hpp"

using namespace agentpool::proxy;

TEST_CASE("added route resolves and strips the prefix") {
    RouteManager routes("/agent");
    routes.add_route(4096);

    auto resolved = routes.resolve("/agent/4096/session/abc");
    REQUIRE(resolved.has_value());
    REQUIRE(resolved->route.route_id == "agent-4096");
    REQUIRE(resolved->route.origin == "http://127.0.0.1:4096");
    REQUIRE(resolved->route.path_prefix == "/agent/4096");
    REQUIRE(resolved->forward_path == "/session/abc");

    auto root = routes.resolve("/agent/4096");
    REQUIRE(root.has_value());
    REQUIRE(root->forward_path == "/");
}

TEST_CASE("removed route is unreachable") {
    RouteManager routes("/agent");
    routes.add_route(4096);
    routes.add_route(4097);
    routes.remove_route(4096);

    REQUIRE_FALSE(routes.resolve("/agent/4096/").has_value());
    REQUIRE(routes.resolve("/agent/4097/").has_value());
    REQUIRE(routes.snapshot()->routes.size() == 1);
}

TEST_CASE("paths outside the base or with bad port segments do not resolve") {
    RouteManager routes("/agent/");
    routes.add_route(4096);

    REQUIRE(routes.base_path() == "/agent");
    REQUIRE_FALSE(routes.resolve("/other/4096/").has_value());
    REQUIRE_FALSE(routes.resolve("/agent/abc/").has_value());
    REQUIRE_FALSE(routes.resolve("/agent/123456/").has_value());
    REQUIRE_FALSE(routes.resolve("/agent/").has_value());
    REQUIRE_FALSE(routes.resolve("/agent4096/").has_value());
}

TEST_CASE("old snapshot is flagged stale after a change") {
    RouteManager routes("/agent");
    auto before = routes.snapshot();
    REQUIRE_FALSE(before->is_stale());

    routes.add_route(4096);
    REQUIRE(before->is_stale());
    REQUIRE(before->find(4096) == nullptr);

    auto after = routes.snapshot();
    REQUIRE_FALSE(after->is_stale());
    REQUIRE(after->find(4096) != nullptr);
}

TEST_CASE("removing an unknown route publishes nothing") {
    RouteManager routes("/agent");
    auto before = routes.snapshot();
    routes.remove_route(9999);
    REQUIRE_FALSE(before->is_stale());
}

TEST_CASE("html root-relative references are rebased") {
    HtmlRewriter rewriter;
    std::string html =
        R"(<script src="/assets/app.js"></script>)"
        R"(<link href="/style.css">)"
        R"(<form action="/submit"></form>)"
        R"(<div style="background: url('/img/bg.png')"></div>)";

    auto out = rewriter.rewrite(html, "/agent/4096");
    REQUIRE(out.find(R"(src="/agent/4096/assets/app.js")") != std::string::npos);
    REQUIRE(out.find(R"(href="/agent/4096/style.css")") != std::string::npos);
    REQUIRE(out.find(R"(action="/agent/4096/submit")") != std::string::npos);
    REQUIRE(out.find(R"(url('/agent/4096/img/bg.png'))") != std::string::npos);
}

TEST_CASE("protocol-relative and absolute references are untouched") {
    HtmlRewriter rewriter;
    std::string html =
        R"(<script src="//cdn.example.com/lib.js"></script>)"
        R"(<a href="https://example.com/x">x</a>)"
        R"(<a href="relative/path">y</a>)";

    REQUIRE(rewriter.rewrite(html, "/agent/4096") == html);
}

TEST_CASE("html content type detection") {
    REQUIRE(HtmlRewriter::is_html("text/html"));
    REQUIRE(HtmlRewriter::is_html("Text/HTML; charset=utf-8"));
    REQUIRE_FALSE(HtmlRewriter::is_html("application/json"));
    REQUIRE_FALSE(HtmlRewriter::is_html("text/html-fragment"));
}

TEST_CASE("hop-by-hop headers are recognised") {
    REQUIRE(ProxyServer::is_hop_by_hop("Connection"));
    REQUIRE(ProxyServer::is_hop_by_hop("transfer-encoding"));
    REQUIRE_FALSE(ProxyServer::is_hop_by_hop("Content-Type"));
}
