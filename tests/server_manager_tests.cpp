#include <catch2/catch_all.hpp>
#include "core/errors.hpp"
#include "fakes.hpp"
#include "proxy/route_manager.hpp"
#include "runtime/server_manager.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

using namespace agentpool;
using namespace agentpool::runtime;
using namespace std::chrono_literals;
using agentpool::testing::FakeAgentApi;
using agentpool::testing::mkd;
using agentpool::testing::write_script;

static ServerManagerOptions options_for(const std::string& executable, int base_port, int max_servers,
                                        int start_timeout_ms = 5000) {
    ServerManagerOptions options;
    options.executable = executable;
    options.base_port = base_port;
    options.max_concurrent_servers = max_servers;
    options.start_timeout_ms = start_timeout_ms;
    options.stop_timeout_ms = 1000;
    return options;
}

namespace {

class RecordingListener : public ServerListener {
public:
    void on_server_started(const AgentServer& server) override {
        std::lock_guard<std::mutex> lock(mutex);
        started.push_back(server.entity_id());
    }
    void on_server_stopped(const std::string& entity_id, int port) override {
        std::lock_guard<std::mutex> lock(mutex);
        stopped.emplace_back(entity_id, port);
    }

    std::mutex mutex;
    std::vector<std::string> started;
    std::vector<std::pair<std::string, int>> stopped;
};

// Route table whose start notification takes a while
class SlowRoutes : public ServerListener {
public:
    void on_server_started(const AgentServer& server) override {
        entered = true;
        std::this_thread::sleep_for(200ms);
        routes.on_server_started(server);
    }
    void on_server_stopped(const std::string& entity_id, int port) override {
        routes.on_server_stopped(entity_id, port);
    }

    agentpool::proxy::RouteManager routes;
    std::atomic<bool> entered{false};
};

} // namespace

TEST_CASE("start and stop a healthy agent") {
    auto dir = mkd("sm_basic");
    auto agent = write_script(dir, "agent.sh", "exec sleep 30");
    FakeAgentApi api;
    ServerManager servers(options_for(agent, 7100, 2), api);
    RecordingListener listener;
    servers.add_listener(&listener);

    auto server = servers.start_server("item-1", dir.string());
    REQUIRE(server->status() == ServerStatus::RUNNING);
    REQUIRE(server->port() == 7100);
    REQUIRE(server->base_url() == "http://127.0.0.1:7100");
    REQUIRE(server->pid() > 0);
    REQUIRE(servers.get_server_for_entity("item-1") == server);
    REQUIRE(servers.ports().is_allocated(7100));
    REQUIRE(listener.started == std::vector<std::string>{"item-1"});

    servers.stop_server("item-1");
    REQUIRE(server->status() == ServerStatus::STOPPED);
    REQUIRE(servers.get_server_for_entity("item-1") == nullptr);
    REQUIRE(servers.ports().outstanding() == 0);
    REQUIRE(listener.stopped.size() == 1);
    REQUIRE(listener.stopped[0].second == 7100);

    // Second stop is a no-op
    servers.stop_server("item-1");
    REQUIRE(listener.stopped.size() == 1);
    servers.remove_listener(&listener);
}

TEST_CASE("starting a running entity returns the same server") {
    auto dir = mkd("sm_same");
    auto agent = write_script(dir, "agent.sh", "exec sleep 30");
    FakeAgentApi api;
    ServerManager servers(options_for(agent, 7110, 2), api);

    auto first = servers.start_server("item-1", dir.string());
    auto second = servers.start_server("item-1", dir.string());
    REQUIRE(first == second);
    REQUIRE(servers.ports().outstanding() == 1);
    REQUIRE(servers.get_running_servers().size() == 1);
}

TEST_CASE("concurrent starts of one entity create one server") {
    auto dir = mkd("sm_concurrent");
    auto agent = write_script(dir, "agent.sh", "exec sleep 30");
    FakeAgentApi api;
    api.health_delay_ms = 100;
    ServerManager servers(options_for(agent, 7120, 4), api);

    std::vector<std::future<AgentServerPtr>> starts;
    for (int i = 0; i < 4; ++i) {
        starts.push_back(std::async(std::launch::async, [&servers, &dir]() {
            return servers.start_server("item-1", dir.string());
        }));
    }

    std::vector<AgentServerPtr> results;
    for (auto& f : starts) {
        results.push_back(f.get());
    }
    for (const auto& r : results) {
        REQUIRE(r == results.front());
    }
    REQUIRE(servers.get_running_servers().size() == 1);
    REQUIRE(servers.ports().outstanding() == 1);
}

TEST_CASE("capacity is enforced per pool") {
    auto dir = mkd("sm_capacity");
    auto agent = write_script(dir, "agent.sh", "exec sleep 30");
    FakeAgentApi api;
    ServerManager servers(options_for(agent, 5000, 1), api);

    servers.start_server("item-1", dir.string());
    REQUIRE_THROWS_AS(servers.start_server("item-2", dir.string()), CapacityExceeded);
    REQUIRE(servers.get_server_for_entity("item-2") == nullptr);
    REQUIRE(servers.get_running_servers().size() == 1);

    servers.stop_server("item-1");
    auto next = servers.start_server("item-2", dir.string());
    REQUIRE(next->port() == 5000);
}

TEST_CASE("health timeout fails the start and frees everything") {
    auto dir = mkd("sm_timeout");
    auto agent = write_script(dir, "agent.sh", "exec sleep 30");
    FakeAgentApi api;
    api.healthy = false;
    ServerManager servers(options_for(agent, 7130, 2, 300), api);

    try {
        servers.start_server("item-1", dir.string());
        FAIL("start_server should have thrown");
    } catch (const StartupFailure& e) {
        REQUIRE(std::string(e.what()).find("did not become healthy within 300ms") != std::string::npos);
    }
    REQUIRE(servers.get_server_for_entity("item-1") == nullptr);
    REQUIRE(servers.ports().outstanding() == 0);
    REQUIRE(api.health_calls > 1);
}

TEST_CASE("agent exiting during startup fails fast") {
    auto dir = mkd("sm_exit");
    auto agent = write_script(dir, "agent.sh", "exit 3");
    FakeAgentApi api;
    api.healthy = false;
    ServerManager servers(options_for(agent, 7140, 2, 10000), api);

    auto begin = std::chrono::steady_clock::now();
    try {
        servers.start_server("item-1", dir.string());
        FAIL("start_server should have thrown");
    } catch (const StartupFailure& e) {
        REQUIRE(std::string(e.what()).find("exited with code 3") != std::string::npos);
    }
    REQUIRE(std::chrono::steady_clock::now() - begin < 5s);
    REQUIRE(servers.get_server_for_entity("item-1") == nullptr);
    REQUIRE(servers.ports().outstanding() == 0);
}

TEST_CASE("missing worktree is a preflight failure") {
    auto dir = mkd("sm_preflight");
    auto agent = write_script(dir, "agent.sh", "exec sleep 30");
    FakeAgentApi api;
    ServerManager servers(options_for(agent, 7150, 2), api);

    REQUIRE_THROWS_AS(servers.start_server("item-1", (dir / "missing").string()), PreflightFailure);
    REQUIRE(servers.get_server_for_entity("item-1") == nullptr);
    REQUIRE(servers.ports().outstanding() == 0);
}

TEST_CASE("failed entity can be started again") {
    auto dir = mkd("sm_retry");
    auto agent = write_script(dir, "agent.sh", "exec sleep 30");
    FakeAgentApi api;
    api.healthy = false;
    ServerManager servers(options_for(agent, 7160, 2, 200), api);

    REQUIRE_THROWS_AS(servers.start_server("item-1", dir.string()), StartupFailure);

    api.healthy = true;
    auto server = servers.start_server("item-1", dir.string());
    REQUIRE(server->status() == ServerStatus::RUNNING);
    REQUIRE(server->port() == 7160);
}

TEST_CASE("stop_all stops every server") {
    auto dir = mkd("sm_stop_all");
    auto agent = write_script(dir, "agent.sh", "exec sleep 30");
    FakeAgentApi api;
    ServerManager servers(options_for(agent, 7170, 3), api);

    auto a = servers.start_server("item-1", dir.string());
    auto b = servers.start_server("item-2", dir.string());
    servers.stop_all();

    REQUIRE(servers.get_running_servers().empty());
    REQUIRE(a->status() == ServerStatus::STOPPED);
    REQUIRE(b->status() == ServerStatus::STOPPED);
    REQUIRE(servers.ports().outstanding() == 0);
}

TEST_CASE("stop during the start notification leaves no route behind") {
    auto dir = mkd("sm_notify_race");
    auto agent = write_script(dir, "agent.sh", "exec sleep 30");
    FakeAgentApi api;
    ServerManager servers(options_for(agent, 7180, 2), api);
    SlowRoutes listener;
    servers.add_listener(&listener);

    auto started = std::async(std::launch::async, [&servers, &dir]() {
        return servers.start_server("item-1", dir.string());
    });
    while (!listener.entered) {
        std::this_thread::sleep_for(1ms);
    }
    servers.stop_server("item-1");
    auto server = started.get();

    REQUIRE(server->status() == ServerStatus::STOPPED);
    REQUIRE(servers.get_server_for_entity("item-1") == nullptr);
    REQUIRE(listener.routes.snapshot()->routes.empty());
    servers.remove_listener(&listener);
}
