#include <catch2/catch_all.hpp>
#include "agent/http_agent_client.hpp"
#include "core/cancellation.hpp"
#include "loopback_server.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace agentpool;
using namespace agentpool::agent;
using namespace std::chrono_literals;
using agentpool::testing::LoopbackServer;
using agentpool::testing::sse_event;

namespace {

// Sleeps in small steps until duration passes or the server is closing
void hold(LoopbackServer& agent, std::chrono::milliseconds duration) {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!agent.closing && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
    }
}

} // namespace

TEST_CASE("cancelling the token aborts a silent event read") {
    LoopbackServer agent;
    agent.server.Get("/event", [&agent](const httplib::Request&, httplib::Response& res) {
        res.set_chunked_content_provider("text/event-stream",
            [&agent](size_t, httplib::DataSink& sink) {
                std::string frame = sse_event(event_types::SERVER_CONNECTED);
                sink.write(frame.data(), frame.size());
                hold(agent, 30s);
                sink.done();
                return true;
            });
    });
    agent.start();

    HttpAgentClient client;
    core::CancellationSource cancel;
    auto events = client.subscribe_events(agent.url(), cancel.token());

    auto first = events->next();
    REQUIRE(first.has_value());
    REQUIRE(first->type == event_types::SERVER_CONNECTED);

    std::thread canceller([&cancel]() {
        std::this_thread::sleep_for(100ms);
        cancel.cancel();
    });

    auto begin = std::chrono::steady_clock::now();
    auto second = events->next();
    auto waited = std::chrono::steady_clock::now() - begin;
    canceller.join();

    REQUIRE_FALSE(second.has_value());
    REQUIRE(waited < 5s);

    events.reset();
    agent.stop();
}

TEST_CASE("stream closed by the agent ends after its last event") {
    LoopbackServer agent;
    agent.server.Get("/event", [](const httplib::Request&, httplib::Response& res) {
        res.set_chunked_content_provider("text/event-stream",
            [](size_t, httplib::DataSink& sink) {
                std::string frame = sse_event(event_types::SESSION_IDLE);
                sink.write(frame.data(), frame.size());
                sink.done();
                return true;
            });
    });
    agent.start();

    HttpAgentClient client;
    core::CancellationSource cancel;
    auto events = client.subscribe_events(agent.url(), cancel.token());

    auto only = events->next();
    REQUIRE(only.has_value());
    REQUIRE(only->type == event_types::SESSION_IDLE);
    REQUIRE_FALSE(events->next().has_value());
}

TEST_CASE("a silent stream is reopened rather than reported as ended") {
    std::atomic<int> connections{0};
    LoopbackServer agent;
    agent.server.Get("/event", [&agent, &connections](const httplib::Request&, httplib::Response& res) {
        int connection = ++connections;
        res.set_chunked_content_provider("text/event-stream",
            [&agent, connection](size_t, httplib::DataSink& sink) {
                std::string frame = sse_event(connection == 1 ? event_types::SERVER_CONNECTED
                                                              : event_types::SESSION_IDLE);
                sink.write(frame.data(), frame.size());
                // Longer than the client's idle timeout on the first connection
                hold(agent, connection == 1 ? 2500ms : 30s);
                sink.done();
                return true;
            });
    });
    agent.start();

    HttpClientTimeouts timeouts;
    timeouts.event_idle_seconds = 1;
    HttpAgentClient client(timeouts);
    core::CancellationSource cancel;
    auto events = client.subscribe_events(agent.url(), cancel.token());

    auto first = events->next();
    REQUIRE(first.has_value());
    REQUIRE(first->type == event_types::SERVER_CONNECTED);

    auto second = events->next();
    REQUIRE(second.has_value());
    REQUIRE(second->type == event_types::SESSION_IDLE);
    REQUIRE(connections == 2);

    cancel.cancel();
    events.reset();
    agent.stop();
}
