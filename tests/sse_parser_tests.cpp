#include <catch2/catch_all.hpp>
#include "agent/sse_parser.hpp"
#include <string>
#include <vector>

using namespace agentpool::agent;

TEST_CASE("events split across chunks are reassembled") {
    std::vector<AgentEvent> events;
    SseParser parser([&events](AgentEvent ev) { events.push_back(std::move(ev)); });

    parser.feed("data: {\"type\":\"server.conn");
    parser.feed("ected\",\"properties\":{}}\n");
    REQUIRE(events.empty());
    parser.feed("\n");

    REQUIRE(events.size() == 1);
    REQUIRE(events[0].type == "server.connected");
}

TEST_CASE("multiple data lines are joined with newlines") {
    std::vector<AgentEvent> events;
    SseParser parser([&events](AgentEvent ev) { events.push_back(std::move(ev)); });

    parser.feed("event: message\r\n");
    parser.feed("data: {\"type\": \"tool.complete\",\r\n");
    parser.feed("data: \"properties\": {\"toolName\": \"bash\", \"content\": \"ok\"}}\r\n\r\n");

    REQUIRE(events.size() == 1);
    REQUIRE(events[0].type == "tool.complete");
    REQUIRE(events[0].tool_name() == std::optional<std::string>("bash"));
    REQUIRE(events[0].content() == std::optional<std::string>("ok"));
}

TEST_CASE("malformed payloads are skipped") {
    std::vector<AgentEvent> events;
    SseParser parser([&events](AgentEvent ev) { events.push_back(std::move(ev)); });

    parser.feed("data: not json\n\n");
    parser.feed("data: [1,2,3]\n\n");
    parser.feed(": keep-alive comment\n\n");
    parser.feed("data: {\"type\":\"session.idle\",\"properties\":{\"sessionID\":\"ses_1\"}}\n\n");

    REQUIRE(parser.skipped() == 2);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].session_id() == std::optional<std::string>("ses_1"));
}

TEST_CASE("finish dispatches a trailing event without blank line") {
    std::vector<AgentEvent> events;
    SseParser parser([&events](AgentEvent ev) { events.push_back(std::move(ev)); });

    parser.feed("data: {\"type\":\"session.updated\"}");
    REQUIRE(events.empty());
    parser.finish();

    REQUIRE(events.size() == 1);
    REQUIRE(events[0].type == "session.updated");
    REQUIRE(events[0].properties.is_object());
}
