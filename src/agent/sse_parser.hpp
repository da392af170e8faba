#pragma once
#include <functional>
#include <string>
#include <vector>
#include "agent/types.hpp"

namespace agentpool::agent {

// Incremental text/event-stream decoder. Lines accumulate until a blank
// line; "data:" lines form the payload, everything else is ignored.
// Payloads that are not a JSON event object are logged and skipped.
class SseParser {
public:
    using EventHandler = std::function<void(AgentEvent)>;

    explicit SseParser(EventHandler on_event) : on_event_(std::move(on_event)) {}

    // Feed raw bytes as they arrive; chunk boundaries may split lines
    void feed(const char* data, size_t size);
    void feed(const std::string& chunk) { feed(chunk.data(), chunk.size()); }

    // Dispatch any event left pending when the stream closes
    void finish();

    size_t skipped() const { return skipped_; }

private:
    EventHandler on_event_;
    std::string buffer_;
    std::vector<std::string> data_lines_;
    size_t skipped_ = 0;

    void process_line(std::string line);
    void dispatch();
};

} // namespace agentpool::agent
