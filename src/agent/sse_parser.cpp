#include "agent/sse_parser.hpp"
#include <spdlog/spdlog.h>

namespace agentpool::agent {

void SseParser::feed(const char* data, size_t size) {
    buffer_.append(data, size);

    size_t start = 0;
    size_t newline;
    while ((newline = buffer_.find('\n', start)) != std::string::npos) {
        process_line(buffer_.substr(start, newline - start));
        start = newline + 1;
    }
    buffer_.erase(0, start);
}

void SseParser::finish() {
    if (!buffer_.empty()) {
        process_line(std::move(buffer_));
        buffer_.clear();
    }
    dispatch();
}

void SseParser::process_line(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    if (line.empty()) {
        dispatch();
        return;
    }

    if (line.rfind("data:", 0) == 0) {
        std::string value = line.substr(5);
        if (!value.empty() && value.front() == ' ') {
            value.erase(0, 1);
        }
        data_lines_.push_back(std::move(value));
    }
    // event:, id:, retry: and comments carry nothing we use
}

void SseParser::dispatch() {
    if (data_lines_.empty()) {
        return;
    }

    std::string payload;
    for (size_t i = 0; i < data_lines_.size(); ++i) {
        if (i > 0) payload += '\n';
        payload += data_lines_[i];
    }
    data_lines_.clear();

    AgentEvent event;
    try {
        event = nlohmann::json::parse(payload).get<AgentEvent>();
    } catch (const std::exception& e) {
        ++skipped_;
        spdlog::warn("Skipping malformed event payload: {}", e.what());
        spdlog::debug("Malformed payload: {}", payload);
        return;
    }
    on_event_(std::move(event));
}

} // namespace agentpool::agent
