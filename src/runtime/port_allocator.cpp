#include "runtime/port_allocator.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <string>

namespace agentpool::runtime {

PortAllocator::PortAllocator(int base_port, int max_concurrent)
    : base_port_(base_port)
    , max_concurrent_(max_concurrent)
    , state_(std::make_shared<const PoolState>()) {
    spdlog::debug("Port allocator: [{}, {})", base_port_, base_port_ + max_concurrent_);
}

std::shared_ptr<const PortAllocator::PoolState> PortAllocator::load() const {
    return std::atomic_load(&state_);
}

void PortAllocator::publish(std::shared_ptr<const PoolState> next) {
    std::atomic_store(&state_, std::move(next));
}

int PortAllocator::allocate_port() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto current = load();

    if (static_cast<int>(current->allocated.size()) >= max_concurrent_) {
        throw CapacityExceeded("Maximum concurrent agent servers (" +
            std::to_string(max_concurrent_) + ") reached");
    }

    auto next = std::make_shared<PoolState>(*current);
    int port;
    if (!next->released.empty()) {
        port = next->released.back();
        next->released.pop_back();
    } else {
        port = base_port_ + next->next_offset;
        next->next_offset++;
    }
    next->allocated.insert(port);
    publish(std::move(next));

    spdlog::debug("Allocated port {}", port);
    return port;
}

void PortAllocator::release_port(int port) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto next = std::make_shared<PoolState>(*load());
    next->allocated.erase(port);
    next->released.push_back(port);
    publish(std::move(next));

    spdlog::debug("Released port {}", port);
}

size_t PortAllocator::outstanding() const {
    return load()->allocated.size();
}

bool PortAllocator::is_allocated(int port) const {
    return load()->allocated.count(port) > 0;
}

std::vector<int> PortAllocator::allocated_ports() const {
    auto state = load();
    return std::vector<int>(state->allocated.begin(), state->allocated.end());
}

} // namespace agentpool::runtime
