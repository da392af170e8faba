#pragma once
#include <memory>
#include <mutex>
#include <set>
#include <vector>

namespace agentpool::runtime {

// Hands out ports from [base_port, base_port + max_concurrent).
// Writers serialize on a mutex and publish a fresh immutable pool state;
// readers load the current state without locking.
class PortAllocator {
public:
    PortAllocator(int base_port, int max_concurrent);

    PortAllocator(const PortAllocator&) = delete;
    PortAllocator& operator=(const PortAllocator&) = delete;

    // Released ports are reused first, then the next unused port from the base.
    // Throws CapacityExceeded once max_concurrent ports are outstanding.
    int allocate_port();

    // Unconditional return to the pool
    void release_port(int port);

    int base_port() const { return base_port_; }
    int max_concurrent() const { return max_concurrent_; }

    size_t outstanding() const;
    bool is_allocated(int port) const;
    std::vector<int> allocated_ports() const;

private:
    struct PoolState {
        int next_offset = 0;        // ports [base, base+next_offset) have been handed out at least once
        std::vector<int> released;  // available for reuse
        std::set<int> allocated;
    };

    int base_port_;
    int max_concurrent_;
    std::mutex write_mutex_;
    std::shared_ptr<const PoolState> state_;

    std::shared_ptr<const PoolState> load() const;
    void publish(std::shared_ptr<const PoolState> next);
};

} // namespace agentpool::runtime
