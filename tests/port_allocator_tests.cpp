#include <catch2/catch_all.hpp>
#include "core/errors.hpp"
#include "runtime/port_allocator.hpp"
#include <algorithm>
#include <set>
#include <thread>
#include <vector>

using namespace agentpool::runtime;

TEST_CASE("ports are handed out from the base upward") {
    PortAllocator ports(4096, 3);
    REQUIRE(ports.allocate_port() == 4096);
    REQUIRE(ports.allocate_port() == 4097);
    REQUIRE(ports.allocate_port() == 4098);
    REQUIRE(ports.outstanding() == 3);
}

TEST_CASE("allocation beyond capacity throws") {
    PortAllocator ports(5000, 1);
    REQUIRE(ports.allocate_port() == 5000);
    REQUIRE_THROWS_AS(ports.allocate_port(), agentpool::CapacityExceeded);
    REQUIRE(ports.outstanding() == 1);
}

TEST_CASE("released ports are reused before fresh ones") {
    PortAllocator ports(4096, 3);
    int a = ports.allocate_port();
    int b = ports.allocate_port();
    ports.release_port(a);

    REQUIRE_FALSE(ports.is_allocated(a));
    REQUIRE(ports.allocate_port() == a);
    REQUIRE(ports.is_allocated(b));
    REQUIRE(ports.allocate_port() == 4098);
}

TEST_CASE("release frees capacity") {
    PortAllocator ports(5000, 1);
    int port = ports.allocate_port();
    ports.release_port(port);
    REQUIRE(ports.allocate_port() == 5000);
}

TEST_CASE("concurrent allocations never share a port") {
    PortAllocator ports(6000, 64);
    std::vector<std::vector<int>> per_thread(8);
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&ports, &per_thread, t]() {
            for (int i = 0; i < 8; ++i) {
                per_thread[t].push_back(ports.allocate_port());
            }
        });
    }
    for (auto& th : threads) th.join();

    std::set<int> seen;
    for (const auto& list : per_thread) {
        for (int p : list) {
            REQUIRE(p >= 6000);
            REQUIRE(p < 6064);
            seen.insert(p);
        }
    }
    REQUIRE(seen.size() == 64);
    REQUIRE_THROWS_AS(ports.allocate_port(), agentpool::CapacityExceeded);
}
