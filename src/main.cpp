#include <spdlog/spdlog.h>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include "core/config.hpp"
#include "daemon/daemon.hpp"
#include "util/logger.hpp"

static void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config <file>] [--port <n>] [--log-level <lvl>]\n";
}

int main(int argc, char** argv) {
    std::string config_path;
    std::optional<int> port;
    std::optional<std::string> log_level;

    // Parse command line args
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "--port" || arg == "--log-level") && i + 1 >= argc) {
            print_usage(argv[0]);
            return 2;
        }
        if (arg == "--config") {
            config_path = argv[++i];
        } else if (arg == "--port") {
            try {
                port = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 2;
            }
        } else if (arg == "--log-level") {
            log_level = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    agentpool::util::init_logger();

    agentpool::daemon::Daemon::Config config;
    try {
        if (!config_path.empty()) {
            config = agentpool::core::AgentPoolConfig::load_file(config_path);
        } else {
            config.apply_env_overrides();
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return 1;
    }
    if (port) {
        config.listen_port = *port;
    }
    if (log_level) {
        config.log_level = *log_level;
    }
    agentpool::util::set_log_level(agentpool::util::parse_log_level(config.log_level));

    spdlog::info("=================================");
    spdlog::info("  agentpool daemon v0.1.0");
    spdlog::info("=================================");

    std::unique_ptr<agentpool::daemon::Daemon> daemon;
    try {
        daemon = std::make_unique<agentpool::daemon::Daemon>(config);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create daemon: {}", e.what());
        return 1;
    }

    if (!daemon->init()) {
        spdlog::error("Failed to initialize daemon");
        return 1;
    }

    // Run (blocks until Ctrl+C)
    daemon->run();

    return 0;
}
