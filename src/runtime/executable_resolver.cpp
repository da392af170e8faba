#include "runtime/executable_resolver.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace agentpool::runtime {

static bool is_executable_file(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

ExecutableResolver::ExecutableResolver(std::string home)
    : home_(std::move(home)) {}

std::string ExecutableResolver::home_directory() {
    const char* home = std::getenv("HOME");
    return home ? std::string(home) : "";
}

std::vector<std::string> ExecutableResolver::nvm_bin_directories() const {
    std::vector<std::string> dirs;
    if (home_.empty()) {
        return dirs;
    }

    fs::path versions = fs::path(home_) / ".nvm" / "versions" / "node";
    std::error_code ec;
    if (!fs::is_directory(versions, ec)) {
        return dirs;
    }
    for (const auto& entry : fs::directory_iterator(versions, ec)) {
        if (entry.is_directory(ec)) {
            dirs.push_back((entry.path() / "bin").string());
        }
    }
    // Newest version first
    std::sort(dirs.rbegin(), dirs.rend());
    return dirs;
}

std::vector<std::string> ExecutableResolver::search_directories() const {
    std::vector<std::string> dirs;

    if (const char* path = std::getenv("PATH")) {
        std::stringstream ss(path);
        std::string dir;
        while (std::getline(ss, dir, ':')) {
            if (!dir.empty()) {
                dirs.push_back(dir);
            }
        }
    }

    if (!home_.empty()) {
        dirs.push_back(home_ + "/.npm-global/bin");
    }
    dirs.push_back("/usr/local/bin");
    dirs.push_back("/usr/bin");
    if (!home_.empty()) {
        dirs.push_back(home_ + "/.local/bin");
        for (auto& dir : nvm_bin_directories()) {
            dirs.push_back(std::move(dir));
        }
        dirs.push_back(home_ + "/.bun/bin");
        dirs.push_back(home_ + "/.yarn/bin");
    }
    dirs.push_back("/opt/homebrew/bin");
    if (!home_.empty()) {
        dirs.push_back(home_ + "/.volta/bin");
        dirs.push_back(home_ + "/.asdf/shims");
    }
    return dirs;
}

std::optional<std::string> ExecutableResolver::resolve(const std::string& name) const {
    if (name.empty()) {
        return std::nullopt;
    }

    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name)) {
            return name;
        }
        return std::nullopt;
    }

    for (const auto& dir : search_directories()) {
        fs::path candidate = fs::path(dir) / name;
        if (is_executable_file(candidate)) {
            spdlog::debug("Resolved {} to {}", name, candidate.string());
            return candidate.string();
        }
    }
    return std::nullopt;
}

} // namespace agentpool::runtime
