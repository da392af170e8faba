#pragma once
#include <optional>
#include <string>
#include <vector>

namespace agentpool::runtime {

// Finds the agent executable. Absolute or relative paths are used as given;
// bare names are searched on PATH, then in the usual per-user install
// locations (npm, nvm, bun, yarn, volta, asdf, homebrew).
class ExecutableResolver {
public:
    explicit ExecutableResolver(std::string home = home_directory());

    std::optional<std::string> resolve(const std::string& name) const;

    std::vector<std::string> search_directories() const;

private:
    std::string home_;

    static std::string home_directory();
    std::vector<std::string> nvm_bin_directories() const;
};

} // namespace agentpool::runtime
