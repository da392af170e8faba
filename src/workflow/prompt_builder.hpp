#pragma once
#include <string>
#include "workflow/collaborators.hpp"

namespace agentpool::workflow {

// Task prompt sent to a freshly started agent. Ends with the exact
// `gh pr create` invocation the completion monitor watches for.
std::string build_initial_prompt(const WorkItem& item, const std::string& default_base_branch = "main");

} // namespace agentpool::workflow
