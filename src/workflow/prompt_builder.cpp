#include "workflow/prompt_builder.hpp"
#include <sstream>

namespace agentpool::workflow {

std::string build_initial_prompt(const WorkItem& item, const std::string& default_base_branch) {
    const std::string& branch = item.branch();
    const std::string& base = item.parents.empty() ? default_base_branch : item.parents.front();

    std::ostringstream prompt;
    prompt << "Please implement the following change:\n\n"
           << "**Title:** " << item.title << "\n"
           << "**Item ID:** " << item.id << "\n"
           << "**Branch:** " << branch;

    if (!item.description.empty()) {
        prompt << "\n\n**Description:**\n" << item.description;
    }
    if (!item.instructions.empty()) {
        prompt << "\n\n**Instructions:**\n" << item.instructions;
    }

    prompt << "\n\n## Workflow Instructions\n\n"
           << "1. Implement the change described above\n"
           << "2. Write tests for your implementation where appropriate\n"
           << "3. Commit your changes to the current branch (" << branch << ")\n"
           << "4. When complete, create a pull request using the following command:\n"
           << "   ```\n"
           << "   gh pr create --base " << base << " --title \"" << item.title
           << "\" --body \"Implements " << item.id << "\"\n"
           << "   ```\n\n"
           << "**Important:** After creating the PR, signal completion so the system can verify and track the PR.\n";

    return prompt.str();
}

} // namespace agentpool::workflow
