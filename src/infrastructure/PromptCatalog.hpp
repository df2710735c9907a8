/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the analysis tasks' backend instructions.
 */

#pragma once

#include <string>
#include "domain/AnalysisInput.hpp"
#include "domain/TaskOutcome.hpp"

namespace answerlens::infrastructure {

class PromptCatalog {
public:
    /** @brief Returns the system instruction for the task filling a role. */
    static std::string GetSystemPrompt(domain::TaskRole role);

    /** @brief Renders the question/answer pair as the user message for a role. */
    static std::string BuildUserMessage(domain::TaskRole role, const domain::AnalysisInput& input);
};

} // namespace answerlens::infrastructure
