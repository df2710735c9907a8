/**
 * @file AnalysisInput.hpp
 * @brief Immutable question/answer record shared by all analysis tasks.
 */

#pragma once
#include <string>
#include <utility>

namespace answerlens::domain {

/**
 * @class AnalysisInput
 * @brief One onboarding question and the subject's free-text answer.
 *
 * Built once per request and handed to every task by const reference.
 * There are no setters; tasks can only read it.
 */
class AnalysisInput {
public:
    AnalysisInput(std::string subjectId, std::string promptText, std::string responseText)
        : m_subjectId(std::move(subjectId)),
          m_promptText(std::move(promptText)),
          m_responseText(std::move(responseText)) {}

    /** @brief Caller-provided identifier, echoed verbatim into the result. */
    const std::string& getSubjectId() const { return m_subjectId; }

    /** @brief The question that was asked. */
    const std::string& getPromptText() const { return m_promptText; }

    /** @brief The subject's answer. */
    const std::string& getResponseText() const { return m_responseText; }

private:
    std::string m_subjectId;
    std::string m_promptText;
    std::string m_responseText;
};

} // namespace answerlens::domain
