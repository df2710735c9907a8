/**
 * @file InsightTask.hpp
 * @brief Task producing a friendly summary and keywords for an answer.
 */

#pragma once

#include <memory>
#include <string>
#include "domain/AnalysisTask.hpp"
#include "domain/TextGenerationService.hpp"

namespace answerlens::application {

/**
 * @class InsightTask
 * @brief "InsightAgent": asks the backend for a summary plus 2-5 keywords.
 */
class InsightTask : public domain::AnalysisTask {
public:
    InsightTask(std::shared_ptr<domain::TextGenerationService> backend,
                domain::GenerationOptions options);

    std::string name() const override { return "InsightAgent"; }
    domain::TaskRole role() const override { return domain::TaskRole::Insight; }

    /** @brief Calls the backend and parses its reply. Failures become TaskOutcome::Failure. */
    domain::TaskOutcome run(const domain::AnalysisInput& input) const override;

    /**
     * @brief Parses {"summary": ..., "keywords": [...]} into an InsightPayload.
     *
     * Missing fields default to empty; keywords past the fifth are dropped.
     * @throws domain::ReplyShapeError on malformed replies.
     */
    static domain::InsightPayload ParseReply(const std::string& reply);

private:
    std::shared_ptr<domain::TextGenerationService> m_backend;
    domain::GenerationOptions m_options;
};

} // namespace answerlens::application
