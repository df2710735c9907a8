/**
 * @file TraitTask.hpp
 * @brief Task scoring personality/dating traits of an answer.
 */

#pragma once

#include <memory>
#include <string>
#include "domain/AnalysisTask.hpp"
#include "domain/TextGenerationService.hpp"

namespace answerlens::application {

/**
 * @class TraitTask
 * @brief "TraitAgent": asks the backend for 2-5 scored traits with one-sentence reasons.
 */
class TraitTask : public domain::AnalysisTask {
public:
    /** @brief Name given to traits the backend returned without one. */
    static constexpr const char* kUnknownTraitName = "unknown_trait";

    TraitTask(std::shared_ptr<domain::TextGenerationService> backend,
              domain::GenerationOptions options);

    std::string name() const override { return "TraitAgent"; }
    domain::TaskRole role() const override { return domain::TaskRole::Traits; }

    domain::TaskOutcome run(const domain::AnalysisInput& input) const override;

    /**
     * @brief Parses {"traits": [{"name", "score", "reason"}, ...]} into a TraitPayload.
     *
     * Keeps the first five entries, clamps scores into [-1, 1], and fills a
     * missing name with kUnknownTraitName, a missing reason with "" and a
     * missing score with 0.
     * @throws domain::ReplyShapeError on malformed replies.
     */
    static domain::TraitPayload ParseReply(const std::string& reply);

private:
    std::shared_ptr<domain::TextGenerationService> m_backend;
    domain::GenerationOptions m_options;
};

} // namespace answerlens::application
