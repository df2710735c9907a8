/**
 * @file TraitTask.cpp
 * @brief Implementation of TraitTask.
 */

#include "application/TraitTask.hpp"
#include "application/ReplyParsing.hpp"
#include "domain/AnalysisErrors.hpp"
#include "infrastructure/PromptCatalog.hpp"

#include <iostream>
#include <stdexcept>

namespace answerlens::application {

using json = nlohmann::json;

TraitTask::TraitTask(std::shared_ptr<domain::TextGenerationService> backend,
                     domain::GenerationOptions options)
    : m_backend(std::move(backend)), m_options(options) {
    if (!m_backend) {
        throw std::invalid_argument("TraitTask: backend must not be null.");
    }
}

domain::TaskOutcome TraitTask::run(const domain::AnalysisInput& input) const {
    try {
        const std::string systemPrompt = infrastructure::PromptCatalog::GetSystemPrompt(role());
        const std::string userPrompt = infrastructure::PromptCatalog::BuildUserMessage(role(), input);

        std::string reply = m_backend->generateJson(systemPrompt, userPrompt, m_options);
        return domain::TaskOutcome::Success(name(), ParseReply(reply));
    } catch (const std::exception& e) {
        std::cerr << "[TraitAgent] " << e.what() << std::endl;
        return domain::TaskOutcome::Failure(name(), name() + " error: " + e.what());
    }
}

domain::TraitPayload TraitTask::ParseReply(const std::string& reply) {
    json parsed = ParseReplyObject(reply);

    domain::TraitPayload payload;
    auto it = parsed.find("traits");
    if (it == parsed.end() || it->is_null()) {
        return payload;
    }
    if (!it->is_array()) {
        throw domain::ReplyShapeError("field 'traits' must be an array");
    }

    for (const auto& item : *it) {
        if (payload.traits.size() == domain::kMaxTraits) break;
        if (!item.is_object()) {
            throw domain::ReplyShapeError("every trait must be an object");
        }

        domain::Trait trait;
        trait.name = ReadStringField(item, "name", kUnknownTraitName);
        trait.reason = ReadStringField(item, "reason", "");
        auto score = item.find("score");
        trait.score = (score == item.end() || score->is_null()) ? 0.0 : ClampScore(ReadScore(*score));
        payload.traits.push_back(std::move(trait));
    }
    return payload;
}

} // namespace answerlens::application
