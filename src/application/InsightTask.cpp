/**
 * @file InsightTask.cpp
 * @brief Implementation of InsightTask.
 */

#include "application/InsightTask.hpp"
#include "application/ReplyParsing.hpp"
#include "domain/AnalysisErrors.hpp"
#include "infrastructure/PromptCatalog.hpp"

#include <iostream>
#include <stdexcept>

namespace answerlens::application {

using json = nlohmann::json;

InsightTask::InsightTask(std::shared_ptr<domain::TextGenerationService> backend,
                         domain::GenerationOptions options)
    : m_backend(std::move(backend)), m_options(options) {
    if (!m_backend) {
        throw std::invalid_argument("InsightTask: backend must not be null.");
    }
}

domain::TaskOutcome InsightTask::run(const domain::AnalysisInput& input) const {
    try {
        const std::string systemPrompt = infrastructure::PromptCatalog::GetSystemPrompt(role());
        const std::string userPrompt = infrastructure::PromptCatalog::BuildUserMessage(role(), input);

        std::string reply = m_backend->generateJson(systemPrompt, userPrompt, m_options);
        return domain::TaskOutcome::Success(name(), ParseReply(reply));
    } catch (const std::exception& e) {
        std::cerr << "[InsightAgent] " << e.what() << std::endl;
        return domain::TaskOutcome::Failure(name(), name() + " error: " + e.what());
    }
}

domain::InsightPayload InsightTask::ParseReply(const std::string& reply) {
    json parsed = ParseReplyObject(reply);

    domain::InsightPayload payload;
    payload.summary = ReadStringField(parsed, "summary", "");

    auto it = parsed.find("keywords");
    if (it != parsed.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw domain::ReplyShapeError("field 'keywords' must be an array");
        }
        for (const auto& item : *it) {
            if (payload.keywords.size() == domain::kMaxKeywords) break;
            if (!item.is_string()) {
                throw domain::ReplyShapeError("every keyword must be a string");
            }
            payload.keywords.push_back(item.get<std::string>());
        }
    }
    return payload;
}

} // namespace answerlens::application
