#include "infrastructure/PromptCatalog.hpp"

namespace answerlens::infrastructure {

std::string PromptCatalog::GetSystemPrompt(domain::TaskRole role) {
    switch (role) {
    case domain::TaskRole::Insight:
        return
            "You are an InsightAgent for a dating app's onboarding system.\n\n"
            "Your job is to analyze a user's response to an onboarding question and produce:\n"
            "1. A SHORT, FRIENDLY natural-language summary (1-2 sentences max)\n"
            "2. 2-5 key phrases that capture the essence of their response\n\n"
            "Be warm and empathetic. Focus on what the user truly wants.\n\n"
            "You MUST respond with valid JSON in this exact format:\n"
            "{\n"
            "  \"summary\": \"A brief, friendly summary of what the user is looking for\",\n"
            "  \"keywords\": [\"keyword1\", \"keyword2\", \"keyword3\"]\n"
            "}\n\n"
            "Only output the JSON, nothing else.";

    case domain::TaskRole::Traits:
        return
            "You are a TraitAgent for a dating app's onboarding system.\n\n"
            "Your job is to analyze a user's response and score 2-5 personality/dating traits.\n"
            "Each trait should have:\n"
            "- A snake_case name (e.g., relationship_goal_readiness, social_energy, openness_to_commitment)\n"
            "- A numeric score from -1.0 to 1.0 where:\n"
            "  - -1.0 = strongly negative/low\n"
            "  - 0.0 = neutral/ambiguous\n"
            "  - 1.0 = strongly positive/high\n"
            "- A one-sentence reasoning explaining the score\n\n"
            "Consider traits relevant to dating like:\n"
            "- relationship_goal_readiness: How clear and ready are they for their stated goals?\n"
            "- openness_to_commitment: How willing are they to commit?\n"
            "- social_energy: Introvert (-1) to extrovert (1)\n"
            "- emotional_availability: How emotionally open do they seem?\n"
            "- self_awareness: How self-aware do they appear about their needs?\n\n"
            "Pick the traits that are MOST RELEVANT to what the user said.\n\n"
            "You MUST respond with valid JSON in this exact format:\n"
            "{\n"
            "  \"traits\": [\n"
            "    {\"name\": \"trait_name\", \"score\": 0.8, \"reason\": \"One sentence explanation\"},\n"
            "    {\"name\": \"another_trait\", \"score\": 0.5, \"reason\": \"One sentence explanation\"}\n"
            "  ]\n"
            "}\n\n"
            "Only output the JSON, nothing else.";
    }
    return "";
}

std::string PromptCatalog::BuildUserMessage(domain::TaskRole role, const domain::AnalysisInput& input) {
    std::string message =
        "Onboarding Question: " + input.getPromptText() + "\n\n" +
        "User's Response: " + input.getResponseText() + "\n\n";

    switch (role) {
    case domain::TaskRole::Insight:
        message += "Analyze this response and provide a summary with keywords.";
        break;
    case domain::TaskRole::Traits:
        message += "Analyze this response and score relevant personality/dating traits.";
        break;
    }
    return message;
}

} // namespace answerlens::infrastructure
