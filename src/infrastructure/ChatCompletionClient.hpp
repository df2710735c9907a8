/**
 * @file ChatCompletionClient.hpp
 * @brief HTTP client for chat-completion backends (Ollama or OpenAI-compatible).
 */

#pragma once

#include <string>
#include "domain/TextGenerationService.hpp"

namespace answerlens::infrastructure {

/**
 * @struct BackendSettings
 * @brief Where and how to reach the text-generation service.
 */
struct BackendSettings {
    enum class Api { Ollama, OpenAI };

    Api api = Api::Ollama;
    std::string baseUrl = "http://localhost:11434"; ///< scheme://host[:port], no trailing path.
    std::string apiKey;                             ///< Sent as a Bearer token for Api::OpenAI.
    std::string model = "qwen2.5:7b";
    int readTimeoutSeconds = 600;
    bool debug = false;
};

/**
 * @class ChatCompletionClient
 * @brief Implements TextGenerationService on top of a chat endpoint in JSON mode.
 *
 * - Api::Ollama posts to /api/chat with format "json".
 * - Api::OpenAI posts to /v1/chat/completions with response_format json_object.
 *
 * Every call opens its own connection, so concurrent calls share nothing.
 */
class ChatCompletionClient : public domain::TextGenerationService {
public:
    explicit ChatCompletionClient(BackendSettings settings);

    /** @see domain::TextGenerationService::generateJson */
    std::string generateJson(const std::string& systemPrompt,
                             const std::string& userPrompt,
                             const domain::GenerationOptions& options) override;

    std::string getCurrentModel() const override { return m_settings.model; }

private:
    BackendSettings m_settings;
};

} // namespace answerlens::infrastructure
