#include "infrastructure/ChatCompletionClient.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace answerlens::infrastructure {

using json = nlohmann::json;

namespace {
constexpr size_t kMaxErrorBodyChars = 300;

std::string Abbreviate(const std::string& body) {
    if (body.size() <= kMaxErrorBodyChars) return body;
    return body.substr(0, kMaxErrorBodyChars) + "...";
}
}

ChatCompletionClient::ChatCompletionClient(BackendSettings settings)
    : m_settings(std::move(settings)) {}

std::string ChatCompletionClient::generateJson(const std::string& systemPrompt,
                                               const std::string& userPrompt,
                                               const domain::GenerationOptions& options) {
    httplib::Client cli(m_settings.baseUrl);
    if (!cli.is_valid()) {
        throw domain::BackendError("unsupported backend URL: " + m_settings.baseUrl);
    }
    cli.set_read_timeout(m_settings.readTimeoutSeconds);

    json messages = json::array({
        {{"role", "system"}, {"content", systemPrompt}},
        {{"role", "user"}, {"content", userPrompt}}
    });

    std::string path;
    json requestData;
    httplib::Headers headers;
    if (m_settings.api == BackendSettings::Api::Ollama) {
        path = "/api/chat";
        requestData = {
            {"model", m_settings.model},
            {"messages", messages},
            {"stream", false},
            {"format", "json"},
            {"options", {
                {"temperature", options.temperature},
                {"num_predict", options.maxTokens}
            }}
        };
    } else {
        path = "/v1/chat/completions";
        requestData = {
            {"model", m_settings.model},
            {"messages", messages},
            {"temperature", options.temperature},
            {"max_tokens", options.maxTokens},
            {"response_format", {{"type", "json_object"}}}
        };
        headers.emplace("Authorization", "Bearer " + m_settings.apiKey);
    }

    if (m_settings.debug) {
        std::cout << "[ChatCompletionClient] Sending request to " << m_settings.model
                  << " PromptSize=" << (systemPrompt.size() + userPrompt.size()) << " bytes" << std::endl;
    }

    auto res = cli.Post(path.c_str(), headers, requestData.dump(), "application/json");
    if (!res) {
        throw domain::BackendError("connection to " + m_settings.baseUrl + " failed (error code " +
                                   std::to_string(static_cast<int>(res.error())) + ")");
    }
    if (res->status != 200) {
        throw domain::BackendError("HTTP " + std::to_string(res->status) + " from " + path + ": " +
                                   Abbreviate(res->body));
    }

    if (m_settings.debug) {
        std::cout << "[ChatCompletionClient] Response received (" << res->body.size() << " bytes)" << std::endl;
    }

    json body;
    try {
        body = json::parse(res->body);
    } catch (const json::parse_error& e) {
        throw domain::BackendError(std::string("malformed response envelope: ") + e.what());
    }

    // Ollama: { "message": { "content": "..." } }
    // OpenAI: { "choices": [ { "message": { "content": "..." } } ] }
    const json* message = nullptr;
    if (m_settings.api == BackendSettings::Api::Ollama) {
        if (body.contains("message")) message = &body["message"];
    } else if (body.contains("choices") && body["choices"].is_array() && !body["choices"].empty()) {
        const json& choice = body["choices"][0];
        if (choice.contains("message")) message = &choice["message"];
    }
    if (!message || !message->is_object() || !message->contains("content") || !(*message)["content"].is_string()) {
        throw domain::BackendError("response envelope has no message content: " + Abbreviate(res->body));
    }
    return (*message)["content"].get<std::string>();
}

} // namespace answerlens::infrastructure
