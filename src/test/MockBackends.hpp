// Backends used by the test executables in place of the HTTP client.
#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include "domain/TextGenerationService.hpp"

namespace answerlens::test {

// Answers each task with a fixed reply, picked by the task named in the system prompt.
class ScriptedBackend : public domain::TextGenerationService {
public:
    ScriptedBackend(std::string insightReply, std::string traitReply,
                    std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : m_insightReply(std::move(insightReply)), m_traitReply(std::move(traitReply)), m_delay(delay) {}

    std::string generateJson(const std::string& systemPrompt, const std::string&,
                             const domain::GenerationOptions&) override {
        ++calls;
        if (m_delay.count() > 0) std::this_thread::sleep_for(m_delay);
        if (systemPrompt.find("InsightAgent") != std::string::npos) return m_insightReply;
        if (systemPrompt.find("TraitAgent") != std::string::npos) return m_traitReply;
        throw domain::BackendError("unexpected system prompt");
    }

    std::string getCurrentModel() const override { return "scripted"; }

    std::atomic<int> calls{0};

private:
    std::string m_insightReply;
    std::string m_traitReply;
    std::chrono::milliseconds m_delay;
};

// Every call fails like an unreachable server.
class FailingBackend : public domain::TextGenerationService {
public:
    std::string generateJson(const std::string&, const std::string&, const domain::GenerationOptions&) override {
        ++calls;
        throw domain::BackendError("connection refused");
    }

    std::string getCurrentModel() const override { return "offline"; }

    std::atomic<int> calls{0};
};

inline const char* kScenarioInsightReply =
    R"({"summary":"Wants commitment","keywords":["serious","relationship"]})";

inline const char* kScenarioTraitReply =
    R"({"traits":[{"name":"relationship_goal_readiness","score":0.9,"reason":"States a clear goal"},)"
    R"({"name":"openness_to_commitment","score":0.8,"reason":"Uses the word serious"}]})";

} // namespace answerlens::test
