/**
 * @file TextGenerationService.hpp
 * @brief Interface for the external text-generation backend.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace answerlens::domain {

/**
 * @class BackendError
 * @brief The backend could not be reached or returned a transport-level failure.
 */
class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @struct GenerationOptions
 * @brief Per-call sampling limits.
 */
struct GenerationOptions {
    double temperature = 0.7;
    int maxTokens = 300;
};

/**
 * @class TextGenerationService
 * @brief Abstract interface for services that turn an instruction plus user content into a JSON reply.
 *
 * Implementations must be callable from several threads at once.
 */
class TextGenerationService {
public:
    virtual ~TextGenerationService() = default;

    /**
     * @brief Generates a JSON-only response using a system prompt and a user prompt.
     * @param systemPrompt System-level instructions (must enforce JSON-only output).
     * @param userPrompt User content.
     * @param options Sampling limits for this call.
     * @return The raw reply text.
     * @throws BackendError when the service cannot produce a reply.
     */
    virtual std::string generateJson(const std::string& systemPrompt,
                                     const std::string& userPrompt,
                                     const GenerationOptions& options) = 0;

    /** @brief Gets the name of the model requests are sent to. */
    virtual std::string getCurrentModel() const = 0;
};

} // namespace answerlens::domain
