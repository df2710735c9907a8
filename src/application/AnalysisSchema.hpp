/**
 * @file AnalysisSchema.hpp
 * @brief Request/response validation and JSON mapping for the transport layer.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/AnalysisInput.hpp"
#include "domain/AnalysisModel.hpp"

namespace answerlens::application {

/**
 * @struct FieldError
 * @brief One schema violation, e.g. {"user_id", "field required"}.
 */
struct FieldError {
    std::string field;   ///< Dotted path, e.g. "insight.keywords".
    std::string message;
};

class AnalysisSchema {
public:
    /**
     * @brief Builds an AnalysisInput from {"user_id", "question", "answer"}.
     *
     * Each field must be a non-empty string; unknown fields are ignored.
     * @param body Parsed request body.
     * @param outErrors Receives every violation found.
     * @return The input, or nullopt if outErrors is non-empty.
     */
    static std::optional<domain::AnalysisInput> ParseRequest(const nlohmann::json& body,
                                                             std::vector<FieldError>& outErrors);

    /**
     * @brief Checks the bounds the core passes through unchecked:
     * 2-5 keywords, 2-5 traits, scores within [-1, 1].
     * @return Every violation; empty means the result may be emitted.
     */
    static std::vector<FieldError> ValidateResult(const domain::AnalysisResult& result);

    /** @brief {"user_id", "insight": {"summary", "keywords"}, "traits": [{"name", "score", "reason"}]} */
    static nlohmann::json ToJson(const domain::AnalysisResult& result);

    /** @brief [{"loc": ["body", field], "msg": message}, ...] */
    static nlohmann::json ErrorsToJson(const std::vector<FieldError>& errors);

    /** @brief "field: message; field: message" */
    static std::string Describe(const std::vector<FieldError>& errors);
};

} // namespace answerlens::application
