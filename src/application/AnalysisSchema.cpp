/**
 * @file AnalysisSchema.cpp
 * @brief Implementation of AnalysisSchema.
 */

#include "application/AnalysisSchema.hpp"

#include <sstream>

namespace answerlens::application {

using json = nlohmann::json;

namespace {

std::optional<std::string> RequireNonEmptyString(const json& body, const char* key,
                                                 std::vector<FieldError>& outErrors) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        outErrors.push_back({key, "field required"});
        return std::nullopt;
    }
    if (!it->is_string()) {
        outErrors.push_back({key, "must be a string"});
        return std::nullopt;
    }
    std::string value = it->get<std::string>();
    if (value.empty()) {
        outErrors.push_back({key, "must contain at least 1 character"});
        return std::nullopt;
    }
    return value;
}

} // namespace

std::optional<domain::AnalysisInput> AnalysisSchema::ParseRequest(const json& body,
                                                                  std::vector<FieldError>& outErrors) {
    if (!body.is_object()) {
        outErrors.push_back({"body", "must be a JSON object"});
        return std::nullopt;
    }

    auto userId = RequireNonEmptyString(body, "user_id", outErrors);
    auto question = RequireNonEmptyString(body, "question", outErrors);
    auto answer = RequireNonEmptyString(body, "answer", outErrors);
    if (!userId || !question || !answer) {
        return std::nullopt;
    }
    return domain::AnalysisInput(*userId, *question, *answer);
}

std::vector<FieldError> AnalysisSchema::ValidateResult(const domain::AnalysisResult& result) {
    std::vector<FieldError> errors;

    const size_t keywords = result.insight.keywords.size();
    if (keywords < domain::kMinKeywords || keywords > domain::kMaxKeywords) {
        errors.push_back({"insight.keywords", "expected 2-5 items, got " + std::to_string(keywords)});
    }

    const size_t traits = result.traits.size();
    if (traits < domain::kMinTraits || traits > domain::kMaxTraits) {
        errors.push_back({"traits", "expected 2-5 items, got " + std::to_string(traits)});
    }

    for (size_t i = 0; i < result.traits.size(); ++i) {
        const double score = result.traits[i].score;
        if (score < domain::kMinTraitScore || score > domain::kMaxTraitScore) {
            errors.push_back({"traits." + std::to_string(i) + ".score", "must be within [-1.0, 1.0]"});
        }
    }
    return errors;
}

json AnalysisSchema::ToJson(const domain::AnalysisResult& result) {
    json traits = json::array();
    for (const auto& trait : result.traits) {
        traits.push_back({
            {"name", trait.name},
            {"score", trait.score},
            {"reason", trait.reason}
        });
    }

    return {
        {"user_id", result.subjectId},
        {"insight", {
            {"summary", result.insight.summary},
            {"keywords", result.insight.keywords}
        }},
        {"traits", traits}
    };
}

json AnalysisSchema::ErrorsToJson(const std::vector<FieldError>& errors) {
    json out = json::array();
    for (const auto& error : errors) {
        out.push_back({
            {"loc", json::array({"body", error.field})},
            {"msg", error.message}
        });
    }
    return out;
}

std::string AnalysisSchema::Describe(const std::vector<FieldError>& errors) {
    std::ostringstream oss;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) oss << "; ";
        oss << errors[i].field << ": " << errors[i].message;
    }
    return oss.str();
}

} // namespace answerlens::application
