/**
 * @file AnalysisModel.hpp
 * @brief Payload shapes produced by the analysis tasks and the merged result.
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace answerlens::domain {

constexpr std::size_t kMinKeywords = 2;
constexpr std::size_t kMaxKeywords = 5;
constexpr std::size_t kMinTraits = 2;
constexpr std::size_t kMaxTraits = 5;
constexpr double kMinTraitScore = -1.0;
constexpr double kMaxTraitScore = 1.0;

/**
 * @struct InsightPayload
 * @brief Friendly summary plus the key phrases of an answer.
 */
struct InsightPayload {
    std::string summary;
    std::vector<std::string> keywords; ///< Never more than kMaxKeywords.
};

/**
 * @struct Trait
 * @brief A single scored personality/dating trait.
 */
struct Trait {
    std::string name;   ///< snake_case, e.g. "openness_to_commitment".
    double score = 0.0; ///< Always within [kMinTraitScore, kMaxTraitScore].
    std::string reason; ///< One-sentence justification.
};

struct TraitPayload {
    std::vector<Trait> traits; ///< Never more than kMaxTraits.
};

/**
 * @struct AnalysisResult
 * @brief Merged output, only ever built when every task succeeded.
 */
struct AnalysisResult {
    std::string subjectId;
    InsightPayload insight;
    std::vector<Trait> traits;
};

} // namespace answerlens::domain
