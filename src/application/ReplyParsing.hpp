/**
 * @file ReplyParsing.hpp
 * @brief Helpers shared by the tasks to turn raw backend replies into typed records.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace answerlens::application {

/**
 * @brief Parses a reply that must hold a single JSON object.
 *
 * A surrounding Markdown code fence (```json ... ```) is removed first.
 * Numbers too large for a double are read as +/-DBL_MAX instead of failing.
 * @throws domain::ReplyShapeError if the text is not JSON or not an object.
 */
nlohmann::json ParseReplyObject(const std::string& reply);

/** @brief Removes a leading/trailing Markdown code fence and surrounding whitespace. */
std::string StripCodeFence(const std::string& text);

/** @brief Clamps a trait score into [-1.0, 1.0]. Idempotent. */
double ClampScore(double score);

/**
 * @brief Reads a score that may be a JSON number or a numeric string.
 *
 * Overflowing values come back as +/-1.0, underflowing ones as 0.0.
 * @throws domain::ReplyShapeError for anything else, including NaN.
 */
double ReadScore(const nlohmann::json& value);

/**
 * @brief Reads an optional string field; a missing or null field yields the fallback.
 * @throws domain::ReplyShapeError if the field is present with a non-string type.
 */
std::string ReadStringField(const nlohmann::json& object, const char* key, const std::string& fallback);

/** @brief Drops entries past maxSize, keeping the original order. Never pads. */
template <typename T>
void TruncateTo(std::vector<T>& items, std::size_t maxSize) {
    if (items.size() > maxSize) {
        items.resize(maxSize);
    }
}

} // namespace answerlens::application
