/**
 * @file ReplyParsing.cpp
 * @brief Implementation of the reply parsing helpers.
 */

#include "application/ReplyParsing.hpp"
#include "domain/AnalysisErrors.hpp"
#include "domain/AnalysisModel.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace answerlens::application {

using json = nlohmann::json;

namespace {

std::string Trim(const std::string& value) {
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) ++start;
    size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
    return value.substr(start, end - start);
}

// Largest finite double; written out so the parser maps it back exactly.
constexpr const char* kSaturatedMagnitude = "1.7976931348623157e308";

// Rewrites number literals outside strings that overflow a double to +/-DBL_MAX.
// The parser refuses infinite values, and ClampScore bounds the result later.
std::string SaturateOverflowingNumbers(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool inString = false;
    size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];
        if (inString) {
            out += c;
            if (c == '\\' && i + 1 < text.size()) {
                out += text[i + 1];
                i += 2;
                continue;
            }
            if (c == '"') inString = false;
            ++i;
            continue;
        }
        if (c == '"') {
            inString = true;
            out += c;
            ++i;
            continue;
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            size_t end = i + 1;
            while (end < text.size() &&
                   (std::isdigit(static_cast<unsigned char>(text[end])) || text[end] == '.' ||
                    text[end] == 'e' || text[end] == 'E' || text[end] == '+' || text[end] == '-')) {
                ++end;
            }
            const std::string literal = text.substr(i, end - i);
            const double value = std::strtod(literal.c_str(), nullptr);
            if (std::isinf(value)) {
                out += (value < 0 ? "-" : "");
                out += kSaturatedMagnitude;
            } else {
                out += literal;
            }
            i = end;
            continue;
        }
        out += c;
        ++i;
    }
    return out;
}

} // namespace

std::string StripCodeFence(const std::string& text) {
    std::string trimmed = Trim(text);
    const std::string fence = "```";
    if (trimmed.compare(0, fence.size(), fence) != 0) {
        return trimmed;
    }

    // Opening fence may carry a language tag ("```json"); content starts on the next line.
    size_t contentStart = trimmed.find('\n');
    if (contentStart == std::string::npos) {
        return trimmed;
    }
    size_t contentEnd = trimmed.rfind(fence);
    if (contentEnd == std::string::npos || contentEnd <= contentStart) {
        contentEnd = trimmed.size();
    }
    return Trim(trimmed.substr(contentStart + 1, contentEnd - contentStart - 1));
}

json ParseReplyObject(const std::string& reply) {
    const std::string text = StripCodeFence(reply);
    json parsed;
    try {
        parsed = json::parse(text);
    } catch (const json::parse_error& e) {
        throw domain::ReplyShapeError(std::string("reply is not valid JSON: ") + e.what());
    } catch (const json::out_of_range&) {
        // Number overflow (406), e.g. a score of 1e400.
        try {
            parsed = json::parse(SaturateOverflowingNumbers(text));
        } catch (const json::exception& e) {
            throw domain::ReplyShapeError(std::string("reply is not valid JSON: ") + e.what());
        }
    }
    if (!parsed.is_object()) {
        throw domain::ReplyShapeError("reply is not a JSON object (got " + std::string(parsed.type_name()) + ")");
    }
    return parsed;
}

double ClampScore(double score) {
    return std::max(domain::kMinTraitScore, std::min(domain::kMaxTraitScore, score));
}

double ReadScore(const json& value) {
    double score = 0.0;
    if (value.is_number()) {
        score = value.get<double>();
    } else if (value.is_string()) {
        const std::string text = Trim(value.get<std::string>());
        // strtod saturates to +/-HUGE_VAL on overflow and to zero on underflow.
        char* end = nullptr;
        score = std::strtod(text.c_str(), &end);
        if (text.empty() || end != text.c_str() + text.size()) {
            throw domain::ReplyShapeError("score is not numeric: \"" + text + "\"");
        }
    } else {
        throw domain::ReplyShapeError("score has unexpected type " + std::string(value.type_name()));
    }

    if (std::isnan(score)) {
        throw domain::ReplyShapeError("score is not a number");
    }
    if (std::isinf(score)) {
        return ClampScore(score);
    }
    return score;
}

std::string ReadStringField(const json& object, const char* key, const std::string& fallback) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_string()) {
        throw domain::ReplyShapeError(std::string("field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

} // namespace answerlens::application
