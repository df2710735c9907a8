/**
 * @file AnalysisErrors.hpp
 * @brief Error taxonomy of the analysis pipeline.
 */

#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace answerlens::domain {

/**
 * @class ReplyShapeError
 * @brief The backend answered, but the reply does not fit the expected structure.
 */
class ReplyShapeError : public std::runtime_error {
public:
    explicit ReplyShapeError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @struct AggregateError
 * @brief Every failure message of one invocation, in task declaration order.
 */
struct AggregateError {
    enum class Kind {
        TaskFailures,    ///< One or more tasks reported Failure.
        IncompleteResult ///< All tasks succeeded but a payload role is missing or mistyped.
    };

    Kind kind = Kind::TaskFailures;
    std::vector<std::string> messages;

    /** @brief Renders as "Agent errors: [a, b]" (or "Incomplete result: [...]"). */
    std::string describe() const {
        std::string out = (kind == Kind::TaskFailures) ? "Agent errors: [" : "Incomplete result: [";
        for (size_t i = 0; i < messages.size(); ++i) {
            if (i > 0) out += ", ";
            out += messages[i];
        }
        out += "]";
        return out;
    }
};

/**
 * @class AnalysisError
 * @brief Raised by the caller-facing entry point when no result can be produced.
 */
class AnalysisError : public std::runtime_error {
public:
    explicit AnalysisError(AggregateError error)
        : std::runtime_error(error.describe()), m_error(std::move(error)) {}

    const AggregateError& getAggregate() const { return m_error; }

private:
    AggregateError m_error;
};

} // namespace answerlens::domain
