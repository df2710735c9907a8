/**
 * @file TaskOutcome.hpp
 * @brief Terminal result of one analysis task: a typed payload or a failure message.
 */

#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include "domain/AnalysisModel.hpp"

namespace answerlens::domain {

/**
 * @enum TaskRole
 * @brief The slot of AnalysisResult a task's payload fills.
 */
enum class TaskRole {
    Insight, ///< Supplies InsightPayload.
    Traits   ///< Supplies TraitPayload.
};

inline std::string RoleToString(TaskRole role) {
    switch (role) {
        case TaskRole::Insight: return "insight";
        case TaskRole::Traits: return "traits";
    }
    return "unknown";
}

using TaskPayload = std::variant<InsightPayload, TraitPayload>;

/**
 * @class TaskOutcome
 * @brief Either Success(payload) or Failure(message). Immutable once built.
 */
class TaskOutcome {
public:
    static TaskOutcome Success(std::string taskName, TaskPayload payload) {
        return TaskOutcome(std::move(taskName), Value(std::in_place_index<0>, std::move(payload)));
    }

    static TaskOutcome Failure(std::string taskName, std::string message) {
        return TaskOutcome(std::move(taskName), Value(std::in_place_index<1>, std::move(message)));
    }

    const std::string& getTaskName() const { return m_taskName; }

    bool isSuccess() const { return m_value.index() == 0; }

    /** @brief Payload of a successful outcome. Throws std::logic_error on a failure. */
    const TaskPayload& getPayload() const {
        if (!isSuccess()) {
            throw std::logic_error("TaskOutcome: no payload on failed task " + m_taskName);
        }
        return std::get<0>(m_value);
    }

    /** @brief Message of a failed outcome. Throws std::logic_error on a success. */
    const std::string& getFailureMessage() const {
        if (isSuccess()) {
            throw std::logic_error("TaskOutcome: no failure message on successful task " + m_taskName);
        }
        return std::get<1>(m_value);
    }

private:
    using Value = std::variant<TaskPayload, std::string>;

    TaskOutcome(std::string taskName, Value value)
        : m_taskName(std::move(taskName)), m_value(std::move(value)) {}

    std::string m_taskName;
    Value m_value;
};

} // namespace answerlens::domain
