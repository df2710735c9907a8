/**
 * @file TaskGraphExecutor.hpp
 * @brief Fan-out/fan-in executor running analysis tasks concurrently and merging their payloads.
 */

#pragma once

#include <memory>
#include <variant>
#include <vector>
#include "domain/AnalysisErrors.hpp"
#include "domain/AnalysisInput.hpp"
#include "domain/AnalysisModel.hpp"
#include "domain/AnalysisTask.hpp"

namespace answerlens::application {

using TaskSet = std::vector<std::shared_ptr<const domain::AnalysisTask>>;

/**
 * @class ExecutionResult
 * @brief Either a fully merged AnalysisResult or the AggregateError explaining why none was built.
 */
class ExecutionResult {
public:
    static ExecutionResult Ok(domain::AnalysisResult result) {
        return ExecutionResult(Value(std::in_place_index<0>, std::move(result)));
    }

    static ExecutionResult Failed(domain::AggregateError error) {
        return ExecutionResult(Value(std::in_place_index<1>, std::move(error)));
    }

    bool ok() const { return m_value.index() == 0; }

    /** @brief Throws std::logic_error when called on a failed execution. */
    const domain::AnalysisResult& getResult() const;

    /** @brief Throws std::logic_error when called on a successful execution. */
    const domain::AggregateError& getError() const;

private:
    using Value = std::variant<domain::AnalysisResult, domain::AggregateError>;

    explicit ExecutionResult(Value value) : m_value(std::move(value)) {}

    Value m_value;
};

/**
 * @class TaskGraphExecutor
 * @brief Runs every task of a set against the same input, joins them all, then merges or fails.
 *
 * - All tasks start concurrently; none is cancelled when a sibling fails.
 * - Any Failure means no result: every failure message is returned, in task order.
 * - On all-success, payloads are merged by role into one AnalysisResult.
 *
 * Holds no state; run() may be called from several threads at once.
 */
class TaskGraphExecutor {
public:
    /**
     * @brief Executes the task set.
     * @param input Shared read-only input; must outlive the call.
     * @param tasks Non-empty set, one task per role.
     * @throws std::invalid_argument if the set is empty, holds a null task or repeats a role.
     */
    ExecutionResult run(const domain::AnalysisInput& input, const TaskSet& tasks) const;

private:
    static void ValidateTaskSet(const TaskSet& tasks);
    static domain::TaskOutcome RunContained(const domain::AnalysisTask& task,
                                            const domain::AnalysisInput& input);
    static ExecutionResult Merge(const domain::AnalysisInput& input,
                                 const TaskSet& tasks,
                                 const std::vector<domain::TaskOutcome>& outcomes);
};

} // namespace answerlens::application
