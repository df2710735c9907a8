/**
 * @file TaskGraphExecutor.cpp
 * @brief Implementation of TaskGraphExecutor.
 */

#include "application/TaskGraphExecutor.hpp"

#include <chrono>
#include <future>
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>
#include <system_error>

namespace answerlens::application {

const domain::AnalysisResult& ExecutionResult::getResult() const {
    if (!ok()) {
        throw std::logic_error("ExecutionResult: no result on failed execution.");
    }
    return std::get<0>(m_value);
}

const domain::AggregateError& ExecutionResult::getError() const {
    if (ok()) {
        throw std::logic_error("ExecutionResult: no error on successful execution.");
    }
    return std::get<1>(m_value);
}

ExecutionResult TaskGraphExecutor::run(const domain::AnalysisInput& input, const TaskSet& tasks) const {
    ValidateTaskSet(tasks);

    std::cout << "[TaskGraphExecutor] Dispatching " << tasks.size()
              << " tasks for subject " << input.getSubjectId() << std::endl;

    // Fan-out. std::async futures join in their destructors, so no task can
    // outlive `input` even if this scope unwinds early.
    std::vector<std::future<domain::TaskOutcome>> pending;
    std::vector<std::optional<domain::TaskOutcome>> launchFailures(tasks.size());
    pending.reserve(tasks.size());
    for (size_t i = 0; i < tasks.size(); ++i) {
        std::shared_ptr<const domain::AnalysisTask> task = tasks[i];
        try {
            pending.push_back(std::async(std::launch::async, [task, &input]() {
                auto start = std::chrono::steady_clock::now();
                domain::TaskOutcome outcome = RunContained(*task, input);
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start);
                std::cout << "[TaskGraphExecutor] " << task->name()
                          << (outcome.isSuccess() ? " succeeded" : " failed")
                          << " in " << elapsed.count() << " ms" << std::endl;
                return outcome;
            }));
        } catch (const std::system_error& e) {
            std::cerr << "[TaskGraphExecutor] Could not start " << task->name() << ": " << e.what() << std::endl;
            pending.emplace_back();
            launchFailures[i] = domain::TaskOutcome::Failure(
                task->name(), task->name() + " error: could not start task: " + e.what());
        }
    }

    // Fan-in: every task reaches a terminal outcome before any decision is made.
    std::vector<domain::TaskOutcome> outcomes;
    outcomes.reserve(tasks.size());
    for (size_t i = 0; i < tasks.size(); ++i) {
        if (launchFailures[i]) {
            outcomes.push_back(*launchFailures[i]);
        } else {
            outcomes.push_back(pending[i].get());
        }
    }

    domain::AggregateError failures;
    for (const auto& outcome : outcomes) {
        if (!outcome.isSuccess()) {
            failures.messages.push_back(outcome.getFailureMessage());
        }
    }
    if (!failures.messages.empty()) {
        std::cerr << "[TaskGraphExecutor] " << failures.messages.size() << " of " << tasks.size()
                  << " tasks failed; no result built." << std::endl;
        return ExecutionResult::Failed(std::move(failures));
    }

    return Merge(input, tasks, outcomes);
}

void TaskGraphExecutor::ValidateTaskSet(const TaskSet& tasks) {
    if (tasks.empty()) {
        throw std::invalid_argument("TaskGraphExecutor: task set must not be empty.");
    }
    std::set<domain::TaskRole> roles;
    for (const auto& task : tasks) {
        if (!task) {
            throw std::invalid_argument("TaskGraphExecutor: task set contains a null task.");
        }
        if (!roles.insert(task->role()).second) {
            throw std::invalid_argument("TaskGraphExecutor: role '" + domain::RoleToString(task->role()) +
                                        "' is supplied by more than one task.");
        }
    }
}

domain::TaskOutcome TaskGraphExecutor::RunContained(const domain::AnalysisTask& task,
                                                    const domain::AnalysisInput& input) {
    try {
        return task.run(input);
    } catch (const std::exception& e) {
        return domain::TaskOutcome::Failure(task.name(), task.name() + " error: " + e.what());
    } catch (...) {
        return domain::TaskOutcome::Failure(task.name(), task.name() + " error: unknown exception");
    }
}

ExecutionResult TaskGraphExecutor::Merge(const domain::AnalysisInput& input,
                                         const TaskSet& tasks,
                                         const std::vector<domain::TaskOutcome>& outcomes) {
    const domain::InsightPayload* insight = nullptr;
    const domain::TraitPayload* traits = nullptr;
    domain::AggregateError incomplete;
    incomplete.kind = domain::AggregateError::Kind::IncompleteResult;

    for (size_t i = 0; i < outcomes.size(); ++i) {
        const domain::TaskPayload& payload = outcomes[i].getPayload();
        const domain::TaskRole role = tasks[i]->role();

        bool matches = false;
        switch (role) {
            case domain::TaskRole::Insight:
                insight = std::get_if<domain::InsightPayload>(&payload);
                matches = insight != nullptr;
                break;
            case domain::TaskRole::Traits:
                traits = std::get_if<domain::TraitPayload>(&payload);
                matches = traits != nullptr;
                break;
        }
        if (!matches) {
            incomplete.messages.push_back(tasks[i]->name() + " produced a payload that does not match its role '" +
                                          domain::RoleToString(role) + "'");
        }
    }

    if (incomplete.messages.empty()) {
        if (!insight) incomplete.messages.push_back("no task produced the insight payload");
        if (!traits) incomplete.messages.push_back("no task produced the traits payload");
    }
    if (!incomplete.messages.empty()) {
        std::cerr << "[TaskGraphExecutor] " << incomplete.describe() << std::endl;
        return ExecutionResult::Failed(std::move(incomplete));
    }

    domain::AnalysisResult result;
    result.subjectId = input.getSubjectId();
    result.insight = *insight;
    result.traits = traits->traits;
    return ExecutionResult::Ok(std::move(result));
}

} // namespace answerlens::application
