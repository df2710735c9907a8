/**
 * @file AnalysisService.hpp
 * @brief Caller-facing entry point: analyzes one question/answer pair.
 */

#pragma once

#include <memory>
#include <string>
#include "application/TaskGraphExecutor.hpp"
#include "domain/AnalysisModel.hpp"
#include "domain/TextGenerationService.hpp"

namespace answerlens::application {

/**
 * @struct TaskOptions
 * @brief Sampling limits of each built-in task.
 */
struct TaskOptions {
    domain::GenerationOptions insight{0.7, 300};
    domain::GenerationOptions traits{0.7, 400};
};

/**
 * @class AnalysisService
 * @brief Owns the task set (built once) and runs it through the executor per request.
 *
 * Safe to share between threads: the task set is never modified after
 * construction and the executor is stateless.
 */
class AnalysisService {
public:
    /** @brief Builds the standard InsightAgent + TraitAgent pair over one backend. */
    AnalysisService(std::shared_ptr<domain::TextGenerationService> backend, TaskOptions options);

    /** @brief Uses a caller-supplied task set. */
    explicit AnalysisService(TaskSet tasks);

    /**
     * @brief Runs all tasks and merges their payloads.
     * @return The merged result; subjectId is echoed unchanged.
     * @throws domain::AnalysisError if any task failed or the result is incomplete.
     */
    domain::AnalysisResult analyze(const std::string& subjectId,
                                   const std::string& promptText,
                                   const std::string& responseText) const;

    domain::AnalysisResult analyze(const domain::AnalysisInput& input) const;

    const TaskSet& getTasks() const { return m_tasks; }

private:
    TaskSet m_tasks;
    TaskGraphExecutor m_executor;
};

} // namespace answerlens::application
