/**
 * @file AnalysisService.cpp
 * @brief Implementation of AnalysisService.
 */

#include "application/AnalysisService.hpp"
#include "application/InsightTask.hpp"
#include "application/TraitTask.hpp"
#include "domain/AnalysisErrors.hpp"

namespace answerlens::application {

AnalysisService::AnalysisService(std::shared_ptr<domain::TextGenerationService> backend, TaskOptions options)
    : m_tasks{std::make_shared<InsightTask>(backend, options.insight),
              std::make_shared<TraitTask>(backend, options.traits)} {}

AnalysisService::AnalysisService(TaskSet tasks)
    : m_tasks(std::move(tasks)) {}

domain::AnalysisResult AnalysisService::analyze(const std::string& subjectId,
                                                const std::string& promptText,
                                                const std::string& responseText) const {
    const domain::AnalysisInput input(subjectId, promptText, responseText);
    return analyze(input);
}

domain::AnalysisResult AnalysisService::analyze(const domain::AnalysisInput& input) const {
    ExecutionResult execution = m_executor.run(input, m_tasks);
    if (!execution.ok()) {
        throw domain::AnalysisError(execution.getError());
    }
    return execution.getResult();
}

} // namespace answerlens::application
