/**
 * @file AnalysisTask.hpp
 * @brief Interface of one independently schedulable analysis unit.
 */

#pragma once
#include <string>
#include "domain/AnalysisInput.hpp"
#include "domain/TaskOutcome.hpp"

namespace answerlens::domain {

/**
 * @class AnalysisTask
 * @brief Produces exactly one TaskOutcome from the shared input.
 *
 * run() must not throw: backend and parsing problems are reported as
 * TaskOutcome::Failure. Implementations hold no mutable state, so one
 * instance may run on several threads at once.
 */
class AnalysisTask {
public:
    virtual ~AnalysisTask() = default;

    /** @brief Name used in logs and failure messages (e.g. "InsightAgent"). */
    virtual std::string name() const = 0;

    /** @brief The result slot this task's payload fills. */
    virtual TaskRole role() const = 0;

    virtual TaskOutcome run(const AnalysisInput& input) const = 0;
};

} // namespace answerlens::domain
