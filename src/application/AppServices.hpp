/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/AnalysisService.hpp"
#include "domain/TextGenerationService.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace answerlens::application {

struct AppServices {
    infrastructure::AppSettings settings;
    std::shared_ptr<domain::TextGenerationService> backend;
    std::shared_ptr<const AnalysisService> analysisService;

    /** @brief Wires the HTTP backend and the task set from resolved settings. Built once per process. */
    static AppServices Create(const infrastructure::AppSettings& settings);
};

} // namespace answerlens::application
