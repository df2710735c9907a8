#include "application/AppServices.hpp"
#include "infrastructure/ChatCompletionClient.hpp"

namespace answerlens::application {

AppServices AppServices::Create(const infrastructure::AppSettings& settings) {
    AppServices services;
    services.settings = settings;
    services.backend = std::make_shared<infrastructure::ChatCompletionClient>(settings.backend);

    TaskOptions options;
    options.insight = domain::GenerationOptions{settings.temperature, settings.insightMaxTokens};
    options.traits = domain::GenerationOptions{settings.temperature, settings.traitMaxTokens};
    services.analysisService = std::make_shared<const AnalysisService>(services.backend, options);
    return services;
}

} // namespace answerlens::application
