#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/AnalysisSchema.hpp"
#include "application/AppServices.hpp"
#include "domain/AnalysisErrors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/HttpApiServer.hpp"

using namespace answerlens;
using json = nlohmann::json;

namespace {

// Component logs go to std::cout; in CLI mode stdout is reserved for the result JSON.
class StdoutToStderr {
public:
    StdoutToStderr() : m_saved(std::cout.rdbuf(std::cerr.rdbuf())) {}
    ~StdoutToStderr() { std::cout.rdbuf(m_saved); }
    StdoutToStderr(const StdoutToStderr&) = delete;
    StdoutToStderr& operator=(const StdoutToStderr&) = delete;
private:
    std::streambuf* m_saved;
};

void PrintUsage() {
    std::cout <<
        "Usage:\n"
        "  answerlens [input.json]              Analyze one Q&A pair (reads stdin when no file is given)\n"
        "  answerlens serve [--host H] [--port P]  Run the HTTP API (GET /health, POST /analyze)\n"
        "  answerlens --help\n\n"
        "Input JSON: {\"user_id\": \"...\", \"question\": \"...\", \"answer\": \"...\"}\n\n"
        "Configuration: settings.json ($ANSWERLENS_CONFIG, ./settings.json or\n"
        "$XDG_CONFIG_HOME/answerlens/settings.json) overridden by ANSWERLENS_API,\n"
        "ANSWERLENS_BASE_URL, ANSWERLENS_MODEL, OPENAI_API_KEY, ANSWERLENS_DEBUG, ANSWERLENS_PORT.\n";
}

int Fail(const std::string& message) {
    std::cerr << "Error: " << message << std::endl;
    return 1;
}

int RunAnalysis(const application::AppServices& services, const std::optional<std::string>& inputPath) {
    json inputJson;
    if (inputPath) {
        std::ifstream file(*inputPath);
        if (!file.is_open()) {
            return Fail("File not found: " + *inputPath);
        }
        try {
            file >> inputJson;
        } catch (const json::exception& e) {
            return Fail(std::string("Invalid JSON in file: ") + e.what());
        }
    } else {
        try {
            std::cin >> inputJson;
        } catch (const json::exception& e) {
            return Fail(std::string("Invalid JSON input: ") + e.what());
        }
    }

    std::vector<application::FieldError> errors;
    auto input = application::AnalysisSchema::ParseRequest(inputJson, errors);
    if (!input) {
        return Fail("Invalid input: " + application::AnalysisSchema::Describe(errors));
    }

    std::optional<domain::AnalysisResult> result;
    try {
        StdoutToStderr redirect;
        result = services.analysisService->analyze(*input);
    } catch (const std::exception& e) {
        return Fail(std::string("Analysis failed: ") + e.what());
    }

    auto violations = application::AnalysisSchema::ValidateResult(*result);
    if (!violations.empty()) {
        return Fail("Analysis failed: " + application::AnalysisSchema::Describe(violations));
    }

    std::cout << application::AnalysisSchema::ToJson(*result).dump(2) << std::endl;
    return 0;
}

int RunServer(const application::AppServices& services, const std::vector<std::string>& args) {
    std::string host = services.settings.serverHost;
    int port = services.settings.serverPort;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--host" && i + 1 < args.size()) {
            host = args[++i];
        } else if (args[i] == "--port" && i + 1 < args.size()) {
            try {
                port = std::stoi(args[++i]);
            } catch (const std::exception&) {
                return Fail("Invalid port: " + args[i]);
            }
            if (port < 1 || port > 65535) {
                return Fail("Invalid port: " + args[i]);
            }
        } else {
            PrintUsage();
            return 1;
        }
    }

    infrastructure::HttpApiServer server(services.analysisService,
                                         services.settings.appName,
                                         services.settings.appVersion);
    return server.listen(host, port) ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    if (!args.empty() && (args[0] == "--help" || args[0] == "-h")) {
        PrintUsage();
        return 0;
    }

    infrastructure::AppSettings settings;
    try {
        settings = infrastructure::ConfigLoader::Load();
    } catch (const std::exception& e) {
        return Fail(std::string("Configuration error - ") + e.what());
    }

    application::AppServices services = application::AppServices::Create(settings);
    std::cerr << "[AnswerLens] Model: " << services.backend->getCurrentModel() << " | Tasks:";
    for (const auto& task : services.analysisService->getTasks()) {
        std::cerr << " " << task->name();
    }
    std::cerr << std::endl;

    if (!args.empty() && args[0] == "serve") {
        return RunServer(services, std::vector<std::string>(args.begin() + 1, args.end()));
    }
    if (args.size() > 1) {
        PrintUsage();
        return 1;
    }
    return RunAnalysis(services, args.empty() ? std::nullopt : std::optional<std::string>(args[0]));
}
