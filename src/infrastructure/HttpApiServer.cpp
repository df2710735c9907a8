/**
 * @file HttpApiServer.cpp
 * @brief Implementation of HttpApiServer.
 */

#include "infrastructure/HttpApiServer.hpp"
#include "application/AnalysisSchema.hpp"
#include "domain/AnalysisErrors.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>

namespace answerlens::infrastructure {

using json = nlohmann::json;

namespace {

void SendJson(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

} // namespace

HttpApiServer::HttpApiServer(std::shared_ptr<const application::AnalysisService> service,
                             std::string appName,
                             std::string appVersion)
    : m_service(std::move(service)),
      m_appName(std::move(appName)),
      m_appVersion(std::move(appVersion)),
      m_server(std::make_unique<httplib::Server>()) {
    if (!m_service) {
        throw std::invalid_argument("HttpApiServer: service must not be null.");
    }
    registerRoutes();
}

HttpApiServer::~HttpApiServer() = default;

void HttpApiServer::registerRoutes() {
    m_server->Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handleHealth(req, res);
    });
    m_server->Post("/analyze", [this](const httplib::Request& req, httplib::Response& res) {
        handleAnalyze(req, res);
    });
    m_server->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cout << "[HttpApiServer] " << req.method << " " << req.path << " -> " << res.status << std::endl;
    });
}

bool HttpApiServer::listen(const std::string& host, int port) {
    std::cout << "[HttpApiServer] " << m_appName << " v" << m_appVersion
              << " listening on " << host << ":" << port << std::endl;
    if (!m_server->listen(host.c_str(), port)) {
        std::cerr << "[HttpApiServer] Failed to bind " << host << ":" << port << std::endl;
        return false;
    }
    return true;
}

void HttpApiServer::handleHealth(const httplib::Request&, httplib::Response& res) const {
    SendJson(res, 200, {{"status", "healthy"}});
}

void HttpApiServer::handleAnalyze(const httplib::Request& req, httplib::Response& res) const {
    json body;
    try {
        body = json::parse(req.body);
    } catch (const json::exception& e) {
        std::vector<application::FieldError> parseErrors;
        parseErrors.push_back({"body", std::string("invalid JSON: ") + e.what()});
        SendJson(res, 422, {
            {"detail", "Validation error"},
            {"errors", application::AnalysisSchema::ErrorsToJson(parseErrors)}
        });
        return;
    }

    std::vector<application::FieldError> errors;
    auto input = application::AnalysisSchema::ParseRequest(body, errors);
    if (!input) {
        SendJson(res, 422, {
            {"detail", "Validation error"},
            {"errors", application::AnalysisSchema::ErrorsToJson(errors)}
        });
        return;
    }

    try {
        domain::AnalysisResult result = m_service->analyze(*input);
        auto violations = application::AnalysisSchema::ValidateResult(result);
        if (!violations.empty()) {
            std::cerr << "[HttpApiServer] Result rejected: " << application::AnalysisSchema::Describe(violations) << std::endl;
            SendJson(res, 500, {{"detail", "Analysis failed: " + application::AnalysisSchema::Describe(violations)}});
            return;
        }
        SendJson(res, 200, application::AnalysisSchema::ToJson(result));
    } catch (const domain::AnalysisError& e) {
        SendJson(res, 500, {{"detail", e.what()}});
    } catch (const std::exception& e) {
        std::cerr << "[HttpApiServer] Unexpected error: " << e.what() << std::endl;
        SendJson(res, 500, {{"detail", std::string("Analysis failed: ") + e.what()}});
    }
}

} // namespace answerlens::infrastructure
