/**
 * @file HttpApiServer.hpp
 * @brief HTTP transport exposing the analysis service.
 */

#pragma once

#include <memory>
#include <string>
#include "application/AnalysisService.hpp"

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace answerlens::infrastructure {

/**
 * @class HttpApiServer
 * @brief Serves GET /health and POST /analyze.
 *
 * POST /analyze answers 200 with the result JSON, 422 when the request body
 * is not a valid {"user_id", "question", "answer"} object, and 500 when the
 * analysis fails or its result breaks the output bounds.
 */
class HttpApiServer {
public:
    HttpApiServer(std::shared_ptr<const application::AnalysisService> service,
                  std::string appName,
                  std::string appVersion);
    ~HttpApiServer();

    HttpApiServer(const HttpApiServer&) = delete;
    HttpApiServer& operator=(const HttpApiServer&) = delete;

    /** @brief Blocks serving requests. Returns false if binding failed. */
    bool listen(const std::string& host, int port);

    /** @brief Handlers, exposed so they can be exercised without a socket. */
    void handleHealth(const httplib::Request& req, httplib::Response& res) const;
    void handleAnalyze(const httplib::Request& req, httplib::Response& res) const;

private:
    void registerRoutes();

    std::shared_ptr<const application::AnalysisService> m_service;
    std::string m_appName;
    std::string m_appVersion;
    std::unique_ptr<httplib::Server> m_server;
};

} // namespace answerlens::infrastructure
