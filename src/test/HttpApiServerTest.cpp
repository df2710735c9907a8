#include <cassert>
#include <iostream>
#include <memory>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "application/AnalysisService.hpp"
#include "infrastructure/HttpApiServer.hpp"
#include "test/MockBackends.hpp"

using namespace answerlens;
using json = nlohmann::json;

namespace {

std::shared_ptr<const application::AnalysisService> MakeService(std::shared_ptr<domain::TextGenerationService> backend) {
    return std::make_shared<const application::AnalysisService>(std::move(backend), application::TaskOptions{});
}

httplib::Response Post(const infrastructure::HttpApiServer& server, const std::string& body) {
    httplib::Request req;
    req.method = "POST";
    req.path = "/analyze";
    req.body = body;
    httplib::Response res;
    server.handleAnalyze(req, res);
    return res;
}

const char* kValidBody = R"({"user_id":"u1","question":"What are you looking for?","answer":"I want a serious relationship."})";

void TestHealth() {
    infrastructure::HttpApiServer server(MakeService(std::make_shared<test::FailingBackend>()), "app", "1.0.0");
    httplib::Request req;
    httplib::Response res;
    server.handleHealth(req, res);
    assert(res.status == 200);
    assert(json::parse(res.body)["status"] == "healthy");
    std::cout << "[PASS] Health." << std::endl;
}

void TestAnalyzeSuccess() {
    auto backend = std::make_shared<test::ScriptedBackend>(test::kScenarioInsightReply, test::kScenarioTraitReply);
    infrastructure::HttpApiServer server(MakeService(backend), "app", "1.0.0");

    auto res = Post(server, kValidBody);
    assert(res.status == 200);
    json body = json::parse(res.body);
    assert(body["user_id"] == "u1");
    assert(body["insight"]["summary"] == "Wants commitment");
    assert(body["traits"].size() == 2);
    std::cout << "[PASS] Analyze success." << std::endl;
}

void TestAnalyzeValidation() {
    infrastructure::HttpApiServer server(MakeService(std::make_shared<test::FailingBackend>()), "app", "1.0.0");

    auto notJson = Post(server, "{oops");
    assert(notJson.status == 422);
    assert(json::parse(notJson.body)["detail"] == "Validation error");

    auto overflow = Post(server, R"({"user_id":1e400,"question":"Q","answer":"A"})");
    assert(overflow.status == 422);
    assert(json::parse(overflow.body)["errors"][0]["loc"][1] == "body");

    auto missing = Post(server, R"({"user_id":"u1","question":"Q"})");
    assert(missing.status == 422);
    json errors = json::parse(missing.body)["errors"];
    assert(errors.size() == 1);
    assert(errors[0]["loc"][1] == "answer");
    std::cout << "[PASS] Analyze validation." << std::endl;
}

void TestAnalyzeFailures() {
    infrastructure::HttpApiServer failing(MakeService(std::make_shared<test::FailingBackend>()), "app", "1.0.0");
    auto res = Post(failing, kValidBody);
    assert(res.status == 500);
    std::string detail = json::parse(res.body)["detail"].get<std::string>();
    assert(detail.find("InsightAgent error") != std::string::npos);
    assert(detail.find("TraitAgent error") != std::string::npos);

    // Both tasks succeed but only one keyword comes back: rejected on the way out.
    auto sparse = std::make_shared<test::ScriptedBackend>(R"({"summary":"s","keywords":["one"]})",
                                                          test::kScenarioTraitReply);
    infrastructure::HttpApiServer strict(MakeService(sparse), "app", "1.0.0");
    auto rejected = Post(strict, kValidBody);
    assert(rejected.status == 500);
    assert(json::parse(rejected.body)["detail"].get<std::string>().find("insight.keywords") != std::string::npos);
    std::cout << "[PASS] Analyze failures." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting HttpApiServer Test..." << std::endl;
    TestHealth();
    TestAnalyzeSuccess();
    TestAnalyzeValidation();
    TestAnalyzeFailures();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
