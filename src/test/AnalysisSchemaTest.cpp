#include <cassert>
#include <iostream>
#include <nlohmann/json.hpp>

#include "application/AnalysisSchema.hpp"

using namespace answerlens;
using namespace answerlens::application;
using json = nlohmann::json;

namespace {

domain::AnalysisResult MakeResult(size_t keywords, size_t traits) {
    domain::AnalysisResult result;
    result.subjectId = "user-123";
    result.insight.summary = "Ready for something serious.";
    for (size_t i = 0; i < keywords; ++i) result.insight.keywords.push_back("k" + std::to_string(i));
    for (size_t i = 0; i < traits; ++i) result.traits.push_back({"t" + std::to_string(i), 0.5, "because"});
    return result;
}

void TestParseRequest() {
    std::vector<FieldError> errors;
    auto input = AnalysisSchema::ParseRequest(
        json{{"user_id", "user-123"}, {"question", "Q?"}, {"answer", "A."}, {"extra", 1}}, errors);
    assert(input);
    assert(errors.empty());
    assert(input->getSubjectId() == "user-123");
    assert(input->getPromptText() == "Q?");
    assert(input->getResponseText() == "A.");

    errors.clear();
    auto bad = AnalysisSchema::ParseRequest(json{{"user_id", ""}, {"answer", 7}}, errors);
    assert(!bad);
    assert(errors.size() == 3);
    assert(errors[0].field == "user_id");
    assert(errors[1].field == "question");
    assert(errors[1].message == "field required");
    assert(errors[2].field == "answer");

    errors.clear();
    assert(!AnalysisSchema::ParseRequest(json::array(), errors));
    assert(errors.size() == 1);
    std::cout << "[PASS] Request parsing." << std::endl;
}

void TestValidateResult() {
    assert(AnalysisSchema::ValidateResult(MakeResult(2, 2)).empty());
    assert(AnalysisSchema::ValidateResult(MakeResult(5, 5)).empty());

    auto tooFew = AnalysisSchema::ValidateResult(MakeResult(1, 1));
    assert(tooFew.size() == 2);
    assert(tooFew[0].field == "insight.keywords");
    assert(tooFew[1].field == "traits");

    auto outOfRange = MakeResult(3, 3);
    outOfRange.traits[2].score = 1.5;
    auto errors = AnalysisSchema::ValidateResult(outOfRange);
    assert(errors.size() == 1);
    assert(errors[0].field == "traits.2.score");
    std::cout << "[PASS] Result validation." << std::endl;
}

void TestToJson() {
    json j = AnalysisSchema::ToJson(MakeResult(2, 2));
    assert(j["user_id"] == "user-123");
    assert(j["insight"]["summary"] == "Ready for something serious.");
    assert(j["insight"]["keywords"].size() == 2);
    assert(j["traits"].size() == 2);
    assert(j["traits"][0]["name"] == "t0");
    assert(j["traits"][0]["score"] == 0.5);
    assert(j["traits"][0]["reason"] == "because");

    json errors = AnalysisSchema::ErrorsToJson({{"user_id", "field required"}});
    assert(errors[0]["loc"][1] == "user_id");
    assert(errors[0]["msg"] == "field required");
    assert(AnalysisSchema::Describe({{"a", "x"}, {"b", "y"}}) == "a: x; b: y");
    std::cout << "[PASS] JSON mapping." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting AnalysisSchema Test..." << std::endl;
    TestParseRequest();
    TestValidateResult();
    TestToJson();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
