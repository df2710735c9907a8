#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "application/InsightTask.hpp"
#include "application/TaskGraphExecutor.hpp"
#include "application/TraitTask.hpp"
#include "test/MockBackends.hpp"

using namespace answerlens;
using namespace answerlens::application;

namespace {

// Task whose behaviour is supplied by the test.
class FakeTask : public domain::AnalysisTask {
public:
    using Body = std::function<domain::TaskOutcome(const FakeTask&, const domain::AnalysisInput&)>;

    FakeTask(std::string name, domain::TaskRole role, Body body)
        : m_name(std::move(name)), m_role(role), m_body(std::move(body)) {}

    std::string name() const override { return m_name; }
    domain::TaskRole role() const override { return m_role; }
    domain::TaskOutcome run(const domain::AnalysisInput& input) const override { return m_body(*this, input); }

private:
    std::string m_name;
    domain::TaskRole m_role;
    Body m_body;
};

domain::TaskOutcome InsightOk(const FakeTask& self, const domain::AnalysisInput&) {
    return domain::TaskOutcome::Success(self.name(), domain::InsightPayload{"Wants commitment", {"serious", "relationship"}});
}

domain::TaskOutcome TraitsOk(const FakeTask& self, const domain::AnalysisInput&) {
    domain::TraitPayload payload;
    payload.traits.push_back({"openness_to_commitment", 0.8, "Uses the word serious"});
    payload.traits.push_back({"social_energy", -0.2, "Short answer"});
    return domain::TaskOutcome::Success(self.name(), payload);
}

domain::TaskOutcome Fails(const FakeTask& self, const domain::AnalysisInput&) {
    return domain::TaskOutcome::Failure(self.name(), self.name() + " error: boom");
}

std::shared_ptr<const domain::AnalysisTask> Make(const std::string& name, domain::TaskRole role, FakeTask::Body body) {
    return std::make_shared<FakeTask>(name, role, std::move(body));
}

const domain::AnalysisInput kInput(" U-1/ü ", "What are you looking for?", "I want a serious relationship.");

void TestAllSuccessMerges() {
    TaskGraphExecutor executor;
    auto result = executor.run(kInput, {Make("InsightAgent", domain::TaskRole::Insight, InsightOk),
                                        Make("TraitAgent", domain::TaskRole::Traits, TraitsOk)});
    assert(result.ok());
    assert(result.getResult().subjectId == " U-1/ü ");
    assert(result.getResult().insight.summary == "Wants commitment");
    assert(result.getResult().insight.keywords.size() == 2);
    assert(result.getResult().traits.size() == 2);
    assert(result.getResult().traits[1].name == "social_energy");

    // Task order in the set does not matter.
    auto reversed = executor.run(kInput, {Make("TraitAgent", domain::TaskRole::Traits, TraitsOk),
                                          Make("InsightAgent", domain::TaskRole::Insight, InsightOk)});
    assert(reversed.ok());
    assert(reversed.getResult().insight.summary == "Wants commitment");
    std::cout << "[PASS] All-success merge." << std::endl;
}

void TestSingleFailure() {
    TaskGraphExecutor executor;
    auto result = executor.run(kInput, {Make("InsightAgent", domain::TaskRole::Insight, InsightOk),
                                        Make("TraitAgent", domain::TaskRole::Traits, Fails)});
    assert(!result.ok());
    assert(result.getError().kind == domain::AggregateError::Kind::TaskFailures);
    assert(result.getError().messages.size() == 1);
    assert(result.getError().messages[0] == "TraitAgent error: boom");
    std::cout << "[PASS] Single failure." << std::endl;
}

void TestAllFailuresKept() {
    TaskGraphExecutor executor;
    auto result = executor.run(kInput, {Make("InsightAgent", domain::TaskRole::Insight, Fails),
                                        Make("TraitAgent", domain::TaskRole::Traits, Fails)});
    assert(!result.ok());
    const auto& messages = result.getError().messages;
    assert(messages.size() == 2);
    assert(messages[0] == "InsightAgent error: boom");
    assert(messages[1] == "TraitAgent error: boom");
    assert(result.getError().describe() == "Agent errors: [InsightAgent error: boom, TraitAgent error: boom]");
    std::cout << "[PASS] All failures kept." << std::endl;
}

void TestNoPartialMerge() {
    auto backend = std::make_shared<test::ScriptedBackend>(test::kScenarioInsightReply, "this is not json");
    TaskSet tasks{std::make_shared<InsightTask>(backend, domain::GenerationOptions{}),
                  std::make_shared<TraitTask>(backend, domain::GenerationOptions{})};

    auto result = TaskGraphExecutor().run(kInput, tasks);
    assert(!result.ok());
    assert(result.getError().messages.size() == 1);
    assert(result.getError().messages[0].rfind("TraitAgent error: ", 0) == 0);
    assert(backend->calls == 2);
    std::cout << "[PASS] No partial merge." << std::endl;
}

void TestThrowingTaskIsContained() {
    std::atomic<bool> siblingFinished{false};
    auto slowSibling = [&siblingFinished](const FakeTask& self, const domain::AnalysisInput& in) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        siblingFinished = true;
        return TraitsOk(self, in);
    };

    TaskGraphExecutor executor;
    auto result = executor.run(kInput, {
        Make("InsightAgent", domain::TaskRole::Insight,
             [](const FakeTask&, const domain::AnalysisInput&) -> domain::TaskOutcome {
                 throw std::runtime_error("crashed");
             }),
        Make("TraitAgent", domain::TaskRole::Traits, slowSibling)});
    assert(!result.ok());
    assert(siblingFinished);
    assert(result.getError().messages.size() == 1);
    assert(result.getError().messages[0] == "InsightAgent error: crashed");

    auto odd = executor.run(kInput, {
        Make("InsightAgent", domain::TaskRole::Insight,
             [](const FakeTask&, const domain::AnalysisInput&) -> domain::TaskOutcome { throw 42; }),
        Make("TraitAgent", domain::TaskRole::Traits, TraitsOk)});
    assert(!odd.ok());
    assert(odd.getError().messages[0] == "InsightAgent error: unknown exception");
    std::cout << "[PASS] Throwing task is contained." << std::endl;
}

void TestTasksRunConcurrently() {
    // Each task waits until both have started; run one after the other, the first would time out.
    std::mutex mutex;
    std::condition_variable cv;
    int started = 0;
    auto rendezvous = [&](const FakeTask& self, const domain::AnalysisInput& in) {
        std::unique_lock<std::mutex> lock(mutex);
        ++started;
        cv.notify_all();
        bool bothStarted = cv.wait_for(lock, std::chrono::seconds(5), [&] { return started == 2; });
        if (!bothStarted) {
            return Fails(self, in);
        }
        return self.role() == domain::TaskRole::Insight ? InsightOk(self, in) : TraitsOk(self, in);
    };

    auto result = TaskGraphExecutor().run(kInput, {Make("InsightAgent", domain::TaskRole::Insight, rendezvous),
                                                   Make("TraitAgent", domain::TaskRole::Traits, rendezvous)});
    assert(result.ok());
    std::cout << "[PASS] Tasks run concurrently." << std::endl;
}

void TestMalformedTaskSets() {
    TaskGraphExecutor executor;
    auto rejects = [&executor](const TaskSet& tasks) {
        try {
            executor.run(kInput, tasks);
        } catch (const std::invalid_argument&) {
            return true;
        }
        return false;
    };
    assert(rejects({}));
    assert(rejects({nullptr}));
    assert(rejects({Make("A", domain::TaskRole::Insight, InsightOk), Make("B", domain::TaskRole::Insight, InsightOk)}));
    std::cout << "[PASS] Malformed task sets rejected." << std::endl;
}

void TestIncompleteResult() {
    TaskGraphExecutor executor;
    auto missing = executor.run(kInput, {Make("InsightAgent", domain::TaskRole::Insight, InsightOk)});
    assert(!missing.ok());
    assert(missing.getError().kind == domain::AggregateError::Kind::IncompleteResult);
    assert(missing.getError().messages.size() == 1);
    assert(missing.getError().messages[0] == "no task produced the traits payload");

    // Declares the insight role but hands back traits.
    auto mismatched = executor.run(kInput, {Make("InsightAgent", domain::TaskRole::Insight, TraitsOk),
                                            Make("TraitAgent", domain::TaskRole::Traits, TraitsOk)});
    assert(!mismatched.ok());
    assert(mismatched.getError().kind == domain::AggregateError::Kind::IncompleteResult);
    assert(mismatched.getError().messages[0].find("InsightAgent") != std::string::npos);
    std::cout << "[PASS] Incomplete result." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting TaskGraphExecutor Test..." << std::endl;
    TestAllSuccessMerges();
    TestSingleFailure();
    TestAllFailuresKept();
    TestNoPartialMerge();
    TestThrowingTaskIsContained();
    TestTasksRunConcurrently();
    TestMalformedTaskSets();
    TestIncompleteResult();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
