#include <gtest/gtest.h>
#include "sandbox/isolated_runner.h"
#include "python/runtime.h"
#include <chrono>
#include <memory>
#include <thread>

using namespace snipbox;
using namespace snipbox::sandbox;
using python::ScriptValueType;

class IsolatedRunnerTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        auto init = python::PythonRuntime::init();
        ASSERT_TRUE(init.ok());
    }

    void SetUp() override {
        IsolationOptions isolation;
        isolation.killGraceMs = 500;
        runner = std::make_unique<IsolatedRunner>(RunnerOptions{}, isolation);
    }

    static Policy policyWith(std::set<std::string> modules, uint32_t timeout = 5, uint32_t memoryMb = 100) {
        Policy policy;
        policy.allowedModules = std::move(modules);
        policy.timeoutSeconds = timeout;
        policy.maxMemoryMb = memoryMb;
        return policy;
    }

    static double secondsSince(std::chrono::steady_clock::time_point start) {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    }

    std::unique_ptr<IsolatedRunner> runner;
};

TEST_F(IsolatedRunnerTest, RunsSnippetInChild) {
    auto result = runner->run("import math\nprint(math.sqrt(16))\n_ = [1, 'two']", policyWith({"math"}));

    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.status, ExecutionStatus::COMPLETED);
    EXPECT_EQ(result.output, "4.0\n");
    ASSERT_TRUE(result.resultValue.has_value());
    ASSERT_EQ(result.resultValue->type, ScriptValueType::LIST);
    EXPECT_EQ(result.resultValue->listVal[1].toString(), "two");
}

TEST_F(IsolatedRunnerTest, RejectionDoesNotFork) {
    auto start = std::chrono::steady_clock::now();
    auto result = runner->run("import os\nos.system('echo hi')", policyWith({"math"}));

    EXPECT_EQ(result.status, ExecutionStatus::REJECTED);
    EXPECT_EQ(result.violations.size(), 2u);
    EXPECT_TRUE(result.output.empty());
    EXPECT_LT(secondsSince(start), 1.0);
}

TEST_F(IsolatedRunnerTest, MemoryBudgetIsEnforced) {
    auto result = runner->run("block = bytearray(512 * 1024 * 1024)\nprint('allocated')", policyWith({}, 5, 50));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, ExecutionStatus::FAILED);
    EXPECT_EQ(result.output.find("allocated"), std::string::npos);
    EXPECT_NE(result.error.value_or("").find("MemoryError"), std::string::npos);

    auto after = runner->run("print('still fine')", policyWith({}));
    EXPECT_TRUE(after.success);
    EXPECT_EQ(after.output, "still fine\n");
}

TEST_F(IsolatedRunnerTest, TimeoutReturnsWithinGrace) {
    auto start = std::chrono::steady_clock::now();
    auto result = runner->run("print('spinning')\nwhile True:\n  pass", policyWith({}, 1));
    double elapsed = secondsSince(start);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, ExecutionStatus::TIMED_OUT);
    EXPECT_EQ(result.error.value_or(""), "Code execution timed out after 1 seconds");
    EXPECT_LT(elapsed, 1.0 + 0.5 + 0.5);
}

TEST_F(IsolatedRunnerTest, ChildStateDoesNotLeak) {
    auto first = runner->run("import json\njson.leaked_marker = 1\n_ = 1", policyWith({"json"}));
    ASSERT_TRUE(first.success) << first.error.value_or("");

    auto second = runner->run("import json\n_ = hasattr(json, 'leaked_marker')", policyWith({"json"}));
    ASSERT_TRUE(second.success) << second.error.value_or("");
    ASSERT_TRUE(second.resultValue.has_value());
    EXPECT_FALSE(second.resultValue->toBool());
}

TEST_F(IsolatedRunnerTest, RuntimeErrorIsReported) {
    auto result = runner->run("print('before')\nraise KeyError('missing')", policyWith({}));

    EXPECT_EQ(result.status, ExecutionStatus::FAILED);
    EXPECT_EQ(result.output, "before\n");
    EXPECT_EQ(result.error.value_or("").find("Error during execution: 'missing'"), 0u);
}

TEST_F(IsolatedRunnerTest, CallableFromWorkerThread) {
    ExecutionResult result;
    std::thread worker([&]() { result = runner->run("print('from worker')", policyWith({})); });
    worker.join();

    EXPECT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "from worker\n");
}

TEST_F(IsolatedRunnerTest, InvalidPolicyFailsWithoutFork) {
    auto result = runner->run("print('x')", policyWith({}, 0));

    EXPECT_EQ(result.status, ExecutionStatus::FAILED);
    EXPECT_EQ(result.error.value_or("").find("Invalid policy: "), 0u);
}
