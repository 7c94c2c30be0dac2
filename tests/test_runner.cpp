#include <gtest/gtest.h>
#include "sandbox/runner.h"
#include "python/runtime.h"
#include <chrono>
#include <thread>

using namespace snipbox;
using namespace snipbox::sandbox;
using python::ScriptValue;
using python::ScriptValueType;

class ExecutionRunnerTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        auto init = python::PythonRuntime::init();
        ASSERT_TRUE(init.ok());
    }

    static Policy policyWith(std::set<std::string> modules, uint32_t timeout = 5) {
        Policy policy;
        policy.allowedModules = std::move(modules);
        policy.timeoutSeconds = timeout;
        return policy;
    }

    static bool contains(const std::optional<std::string>& text, const std::string& needle) {
        return text && text->find(needle) != std::string::npos;
    }

    ExecutionRunner runner;
};

TEST_F(ExecutionRunnerTest, AllowedImportRuns) {
    auto result = runner.run("import math\nresult = math.sqrt(16)\nprint(result)", policyWith({"math"}));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.status, ExecutionStatus::COMPLETED);
    EXPECT_NE(result.output.find("4.0"), std::string::npos);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_TRUE(result.violations.empty());
    EXPECT_GT(result.executionTime, 0.0);
}

TEST_F(ExecutionRunnerTest, UnauthorizedImportIsRejected) {
    auto result = runner.run("import os\nos.system('echo hi')", Policy::defaults());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, ExecutionStatus::REJECTED);
    EXPECT_TRUE(contains(result.error, "os"));
    EXPECT_EQ(*result.error,
              "Safety violations: Unauthorized import: os; Potentially unsafe system operation: system");
    EXPECT_EQ(result.violations.size(), 2u);
    EXPECT_TRUE(result.output.empty());
    EXPECT_FALSE(result.resultValue.has_value());
}

TEST_F(ExecutionRunnerTest, RejectionHasNoSideEffects) {
    auto result = runner.run("print('side effect')\nimport subprocess\n", policyWith({"math"}));

    EXPECT_EQ(result.status, ExecutionStatus::REJECTED);
    EXPECT_TRUE(result.output.empty());
    EXPECT_TRUE(contains(result.error, "subprocess"));
}

TEST_F(ExecutionRunnerTest, RestrictedCallIsRejected) {
    auto result = runner.run("data = open('/etc/passwd')\n", policyWith({}));

    EXPECT_EQ(result.status, ExecutionStatus::REJECTED);
    ASSERT_EQ(result.violations.size(), 1u);
    EXPECT_EQ(result.violations[0].kind, ViolationKind::UNAUTHORIZED_CALL);
    EXPECT_TRUE(contains(result.error, "Unauthorized function call: open"));
}

TEST_F(ExecutionRunnerTest, BusyLoopTimesOut) {
    auto start = std::chrono::steady_clock::now();
    auto result = runner.run("print('started')\nwhile True:\n  pass", policyWith({}, 2));
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, ExecutionStatus::TIMED_OUT);
    EXPECT_EQ(*result.error, "Code execution timed out after 2 seconds");
    EXPECT_EQ(result.output, "started\n");
    EXPECT_GE(elapsed, 1.9);
    EXPECT_LT(elapsed, 3.5);
}

TEST_F(ExecutionRunnerTest, BareExceptDoesNotOutliveDeadline) {
    auto start = std::chrono::steady_clock::now();
    auto result = runner.run("while True:\n"
                             "    try:\n"
                             "        while True:\n"
                             "            pass\n"
                             "    except:\n"
                             "        pass\n",
                             policyWith({}, 1));
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    EXPECT_EQ(result.status, ExecutionStatus::TIMED_OUT);
    EXPECT_EQ(*result.error, "Code execution timed out after 1 seconds");
    EXPECT_LT(elapsed, 2.5);

    auto next = runner.run("print('alive')", policyWith({}));
    EXPECT_TRUE(next.success);
    EXPECT_EQ(next.output, "alive\n");
}

TEST_F(ExecutionRunnerTest, RuntimeErrorKeepsOutputAndTraceback) {
    auto result = runner.run("print('before')\nprint(1/0)", policyWith({}));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, ExecutionStatus::FAILED);
    EXPECT_EQ(result.output, "before\n");
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->find("Error during execution: division by zero\n"), 0u);
    EXPECT_TRUE(contains(result.error, "ZeroDivisionError"));
}

TEST_F(ExecutionRunnerTest, DivisionByZeroWithoutOutput) {
    auto result = runner.run("print(1/0)", policyWith({}));

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.output.empty());
    EXPECT_TRUE(contains(result.error, "division by zero"));
}

TEST_F(ExecutionRunnerTest, RunsAreIndependent) {
    const std::string source =
        "try:\n"
        "    counter += 1\n"
        "except NameError:\n"
        "    counter = 1\n"
        "_ = counter\n";

    auto first = runner.run(source, policyWith({}));
    auto second = runner.run(source, policyWith({}));

    ASSERT_TRUE(first.success);
    ASSERT_TRUE(second.success);
    ASSERT_TRUE(first.resultValue.has_value());
    ASSERT_TRUE(second.resultValue.has_value());
    EXPECT_EQ(first.resultValue->toInt(), 1);
    EXPECT_EQ(second.resultValue->toInt(), 1);
}

TEST_F(ExecutionRunnerTest, AllowListIsPerCall) {
    auto first = runner.run("import json\nprint(json.dumps([1]))", policyWith({"json"}));
    EXPECT_TRUE(first.success);
    EXPECT_EQ(first.output, "[1]\n");

    auto second = runner.run("import json\nprint(json.dumps([1]))", policyWith({"math"}));
    EXPECT_EQ(second.status, ExecutionStatus::REJECTED);
    EXPECT_TRUE(contains(second.error, "json"));
}

TEST_F(ExecutionRunnerTest, SyntaxErrorProducesNoOutput) {
    auto result = runner.run("print('never')\nprint('unclosed", policyWith({}));

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.output.empty());
    ASSERT_EQ(result.violations.size(), 1u);
    EXPECT_EQ(result.violations[0].kind, ViolationKind::PARSE_ERROR);
    EXPECT_TRUE(contains(result.error, "Syntax error in code: "));
}

TEST_F(ExecutionRunnerTest, DynamicImportDeniedAtRuntime) {
    auto result = runner.run("m = __builtins__['__import__']('os')\n", policyWith({"math"}));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, ExecutionStatus::FAILED);
    EXPECT_TRUE(result.violations.empty());
    EXPECT_TRUE(contains(result.error, "Import of 'os' is not allowed"));
}

TEST_F(ExecutionRunnerTest, RestrictedBuiltinAbsentAtRuntime) {
    auto result = runner.run("f = eval\n", policyWith({}));

    EXPECT_EQ(result.status, ExecutionStatus::FAILED);
    EXPECT_TRUE(contains(result.error, "name 'eval' is not defined"));
}

TEST_F(ExecutionRunnerTest, SentinelValueIsReturned) {
    auto result = runner.run("_ = {'a': [1, 2.5, 'x'], 'b': None, 'c': True}", policyWith({}));

    ASSERT_TRUE(result.success);
    ASSERT_TRUE(result.resultValue.has_value());
    const ScriptValue& value = *result.resultValue;
    ASSERT_EQ(value.type, ScriptValueType::DICT);
    ASSERT_EQ(value.dictVal.at("a").listVal.size(), 3u);
    EXPECT_EQ(value.dictVal.at("a").listVal[0].toInt(), 1);
    EXPECT_DOUBLE_EQ(value.dictVal.at("a").listVal[1].toFloat(), 2.5);
    EXPECT_EQ(value.dictVal.at("a").listVal[2].toString(), "x");
    EXPECT_TRUE(value.dictVal.at("b").isNone());
    EXPECT_EQ(value.dictVal.at("c").type, ScriptValueType::BOOL);
}

TEST_F(ExecutionRunnerTest, NoSentinelMeansNoValue) {
    auto result = runner.run("x = 5", policyWith({}));

    ASSERT_TRUE(result.success);
    EXPECT_FALSE(result.resultValue.has_value());
}

TEST_F(ExecutionRunnerTest, CustomSentinelName) {
    RunnerOptions options;
    options.sentinelName = "answer";
    ExecutionRunner custom(options);

    auto result = custom.run("answer = 6 * 7\n_ = 'ignored'", policyWith({}));
    ASSERT_TRUE(result.success);
    ASSERT_TRUE(result.resultValue.has_value());
    EXPECT_EQ(result.resultValue->toInt(), 42);
}

TEST_F(ExecutionRunnerTest, UnconvertibleValueBecomesRepr) {
    auto result = runner.run("_ = {1, 2}", policyWith({}));

    ASSERT_TRUE(result.success);
    ASSERT_TRUE(result.resultValue.has_value());
    EXPECT_EQ(result.resultValue->type, ScriptValueType::OBJECT);
    EXPECT_EQ(result.resultValue->toString(), "{1, 2}");
}

TEST_F(ExecutionRunnerTest, StdoutAndStderrInterleave) {
    auto result = runner.run("import sys\nprint('out')\nprint('err', file=sys.stderr)\nprint('more')",
                             policyWith({"sys"}));

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.output, "out\nerr\nmore\n");
}

TEST_F(ExecutionRunnerTest, LoneSurrogateKeepsOutput) {
    auto result = runner.run("print('hello world')\nprint('\\ud800')", policyWith({}));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output, "hello world\n\\ud800\n");
}

TEST_F(ExecutionRunnerTest, OutputIsTruncated) {
    RunnerOptions options;
    options.maxOutputBytes = 10;
    ExecutionRunner small(options);

    auto result = small.run("print('x' * 100)", policyWith({}));
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.output, std::string(10, 'x') + "\n[output truncated]");
}

TEST_F(ExecutionRunnerTest, TruncationRespectsUtf8) {
    std::string text = "ab\xc3\xa9";
    EXPECT_EQ(truncateOutput(text, 3), "ab\n[output truncated]");
    EXPECT_EQ(truncateOutput(text, 4), text);
}

TEST_F(ExecutionRunnerTest, ZeroTimeoutIsInvalid) {
    auto result = runner.run("print('hi')", policyWith({}, 0));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, ExecutionStatus::FAILED);
    EXPECT_TRUE(contains(result.error, "Invalid policy: "));
    EXPECT_TRUE(result.output.empty());
}

TEST_F(ExecutionRunnerTest, DeadlineCannotArmOffMainThread) {
    ExecutionResult result;
    std::thread worker([&]() { result = runner.run("print('hi')", policyWith({})); });
    worker.join();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, ExecutionStatus::FAILED);
    EXPECT_TRUE(contains(result.error, "Cannot arm execution deadline: "));
    EXPECT_TRUE(result.output.empty());
}

TEST_F(ExecutionRunnerTest, StatusNames) {
    EXPECT_STREQ(executionStatusName(ExecutionStatus::COMPLETED), "completed");
    EXPECT_STREQ(executionStatusName(ExecutionStatus::TIMED_OUT), "timed_out");
}
