#include "codejudge/config.hpp"
#include "codejudge/judge/output_judge.hpp"
#include "gtest/gtest.h"
#include "test/mock_executor.hpp"

using namespace std;
using namespace codejudge;

TEST(OutputJudgeTest, NormalizeRelaxedTest) {
    EXPECT_EQ(normalize_output("  a   b\n", comparison_mode::RELAXED), "a b");
    EXPECT_EQ(normalize_output("Hello\r\nWORLD\r\n", comparison_mode::RELAXED), "hello world");
    EXPECT_EQ(normalize_output("\t1\t2 \n\n3\n", comparison_mode::RELAXED), "1 2 3");
    EXPECT_EQ(normalize_output("", comparison_mode::RELAXED), "");
    EXPECT_EQ(normalize_output(" \n\t ", comparison_mode::RELAXED), "");
}

TEST(OutputJudgeTest, NormalizeStrictTest) {
    EXPECT_EQ(normalize_output("  a   b\n", comparison_mode::STRICT), "a   b");
    EXPECT_EQ(normalize_output("1\r\n2\r\n", comparison_mode::STRICT), "1\n2");
    EXPECT_EQ(normalize_output("Yes", comparison_mode::STRICT), "Yes");
}

TEST(OutputJudgeTest, RelaxedAndStrictComparisonTest) {
    EXPECT_TRUE(outputs_match("  a   b\n", "a b", comparison_mode::RELAXED));
    EXPECT_FALSE(outputs_match("  a   b\n", "a b", comparison_mode::STRICT));
    EXPECT_TRUE(outputs_match("YES\r\n", "yes", comparison_mode::RELAXED));
    EXPECT_FALSE(outputs_match("YES\r\n", "yes", comparison_mode::STRICT));
    EXPECT_TRUE(outputs_match("1\r\n2\r\n", "1\n2\n", comparison_mode::STRICT));
}

TEST(OutputJudgeTest, ParseComparisonModeTest) {
    EXPECT_EQ(parse_comparison_mode("strict"), comparison_mode::STRICT);
    EXPECT_EQ(parse_comparison_mode(" Relaxed "), comparison_mode::RELAXED);
    EXPECT_EQ(parse_comparison_mode(""), comparison_mode::RELAXED);
    EXPECT_THROW(parse_comparison_mode("fuzzy"), invalid_argument);
}

TEST(OutputJudgeTest, ExpectedOutputTest) {
    case_verdict verdict = judge_case(make_output("3\n", 12, 2048), string("3"), comparison_mode::RELAXED);
    EXPECT_TRUE(verdict.passed);
    EXPECT_EQ(verdict.actual_output, "3\n");
    EXPECT_FALSE(verdict.error);
    EXPECT_EQ(verdict.runtime_ms, 12);
    EXPECT_EQ(verdict.peak_memory_kb, 2048);

    verdict = judge_case(make_output("4\n"), string("3"), comparison_mode::RELAXED);
    EXPECT_FALSE(verdict.passed);
    EXPECT_FALSE(verdict.error);
}

TEST(OutputJudgeTest, NoExpectedOutputTest) {
    // 没有标准输出时只看是否出错，不看输出内容
    EXPECT_TRUE(judge_case(make_output("anything"), nullopt, comparison_mode::RELAXED).passed);
    EXPECT_TRUE(judge_case(make_output(""), nullopt, comparison_mode::RELAXED).passed);
    EXPECT_TRUE(judge_case(make_output("x"), string(""), comparison_mode::RELAXED).passed);

    case_verdict verdict = judge_case(make_crash("Traceback: boom"), nullopt, comparison_mode::RELAXED);
    EXPECT_FALSE(verdict.passed);
    EXPECT_EQ(verdict.error, "Traceback: boom");

    execution_result warned = make_output("ok");
    warned.stderr_text = "warning";
    EXPECT_FALSE(judge_case(warned, nullopt, comparison_mode::RELAXED).passed);

    EXPECT_FALSE(judge_case(make_timeout("partial"), nullopt, comparison_mode::RELAXED).passed);
}

TEST(OutputJudgeTest, TimeoutNeverPassesTest) {
    case_verdict verdict = judge_case(make_timeout("3"), string("3"), comparison_mode::RELAXED);
    EXPECT_FALSE(verdict.passed);
    EXPECT_EQ(verdict.actual_output, "3");
    EXPECT_EQ(verdict.error, "Time limit exceeded");
}

TEST(OutputJudgeTest, NonZeroExitWithoutStderrTest) {
    case_verdict verdict = judge_case(make_crash("", 3), nullopt, comparison_mode::RELAXED);
    EXPECT_FALSE(verdict.passed);
    EXPECT_EQ(verdict.error, "Process exited with code 3");

    execution_result killed = make_crash("", -1);
    killed.signal = 11;
    EXPECT_EQ(judge_case(killed, nullopt, comparison_mode::RELAXED).error, "Process killed by signal 11");
}

TEST(OutputJudgeTest, ServiceUnavailableTest) {
    for (auto failure : {execution_failure::TOOLCHAIN_MISSING, execution_failure::NETWORK_ERROR}) {
        execution_result result = execution_result::make_failure(failure, "g++ not found in PATH, set GXX_BIN");
        case_verdict verdict = judge_case(result, string("3"), comparison_mode::RELAXED);
        EXPECT_FALSE(verdict.passed);
        EXPECT_EQ(verdict.error, "Runtime Error: execution service unavailable");
        EXPECT_FALSE(verdict.runtime_ms);
    }
}

TEST(OutputJudgeTest, ErrorTruncationTest) {
    size_t old_limit = ERROR_LIMIT;
    ERROR_LIMIT = 16;
    case_verdict verdict = judge_case(make_crash(string(100, 'e')), nullopt, comparison_mode::RELAXED);
    ERROR_LIMIT = old_limit;

    ASSERT_TRUE(verdict.error);
    EXPECT_EQ(verdict.error->substr(0, 16), string(16, 'e'));
    EXPECT_NE(verdict.error->find("truncated"), string::npos);
    EXPECT_LT(verdict.error->size(), 100u);
}

TEST(OutputJudgeTest, IdempotentTest) {
    execution_result result = make_output(" Hello  World \r\n");
    case_verdict first = judge_case(result, string("hello world"), comparison_mode::RELAXED);
    for (int i = 0; i < 3; ++i) {
        case_verdict again = judge_case(result, string("hello world"), comparison_mode::RELAXED);
        EXPECT_EQ(again.passed, first.passed);
        EXPECT_EQ(again.actual_output, first.actual_output);
        EXPECT_EQ(again.error, first.error);
    }
}
