#include "codejudge/common/json_utils.hpp"
#include "codejudge/config.hpp"
#include "codejudge/judge/submission.hpp"
#include "gtest/gtest.h"
#include "test/worker.hpp"

using namespace std;
using namespace codejudge;
using namespace nlohmann;

class SubmissionTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }
};

TEST_F(SubmissionTest, ParseInputContractTest) {
    json j = json::parse(R"json({
        "id": "sub-1",
        "language": "Python3",
        "source": "print(input())",
        "testCases": [
            {"input": "1\n", "expectedOutput": "1"},
            {"input": "2\n", "expectedOutput": ""},
            {"input": "3\n", "expectedOutput": null},
            {"input": "4\n"}
        ],
        "comparisonMode": "strict",
        "timeLimitMs": 2000,
        "memoryLimitKb": 65536,
        "action": "run"
    })json");
    submission submit = j.get<submission>();

    EXPECT_EQ(submit.id, "sub-1");
    EXPECT_EQ(submit.lang, language::PYTHON);
    EXPECT_EQ(submit.source, "print(input())");
    ASSERT_EQ(submit.test_cases.size(), 4u);
    EXPECT_EQ(submit.test_cases[0].input, "1\n");
    EXPECT_EQ(submit.test_cases[0].expected_output, "1");
    // 空字符串、null 与缺失都视为没有标准输出
    EXPECT_FALSE(submit.test_cases[1].expected_output);
    EXPECT_FALSE(submit.test_cases[2].expected_output);
    EXPECT_FALSE(submit.test_cases[3].expected_output);
    EXPECT_EQ(submit.mode, comparison_mode::STRICT);
    EXPECT_EQ(submit.time_limit_ms, 2000);
    EXPECT_EQ(submit.memory_limit_kb, 65536);
    EXPECT_EQ(submit.detail, detail_level::FULL);
}

TEST_F(SubmissionTest, DefaultsTest) {
    json j = json::parse(R"({"language": "cpp", "code": "int main() {}", "testCases": []})");
    submission submit = j.get<submission>();

    EXPECT_EQ(submit.id, "");
    EXPECT_EQ(submit.source, "int main() {}");
    EXPECT_TRUE(submit.test_cases.empty());
    EXPECT_EQ(submit.mode, comparison_mode::RELAXED);
    EXPECT_EQ(submit.time_limit_ms, TIME_LIMIT_MS);
    EXPECT_FALSE(submit.memory_limit_kb);
    EXPECT_FALSE(submit.version);
    EXPECT_EQ(submit.detail, detail_level::SUMMARY);
}

TEST_F(SubmissionTest, InvalidSubmissionTest) {
    EXPECT_THROW(json::parse(R"({"language": "cobol", "source": "", "testCases": []})").get<submission>(), invalid_argument);
    EXPECT_THROW(json::parse(R"({"source": "", "testCases": []})").get<submission>(), invalid_argument);
    EXPECT_THROW(json::parse(R"({"language": "cpp", "testCases": []})").get<submission>(), invalid_argument);
    EXPECT_THROW(json::parse(R"({"language": "cpp", "source": ""})").get<submission>(), invalid_argument);
    EXPECT_THROW(json::parse(R"({"language": "cpp", "source": "", "testCases": {}})").get<submission>(), invalid_argument);
    EXPECT_THROW(json::parse(R"({"language": "cpp", "source": "", "testCases": [{"expectedOutput": 3}]})").get<submission>(), invalid_argument);
    EXPECT_THROW(json::parse(R"({"language": "cpp", "source": "", "testCases": [], "comparisonMode": "fuzzy"})").get<submission>(), invalid_argument);
    EXPECT_THROW(json::parse(R"({"language": "cpp", "source": "", "testCases": [], "timeLimitMs": 0})").get<submission>(), invalid_argument);
    EXPECT_THROW(json::parse(R"({"language": "cpp", "source": "", "testCases": [], "action": "deploy"})").get<submission>(), invalid_argument);
    EXPECT_THROW(json::parse("[]").get<submission>(), invalid_argument);
}

TEST_F(SubmissionTest, DetailLevelTest) {
    EXPECT_EQ(parse_detail_level("run"), detail_level::FULL);
    EXPECT_EQ(parse_detail_level("full"), detail_level::FULL);
    EXPECT_EQ(parse_detail_level("Submit"), detail_level::SUMMARY);
    EXPECT_EQ(parse_detail_level("summary"), detail_level::SUMMARY);
    EXPECT_THROW(parse_detail_level("verbose"), invalid_argument);
}

TEST_F(SubmissionTest, InvalidUtf8OutputTest) {
    submission submit = make_submission(language::CPP, "int main() {}", {{"1", "1"}});
    judge_report report;
    report.verdict.result = status::WRONG_ANSWER;
    report.verdict.total_tests = 1;
    report.cases.push_back(case_verdict{false, "\xff\xfe", string("\xff"), 3L, nullopt});

    json j = codejudge::to_json(submit, report, detail_level::FULL);
    string line;
    ASSERT_NO_THROW(line = dump_lossy(j));
    EXPECT_EQ(line.find('\n'), string::npos);

    // 非法字节被替换为 U+FFFD，输出仍然是合法的 JSON
    json parsed = json::parse(line);
    EXPECT_EQ(parsed["status"], "Wrong Answer");
    EXPECT_EQ(parsed["cases"][0]["actualOutput"], "\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(parsed["cases"][0]["error"], "\xEF\xBF\xBD");
}
