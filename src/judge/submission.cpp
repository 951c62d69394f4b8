#include "codejudge/judge/submission.hpp"
#include <boost/algorithm/string.hpp>
#include <stdexcept>
#include "codejudge/common/json_utils.hpp"
#include "codejudge/config.hpp"

namespace codejudge {
using namespace std;
using namespace nlohmann;

detail_level parse_detail_level(const string &level) {
    string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(level));
    if (key == "full" || key == "run") return detail_level::FULL;
    if (key == "summary" || key == "submit") return detail_level::SUMMARY;
    throw invalid_argument("Unknown detail level " + level + ", expected full or summary");
}

static void from_json(const json &j, test_case &tc) {
    tc.input = get_value_def<string>(j, "", "input");
    if (exists(j, "expectedOutput")) {
        const json &expected = j.at("expectedOutput");
        if (!expected.is_string())
            throw build_invalid_argument(j, "expectedOutput");
        string text = expected.get<string>();
        if (!text.empty()) tc.expected_output = text;
    }
}

void from_json(const json &j, submission &submit) {
    if (!j.is_object())
        throw invalid_argument("Submission must be a JSON object");

    submit.id.clear();
    assign_optional(j, submit.id, "id");
    submit.lang = parse_language(get_value<string>(j, "language"));
    if (exists(j, "source"))
        submit.source = get_value<string>(j, "source");
    else
        submit.source = get_value<string>(j, "code");

    const json &cases = access(j, "testCases");
    if (!cases.is_array())
        throw build_invalid_argument(j, "testCases");
    submit.test_cases.clear();
    for (auto &c : cases) {
        test_case tc;
        from_json(c, tc);
        submit.test_cases.push_back(move(tc));
    }

    submit.mode = parse_comparison_mode(get_value_def<string>(j, COMPARISON_MODE, "comparisonMode"));
    submit.time_limit_ms = get_value_def<int>(j, TIME_LIMIT_MS, "timeLimitMs");
    if (submit.time_limit_ms <= 0)
        throw build_invalid_argument(j, "timeLimitMs");
    submit.memory_limit_kb = nullopt;
    if (exists(j, "memoryLimitKb"))
        submit.memory_limit_kb = get_value<long>(j, "memoryLimitKb");
    submit.version = nullopt;
    if (exists(j, "version"))
        submit.version = get_value<string>(j, "version");
    submit.detail = parse_detail_level(get_value_def<string>(j, "submit", "action"));
}

json to_json(const case_verdict &verdict) {
    json j = {
        {"passed", verdict.passed},
        {"actualOutput", verdict.actual_output}};
    if (verdict.error) j["error"] = *verdict.error;
    if (verdict.runtime_ms) j["runtimeMs"] = *verdict.runtime_ms;
    if (verdict.peak_memory_kb) j["peakMemoryKb"] = *verdict.peak_memory_kb;
    return j;
}

json to_json(const submission &submit, const judge_report &report, detail_level detail) {
    const submission_verdict &verdict = report.verdict;
    json j = {
        {"status", get_display_message(verdict.result)},
        {"testsPassed", verdict.tests_passed},
        {"totalTests", verdict.total_tests},
        {"runtimeMs", verdict.runtime_ms},
        {"peakMemoryKb", nullptr},
        {"score", verdict.score}};
    if (!submit.id.empty()) j["id"] = submit.id;
    if (verdict.peak_memory_kb) j["peakMemoryKb"] = *verdict.peak_memory_kb;
    if (verdict.compile_error) j["compileError"] = *verdict.compile_error;

    if (detail == detail_level::FULL) {
        json cases = json::array();
        for (auto &c : report.cases) cases.push_back(to_json(c));
        j["cases"] = cases;
    }
    return j;
}

}  // namespace codejudge
