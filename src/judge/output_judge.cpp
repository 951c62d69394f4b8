#include "codejudge/judge/output_judge.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <stdexcept>
#include "codejudge/common/utils.hpp"
#include "codejudge/config.hpp"

namespace codejudge {
using namespace std;

const char *SERVICE_UNAVAILABLE = "Runtime Error: execution service unavailable";

comparison_mode parse_comparison_mode(const string &mode) {
    string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(mode));
    if (key == "strict") return comparison_mode::STRICT;
    if (key == "relaxed" || key.empty()) return comparison_mode::RELAXED;
    throw invalid_argument("Unknown comparison mode " + mode + ", expected strict or relaxed");
}

const char *to_string(comparison_mode mode) {
    return mode == comparison_mode::STRICT ? "strict" : "relaxed";
}

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

string normalize_output(const string &text, comparison_mode mode) {
    string result = boost::algorithm::replace_all_copy(text, "\r\n", "\n");

    if (mode == comparison_mode::RELAXED) {
        string collapsed;
        collapsed.reserve(result.size());
        bool in_space = false;
        for (char c : result) {
            if (is_space(c)) {
                in_space = true;
                continue;
            }
            if (in_space && !collapsed.empty()) collapsed += ' ';
            in_space = false;
            collapsed += c;
        }
        return boost::algorithm::to_lower_copy(collapsed);
    }

    boost::algorithm::trim_if(result, is_space);
    return result;
}

bool outputs_match(const string &actual, const string &expected, comparison_mode mode) {
    return normalize_output(actual, mode) == normalize_output(expected, mode);
}

static optional<string> error_message(const execution_result &result) {
    if (result.failure == execution_failure::TOOLCHAIN_MISSING || result.failure == execution_failure::NETWORK_ERROR)
        return SERVICE_UNAVAILABLE;
    if (!result.stderr_text.empty())
        return truncate_text(result.stderr_text, ERROR_LIMIT);
    if (result.timed_out)
        return "Time limit exceeded";
    if (result.signal != 0)
        return fmt::format("Process killed by signal {}", result.signal);
    if (result.exit_code != 0)
        return fmt::format("Process exited with code {}", result.exit_code);
    return nullopt;
}

case_verdict judge_case(const execution_result &result, const optional<string> &expected, comparison_mode mode) {
    case_verdict verdict;
    verdict.actual_output = result.stdout_text;
    verdict.error = error_message(result);
    verdict.peak_memory_kb = result.peak_memory_kb;
    if (result.failure == execution_failure::NONE || result.failure == execution_failure::COMPILATION_ERROR)
        verdict.runtime_ms = result.runtime_ms;

    if (result.failure != execution_failure::NONE || result.timed_out) {
        verdict.passed = false;
    } else if (expected && !expected->empty()) {
        verdict.passed = outputs_match(result.stdout_text, *expected, mode);
    } else {
        verdict.passed = result.succeeded() && result.stderr_text.empty();
    }
    return verdict;
}

}  // namespace codejudge
