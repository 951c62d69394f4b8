#include "codejudge/judge/judger.hpp"
#include <glog/logging.h>
#include <stdexcept>
#include "codejudge/common/exceptions.hpp"
#include "codejudge/common/utils.hpp"
#include "codejudge/config.hpp"

namespace codejudge {
using namespace std;

void verdict_builder::add_case(const execution_result &result, case_verdict verdict) {
    if (verdict.passed) {
        ++passed;
        if (time_limit_exceeded) passed_after_timeout = true;
    }
    if (result.timed_out) time_limit_exceeded = true;
    if (result.runtime_error()) runtime_error = true;
    if (verdict.runtime_ms) runtime_ms += max(0L, *verdict.runtime_ms);
    if (verdict.peak_memory_kb)
        peak_memory_kb = max(peak_memory_kb.value_or(0), *verdict.peak_memory_kb);
    cases.push_back(move(verdict));
}

void verdict_builder::compilation_failed(const string &log) {
    compile_error = log;
}

judge_report verdict_builder::build(size_t total_tests) const {
    judge_report report;
    report.cases = cases;

    submission_verdict &verdict = report.verdict;
    verdict.total_tests = total_tests;
    verdict.tests_passed = passed;
    verdict.runtime_ms = runtime_ms;
    verdict.peak_memory_kb = peak_memory_kb;

    if (compile_error) {
        verdict.result = status::COMPILATION_ERROR;
        verdict.tests_passed = 0;
        verdict.compile_error = compile_error;
    } else if (time_limit_exceeded && !passed_after_timeout) {
        verdict.result = status::TIME_LIMIT_EXCEEDED;
    } else if (runtime_error && passed == 0) {
        verdict.result = status::RUNTIME_ERROR;
    } else if (total_tests > 0 && passed == total_tests) {
        verdict.result = status::ACCEPTED;
    } else if (passed > 0) {
        verdict.result = status::PARTIAL_CORRECT;
    } else {
        verdict.result = status::WRONG_ANSWER;
    }

    if (total_tests > 0)
        verdict.score = (int)(100 * verdict.tests_passed / total_tests);
    return report;
}

submission_judger::submission_judger(shared_ptr<executor> engine)
    : engine(move(engine)) {}

judge_report submission_judger::judge(const submission &submit, const cancellation_token &token) const {
    if (submit.test_cases.empty())
        throw invalid_argument("Submission has no test cases");

    LOG(INFO) << "Judging " << submit << " with " << submit.test_cases.size() << " test cases";
    elapsed_time elapsed;
    fire_status_changed(submit, status::COMPILING);

    verdict_builder builder;
    for (size_t i = 0; i < submit.test_cases.size(); ++i) {
        if (token.is_cancelled()) throw cancelled_error();

        const test_case &tc = submit.test_cases[i];
        execution_request request;
        request.lang = submit.lang;
        request.source = submit.source;
        request.stdin_text = tc.input;
        request.time_limit_ms = submit.time_limit_ms;
        request.memory_limit_kb = submit.memory_limit_kb;
        request.version = submit.version;

        execution_result result = engine->execute(request, token);
        if (token.is_cancelled()) throw cancelled_error();

        if (result.failure == execution_failure::COMPILATION_ERROR) {
            DLOG(INFO) << submit << " failed to compile at test case " << i;
            builder.compilation_failed(truncate_text(result.stderr_text, ERROR_LIMIT));
            break;
        }

        builder.add_case(result, judge_case(result, tc.expected_output, submit.mode));
        if (i == 0) fire_status_changed(submit, status::RUNNING);
    }

    judge_report report = builder.build(submit.test_cases.size());
    fire_status_changed(submit, report.verdict.result);

    LOG(INFO) << "Judged " << submit << ": " << get_display_message(report.verdict.result) << " "
              << report.verdict.tests_passed << "/" << report.verdict.total_tests << " in "
              << elapsed.duration<chrono::milliseconds>().count() << "ms";
    fire_judge_finished(submit, report);
    return report;
}

void submission_judger::on_status_changed(function<void(const submission &, status)> callback) {
    status_changed.push_back(callback);
}

void submission_judger::on_judge_finished(function<void(const submission &, const judge_report &)> callback) {
    judge_finished.push_back(callback);
}

void submission_judger::fire_status_changed(const submission &submit, status stat) const {
    for (auto &f : status_changed) f(submit, stat);
}

void submission_judger::fire_judge_finished(const submission &submit, const judge_report &report) const {
    for (auto &f : judge_finished) f(submit, report);
}

}  // namespace codejudge
