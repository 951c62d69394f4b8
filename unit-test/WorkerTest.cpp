#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include "codejudge/common/exceptions.hpp"
#include "codejudge/worker.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/mock_executor.hpp"
#include "test/worker.hpp"

using namespace std;
using namespace codejudge;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Throw;

class WorkerTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }
};

// 停止标记是全局的，所有提交必须在启动 worker 之前入队
TEST_F(WorkerTest, ParallelSubmissionsTest) {
    auto engine = make_shared<::testing::NiceMock<mock_executor>>();
    ON_CALL(*engine, execute(_, _))
        .WillByDefault(Invoke([](const execution_request &request, const cancellation_token &) {
            return make_output(request.stdin_text);
        }));

    submission_judger judger(engine);
    mutex results_mutex;
    map<string, judge_report> reports;
    map<string, string> failures;
    judger.on_judge_finished([&](const submission &submit, const judge_report &report) {
        scoped_lock guard(results_mutex);
        reports[submit.id] = report;
    });

    concurrent_queue<shared_ptr<judge_task>> queue;
    for (int i = 0; i < 8; ++i) {
        submission submit = make_submission(language::PYTHON, "print(input())", {{"1", "1"}, {"2", "2"}});
        submit.id = "accepted-" + to_string(i);
        push_submission(queue, submit);
    }

    submission wrong = make_submission(language::PYTHON, "print(0)", {{"1", "0"}, {"2", "2"}});
    wrong.id = "partial";
    push_submission(queue, wrong);

    submission empty = make_submission(language::PYTHON, "print(0)", {});
    empty.id = "empty";
    push_submission(queue, empty);

    cancellation_token token;
    token.cancel();
    submission cancelled = make_submission(language::PYTHON, "print(0)", {{"1", "1"}});
    cancelled.id = "cancelled";
    push_submission(queue, cancelled, token);

    stop_workers();
    vector<thread> workers;
    for (size_t i = 0; i < 4; ++i)
        workers.push_back(start_worker(i, judger, queue, [&](const submission &submit, const string &message) {
            scoped_lock guard(results_mutex);
            failures[submit.id] = message;
        }));
    for (auto &th : workers) th.join();

    ASSERT_EQ(reports.size(), 9u);
    for (int i = 0; i < 8; ++i) {
        auto &verdict = reports["accepted-" + to_string(i)].verdict;
        EXPECT_EQ(verdict.result, status::ACCEPTED);
        EXPECT_EQ(verdict.score, 100);
    }
    EXPECT_EQ(reports["partial"].verdict.result, status::PARTIAL_CORRECT);
    EXPECT_EQ(reports["partial"].verdict.score, 50);

    ASSERT_EQ(failures.size(), 2u);
    EXPECT_EQ(failures["empty"], "Submission has no test cases");
    EXPECT_TRUE(failures.count("cancelled"));
    EXPECT_TRUE(queue.empty());
}

TEST_F(WorkerTest, InternalErrorTest) {
    auto engine = make_shared<::testing::NiceMock<mock_executor>>();
    ON_CALL(*engine, execute(_, _)).WillByDefault(Throw(internal_error("Unable to create JavaScript runtime")));

    submission_judger judger(engine);
    bool finished = false;
    judger.on_judge_finished([&](const submission &, const judge_report &) { finished = true; });

    concurrent_queue<shared_ptr<judge_task>> queue;
    push_submission(queue, make_submission(language::JAVASCRIPT, "console.log(1)", {{"", "1"}}));

    stop_workers();
    vector<pair<string, string>> failures;
    thread worker = start_worker(0, judger, queue, [&](const submission &submit, const string &message) {
        failures.emplace_back(submit.id, message);
    });
    worker.join();

    EXPECT_FALSE(finished);
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].first, "test");
    EXPECT_EQ(failures[0].second, "Unable to create JavaScript runtime");
}
