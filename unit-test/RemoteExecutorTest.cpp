#include <signal.h>
#include <memory>
#include "codejudge/common/exceptions.hpp"
#include "codejudge/exec/remote_executor.hpp"
#include "gtest/gtest.h"
#include "test/worker.hpp"

using namespace std;
using namespace codejudge;

// 不会有服务监听的本地端口，连接会被立即拒绝
static const string UNREACHABLE_URL = "http://127.0.0.1:1";

class RemoteExecutorTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    static execution_request make_request(language lang) {
        execution_request request;
        request.lang = lang;
        request.source = "print(input())";
        request.stdin_text = "1\n";
        request.time_limit_ms = 3000;
        return request;
    }
};

TEST_F(RemoteExecutorTest, ParseSuccessfulResponseTest) {
    string body = R"({"language":"python","version":"3.11.0",
        "run":{"stdout":"1\n","stderr":"","code":0,"signal":null,"output":"1\n","wall_time":42,"memory":8388608}})";
    execution_result result = parse_execute_response(200, body, 120, 3000);
    EXPECT_EQ(result.failure, execution_failure::NONE);
    EXPECT_EQ(result.stdout_text, "1\n");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.signal, 0);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.runtime_ms, 42);
    EXPECT_EQ(result.peak_memory_kb, 8192);
}

TEST_F(RemoteExecutorTest, RoundTripTimeFallbackTest) {
    string body = R"({"run":{"stdout":"x","stderr":"","code":0,"signal":null}})";
    execution_result result = parse_execute_response(200, body, 120, 3000);
    EXPECT_EQ(result.runtime_ms, 120);
    EXPECT_FALSE(result.peak_memory_kb);
}

TEST_F(RemoteExecutorTest, ParseCompileErrorTest) {
    string body = R"({"compile":{"stdout":"","stderr":"main.cpp:1:1: error: expected","code":1,"signal":null},
        "run":{"stdout":"","stderr":"","code":null,"signal":null}})";
    execution_result result = parse_execute_response(200, body, 10, 3000);
    EXPECT_EQ(result.failure, execution_failure::COMPILATION_ERROR);
    EXPECT_EQ(result.stderr_text, "main.cpp:1:1: error: expected");
}

TEST_F(RemoteExecutorTest, ParseTimeoutTest) {
    string body = R"({"run":{"stdout":"partial","stderr":"","code":null,"signal":"SIGKILL"}})";
    execution_result result = parse_execute_response(200, body, 3100, 3000);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.signal, SIGKILL);
    EXPECT_EQ(result.stdout_text, "partial");
    EXPECT_EQ(result.stderr_text, "Time limit exceeded");

    body = R"({"run":{"stdout":"","stderr":"","code":null,"signal":"SIGKILL","status":"TO","wall_time":3001}})";
    EXPECT_TRUE(parse_execute_response(200, body, 3100, 3000).timed_out);
}

TEST_F(RemoteExecutorTest, ParseRuntimeErrorTest) {
    string body = R"({"run":{"stdout":"","stderr":"Segmentation fault","code":null,"signal":"SIGSEGV","wall_time":5}})";
    execution_result result = parse_execute_response(200, body, 50, 3000);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.signal, SIGSEGV);
    EXPECT_TRUE(result.runtime_error());
}

TEST_F(RemoteExecutorTest, ParseHttpErrorTest) {
    execution_result result = parse_execute_response(503, "Service Unavailable", 10, 3000);
    EXPECT_EQ(result.failure, execution_failure::NETWORK_ERROR);
    EXPECT_EQ(result.stdout_text, "");
    EXPECT_NE(result.stderr_text.find("503"), string::npos);
    EXPECT_NE(result.stderr_text.find("Service Unavailable"), string::npos);
}

TEST_F(RemoteExecutorTest, ParseMalformedResponseTest) {
    execution_result result = parse_execute_response(200, "<html>oops</html>", 10, 3000);
    EXPECT_EQ(result.failure, execution_failure::NETWORK_ERROR);
    EXPECT_NE(result.stderr_text.find("<html>oops</html>"), string::npos);

    EXPECT_EQ(parse_execute_response(200, R"({"message":"no run"})", 10, 3000).failure, execution_failure::NETWORK_ERROR);
}

TEST_F(RemoteExecutorTest, RuntimeMatchesTest) {
    remote_runtime runtime = nlohmann::json::parse(R"({"language":"c++","version":"10.2.0","aliases":["cpp","g++"]})").get<remote_runtime>();
    EXPECT_TRUE(runtime_matches(runtime, language::CPP));
    EXPECT_FALSE(runtime_matches(runtime, language::JAVA));

    remote_runtime python = nlohmann::json::parse(R"({"language":"python","version":"3.10.0"})").get<remote_runtime>();
    EXPECT_TRUE(runtime_matches(python, language::PYTHON));
    EXPECT_TRUE(python.aliases.empty());
}

TEST_F(RemoteExecutorTest, UnreachableServiceTest) {
    auto breaker = make_shared<circuit_breaker>(3, chrono::seconds(30));
    remote_executor remote(UNREACHABLE_URL, breaker, {{language::PYTHON, "3.11.0"}}, 2000);

    execution_result result = remote.execute(make_request(language::PYTHON), cancellation_token());
    EXPECT_EQ(result.failure, execution_failure::NETWORK_ERROR);
    EXPECT_EQ(result.stdout_text, "");
    EXPECT_FALSE(result.stderr_text.empty());
    EXPECT_EQ(breaker->current_state(), circuit_breaker::state::CLOSED);
}

TEST_F(RemoteExecutorTest, CircuitOpensAndFailsFastTest) {
    auto breaker = make_shared<circuit_breaker>(2, chrono::seconds(30));
    remote_executor remote(UNREACHABLE_URL + "/", breaker, {{language::CPP, "10.2.0"}}, 2000);

    for (int i = 0; i < 2; ++i)
        EXPECT_EQ(remote.execute(make_request(language::CPP), cancellation_token()).failure, execution_failure::NETWORK_ERROR);
    EXPECT_EQ(breaker->current_state(), circuit_breaker::state::OPEN);

    execution_result result = remote.execute(make_request(language::CPP), cancellation_token());
    EXPECT_EQ(result.failure, execution_failure::NETWORK_ERROR);
    EXPECT_NE(result.stderr_text.find("circuit open"), string::npos);
}

TEST_F(RemoteExecutorTest, PinnedVersionSkipsDiscoveryTest) {
    auto breaker = make_shared<circuit_breaker>(3, chrono::seconds(30));
    remote_executor remote(UNREACHABLE_URL, breaker, {}, 2000);

    execution_request request = make_request(language::JAVA);
    request.version = "15.0.2";
    EXPECT_EQ(remote.resolve_version(request, cancellation_token()), "15.0.2");

    // 没有默认版本时需要查询 /runtimes，服务不可达时抛出 network_error
    EXPECT_THROW(remote.resolve_version(make_request(language::JAVA), cancellation_token()), network_error);
}

TEST_F(RemoteExecutorTest, InvalidUtf8RequestTest) {
    auto breaker = make_shared<circuit_breaker>(3, chrono::seconds(30));
    remote_executor remote(UNREACHABLE_URL, breaker, {{language::PYTHON, "3.11.0"}}, 2000);

    execution_request request = make_request(language::PYTHON);
    request.source = "print('\xff')";
    request.stdin_text = "\xff\xfe";
    execution_result result;
    EXPECT_NO_THROW(result = remote.execute(request, cancellation_token()));
    EXPECT_EQ(result.failure, execution_failure::NETWORK_ERROR);
    EXPECT_EQ(result.stderr_text.find("circuit open"), string::npos);
}

TEST_F(RemoteExecutorTest, HalfOpenTrialIsReleasedTest) {
    auto breaker = make_shared<circuit_breaker>(1, chrono::milliseconds(0));
    remote_executor remote(UNREACHABLE_URL, breaker, {{language::PYTHON, "3.11.0"}}, 2000);

    remote.execute(make_request(language::PYTHON), cancellation_token());
    EXPECT_EQ(breaker->current_state(), circuit_breaker::state::OPEN);

    // 冷却时间为 0，下一个请求就是 HALF_OPEN 的试探请求
    execution_request request = make_request(language::PYTHON);
    request.stdin_text = "\xff";
    EXPECT_NO_THROW(remote.execute(request, cancellation_token()));
    EXPECT_EQ(breaker->current_state(), circuit_breaker::state::OPEN);

    // 试探名额已经释放，后续请求仍然会真正发出而不是被直接拒绝
    execution_result result = remote.execute(make_request(language::PYTHON), cancellation_token());
    EXPECT_EQ(result.failure, execution_failure::NETWORK_ERROR);
    EXPECT_EQ(result.stderr_text.find("circuit open"), string::npos);
}
