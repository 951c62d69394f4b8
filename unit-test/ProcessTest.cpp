#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/select.h>
#include <unistd.h>
#include <chrono>
#include <thread>
#include "codejudge/common/exceptions.hpp"
#include "codejudge/exec/process.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace codejudge;

TEST(ProcessTest, EchoStdinTest) {
    process_options opt;
    opt.command = {"/bin/cat"};
    opt.stdin_text = "hello\r\nworld\n";
    opt.time_limit_ms = 3000;

    process_result result = run_process(opt);
    EXPECT_EQ(result.stdout_text, "hello\r\nworld\n");
    EXPECT_EQ(result.stderr_text, "");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.signal, 0);
    EXPECT_FALSE(result.timed_out);
}

TEST(ProcessTest, LargeStdinTest) {
    // 超过管道缓冲区大小，要求边写边读
    string input(1 << 20, 'x');
    process_options opt;
    opt.command = {"/bin/cat"};
    opt.stdin_text = input;
    opt.time_limit_ms = 5000;

    process_result result = run_process(opt);
    EXPECT_EQ(result.stdout_text.size(), input.size());
    EXPECT_EQ(result.exit_code, 0);
}

TEST(ProcessTest, SeparateStreamsTest) {
    process_options opt;
    opt.command = {"/bin/sh", "-c", "echo out; echo err >&2; exit 3"};
    opt.time_limit_ms = 3000;

    process_result result = run_process(opt);
    EXPECT_EQ(result.stdout_text, "out\n");
    EXPECT_EQ(result.stderr_text, "err\n");
    EXPECT_EQ(result.exit_code, 3);
}

TEST(ProcessTest, TimeLimitTest) {
    process_options opt;
    opt.command = {"/bin/sh", "-c", "echo partial; sleep 10"};
    opt.time_limit_ms = 300;

    auto start = chrono::steady_clock::now();
    process_result result = run_process(opt);
    auto elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start).count();

    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.signal, SIGKILL);
    EXPECT_EQ(result.stdout_text, "partial\n");
    EXPECT_GE(result.runtime_ms, 300);
    EXPECT_LT(elapsed, 3000);
}

TEST(ProcessTest, KillsProcessGroupTest) {
    // 后台的 sleep 与 shell 在同一个进程组中，超时后一起被杀死，不会拖住管道
    process_options opt;
    opt.command = {"/bin/sh", "-c", "sleep 10 & sleep 10"};
    opt.time_limit_ms = 200;

    auto start = chrono::steady_clock::now();
    process_result result = run_process(opt);
    auto elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start).count();

    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(elapsed, 3000);
}

TEST(ProcessTest, CancellationTest) {
    cancellation_token token;
    process_options opt;
    opt.command = {"/bin/sleep", "10"};
    opt.time_limit_ms = 10000;
    opt.token = &token;

    thread canceller([token] {
        this_thread::sleep_for(chrono::milliseconds(100));
        token.cancel();
    });
    process_result result = run_process(opt);
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.timed_out);
    EXPECT_LT(result.runtime_ms, 5000);
}

TEST(ProcessTest, OutputLimitTest) {
    process_options opt;
    opt.command = {"/bin/sh", "-c", "head -c 100000 /dev/zero"};
    opt.time_limit_ms = 3000;
    opt.output_limit = 1000;

    process_result result = run_process(opt);
    EXPECT_EQ(result.stdout_text.size(), 1000u);
    EXPECT_EQ(result.exit_code, 0);
}

TEST(ProcessTest, MissingBinaryTest) {
    process_options opt;
    opt.command = {"codejudge-no-such-binary"};
    opt.time_limit_ms = 1000;

    try {
        run_process(opt);
        FAIL() << "expected toolchain_missing_error";
    } catch (toolchain_missing_error &ex) {
        EXPECT_EQ(ex.binary(), "codejudge-no-such-binary");
    }
}

TEST(ProcessTest, MemorySamplingTest) {
    process_options opt;
    opt.command = {"/bin/sh", "-c", "sleep 0.3"};
    opt.time_limit_ms = 3000;
    opt.sample_interval_ms = 20;

    process_result result = run_process(opt);
    EXPECT_EQ(result.exit_code, 0);
    // 采样只在 Linux 上可用
    if (result.peak_memory_kb) EXPECT_GT(*result.peak_memory_kb, 0);
}

TEST(ProcessTest, EmptyCommandTest) {
    process_options opt;
    EXPECT_THROW(run_process(opt), invalid_argument);
}

TEST(ProcessTest, HighDescriptorTest) {
    // 占满低编号的 fd，使子进程的管道编号超过 FD_SETSIZE
    rlimit saved;
    ASSERT_EQ(getrlimit(RLIMIT_NOFILE, &saved), 0);
    rlim_t wanted = FD_SETSIZE + 64;
    if (saved.rlim_max != RLIM_INFINITY && saved.rlim_max < wanted)
        GTEST_SKIP() << "RLIMIT_NOFILE is too small";
    rlimit raised = saved;
    raised.rlim_cur = max<rlim_t>(saved.rlim_cur, wanted);
    ASSERT_EQ(setrlimit(RLIMIT_NOFILE, &raised), 0);

    vector<int> fillers;
    while (fillers.empty() || fillers.back() < FD_SETSIZE) {
        int fd = fcntl(STDERR_FILENO, F_DUPFD_CLOEXEC, 0);
        if (fd < 0) break;
        fillers.push_back(fd);
    }

    process_options opt;
    opt.command = {"/bin/sh", "-c", "cat; echo err >&2"};
    opt.stdin_text = "high\n";
    opt.time_limit_ms = 3000;
    process_result result;
    EXPECT_NO_THROW(result = run_process(opt));

    for (int fd : fillers) close(fd);
    setrlimit(RLIMIT_NOFILE, &saved);

    ASSERT_FALSE(fillers.empty());
    EXPECT_GE(fillers.back(), FD_SETSIZE);
    EXPECT_EQ(result.stdout_text, "high\n");
    EXPECT_EQ(result.stderr_text, "err\n");
    EXPECT_EQ(result.exit_code, 0);
}
