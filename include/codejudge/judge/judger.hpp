#pragma once

#include <functional>
#include <memory>
#include <vector>
#include "codejudge/common/cancellation.hpp"
#include "codejudge/exec/execution.hpp"
#include "codejudge/judge/submission.hpp"

namespace codejudge {

/**
 * @brief 按数据点顺序累积评测结果，最后计算提交的汇总结果
 * 判定规则（按优先级）：
 * 1. 出现编译错误：COMPILATION_ERROR，通过数为 0
 * 2. 出现超时，且第一次超时之后没有数据点通过：TIME_LIMIT_EXCEEDED
 * 3. 没有通过且出现运行时错误：RUNTIME_ERROR
 * 4. 全部通过：ACCEPTED
 * 5. 部分通过：PARTIAL_CORRECT
 * 6. 其他情况：WRONG_ANSWER
 * 分数为 floor(100 * 通过数 / 总数)
 */
struct verdict_builder {
    void add_case(const execution_result &result, case_verdict verdict);

    /**
     * @brief 记录编译错误，之后不应再添加数据点
     * @param log 编译器输出，已去掉内部路径
     */
    void compilation_failed(const std::string &log);

    judge_report build(std::size_t total_tests) const;

private:
    std::vector<case_verdict> cases;
    std::size_t passed = 0;
    bool time_limit_exceeded = false;
    // 第一次超时之后是否有数据点通过
    bool passed_after_timeout = false;
    bool runtime_error = false;
    std::optional<std::string> compile_error;
    long runtime_ms = 0;
    std::optional<long> peak_memory_kb;
};

/**
 * @brief 提交评测的协调者
 * 每个提交的状态变化：PENDING -> COMPILING -> RUNNING -> 最终结果。
 * 数据点严格按顺序运行，前一个数据点的进程和临时文件全部清理后才运行下一个。
 * 不会自动重试任何数据点。
 */
struct submission_judger {
    explicit submission_judger(std::shared_ptr<executor> engine);

    /**
     * @brief 评测一个提交并通知所有 on_judge_finished 回调
     * @param submit 要评测的提交，评测过程中不会被修改
     * @param token 取消标记，取消后立即杀死正在运行的数据点并跳过后续数据点
     * @throws std::invalid_argument 提交没有任何数据点
     * @throws cancelled_error 提交被取消，已经完成的数据点结果被丢弃
     */
    judge_report judge(const submission &submit, const cancellation_token &token) const;

    /**
     * @brief 注册状态变化的回调函数，在评测线程中同步调用
     */
    void on_status_changed(std::function<void(const submission &, status)> callback);

    /**
     * @brief 注册评测结束的事件回调函数
     * 这些回调函数会在一个提交评测结束后被调用，通常用于将结果交给外部存储
     */
    void on_judge_finished(std::function<void(const submission &, const judge_report &)> callback);

private:
    void fire_status_changed(const submission &submit, status stat) const;

    void fire_judge_finished(const submission &submit, const judge_report &report) const;

    std::shared_ptr<executor> engine;

    std::vector<std::function<void(const submission &, status)>> status_changed;

    std::vector<std::function<void(const submission &, const judge_report &)>> judge_finished;
};

}  // namespace codejudge
