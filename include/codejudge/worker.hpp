#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>
#include "codejudge/common/cancellation.hpp"
#include "codejudge/common/concurrent_queue.hpp"
#include "codejudge/judge/judger.hpp"
#include "codejudge/judge/submission.hpp"

/**
 * 评测 worker 相关函数
 * 主线程把读入的提交放入 task_queue，每个 worker 线程从队列中取出一个提交，
 * 交给 submission_judger 完整评测之后再取下一个。
 *
 * 同一个提交的数据点在同一个 worker 中顺序运行，不同提交之间可以完全并行。
 * worker 之间除了队列之外没有共享的可变状态，评测结果通过 judger 的
 * on_judge_finished 回调返回。
 */
namespace codejudge {

/**
 * @brief 等待评测的提交
 */
struct judge_task {
    submission submit;

    /**
     * @brief 提交的取消标记，调用方保留一份拷贝用于取消
     */
    cancellation_token token;
};

/**
 * @brief 提交无法评测（格式错误、被取消或者内部错误）时的回调
 */
using failure_handler = std::function<void(const submission &, const std::string &)>;

/**
 * @brief 停止所有的 worker
 * 调用该函数后，worker 在评测队列为空时退出，正在评测的提交会评测完成。
 */
void stop_workers();

/**
 * @brief 启动评测 worker 线程
 * @param worker_id worker 编号，只用于日志
 * @param judger 评测器，必须在所有 worker 退出之后才能销毁
 * @param task_queue 等待评测的提交队列
 * @param on_failure 提交评测失败时的回调，在 worker 线程中调用
 * @return 产生的线程
 */
std::thread start_worker(std::size_t worker_id, const submission_judger &judger,
                         concurrent_queue<std::shared_ptr<judge_task>> &task_queue,
                         failure_handler on_failure);

}  // namespace codejudge
