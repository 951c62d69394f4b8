#include "codejudge/worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <atomic>
#include <chrono>
#include "codejudge/common/exceptions.hpp"

namespace codejudge {
using namespace std;

// 停止 worker 的标记
static atomic<bool> stop(false);

// 队列为空时等待新提交的最长时间，之后重新检查停止标记
const chrono::milliseconds idle_wait(10);

void stop_workers() {
    stop = true;
}

static void worker_loop(size_t worker_id, const submission_judger &judger,
                        concurrent_queue<shared_ptr<judge_task>> &task_queue,
                        const failure_handler &on_failure) {
    DLOG(INFO) << "Worker " << worker_id << " started";

    while (true) {
        shared_ptr<judge_task> task;
        if (!task_queue.pop_for(task, idle_wait)) {
            // 停止后不会再有新提交入队，队列为空时自然退出
            if (stop) break;
            continue;
        }

        try {
            judger.judge(task->submit, task->token);
        } catch (cancelled_error &ex) {
            LOG(WARNING) << "Worker " << worker_id << ": " << task->submit << " was cancelled";
            on_failure(task->submit, ex.what());
        } catch (invalid_argument &ex) {
            LOG(WARNING) << "Worker " << worker_id << ": " << task->submit << " is invalid, " << ex.what();
            on_failure(task->submit, ex.what());
        } catch (judge_exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed when judging " << task->submit << ", "
                       << ex.what() << endl
                       << ex.trace();
            on_failure(task->submit, ex.what());
        } catch (exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed when judging " << task->submit << ", "
                       << ex.what() << endl
                       << boost::diagnostic_information(ex);
            on_failure(task->submit, ex.what());
        }
    }

    DLOG(INFO) << "Worker " << worker_id << " stopped";
}

thread start_worker(size_t worker_id, const submission_judger &judger,
                    concurrent_queue<shared_ptr<judge_task>> &task_queue,
                    failure_handler on_failure) {
    return thread([worker_id, &judger, &task_queue, on_failure = move(on_failure)] {
        worker_loop(worker_id, judger, task_queue, on_failure);
    });
}

}  // namespace codejudge
