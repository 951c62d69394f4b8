#pragma once

#include <atomic>
#include <memory>

namespace codejudge {

/**
 * @brief 提交级别的取消标记
 * 拷贝后的 token 共享同一个标记，调用方保留一份用于 cancel()，
 * 执行器在轮询时检查 is_cancelled()。
 */
struct cancellation_token {
    cancellation_token();

    void cancel() const noexcept;

    bool is_cancelled() const noexcept;

private:
    std::shared_ptr<std::atomic<bool>> flag;
};

}  // namespace codejudge
