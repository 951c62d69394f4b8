#pragma once

#include <chrono>
#include <functional>
#include <mutex>

namespace codejudge {

/**
 * @brief 熔断器，保护不稳定的外部服务
 *
 * CLOSED: 正常放行，连续失败 failure_threshold 次后进入 OPEN
 * OPEN: 拒绝所有请求，经过 cooldown 后进入 HALF_OPEN
 * HALF_OPEN: 只放行一个试探请求，成功则回到 CLOSED，失败则重新进入 OPEN
 *
 * 每个需要保护的服务持有自己的熔断器实例，时钟可以注入以便测试。
 */
struct circuit_breaker {
    enum class state {
        CLOSED,
        OPEN,
        HALF_OPEN
    };

    using clock_type = std::function<std::chrono::steady_clock::time_point()>;

    circuit_breaker(int failure_threshold, std::chrono::milliseconds cooldown, clock_type clock = std::chrono::steady_clock::now);

    /**
     * @brief 当前是否允许发出请求
     * 在 HALF_OPEN 状态下返回 true 即占用了唯一的试探名额，
     * 调用方必须随后调用 record_success 或 record_failure
     */
    bool allow_request();

    void record_success();

    void record_failure();

    state current_state();

private:
    void transit(state next);

    const int failure_threshold;
    const std::chrono::milliseconds cooldown;
    clock_type clock;

    std::mutex mut;
    state st = state::CLOSED;
    int consecutive_failures = 0;
    bool trial_in_flight = false;
    std::chrono::steady_clock::time_point opened_at;
};

const char *to_string(circuit_breaker::state st);

}  // namespace codejudge
