#pragma once

namespace codejudge {

/**
 * @brief 表示整个提交的评测状态
 * PENDING -> COMPILING -> RUNNING -> 最终结果（其余 6 种）
 */
enum class status {
    /**
     * @brief 提交正在等待队列中，还未开始评测
     */
    PENDING = 0,

    /**
     * @brief 正在编译，或者解释型语言正在运行第一个数据点
     */
    COMPILING = 1,

    /**
     * @brief 用户程序正在运行
     * 编译完成且所有测试数据点还没有完成评测
     */
    RUNNING = 2,

    /**
     * @brief 所有数据点都通过
     */
    ACCEPTED = 3,

    /**
     * @brief 部分数据点通过
     */
    PARTIAL_CORRECT = 4,

    /**
     * @brief 用户程序无法通过编译，后续数据点都不会运行
     */
    COMPILATION_ERROR = 5,

    /**
     * @brief 没有数据点通过，且没有更具体的错误
     */
    WRONG_ANSWER = 6,

    /**
     * @brief 没有数据点通过，且存在非零退出、抛出异常或执行服务不可用的数据点
     */
    RUNTIME_ERROR = 7,

    /**
     * @brief 没有数据点通过，且存在超时被杀死的数据点
     */
    TIME_LIMIT_EXCEEDED = 8
};

const char *get_display_message(status);

/**
 * @brief 是否为评测结束后的最终状态
 */
bool is_final(status);

}  // namespace codejudge
