#pragma once

#include <optional>
#include <string>
#include "codejudge/common/cancellation.hpp"
#include "codejudge/exec/language.hpp"

namespace codejudge {

/**
 * @brief 一次执行请求，创建后不再修改
 */
struct execution_request {
    language lang = language::JAVASCRIPT;

    std::string source;

    /**
     * @brief 完整的标准输入，写入后关闭输入流
     */
    std::string stdin_text;

    /**
     * @brief 时钟时间限制（毫秒）
     */
    int time_limit_ms = 3000;

    std::optional<long> memory_limit_kb;

    /**
     * @brief 远程执行时指定的工具链版本，为空时自动选择
     */
    std::optional<std::string> version;
};

/**
 * @brief 执行失败的种类
 * 除 NONE 以外的失败都以数据的形式返回，而不是抛出异常
 */
enum class execution_failure {
    NONE,

    /**
     * @brief 选手代码编译失败，stderr 为编译器输出，运行步骤没有开始
     */
    COMPILATION_ERROR,

    /**
     * @brief 编译器或解释器无法启动，stderr 说明缺失的程序及覆盖路径的环境变量
     */
    TOOLCHAIN_MISSING,

    /**
     * @brief 远程执行服务不可达、超时或者返回了非 2xx 响应
     */
    NETWORK_ERROR
};

const char *to_string(execution_failure failure);

struct execution_result {
    std::string stdout_text;
    std::string stderr_text;

    /**
     * @brief 退出码，被信号杀死时为 -1；沙箱中 0 表示正常，1 表示抛出了异常
     */
    int exit_code = 0;

    /**
     * @brief 杀死进程的信号，没有时为 0
     */
    int signal = 0;

    bool timed_out = false;

    /**
     * @brief 从进程（或脚本）开始到结束或被杀死的时钟时间
     */
    long runtime_ms = 0;

    std::optional<long> peak_memory_kb;

    execution_failure failure = execution_failure::NONE;

    /**
     * @brief 程序正常结束：没有失败、没有超时、退出码为 0
     */
    bool succeeded() const;

    /**
     * @brief 是否为运行时错误：非零退出、被信号杀死，或执行服务不可用
     * 超时与编译错误不属于运行时错误
     */
    bool runtime_error() const;

    static execution_result make_failure(execution_failure failure, const std::string &message);
};

/**
 * @brief 执行器，每种执行方式（进程内沙箱、子进程、远程服务）实现一次
 * execute 对同一个执行器可以并发调用，每个请求使用独立的临时文件夹或沙箱上下文。
 */
struct executor {
    virtual ~executor() = default;

    /**
     * @brief 执行一次请求
     * 编译错误、工具链缺失、网络错误都通过返回值的 failure 表示。
     * @param request 执行请求
     * @param token 取消标记，被取消时尽快杀死正在运行的程序并返回
     */
    virtual execution_result execute(const execution_request &request, const cancellation_token &token) = 0;
};

}  // namespace codejudge
