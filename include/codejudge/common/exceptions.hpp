#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <stdexcept>
#include <string>

namespace codejudge {

struct judge_exception : std::exception {
    explicit judge_exception(const std::string &message);

    const char *what() const noexcept override;

    /**
     * @brief 异常构造时的调用栈，只用于日志
     */
    const boost::stacktrace::stacktrace &trace() const;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 比如创建管道、fork 失败
 */
struct internal_error : public judge_exception {
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示网络错误，通常由 CURL 产生
 */
struct network_error : public judge_exception {
    explicit network_error(const std::string &message);
};

/**
 * @brief 表示选手代码编译错误
 */
struct compilation_error : public judge_exception {
    const std::string error_log;

    compilation_error(const std::string &message, const std::string &error_log);
};

/**
 * @brief 表示编译器或解释器无法启动
 * 这是运维问题而不是选手代码的问题，错误信息需要指出可以覆盖路径的环境变量
 */
struct toolchain_missing_error : public judge_exception {
    toolchain_missing_error(const std::string &message, const std::string &binary);

    /**
     * @brief 无法启动的程序名
     */
    const std::string &binary() const;

private:
    std::string binary_name;
};

/**
 * @brief 提交的评测被取消
 * 已经评测完的数据点结果将被丢弃
 */
struct cancelled_error : public judge_exception {
    cancelled_error();
    explicit cancelled_error(const std::string &message);
};

}  // namespace codejudge
