#pragma once

#include <optional>
#include <string>
#include "codejudge/exec/execution.hpp"

namespace codejudge {

enum class comparison_mode {
    /**
     * @brief 只统一换行符并去掉首尾空白，然后精确比较
     */
    STRICT,

    /**
     * @brief 忽略空白字符的数量以及大小写
     */
    RELAXED
};

/**
 * @brief 解析比较模式，空字符串表示默认的 relaxed
 * @throws std::invalid_argument 不是 strict 或 relaxed
 */
comparison_mode parse_comparison_mode(const std::string &mode);

const char *to_string(comparison_mode mode);

/**
 * @brief 规范化程序输出，步骤的顺序不能改变
 * 1. CRLF 转换为 LF
 * 2. RELAXED: 连续的空白字符合并为一个空格并去掉首尾空白；STRICT: 只去掉首尾空白
 * 3. RELAXED: 全部转换为小写
 */
std::string normalize_output(const std::string &text, comparison_mode mode);

bool outputs_match(const std::string &actual, const std::string &expected, comparison_mode mode);

/**
 * @brief 单个数据点的评测结果
 */
struct case_verdict {
    bool passed = false;

    /**
     * @brief 程序的标准输出（未规范化）
     */
    std::string actual_output;

    /**
     * @brief 展示给用户的错误信息，已截断且去掉了内部路径
     */
    std::optional<std::string> error;

    std::optional<long> runtime_ms;

    std::optional<long> peak_memory_kb;
};

/**
 * @brief 评测一个数据点
 * 没有标准输出（为空）的数据点只检查程序是否正常结束且没有 stderr 输出；
 * 否则比较规范化后的输出。超时、编译错误以及执行服务不可用的数据点一定不通过。
 * 对于同样的输入总是返回同样的结果。
 * @param result 程序的执行结果
 * @param expected 标准输出
 * @param mode 比较模式
 */
case_verdict judge_case(const execution_result &result, const std::optional<std::string> &expected, comparison_mode mode);

}  // namespace codejudge
