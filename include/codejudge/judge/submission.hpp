#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "codejudge/common/status.hpp"
#include "codejudge/exec/language.hpp"
#include "codejudge/judge/output_judge.hpp"

namespace codejudge {

/**
 * @brief 一个测试数据点，评测过程中只读
 */
struct test_case {
    std::string input;

    /**
     * @brief 标准输出，缺失、null 或者空字符串都视为没有标准输出
     */
    std::optional<std::string> expected_output;
};

/**
 * @brief 返回给提交存储的详细程度
 */
enum class detail_level {
    /**
     * @brief 只返回汇总结果，对应 submit 操作
     */
    SUMMARY,

    /**
     * @brief 同时返回每个数据点的结果，对应 run 操作
     */
    FULL
};

/**
 * @throws std::invalid_argument 不是 summary, full, run, submit 之一
 */
detail_level parse_detail_level(const std::string &level);

/**
 * @brief 一个选手提交
 * JSON 格式：
 * {
 *   "id": "可选，用于日志",
 *   "language": "cpp",
 *   "source": "...",           // 也可以是 "code"
 *   "testCases": [{"input": "1 2\n", "expectedOutput": "3"}],
 *   "comparisonMode": "relaxed",
 *   "timeLimitMs": 3000,
 *   "memoryLimitKb": 262144,
 *   "action": "submit"
 * }
 */
struct submission {
    std::string id;

    language lang = language::JAVASCRIPT;

    std::string source;

    std::vector<test_case> test_cases;

    comparison_mode mode = comparison_mode::RELAXED;

    int time_limit_ms = 3000;

    std::optional<long> memory_limit_kb;

    /**
     * @brief 远程执行时固定的工具链版本
     */
    std::optional<std::string> version;

    detail_level detail = detail_level::SUMMARY;
};

/**
 * @brief 从输入 JSON 构造提交，缺省值取自 config.hpp 的全局配置
 * @throws std::invalid_argument 缺少字段、字段类型错误或者语言不受支持
 */
void from_json(const nlohmann::json &j, submission &submit);

/**
 * @brief 提交的汇总评测结果，计算完成后不再修改
 */
struct submission_verdict {
    status result = status::PENDING;

    std::size_t tests_passed = 0;

    std::size_t total_tests = 0;

    /**
     * @brief 所有已运行数据点的运行时间之和
     */
    long runtime_ms = 0;

    /**
     * @brief 所有数据点中观察到的最大内存
     */
    std::optional<long> peak_memory_kb;

    /**
     * @brief floor(100 * tests_passed / total_tests)
     */
    int score = 0;

    /**
     * @brief 编译错误时的编译器输出
     */
    std::optional<std::string> compile_error;
};

struct judge_report {
    submission_verdict verdict;

    /**
     * @brief 按顺序排列的每个已运行数据点的结果
     * 编译错误会使后面的数据点不再运行，因此可能少于 total_tests
     */
    std::vector<case_verdict> cases;
};

nlohmann::json to_json(const case_verdict &verdict);

/**
 * @brief 生成返回给提交存储的 JSON
 * @param detail SUMMARY 时不包含 cases
 */
nlohmann::json to_json(const submission &submit, const judge_report &report, detail_level detail);

template <typename T>
T &operator<<(T &os, const submission &submit) {
    os << "Submission[" << to_string(submit.lang) << ":" << (submit.id.empty() ? "-" : submit.id) << "]";
    return os;
}

}  // namespace codejudge
