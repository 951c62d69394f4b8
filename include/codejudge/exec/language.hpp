#pragma once

#include <string>

namespace codejudge {

/**
 * @brief 支持的语言，这是一个封闭的枚举
 */
enum class language {
    JAVASCRIPT,
    TYPESCRIPT,
    PYTHON,
    JAVA,
    CPP
};

/**
 * @brief 解析语言名称，忽略大小写和首尾空白
 * 除了规范名以外还接受 js, node, ts, py, python3, c++ 等别名
 * @throws std::invalid_argument 不支持的语言
 */
language parse_language(const std::string &name);

/**
 * @brief 语言的规范名: javascript, typescript, python, java, cpp
 */
const char *to_string(language lang);

/**
 * @brief JavaScript 和 TypeScript 在进程内沙箱中运行，不需要外部工具链
 */
bool is_script_language(language lang);

}  // namespace codejudge
