#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "codejudge/exec/language.hpp"

namespace codejudge {

/**
 * @brief 调用外部程序的方式
 */
struct command_spec {
    /**
     * @brief 程序名或路径，按照 PATH 查找
     */
    std::string binary;

    /**
     * @brief 可以覆盖 binary 的环境变量，为空表示程序由我们自己生成（比如编译产物）
     */
    std::string env_var;

    /**
     * @brief 用于诊断信息的名称，比如 "Java compiler"
     */
    std::string label;

    std::vector<std::string> args;

    /**
     * @brief binary 与 args 拼接成的完整命令
     */
    std::vector<std::string> command() const;
};

/**
 * @brief 需要外部工具链的语言（Python, Java, C++）的编译运行方式
 */
struct toolchain {
    language lang;

    /**
     * @brief 源代码文件名，Java 的文件名必须与 public class 同名
     */
    std::string source_file;

    /**
     * @brief 编译命令，解释型语言为空
     */
    std::optional<command_spec> compile;

    command_spec run;
};

/**
 * @brief 根据当前配置生成语言对应的工具链
 * @param lang 语言，不能为 JavaScript 或 TypeScript
 * @param source 源代码，用于确定 Java 的主类名
 * @param memory_limit_kb 可选的内存限制，只用于 Java 的 -Xmx
 * @throws std::invalid_argument 若语言不需要外部工具链
 */
toolchain get_toolchain(language lang, const std::string &source, std::optional<long> memory_limit_kb = std::nullopt);

/**
 * @brief 查找 Java 源代码中第一个 public class 的类名
 * @return 类名，找不到时返回 Solution
 */
std::string java_main_class(const std::string &source);

/**
 * @brief 启动失败时给运维人员看的诊断信息，指出缺失的程序以及覆盖路径的环境变量
 */
std::string missing_toolchain_message(const command_spec &cmd);

struct toolchain_status {
    language lang;
    std::string label;
    std::string binary;
    std::string env_var;

    /**
     * @brief 找到的可执行文件路径，找不到时为空
     */
    std::optional<std::filesystem::path> resolved;
};

/**
 * @brief 检查所有外部工具链是否可用
 */
std::vector<toolchain_status> check_toolchains();

}  // namespace codejudge
