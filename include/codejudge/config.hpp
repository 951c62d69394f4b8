#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include "codejudge/exec/language.hpp"

namespace codejudge {

/**
 * @brief 用户程序默认的运行时间限制（毫秒，时钟时间）
 * 可以通过环境变量 TIMELIMIT 或命令行 --time-limit 覆盖
 */
extern int TIME_LIMIT_MS;

/**
 * @brief 编译器的运行时间限制（毫秒）
 */
extern int COMPILE_TIME_LIMIT_MS;

/**
 * @brief 采样 /proc/<pid>/status 中 VmRSS 的间隔（毫秒）
 */
extern int MEMORY_SAMPLE_INTERVAL_MS;

/**
 * @brief 每个输出流最多保存的字节数，超出部分被丢弃
 */
extern std::size_t OUTPUT_LIMIT;

/**
 * @brief 返回给用户的错误信息的最大长度
 */
extern std::size_t ERROR_LIMIT;

/**
 * @brief 选手程序编译及运行的根目录
 * RUN_DIR 的文件结构如下：
 *
 * RUN_DIR
 * ├── codejudge-cpp-<uuid> // 每个执行请求独占的文件夹，请求结束后删除
 * │   ├── main.cpp
 * │   └── main
 * └── ...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 编译器与解释器的路径或名字
 * 对应的环境变量分别为 PYTHON_BIN, JAVAC_BIN, JAVA_BIN, GXX_BIN
 */
extern std::string PYTHON_BIN;
extern std::string JAVAC_BIN;
extern std::string JAVA_BIN;
extern std::string GXX_BIN;

/**
 * @brief 执行模式：local, remote, auto
 * auto 模式下优先本地执行，本地工具链缺失时转交远程执行服务
 */
extern std::string EXECUTOR_MODE;

/**
 * @brief Piston 兼容的远程执行服务地址
 */
extern std::string REMOTE_URL;

extern bool REMOTE_ENABLED;

/**
 * @brief 访问远程执行服务的网络超时（毫秒）
 */
extern int REMOTE_TIMEOUT_MS;

/**
 * @brief 远程执行服务的默认语言版本，未配置的语言通过 /runtimes 查询
 */
extern std::map<language, std::string> REMOTE_VERSIONS;

/**
 * @brief 连续失败多少次后熔断远程执行服务
 */
extern int REMOTE_FAILURE_THRESHOLD;

/**
 * @brief 熔断后多久允许一次试探请求（毫秒）
 */
extern int REMOTE_COOLDOWN_MS;

/**
 * @brief 默认比较模式：relaxed 或 strict
 */
extern std::string COMPARISON_MODE;

/**
 * @brief typescript.js 的路径，为空时 TypeScript 不可用
 */
extern std::filesystem::path TYPESCRIPT_JS;

/**
 * @brief JavaScript 沙箱的堆内存上限（KB）
 */
extern std::size_t SANDBOX_MEMORY_LIMIT_KB;

}  // namespace codejudge
