#pragma once

#include <sys/types.h>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "codejudge/common/cancellation.hpp"

namespace codejudge {

struct process_options {
    /**
     * @brief 程序 (command[0]) 及其参数，command[0] 按照 PATH 查找
     */
    std::vector<std::string> command;

    /**
     * @brief 子进程的工作路径，为空时继承当前工作路径
     */
    std::filesystem::path workdir;

    /**
     * @brief 写入子进程标准输入的全部内容，写完后关闭管道
     */
    std::string stdin_text;

    /**
     * @brief 时钟时间限制（毫秒），小于 0 表示不限制
     */
    int time_limit_ms = -1;

    /**
     * @brief 每个输出流最多保存的字节数
     */
    std::size_t output_limit = 8 << 20;

    /**
     * @brief 内存采样间隔（毫秒）
     */
    int sample_interval_ms = 60;

    /**
     * @brief 可选的取消标记
     */
    const cancellation_token *token = nullptr;
};

struct process_result {
    std::string stdout_text;
    std::string stderr_text;

    /**
     * @brief 退出码，被信号杀死时为 -1
     */
    int exit_code = -1;

    /**
     * @brief 杀死子进程的信号，正常退出时为 0
     */
    int signal = 0;

    bool timed_out = false;

    bool cancelled = false;

    long runtime_ms = 0;

    /**
     * @brief 采样到的最大 VmRSS，无法采样时为空
     */
    std::optional<long> peak_memory_kb;
};

/**
 * @brief 运行子进程并等待其结束
 * 1. 创建标准输入、输出、错误管道，以及一个 close-on-exec 的管道用于回报 exec 失败的 errno
 * 2. fork 出子进程，子进程进入独立的进程组，以便我们通过 SIGKILL 可以杀死进程组内所有进程
 * 3. 父进程轮询管道：写入标准输入、读取输出、检查超时与取消、定期采样内存
 * 4. 子进程退出后杀死进程组内残留的进程
 *
 * @throws toolchain_missing_error 若 exec 失败（程序不存在或不可执行）
 * @throws std::system_error 若创建管道、fork 等系统调用失败
 */
process_result run_process(const process_options &opt);

/**
 * @brief 读取 /proc/<pid>/status 中的 VmRSS
 * @return 常驻内存（KB），进程不存在或平台不支持时返回空
 */
std::optional<long> read_resident_memory_kb(pid_t pid);

}  // namespace codejudge
