#pragma once

#include <filesystem>
#include <string>
#include "codejudge/exec/execution.hpp"
#include "codejudge/exec/toolchain.hpp"

/**
 * 子进程执行器负责需要外部工具链的语言（Python、Java、C++）
 * 每个执行请求：
 * 1. 在 RUN_DIR 下创建一个名字随机的工作文件夹，写入源代码
 * 2. 需要编译的语言先调用编译器，编译失败则不会运行
 * 3. 运行程序，写入全部标准输入后关闭输入流，超时后杀死进程组
 * 4. 无论成功与否，返回前删除工作文件夹
 */
namespace codejudge {

struct local_executor : public executor {
    execution_result execute(const execution_request &request, const cancellation_token &token) override;

private:
    /**
     * @brief 在工作文件夹中编译源代码
     * @throws compilation_error 编译器返回非零值、超时或输出了错误诊断
     * @throws toolchain_missing_error 编译器无法启动
     */
    void compile(const toolchain &tc, const std::filesystem::path &workdir, const cancellation_token &token);

    execution_result run(const toolchain &tc, const std::filesystem::path &workdir, const execution_request &request, const cancellation_token &token);
};

/**
 * @brief 从错误信息中去掉工作文件夹的路径，避免泄露服务器的文件结构
 */
std::string strip_workdir(const std::string &text, const std::filesystem::path &workdir);

}  // namespace codejudge
