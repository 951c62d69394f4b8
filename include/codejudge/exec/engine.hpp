#pragma once

#include <memory>
#include <string>
#include "codejudge/exec/execution.hpp"

namespace codejudge {

enum class executor_mode {
    /**
     * @brief 只使用本地工具链
     */
    LOCAL,

    /**
     * @brief Python、Java、C++ 全部交给远程执行服务
     */
    REMOTE,

    /**
     * @brief 优先本地执行，本地工具链缺失时交给远程执行服务
     */
    AUTO
};

/**
 * @throws std::invalid_argument 不是 local, remote, auto 之一
 */
executor_mode parse_executor_mode(const std::string &mode);

/**
 * @brief 执行入口 execute(ExecutionRequest) -> ExecutionResult
 * 每个请求只选择一次执行器：JavaScript、TypeScript 总在进程内沙箱运行，
 * 其他语言根据执行模式选择子进程执行器或远程执行器。
 */
struct execution_engine : public executor {
    /**
     * @param remote 可以为空，表示禁用远程执行
     */
    execution_engine(executor_mode mode, std::shared_ptr<executor> sandbox,
                     std::shared_ptr<executor> local, std::shared_ptr<executor> remote);

    execution_result execute(const execution_request &request, const cancellation_token &token) override;

private:
    executor_mode mode;
    std::shared_ptr<executor> sandbox;
    std::shared_ptr<executor> local;
    std::shared_ptr<executor> remote;
};

/**
 * @brief 根据 config.hpp 中的全局配置创建执行入口
 */
std::shared_ptr<execution_engine> make_execution_engine();

}  // namespace codejudge
