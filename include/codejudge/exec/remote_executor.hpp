#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "codejudge/exec/circuit_breaker.hpp"
#include "codejudge/exec/execution.hpp"

/**
 * 远程执行器：把执行请求转发给 Piston 兼容的执行服务
 * POST {url}/execute
 * {
 *     "language": "python",
 *     "version": "3.11.0",
 *     "files": [{"name": "main.py", "content": "..."}],
 *     "stdin": "...",
 *     "args": [],
 *     "compile_timeout": 10000,
 *     "run_timeout": 3000
 * }
 * 响应的 run 字段包含 stdout, stderr, code, signal，编译型语言还有 compile 字段。
 */
namespace codejudge {

struct remote_runtime {
    std::string language;
    std::string version;
    std::vector<std::string> aliases;
};

void from_json(const nlohmann::json &j, remote_runtime &runtime);

struct remote_executor : public executor {
    /**
     * @param base_url 服务地址，比如 https://emkc.org/api/v2/piston
     * @param breaker 熔断器，熔断期间请求直接失败而不访问网络
     * @param default_versions 预先配置的语言版本
     * @param timeout_ms 每个 HTTP 请求的超时时间
     */
    remote_executor(std::string base_url, std::shared_ptr<circuit_breaker> breaker,
                    std::map<language, std::string> default_versions, int timeout_ms);

    execution_result execute(const execution_request &request, const cancellation_token &token) override;

    /**
     * @brief 查询服务支持的运行时
     * @throws network_error 服务不可达或返回了非法响应
     */
    std::vector<remote_runtime> list_runtimes(const cancellation_token *token = nullptr);

    /**
     * @brief 确定语言的版本：请求指定的版本、缓存的版本、查询 /runtimes 得到的第一个匹配项
     * 查询结果在进程生命周期内缓存
     * @throws network_error 服务不可达，或者服务不支持该语言
     */
    std::string resolve_version(const execution_request &request, const cancellation_token &token);

private:
    execution_result send(const execution_request &request, const std::string &version, const cancellation_token &token, long &status);

    std::string base_url;
    std::shared_ptr<circuit_breaker> breaker;
    const int timeout_ms;

    std::mutex cache_mutex;
    std::map<language, std::string> version_cache;
};

/**
 * @brief 运行时是否对应该语言（比较 language 字段和 aliases）
 */
bool runtime_matches(const remote_runtime &runtime, language lang);

/**
 * @brief 解析 /execute 的响应
 * 非 2xx 响应或者无法解析的响应转换为 NETWORK_ERROR，stderr 中包含状态码和响应内容
 * @param status HTTP 状态码
 * @param body 响应内容
 * @param elapsed_ms 请求耗时，响应中没有 wall_time 时作为运行时间
 * @param time_limit_ms 请求的时间限制
 */
execution_result parse_execute_response(long status, const std::string &body, long elapsed_ms, int time_limit_ms);

}  // namespace codejudge
