#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include "codejudge/exec/execution.hpp"

struct JSRuntime;
struct JSContext;

/**
 * JavaScript 与 TypeScript 在进程内的 QuickJS 虚拟机中运行，不产生子进程。
 *
 * 沙箱的全局对象只额外暴露以下宿主函数，这就是沙箱的边界：
 *   console.log / info / debug / warn  写入 stdout
 *   console.error                      写入 stderr
 *   readLine / gets / prompt           依次返回标准输入的下一行，读完后返回空字符串
 *   setTimeout / setInterval / clearTimeout / clearInterval
 *   require('fs').readFileSync         返回完整的标准输入，其余模块一律拒绝
 * 不加载 quickjs-libc 的 std、os 模块，因此选手代码无法访问文件系统和网络。
 */
namespace codejudge {

/**
 * @brief 在独立的 QuickJS 运行时中加载 typescript.js，调用 ts.transpileModule 去掉类型标注
 * 不检查类型错误。运行时在第一次使用时加载，所有线程共享，通过互斥锁串行化。
 */
struct typescript_transpiler {
    explicit typescript_transpiler(std::filesystem::path typescript_js);
    ~typescript_transpiler();

    typescript_transpiler(const typescript_transpiler &) = delete;
    typescript_transpiler &operator=(const typescript_transpiler &) = delete;

    /**
     * @brief typescript.js 是否已经配置且存在
     */
    bool available() const;

    /**
     * @brief 将 TypeScript（或使用了 import/export 的 JavaScript）转换为 CommonJS、ES2019 的 JavaScript
     * @throws toolchain_missing_error 若 typescript.js 不可用
     * @throws internal_error 若 typescript.js 加载失败或转换过程抛出异常
     */
    std::string transpile(const std::string &source);

private:
    void load();

    std::filesystem::path script;
    std::mutex mut;
    JSRuntime *rt = nullptr;
    JSContext *ctx = nullptr;
};

/**
 * @brief 根据 TYPESCRIPT_JS 配置创建的共享转换器
 */
std::shared_ptr<typescript_transpiler> default_transpiler();

struct sandbox_executor : public executor {
    explicit sandbox_executor(std::shared_ptr<typescript_transpiler> transpiler = default_transpiler());

    execution_result execute(const execution_request &request, const cancellation_token &token) override;

private:
    std::shared_ptr<typescript_transpiler> transpiler;
};

/**
 * @brief 源代码是否使用了 ES module 语法，需要转换才能作为脚本运行
 */
bool uses_module_syntax(const std::string &source);

}  // namespace codejudge
