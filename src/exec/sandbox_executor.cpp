#include "codejudge/exec/sandbox_executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <quickjs.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <chrono>
#include <regex>
#include <vector>
#include "codejudge/common/exceptions.hpp"
#include "codejudge/common/utils.hpp"
#include "codejudge/config.hpp"

namespace codejudge {
using namespace std;
using namespace std::chrono;

const size_t SANDBOX_STACK_SIZE = 1 << 20;  // 1M

namespace {

struct sandbox_timer {
    int id;
    double due;
    long seq;
    double interval;  // 小于 0 表示 setTimeout
    JSValue callback;
    vector<JSValue> args;
};

/**
 * @brief 一次执行的全部宿主状态，通过 JS_SetContextOpaque 与上下文关联
 */
struct sandbox_state {
    vector<string> stdout_lines;
    vector<string> stderr_lines;

    // 按换行连接后的字节数，与子进程一样每个流最多保留 OUTPUT_LIMIT 字节
    size_t output_limit = OUTPUT_LIMIT;
    size_t stdout_bytes = 0;
    size_t stderr_bytes = 0;

    string stdin_text;
    vector<string> stdin_lines;
    size_t next_line = 0;

    steady_clock::time_point deadline;
    const cancellation_token *token = nullptr;
    bool timed_out = false;
    bool cancelled = false;

    vector<sandbox_timer> timers;
    int next_timer_id = 1;
    long next_seq = 0;
    double virtual_now = 0;

    /**
     * @brief 追加一行输出，超出限制的部分直接丢弃
     */
    void append_output(vector<string> &lines, size_t &bytes, string line) {
        if (bytes >= output_limit) return;
        size_t cost = line.size() + (lines.empty() ? 0 : 1);
        if (bytes + cost > output_limit) {
            line.resize(line.size() - (bytes + cost - output_limit));
            cost = output_limit - bytes;
        }
        bytes += cost;
        lines.push_back(move(line));
    }

    bool interrupted() {
        if (token && token->is_cancelled()) cancelled = true;
        if (steady_clock::now() >= deadline) timed_out = true;
        return timed_out || cancelled;
    }
};

sandbox_state &state_of(JSContext *ctx) {
    return *static_cast<sandbox_state *>(JS_GetContextOpaque(ctx));
}

int interrupt_handler(JSRuntime *, void *opaque) {
    return static_cast<sandbox_state *>(opaque)->interrupted() ? 1 : 0;
}

/**
 * @brief 把参数按 String(x) 转换后用空格连接，与 console.log 的行为一致
 * @return false 若转换时抛出了异常
 */
bool join_arguments(JSContext *ctx, int argc, JSValueConst *argv, string &line) {
    for (int i = 0; i < argc; ++i) {
        size_t len;
        const char *str = JS_ToCStringLen(ctx, &len, argv[i]);
        if (!str) return false;
        if (i > 0) line += ' ';
        line.append(str, len);
        JS_FreeCString(ctx, str);
    }
    return true;
}

JSValue js_console_log(JSContext *ctx, JSValueConst, int argc, JSValueConst *argv) {
    string line;
    if (!join_arguments(ctx, argc, argv, line)) return JS_EXCEPTION;
    sandbox_state &state = state_of(ctx);
    state.append_output(state.stdout_lines, state.stdout_bytes, move(line));
    return JS_UNDEFINED;
}

JSValue js_console_error(JSContext *ctx, JSValueConst, int argc, JSValueConst *argv) {
    string line;
    if (!join_arguments(ctx, argc, argv, line)) return JS_EXCEPTION;
    sandbox_state &state = state_of(ctx);
    state.append_output(state.stderr_lines, state.stderr_bytes, move(line));
    return JS_UNDEFINED;
}

JSValue js_read_line(JSContext *ctx, JSValueConst, int, JSValueConst *) {
    sandbox_state &state = state_of(ctx);
    if (state.next_line >= state.stdin_lines.size()) return JS_NewString(ctx, "");
    const string &line = state.stdin_lines[state.next_line++];
    return JS_NewStringLen(ctx, line.data(), line.size());
}

JSValue js_read_file_sync(JSContext *ctx, JSValueConst, int, JSValueConst *) {
    const string &text = state_of(ctx).stdin_text;
    return JS_NewStringLen(ctx, text.data(), text.size());
}

JSValue js_require(JSContext *ctx, JSValueConst, int argc, JSValueConst *argv) {
    const char *name = argc > 0 ? JS_ToCString(ctx, argv[0]) : nullptr;
    if (!name) return JS_ThrowTypeError(ctx, "require expects a module name");
    string module(name);
    JS_FreeCString(ctx, name);

    if (module == "fs" || module == "node:fs") {
        JSValue fs = JS_NewObject(ctx);
        JS_SetPropertyStr(ctx, fs, "readFileSync", JS_NewCFunction(ctx, js_read_file_sync, "readFileSync", 2));
        return fs;
    }

    JSValue error = JS_NewError(ctx);
    string message = fmt::format("Module '{}' is not allowed", module);
    JS_SetPropertyStr(ctx, error, "message", JS_NewStringLen(ctx, message.data(), message.size()));
    return JS_Throw(ctx, error);
}

JSValue add_timer(JSContext *ctx, int argc, JSValueConst *argv, bool repeat) {
    if (argc < 1 || !JS_IsFunction(ctx, argv[0]))
        return JS_ThrowTypeError(ctx, "callback must be a function");
    double delay = 0;
    if (argc > 1 && JS_ToFloat64(ctx, &delay, argv[1]) < 0) return JS_EXCEPTION;
    if (!(delay >= 0)) delay = 0;

    sandbox_state &state = state_of(ctx);
    sandbox_timer timer;
    timer.id = state.next_timer_id++;
    timer.due = state.virtual_now + delay;
    timer.seq = state.next_seq++;
    timer.interval = repeat ? max(delay, 1.0) : -1;
    timer.callback = JS_DupValue(ctx, argv[0]);
    for (int i = 2; i < argc; ++i)
        timer.args.push_back(JS_DupValue(ctx, argv[i]));
    state.timers.push_back(move(timer));
    return JS_NewInt32(ctx, state.timers.back().id);
}

void free_timer(JSContext *ctx, sandbox_timer &timer) {
    JS_FreeValue(ctx, timer.callback);
    for (auto &arg : timer.args) JS_FreeValue(ctx, arg);
    timer.args.clear();
}

JSValue js_set_timeout(JSContext *ctx, JSValueConst, int argc, JSValueConst *argv) {
    return add_timer(ctx, argc, argv, false);
}

JSValue js_set_interval(JSContext *ctx, JSValueConst, int argc, JSValueConst *argv) {
    return add_timer(ctx, argc, argv, true);
}

JSValue js_clear_timer(JSContext *ctx, JSValueConst, int argc, JSValueConst *argv) {
    int32_t id;
    if (argc < 1 || JS_ToInt32(ctx, &id, argv[0]) < 0) return JS_UNDEFINED;
    auto &timers = state_of(ctx).timers;
    auto it = find_if(timers.begin(), timers.end(), [id](const sandbox_timer &t) { return t.id == id; });
    if (it != timers.end()) {
        free_timer(ctx, *it);
        timers.erase(it);
    }
    return JS_UNDEFINED;
}

void set_function(JSContext *ctx, JSValue obj, const char *name, JSCFunction *func, int length) {
    JS_SetPropertyStr(ctx, obj, name, JS_NewCFunction(ctx, func, name, length));
}

/**
 * @brief 在全局对象上安装宿主函数白名单
 */
void install_host_functions(JSContext *ctx) {
    JSValue global = JS_GetGlobalObject(ctx);

    JSValue console = JS_NewObject(ctx);
    set_function(ctx, console, "log", js_console_log, 1);
    set_function(ctx, console, "info", js_console_log, 1);
    set_function(ctx, console, "debug", js_console_log, 1);
    set_function(ctx, console, "warn", js_console_log, 1);
    set_function(ctx, console, "error", js_console_error, 1);
    JS_SetPropertyStr(ctx, global, "console", console);

    set_function(ctx, global, "readLine", js_read_line, 0);
    set_function(ctx, global, "gets", js_read_line, 0);
    set_function(ctx, global, "prompt", js_read_line, 0);
    set_function(ctx, global, "setTimeout", js_set_timeout, 2);
    set_function(ctx, global, "setInterval", js_set_interval, 2);
    set_function(ctx, global, "clearTimeout", js_clear_timer, 1);
    set_function(ctx, global, "clearInterval", js_clear_timer, 1);
    set_function(ctx, global, "require", js_require, 1);

    JS_FreeValue(ctx, global);
}

/**
 * @brief 取出并清除当前的异常，转换成一行错误信息
 */
string take_exception(JSContext *ctx) {
    JSValue exception = JS_GetException(ctx);
    string message;
    if (const char *str = JS_ToCString(ctx, exception)) {
        message = str;
        JS_FreeCString(ctx, str);
    } else {
        JS_FreeValue(ctx, JS_GetException(ctx));
        message = "Uncaught exception";
    }
    JS_FreeValue(ctx, exception);
    replace(message.begin(), message.end(), '\n', ' ');
    return message;
}

/**
 * @brief 执行所有等待中的 Promise 任务
 * @return false 若某个任务抛出了异常
 */
bool run_pending_jobs(JSRuntime *rt, sandbox_state &state, string &error) {
    JSContext *job_ctx;
    while (true) {
        int r = JS_ExecutePendingJob(rt, &job_ctx);
        if (r == 0) return true;
        if (r < 0) {
            error = take_exception(job_ctx);
            return false;
        }
        if (state.interrupted()) return true;
    }
}

/**
 * @brief 按照到期时间依次执行定时器
 * 不会真正等待，只推进虚拟时间；总的执行时间仍然受时间限制约束
 * @return false 若某个回调抛出了异常
 */
bool run_timers(JSContext *ctx, JSRuntime *rt, sandbox_state &state, string &error) {
    while (!state.timers.empty()) {
        if (state.interrupted()) return true;

        auto it = min_element(state.timers.begin(), state.timers.end(), [](const sandbox_timer &a, const sandbox_timer &b) {
            return a.due != b.due ? a.due < b.due : a.seq < b.seq;
        });
        state.virtual_now = max(state.virtual_now, it->due);

        JSValue callback = JS_DupValue(ctx, it->callback);
        vector<JSValue> args;
        for (auto &arg : it->args) args.push_back(JS_DupValue(ctx, arg));
        if (it->interval < 0) {
            free_timer(ctx, *it);
            state.timers.erase(it);
        } else {
            it->due += it->interval;
            it->seq = state.next_seq++;
        }

        JSValue ret = JS_Call(ctx, callback, JS_UNDEFINED, (int)args.size(), args.data());
        JS_FreeValue(ctx, callback);
        for (auto &arg : args) JS_FreeValue(ctx, arg);
        if (JS_IsException(ret)) {
            error = take_exception(ctx);
            return false;
        }
        JS_FreeValue(ctx, ret);
        if (!run_pending_jobs(rt, state, error)) return false;
    }
    return true;
}

/**
 * @brief 转译得到的 CommonJS 代码会访问 exports 和 module，
 * 用函数参数提供这两个局部变量，不在全局对象上暴露
 */
string wrap_commonjs(const string &source) {
    return "(function (module) {\n(function (exports, module) {\n" + source + "\n})(module.exports, module);\n})({exports: {}});\n";
}

vector<string> split_lines(const string &text) {
    static const regex newline("\r?\n");
    return vector<string>(sregex_token_iterator(text.begin(), text.end(), newline, -1), sregex_token_iterator());
}

}  // namespace

bool uses_module_syntax(const string &source) {
    static const regex module_syntax(R"((^|\n)\s*(import\s+[\w{*'"]|export\s+(default|const|let|var|function|class|async|\{)))");
    return regex_search(source, module_syntax);
}

sandbox_executor::sandbox_executor(shared_ptr<typescript_transpiler> transpiler)
    : transpiler(move(transpiler)) {}

execution_result sandbox_executor::execute(const execution_request &request, const cancellation_token &token) {
    if (!is_script_language(request.lang))
        throw invalid_argument(fmt::format("{} cannot run in the script sandbox", to_string(request.lang)));

    string source = html_unescape(request.source);
    try {
        if (request.lang == language::TYPESCRIPT) {
            if (!transpiler || !transpiler->available())
                return execution_result::make_failure(execution_failure::TOOLCHAIN_MISSING,
                                                      "TypeScript compiler not available. Set TYPESCRIPT_JS to the path of typescript.js.");
            source = wrap_commonjs(transpiler->transpile(source));
        } else if (uses_module_syntax(source) && transpiler && transpiler->available()) {
            source = wrap_commonjs(transpiler->transpile(source));
        }
    } catch (internal_error &ex) {
        LOG(ERROR) << "TypeScript transpilation failed: " << ex.what();
        return execution_result::make_failure(execution_failure::COMPILATION_ERROR, ex.what());
    }

    sandbox_state state;
    state.stdin_text = request.stdin_text;
    state.stdin_lines = split_lines(request.stdin_text);
    state.token = &token;

    unique_ptr<JSRuntime, decltype(&JS_FreeRuntime)> rt(JS_NewRuntime(), JS_FreeRuntime);
    if (!rt) throw internal_error("Unable to create JavaScript runtime");
    size_t memory_limit_kb = request.memory_limit_kb ? (size_t)*request.memory_limit_kb : SANDBOX_MEMORY_LIMIT_KB;
    JS_SetMemoryLimit(rt.get(), memory_limit_kb * 1024);
    JS_SetMaxStackSize(rt.get(), SANDBOX_STACK_SIZE);
    JS_SetInterruptHandler(rt.get(), interrupt_handler, &state);

    unique_ptr<JSContext, decltype(&JS_FreeContext)> ctx(JS_NewContext(rt.get()), JS_FreeContext);
    if (!ctx) throw internal_error("Unable to create JavaScript context");
    JS_SetContextOpaque(ctx.get(), &state);
    install_host_functions(ctx.get());

    execution_result result;
    string error;
    auto start = steady_clock::now();
    state.deadline = start + milliseconds(request.time_limit_ms);

    JSValue ret = JS_Eval(ctx.get(), source.c_str(), source.size(), "main.js", JS_EVAL_TYPE_GLOBAL);
    bool ok = !JS_IsException(ret);
    if (ok) {
        JS_FreeValue(ctx.get(), ret);
        ok = run_pending_jobs(rt.get(), state, error) && run_timers(ctx.get(), rt.get(), state, error);
    } else {
        error = take_exception(ctx.get());
    }
    result.runtime_ms = duration_cast<milliseconds>(steady_clock::now() - start).count();

    // 定时器持有的函数必须在释放上下文之前释放
    for (auto &timer : state.timers) free_timer(ctx.get(), timer);
    state.timers.clear();

    JSMemoryUsage usage;
    JS_ComputeMemoryUsage(rt.get(), &usage);
    result.peak_memory_kb = (long)(usage.malloc_size / 1024);

    if (state.timed_out) {
        result.timed_out = true;
        state.stderr_lines.push_back(fmt::format("Script execution timed out after {} ms", request.time_limit_ms));
    } else if (state.cancelled) {
        state.stderr_lines.push_back("Cancelled");
    } else if (!ok) {
        state.stderr_lines.push_back(error);
    }

    result.exit_code = ok && !state.timed_out && !state.cancelled ? 0 : 1;
    result.stdout_text = boost::algorithm::join(state.stdout_lines, "\n");
    result.stderr_text = boost::algorithm::join(state.stderr_lines, "\n");
    return result;
}

}  // namespace codejudge
