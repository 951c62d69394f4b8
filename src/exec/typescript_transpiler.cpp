#include <fmt/core.h>
#include <glog/logging.h>
#include <quickjs.h>
#include <cstring>
#include "codejudge/common/exceptions.hpp"
#include "codejudge/common/io_utils.hpp"
#include "codejudge/common/utils.hpp"
#include "codejudge/config.hpp"
#include "codejudge/exec/sandbox_executor.hpp"

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

// ts.ModuleKind.CommonJS 与 ts.ScriptTarget.ES2019
static const char *TRANSPILE_FUNCTION = R"(
globalThis.__transpile = function (source) {
    return ts.transpileModule(source, {
        compilerOptions: {
            module: ts.ModuleKind.CommonJS,
            target: ts.ScriptTarget.ES2019,
            strict: false,
            esModuleInterop: true
        }
    }).outputText;
};
)";

static string exception_message(JSContext *ctx) {
    JSValue exception = JS_GetException(ctx);
    string message = "unknown error";
    if (const char *str = JS_ToCString(ctx, exception)) {
        message = str;
        JS_FreeCString(ctx, str);
    }
    JS_FreeValue(ctx, exception);
    return message;
}

typescript_transpiler::typescript_transpiler(fs::path typescript_js)
    : script(move(typescript_js)) {}

typescript_transpiler::~typescript_transpiler() {
    if (ctx) JS_FreeContext(ctx);
    if (rt) JS_FreeRuntime(rt);
}

bool typescript_transpiler::available() const {
    error_code ec;
    return !script.empty() && fs::is_regular_file(script, ec);
}

void typescript_transpiler::load() {
    if (ctx) return;

    elapsed_time elapsed;
    string code = read_file_content(script);

    rt = JS_NewRuntime();
    if (!rt) throw internal_error("Unable to create JavaScript runtime for TypeScript");
    ctx = JS_NewContext(rt);
    if (!ctx) throw internal_error("Unable to create JavaScript context for TypeScript");

    JSValue ret = JS_Eval(ctx, code.c_str(), code.size(), script.c_str(), JS_EVAL_TYPE_GLOBAL);
    if (JS_IsException(ret)) {
        string message = exception_message(ctx);
        JS_FreeContext(ctx);
        JS_FreeRuntime(rt);
        ctx = nullptr;
        rt = nullptr;
        throw internal_error(fmt::format("Unable to load {}: {}", script, message));
    }
    JS_FreeValue(ctx, ret);

    ret = JS_Eval(ctx, TRANSPILE_FUNCTION, strlen(TRANSPILE_FUNCTION), "<transpile>", JS_EVAL_TYPE_GLOBAL);
    if (JS_IsException(ret))
        throw internal_error("typescript.js does not define ts.transpileModule: " + exception_message(ctx));
    JS_FreeValue(ctx, ret);

    LOG(INFO) << "Loaded TypeScript compiler from " << script << " in "
              << elapsed.duration<chrono::milliseconds>().count() << "ms";
}

string typescript_transpiler::transpile(const string &source) {
    if (!available())
        throw toolchain_missing_error("TypeScript compiler not available. Set TYPESCRIPT_JS to the path of typescript.js.", "typescript.js");

    scoped_lock guard(mut);
    load();

    JSValue global = JS_GetGlobalObject(ctx);
    JSValue func = JS_GetPropertyStr(ctx, global, "__transpile");
    JSValue arg = JS_NewStringLen(ctx, source.data(), source.size());
    JSValue ret = JS_Call(ctx, func, global, 1, &arg);
    JS_FreeValue(ctx, arg);
    JS_FreeValue(ctx, func);
    JS_FreeValue(ctx, global);

    if (JS_IsException(ret))
        throw internal_error("TypeScript transpilation failed: " + exception_message(ctx));

    string output;
    if (const char *str = JS_ToCString(ctx, ret)) {
        output = str;
        JS_FreeCString(ctx, str);
    }
    JS_FreeValue(ctx, ret);
    // 释放上一次转换产生的垃圾，避免运行时持续增长
    JS_RunGC(rt);
    return output;
}

shared_ptr<typescript_transpiler> default_transpiler() {
    static mutex mut;
    static shared_ptr<typescript_transpiler> instance;
    static fs::path loaded;
    scoped_lock guard(mut);
    if (!instance || loaded != TYPESCRIPT_JS) {
        instance = make_shared<typescript_transpiler>(TYPESCRIPT_JS);
        loaded = TYPESCRIPT_JS;
    }
    return instance;
}

}  // namespace codejudge
