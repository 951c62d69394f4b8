#include "codejudge/exec/remote_executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/assign.hpp>
#include <set>
#include <unordered_map>
#include "codejudge/common/exceptions.hpp"
#include "codejudge/common/json_utils.hpp"
#include "codejudge/common/utils.hpp"
#include "codejudge/config.hpp"
#include "codejudge/exec/http.hpp"
#include "codejudge/exec/toolchain.hpp"

namespace codejudge {
using namespace std;
using namespace nlohmann;

// 响应内容可能是一整个 HTML 错误页，只保留开头
const size_t RESPONSE_EXCERPT = 1024;

// clang-format off
static const unordered_map<string, int> signal_numbers = boost::assign::map_list_of
    ("SIGHUP", SIGHUP)
    ("SIGINT", SIGINT)
    ("SIGQUIT", SIGQUIT)
    ("SIGILL", SIGILL)
    ("SIGABRT", SIGABRT)
    ("SIGBUS", SIGBUS)
    ("SIGFPE", SIGFPE)
    ("SIGKILL", SIGKILL)
    ("SIGSEGV", SIGSEGV)
    ("SIGPIPE", SIGPIPE)
    ("SIGALRM", SIGALRM)
    ("SIGTERM", SIGTERM)
    ("SIGXCPU", SIGXCPU)
    ("SIGXFSZ", SIGXFSZ);

static const map<language, set<string>> runtime_names = boost::assign::map_list_of
    (language::JAVASCRIPT, set<string>{"javascript", "js", "node-javascript", "node-js"})
    (language::TYPESCRIPT, set<string>{"typescript", "ts"})
    (language::PYTHON, set<string>{"python", "python3", "py"})
    (language::JAVA, set<string>{"java"})
    (language::CPP, set<string>{"c++", "cpp", "g++"});
// clang-format on

void from_json(const json &j, remote_runtime &runtime) {
    runtime.language = get_value<string>(j, "language");
    runtime.version = get_value<string>(j, "version");
    runtime.aliases = get_value_def<vector<string>>(j, {}, "aliases");
}

bool runtime_matches(const remote_runtime &runtime, language lang) {
    auto &names = runtime_names.at(lang);
    if (names.count(runtime.language)) return true;
    for (auto &alias : runtime.aliases)
        if (names.count(alias)) return true;
    return false;
}

static string source_file_name(const execution_request &request) {
    switch (request.lang) {
        case language::JAVASCRIPT: return "main.js";
        case language::TYPESCRIPT: return "main.ts";
        default: return get_toolchain(request.lang, request.source).source_file;
    }
}

static string excerpt(const string &body) {
    return truncate_text(body, RESPONSE_EXCERPT);
}

execution_result parse_execute_response(long status, const string &body, long elapsed_ms, int time_limit_ms) {
    if (status < 200 || status >= 300)
        return execution_result::make_failure(execution_failure::NETWORK_ERROR,
                                              fmt::format("Remote executor returned HTTP {}: {}", status, excerpt(body)));

    json response = json::parse(body, nullptr, false);
    if (response.is_discarded() || !response.is_object() || !response.contains("run") || !response["run"].is_object())
        return execution_result::make_failure(execution_failure::NETWORK_ERROR,
                                              fmt::format("Remote executor returned a malformed response (HTTP {}): {}", status, excerpt(body)));

    if (exists(response, "compile")) {
        const json &compile = response["compile"];
        if (get_value_def<int>(compile, 0, "code") != 0 || !get_value_def<string>(compile, "", "signal").empty()) {
            string log = get_value_def<string>(compile, "", "stderr");
            if (log.empty()) log = get_value_def<string>(compile, "", "output");
            return execution_result::make_failure(execution_failure::COMPILATION_ERROR, log);
        }
    }

    const json &run = response["run"];
    execution_result result;
    result.stdout_text = get_value_def<string>(run, "", "stdout");
    result.stderr_text = get_value_def<string>(run, "", "stderr");
    result.exit_code = get_value_def<int>(run, -1, "code");

    string signal_name = get_value_def<string>(run, "", "signal");
    if (!signal_name.empty()) {
        auto it = signal_numbers.find(signal_name);
        result.signal = it == signal_numbers.end() ? SIGKILL : it->second;
    }

    result.runtime_ms = elapsed_ms;
    if (exists(run, "wall_time")) result.runtime_ms = get_value_def<long>(run, elapsed_ms, "wall_time");
    if (exists(run, "memory")) result.peak_memory_kb = get_value_def<long>(run, 0, "memory") / 1024;

    // Piston 在超时后用 SIGKILL 杀死程序，新版本还会返回 status: "TO"
    string run_status = get_value_def<string>(run, "", "status");
    result.timed_out = run_status == "TO" ||
                       (signal_name == "SIGKILL" && (!exists(run, "wall_time") || result.runtime_ms >= time_limit_ms));
    if (result.timed_out && result.stderr_text.empty())
        result.stderr_text = "Time limit exceeded";
    return result;
}

remote_executor::remote_executor(string base_url, shared_ptr<circuit_breaker> breaker,
                                 map<language, string> default_versions, int timeout_ms)
    : base_url(move(base_url)), breaker(move(breaker)), timeout_ms(timeout_ms), version_cache(move(default_versions)) {
    while (boost::algorithm::ends_with(this->base_url, "/"))
        this->base_url.pop_back();
}

vector<remote_runtime> remote_executor::list_runtimes(const cancellation_token *token) {
    http_response response = http_request("GET", base_url + "/runtimes", nullopt, timeout_ms, token);
    if (!response.ok())
        throw network_error(fmt::format("Remote executor returned HTTP {}: {}", response.status, excerpt(response.body)));
    json j = json::parse(response.body, nullptr, false);
    if (j.is_discarded() || !j.is_array())
        throw network_error("Remote executor returned a malformed runtime list: " + excerpt(response.body));
    try {
        return j.get<vector<remote_runtime>>();
    } catch (invalid_argument &e) {
        throw network_error(string("Remote executor returned a malformed runtime list: ") + e.what());
    }
}

string remote_executor::resolve_version(const execution_request &request, const cancellation_token &token) {
    if (request.version && !request.version->empty()) return *request.version;
    {
        scoped_lock guard(cache_mutex);
        auto it = version_cache.find(request.lang);
        if (it != version_cache.end() && !it->second.empty()) return it->second;
    }

    for (auto &runtime : list_runtimes(&token)) {
        if (!runtime_matches(runtime, request.lang)) continue;
        LOG(INFO) << "Remote executor resolved " << to_string(request.lang) << " to version " << runtime.version;
        scoped_lock guard(cache_mutex);
        version_cache[request.lang] = runtime.version;
        return runtime.version;
    }
    throw network_error(fmt::format("Remote executor has no runtime for {}", to_string(request.lang)));
}

execution_result remote_executor::send(const execution_request &request, const string &version, const cancellation_token &token, long &status) {
    json body = {
        {"language", to_string(request.lang)},
        {"version", version},
        {"files", json::array({{{"name", source_file_name(request)}, {"content", html_unescape(request.source)}}})},
        {"stdin", request.stdin_text},
        {"args", json::array()},
        {"compile_timeout", COMPILE_TIME_LIMIT_MS},
        {"run_timeout", request.time_limit_ms}};
    if (request.memory_limit_kb)
        body["run_memory_limit"] = *request.memory_limit_kb * 1024;

    elapsed_time elapsed;
    // 源代码和输入可能不是合法的 UTF-8
    http_response response = http_request("POST", base_url + "/execute", dump_lossy(body), timeout_ms, &token);
    status = response.status;
    return parse_execute_response(response.status, response.body,
                                  elapsed.duration<chrono::milliseconds>().count(), request.time_limit_ms);
}

execution_result remote_executor::execute(const execution_request &request, const cancellation_token &token) {
    if (!breaker->allow_request())
        return execution_result::make_failure(execution_failure::NETWORK_ERROR, "Remote executor is unavailable (circuit open)");

    execution_result result;
    long status = 0;
    try {
        result = send(request, resolve_version(request, token), token, status);
    } catch (network_error &ex) {
        LOG(WARNING) << "Remote execution of " << to_string(request.lang) << " failed: " << ex.what();
        breaker->record_failure();
        return execution_result::make_failure(execution_failure::NETWORK_ERROR, ex.what());
    } catch (cancelled_error &) {
        // 取消不代表服务不可用，释放可能占用的试探名额
        breaker->record_success();
        throw;
    } catch (exception &ex) {
        // 其余异常同样要释放试探名额，否则熔断器会一直停留在 HALF_OPEN
        LOG(ERROR) << "Remote execution of " << to_string(request.lang) << " failed unexpectedly: " << ex.what();
        breaker->record_failure();
        return execution_result::make_failure(execution_failure::NETWORK_ERROR, ex.what());
    }

    // 5xx 和无法解析的响应都视为服务故障，4xx 说明服务仍然可用
    if (result.failure == execution_failure::NETWORK_ERROR && !(status >= 400 && status < 500)) {
        LOG(WARNING) << "Remote execution of " << to_string(request.lang) << " failed: " << result.stderr_text;
        breaker->record_failure();
    } else {
        breaker->record_success();
    }
    return result;
}

}  // namespace codejudge
