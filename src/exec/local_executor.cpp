#include "codejudge/exec/local_executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/replace.hpp>
#include <regex>
#include "codejudge/common/defer.hpp"
#include "codejudge/common/exceptions.hpp"
#include "codejudge/common/io_utils.hpp"
#include "codejudge/common/utils.hpp"
#include "codejudge/config.hpp"
#include "codejudge/exec/process.hpp"

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

string strip_workdir(const string &text, const fs::path &workdir) {
    string result = text;
    boost::replace_all(result, (workdir / "").string(), "");
    boost::replace_all(result, workdir.string(), ".");
    return result;
}

static bool has_compiler_diagnostics(const string &log) {
    static const regex diagnostics(R"((^|\s)(fatal )?error:)", regex::icase);
    return regex_search(log, diagnostics);
}

void local_executor::compile(const toolchain &tc, const fs::path &workdir, const cancellation_token &token) {
    process_options opt;
    opt.command = tc.compile->command();
    opt.workdir = workdir;
    opt.time_limit_ms = COMPILE_TIME_LIMIT_MS;
    opt.output_limit = OUTPUT_LIMIT;
    opt.sample_interval_ms = MEMORY_SAMPLE_INTERVAL_MS;
    opt.token = &token;

    process_result result = run_process(opt);
    if (result.cancelled) throw cancelled_error();

    // g++ 把诊断输出到 stderr，javac 的部分版本输出到 stdout
    string log = result.stderr_text.empty() ? result.stdout_text : result.stderr_text;
    if (result.timed_out)
        throw compilation_error("Compilation time limit exceeded", log.empty() ? "Compilation time limit exceeded" : log);
    if (result.exit_code != 0 || result.signal != 0 || has_compiler_diagnostics(log))
        throw compilation_error(fmt::format("{} exited with {}", tc.compile->binary, result.exit_code), log);
}

execution_result local_executor::run(const toolchain &tc, const fs::path &workdir, const execution_request &request, const cancellation_token &token) {
    process_options opt;
    opt.command = tc.run.command();
    opt.workdir = workdir;
    opt.stdin_text = request.stdin_text;
    opt.time_limit_ms = request.time_limit_ms;
    opt.output_limit = OUTPUT_LIMIT;
    opt.sample_interval_ms = MEMORY_SAMPLE_INTERVAL_MS;
    opt.token = &token;

    process_result proc = run_process(opt);

    execution_result result;
    result.stdout_text = move(proc.stdout_text);
    result.stderr_text = move(proc.stderr_text);
    result.exit_code = proc.exit_code;
    result.signal = proc.signal;
    result.timed_out = proc.timed_out;
    result.runtime_ms = proc.runtime_ms;
    result.peak_memory_kb = proc.peak_memory_kb;
    if (result.timed_out && result.stderr_text.empty())
        result.stderr_text = "Time limit exceeded";
    if (proc.cancelled && result.stderr_text.empty())
        result.stderr_text = "Cancelled";
    return result;
}

execution_result local_executor::execute(const execution_request &request, const cancellation_token &token) {
    string source = html_unescape(request.source);
    toolchain tc = get_toolchain(request.lang, source, request.memory_limit_kb);

    fs::path workdir;
    try {
        workdir = create_unique_directory(RUN_DIR, fmt::format("codejudge-{}-", to_string(request.lang)));
    } catch (exception &ex) {
        throw internal_error(fmt::format("Unable to create working directory in {}: {}", RUN_DIR, ex.what()));
    }
    defer {
        remove_directory_quietly(workdir);
    };

    write_file_content(workdir / assert_safe_path(tc.source_file), source);

    const command_spec *current = tc.compile ? &*tc.compile : &tc.run;
    try {
        if (tc.compile) {
            DLOG(INFO) << "Compiling " << to_string(request.lang) << " source in " << workdir;
            compile(tc, workdir, token);
        }
        current = &tc.run;
        execution_result result = run(tc, workdir, request, token);
        result.stderr_text = strip_workdir(result.stderr_text, workdir);
        return result;
    } catch (compilation_error &ex) {
        return execution_result::make_failure(execution_failure::COMPILATION_ERROR, strip_workdir(ex.error_log, workdir));
    } catch (toolchain_missing_error &ex) {
        string message = missing_toolchain_message(*current);
        LOG(ERROR) << message << " (" << ex.what() << ")";
        return execution_result::make_failure(execution_failure::TOOLCHAIN_MISSING, message);
    }
}

}  // namespace codejudge
