#include <glog/logging.h>
#include <signal.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <mutex>
#include <thread>
#include "codejudge/common/cancellation.hpp"
#include "codejudge/common/concurrent_queue.hpp"
#include "codejudge/common/io_utils.hpp"
#include "codejudge/common/json_utils.hpp"
#include "codejudge/common/utils.hpp"
#include "codejudge/config.hpp"
#include "codejudge/env.hpp"
#include "codejudge/exec/engine.hpp"
#include "codejudge/exec/sandbox_executor.hpp"
#include "codejudge/exec/toolchain.hpp"
#include "codejudge/judge/judger.hpp"
#include "codejudge/judge/submission.hpp"
#include "codejudge/worker.hpp"
using namespace std;

codejudge::concurrent_queue<shared_ptr<codejudge::judge_task>> submission_queue;

// 所有提交共享同一个取消标记，收到 SIGINT 时全部取消
codejudge::cancellation_token interrupt_token;

void sigintHandler(int /* signum */) {
    LOG(ERROR) << "Received SIGINT, cancelling submissions";
    interrupt_token.cancel();
    codejudge::stop_workers();
}

/**
 * @brief 输出工具链检查结果，全部可用时返回 true
 */
static bool print_environment_report() {
    bool ok = true;
    for (auto &status : codejudge::check_toolchains()) {
        cout << codejudge::to_string(status.lang) << "\t" << status.label << "\t"
             << status.binary << " (" << status.env_var << "): ";
        if (status.resolved) {
            cout << status.resolved->string() << endl;
        } else {
            cout << "not found" << endl;
            ok = false;
        }
    }

    cout << "typescript\tTypeScript compiler\t" << (codejudge::TYPESCRIPT_JS.empty() ? "-" : codejudge::TYPESCRIPT_JS.string())
         << " (TYPESCRIPT_JS): " << (codejudge::default_transpiler()->available() ? "available" : "not found") << endl;
    cout << "remote\tRemote executor\t" << codejudge::REMOTE_URL << " (PISTON_URL): "
         << (codejudge::REMOTE_ENABLED ? "enabled" : "disabled") << endl;
    cout << "mode\t" << codejudge::EXECUTOR_MODE << endl;
    return ok;
}

/**
 * @brief 读取一个提交文件，文件内容可以是一个提交或者提交数组
 * 没有 id 的提交使用文件名（以及数组下标）作为 id
 */
static vector<codejudge::submission> read_submissions(const string &file) {
    string content;
    if (file == "-") {
        content.assign(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
    } else {
        if (!filesystem::is_regular_file(file))
            throw invalid_argument("Submission file " + file + " does not exist");
        content = codejudge::read_file_content(file);
    }

    nlohmann::json j = nlohmann::json::parse(content);
    vector<codejudge::submission> result;
    if (j.is_array()) {
        for (size_t i = 0; i < j.size(); ++i) {
            codejudge::submission submit = j[i].get<codejudge::submission>();
            if (submit.id.empty()) submit.id = file + "#" + to_string(i);
            result.push_back(move(submit));
        }
    } else {
        codejudge::submission submit = j.get<codejudge::submission>();
        if (submit.id.empty()) submit.id = file;
        result.push_back(move(submit));
    }
    return result;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    signal(SIGINT, sigintHandler);

    codejudge::load_environment();

    namespace po = boost::program_options;
    po::options_description desc("codejudge options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("submission", po::value<vector<string>>(), "submission JSON files to judge, use - to read from stdin. A file may contain one submission or an array of submissions.")
        ("workers", po::value<size_t>()->default_value(1), "set the number of submissions judged in parallel")
        ("detail", po::value<string>(), "force the detail level of verdicts: full (with every test case) or summary. Defaults to the action of each submission")
        ("mode", po::value<string>(), "set the executor mode: local, remote or auto. You can either pass it from environ EXECUTOR_MODE")
        ("remote-url", po::value<string>(), "set the base url of the Piston compatible execution service. You can either pass it from environ PISTON_URL")
        ("time-limit", po::value<int>(), "set the default time limit in milliseconds, default to 3000. You can either pass it from environ TIMELIMIT")
        ("run-dir", po::value<string>(), "set the directory to compile and run user programs. You can either pass it from environ RUNDIR")
        ("typescript", po::value<string>(), "set the path of typescript.js used to transpile TypeScript. You can either pass it from environ TYPESCRIPT_JS")
        ("check-env", "check whether compilers and interpreters can be found and exit")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("submission", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "codejudge: Compile, run and judge submissions against their test cases" << endl
             << "Verdicts are printed to stdout as one JSON object per line" << endl
             << "Usage: " << argv[0] << " [options] submission.json..." << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "codejudge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("mode")) codejudge::EXECUTOR_MODE = vm["mode"].as<string>();
    if (vm.count("remote-url")) codejudge::REMOTE_URL = vm["remote-url"].as<string>();
    if (vm.count("time-limit")) codejudge::TIME_LIMIT_MS = vm["time-limit"].as<int>();
    if (vm.count("run-dir")) codejudge::RUN_DIR = filesystem::path(vm["run-dir"].as<string>());
    if (vm.count("typescript")) codejudge::TYPESCRIPT_JS = filesystem::path(vm["typescript"].as<string>());

    CHECK(codejudge::TIME_LIMIT_MS > 0)
        << "Time limit should be positive, got " << codejudge::TIME_LIMIT_MS;
    CHECK(filesystem::is_directory(codejudge::RUN_DIR))
        << "Run directory " << codejudge::RUN_DIR << " does not exist";

    if (vm.count("check-env")) {
        return print_environment_report() ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (!vm.count("submission")) {
        cerr << "No submission given" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    optional<codejudge::detail_level> forced_detail;
    shared_ptr<codejudge::execution_engine> engine;
    try {
        if (vm.count("detail")) forced_detail = codejudge::parse_detail_level(vm["detail"].as<string>());
        codejudge::parse_comparison_mode(codejudge::COMPARISON_MODE);
        engine = codejudge::make_execution_engine();
    } catch (invalid_argument& e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    // 多个 worker 同时输出结果，保证每行是一个完整的 JSON
    mutex output_mutex;
    bool failed = false;

    codejudge::submission_judger judger(engine);
    judger.on_judge_finished([&](const codejudge::submission& submit, const codejudge::judge_report& report) {
        nlohmann::json j = codejudge::to_json(submit, report, forced_detail.value_or(submit.detail));
        scoped_lock guard(output_mutex);
        cout << nlohmann::dump_lossy(j) << endl;
    });

    auto report_failure = [&](const codejudge::submission& submit, const string& message) {
        nlohmann::json j = {{"id", submit.id}, {"error", message}};
        scoped_lock guard(output_mutex);
        cout << nlohmann::dump_lossy(j) << endl;
        failed = true;
    };

    for (auto& file : vm["submission"].as<vector<string>>()) {
        try {
            for (auto& submit : read_submissions(file)) {
                auto task = make_shared<codejudge::judge_task>();
                task->submit = move(submit);
                task->token = interrupt_token;
                submission_queue.push(task);
            }
        } catch (std::exception& e) {
            LOG(ERROR) << "Submission file " << file << " is malformed, " << e.what();
            codejudge::submission invalid;
            invalid.id = file;
            report_failure(invalid, e.what());
        }
    }

    // 所有提交都已入队，worker 在队列清空后退出
    codejudge::stop_workers();

    size_t workers = max<size_t>(1, vm["workers"].as<size_t>());
    vector<thread> worker_threads;
    for (size_t i = 0; i < workers; ++i)
        worker_threads.push_back(codejudge::start_worker(i, judger, submission_queue, report_failure));

    for (auto& th : worker_threads)
        th.join();

    return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
