#include "codejudge/exec/toolchain.hpp"
#include <fmt/core.h>
#include <regex>
#include <stdexcept>
#include "codejudge/common/utils.hpp"
#include "codejudge/config.hpp"

namespace codejudge {
using namespace std;

vector<string> command_spec::command() const {
    vector<string> cmd = {binary};
    cmd.insert(cmd.end(), args.begin(), args.end());
    return cmd;
}

string java_main_class(const string &source) {
    static const regex public_class(R"(public\s+(?:(?:final|abstract)\s+)*class\s+([A-Za-z_$][A-Za-z0-9_$]*))");
    smatch match;
    if (regex_search(source, match, public_class))
        return match[1].str();
    return "Solution";
}

toolchain get_toolchain(language lang, const string &source, optional<long> memory_limit_kb) {
    toolchain tc;
    tc.lang = lang;
    switch (lang) {
        case language::PYTHON:
            tc.source_file = "main.py";
            tc.run = {PYTHON_BIN, "PYTHON_BIN", "Python interpreter", {"main.py"}};
            break;
        case language::CPP:
            tc.source_file = "main.cpp";
            tc.compile = command_spec{GXX_BIN, "GXX_BIN", "C++ compiler", {"-std=c++17", "-O2", "-o", "main", "main.cpp"}};
            tc.run = {"./main", "", "compiled program", {}};
            break;
        case language::JAVA: {
            string main_class = java_main_class(source);
            tc.source_file = main_class + ".java";
            tc.compile = command_spec{JAVAC_BIN, "JAVAC_BIN", "Java compiler", {"-encoding", "UTF-8", "-d", ".", tc.source_file}};
            tc.run = {JAVA_BIN, "JAVA_BIN", "Java runtime", {}};
            if (memory_limit_kb)
                tc.run.args.push_back(fmt::format("-Xmx{}k", *memory_limit_kb));
            tc.run.args.insert(tc.run.args.end(), {"-cp", ".", main_class});
            break;
        }
        default:
            throw invalid_argument(fmt::format("{} does not use an external toolchain", to_string(lang)));
    }
    return tc;
}

string missing_toolchain_message(const command_spec &cmd) {
    if (cmd.env_var.empty())
        return fmt::format("Failed to start {} ({}).", cmd.label, cmd.binary);
    return fmt::format("Failed to start {} ({}). {} not found in PATH. Install it on the execution host or set {}.",
                       cmd.label, cmd.binary, cmd.binary, cmd.env_var);
}

vector<toolchain_status> check_toolchains() {
    vector<toolchain_status> result;
    for (language lang : {language::PYTHON, language::JAVA, language::CPP}) {
        toolchain tc = get_toolchain(lang, "");
        for (auto *cmd : {tc.compile ? &*tc.compile : nullptr, &tc.run}) {
            if (!cmd || cmd->env_var.empty()) continue;
            result.push_back({lang, cmd->label, cmd->binary, cmd->env_var, find_executable(cmd->binary)});
        }
    }
    return result;
}

}  // namespace codejudge
