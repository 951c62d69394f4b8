#include "codejudge/exec/execution.hpp"

namespace codejudge {
using namespace std;

const char *to_string(execution_failure failure) {
    switch (failure) {
        case execution_failure::NONE: return "none";
        case execution_failure::COMPILATION_ERROR: return "compilation_error";
        case execution_failure::TOOLCHAIN_MISSING: return "toolchain_missing";
        case execution_failure::NETWORK_ERROR: return "network_error";
    }
    return "unknown";
}

bool execution_result::succeeded() const {
    return failure == execution_failure::NONE && !timed_out && exit_code == 0 && signal == 0;
}

bool execution_result::runtime_error() const {
    if (timed_out || failure == execution_failure::COMPILATION_ERROR) return false;
    return failure != execution_failure::NONE || exit_code != 0 || signal != 0;
}

execution_result execution_result::make_failure(execution_failure failure, const string &message) {
    execution_result result;
    result.failure = failure;
    result.stderr_text = message;
    result.exit_code = 1;
    return result;
}

}  // namespace codejudge
