#pragma once

#include <gmock/gmock.h>
#include <string>
#include "codejudge/exec/execution.hpp"

namespace codejudge {

struct mock_executor : public executor {
    MOCK_METHOD(execution_result, execute, (const execution_request &request, const cancellation_token &token), (override));
};

/**
 * @brief 构造一个正常结束的执行结果
 */
inline execution_result make_output(const std::string &stdout_text, long runtime_ms = 10, long memory_kb = 1024) {
    execution_result result;
    result.stdout_text = stdout_text;
    result.runtime_ms = runtime_ms;
    result.peak_memory_kb = memory_kb;
    return result;
}

inline execution_result make_timeout(const std::string &partial_output = "") {
    execution_result result;
    result.stdout_text = partial_output;
    result.stderr_text = "Time limit exceeded";
    result.exit_code = -1;
    result.signal = 9;
    result.timed_out = true;
    result.runtime_ms = 3000;
    return result;
}

inline execution_result make_crash(const std::string &stderr_text, int exit_code = 1) {
    execution_result result;
    result.stderr_text = stderr_text;
    result.exit_code = exit_code;
    result.runtime_ms = 5;
    return result;
}

}  // namespace codejudge
