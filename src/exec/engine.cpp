#include "codejudge/exec/engine.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <stdexcept>
#include "codejudge/config.hpp"
#include "codejudge/exec/circuit_breaker.hpp"
#include "codejudge/exec/local_executor.hpp"
#include "codejudge/exec/remote_executor.hpp"
#include "codejudge/exec/sandbox_executor.hpp"

namespace codejudge {
using namespace std;

executor_mode parse_executor_mode(const string &mode) {
    string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(mode));
    if (key == "local") return executor_mode::LOCAL;
    if (key == "remote") return executor_mode::REMOTE;
    if (key == "auto" || key.empty()) return executor_mode::AUTO;
    throw invalid_argument("Unknown executor mode " + mode + ", expected local, remote or auto");
}

execution_engine::execution_engine(executor_mode mode, shared_ptr<executor> sandbox,
                                   shared_ptr<executor> local, shared_ptr<executor> remote)
    : mode(mode), sandbox(move(sandbox)), local(move(local)), remote(move(remote)) {}

execution_result execution_engine::execute(const execution_request &request, const cancellation_token &token) {
    if (is_script_language(request.lang))
        return sandbox->execute(request, token);

    if (mode == executor_mode::REMOTE) {
        if (!remote)
            return execution_result::make_failure(execution_failure::NETWORK_ERROR, "Remote executor is disabled. Set REMOTE_EXECUTOR=on.");
        return remote->execute(request, token);
    }

    execution_result result = local->execute(request, token);
    if (mode == executor_mode::AUTO && result.failure == execution_failure::TOOLCHAIN_MISSING && remote && !token.is_cancelled()) {
        LOG(WARNING) << "Local toolchain for " << to_string(request.lang) << " is missing, falling back to remote executor";
        return remote->execute(request, token);
    }
    return result;
}

shared_ptr<execution_engine> make_execution_engine() {
    shared_ptr<executor> remote;
    if (REMOTE_ENABLED) {
        auto breaker = make_shared<circuit_breaker>(REMOTE_FAILURE_THRESHOLD, chrono::milliseconds(REMOTE_COOLDOWN_MS));
        remote = make_shared<remote_executor>(REMOTE_URL, breaker, REMOTE_VERSIONS, REMOTE_TIMEOUT_MS);
    }
    return make_shared<execution_engine>(parse_executor_mode(EXECUTOR_MODE),
                                         make_shared<sandbox_executor>(),
                                         make_shared<local_executor>(),
                                         remote);
}

}  // namespace codejudge
