#include "codejudge/common/exceptions.hpp"

namespace codejudge {
using namespace std;

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

const boost::stacktrace::stacktrace &judge_exception::trace() const {
    return *stacktrace;
}

internal_error::internal_error(const string &message)
    : judge_exception(message) {}

network_error::network_error(const string &message)
    : judge_exception(message) {}

compilation_error::compilation_error(const string &message, const string &error_log)
    : judge_exception(message), error_log(error_log) {}

toolchain_missing_error::toolchain_missing_error(const string &message, const string &binary)
    : judge_exception(message), binary_name(binary) {}

const string &toolchain_missing_error::binary() const {
    return binary_name;
}

cancelled_error::cancelled_error()
    : judge_exception("submission cancelled") {}

cancelled_error::cancelled_error(const string &message)
    : judge_exception(message) {}

}  // namespace codejudge
