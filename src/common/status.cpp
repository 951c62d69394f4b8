#include "codejudge/common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace codejudge {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::PENDING, "Pending")
    (status::COMPILING, "Compiling")
    (status::RUNNING, "Running")
    (status::ACCEPTED, "Accepted")
    (status::PARTIAL_CORRECT, "Partial Correct")
    (status::COMPILATION_ERROR, "Compilation Error")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

bool is_final(status stat) {
    return stat != status::PENDING && stat != status::COMPILING && stat != status::RUNNING;
}

}  // namespace codejudge
