#include "codejudge/common/cancellation.hpp"

namespace codejudge {
using namespace std;

cancellation_token::cancellation_token()
    : flag(make_shared<atomic<bool>>(false)) {}

void cancellation_token::cancel() const noexcept {
    flag->store(true);
}

bool cancellation_token::is_cancelled() const noexcept {
    return flag->load();
}

}  // namespace codejudge
