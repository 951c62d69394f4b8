#include "codejudge/exec/circuit_breaker.hpp"
#include <glog/logging.h>
#include <algorithm>

namespace codejudge {
using namespace std;

const char *to_string(circuit_breaker::state st) {
    switch (st) {
        case circuit_breaker::state::CLOSED: return "closed";
        case circuit_breaker::state::OPEN: return "open";
        case circuit_breaker::state::HALF_OPEN: return "half-open";
    }
    return "unknown";
}

circuit_breaker::circuit_breaker(int failure_threshold, chrono::milliseconds cooldown, clock_type clock)
    : failure_threshold(max(1, failure_threshold)), cooldown(cooldown), clock(move(clock)) {}

void circuit_breaker::transit(state next) {
    if (st != next)
        LOG(WARNING) << "Circuit breaker " << to_string(st) << " -> " << to_string(next);
    st = next;
}

bool circuit_breaker::allow_request() {
    scoped_lock guard(mut);
    switch (st) {
        case state::CLOSED:
            return true;
        case state::OPEN:
            if (clock() - opened_at < cooldown) return false;
            transit(state::HALF_OPEN);
            trial_in_flight = true;
            return true;
        case state::HALF_OPEN:
            if (trial_in_flight) return false;
            trial_in_flight = true;
            return true;
    }
    return false;
}

void circuit_breaker::record_success() {
    scoped_lock guard(mut);
    consecutive_failures = 0;
    trial_in_flight = false;
    transit(state::CLOSED);
}

void circuit_breaker::record_failure() {
    scoped_lock guard(mut);
    trial_in_flight = false;
    if (st == state::HALF_OPEN || ++consecutive_failures >= failure_threshold) {
        opened_at = clock();
        transit(state::OPEN);
    }
}

circuit_breaker::state circuit_breaker::current_state() {
    scoped_lock guard(mut);
    return st;
}

}  // namespace codejudge
