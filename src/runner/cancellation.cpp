#include "polyrun/runner/cancellation.hpp"

namespace polyrun {
using namespace std;

void cancellation_token::cancel() noexcept {
    cancelled.store(true);
}

bool cancellation_token::is_cancelled() const noexcept {
    return cancelled.load();
}

void cancellation_token::set_deadline(clock::time_point deadline) noexcept {
    int64_t ns = chrono::duration_cast<chrono::nanoseconds>(deadline.time_since_epoch()).count();
    deadline_ns.store(ns > 0 ? ns : 1);
}

optional<cancellation_token::clock::time_point> cancellation_token::deadline() const noexcept {
    int64_t ns = deadline_ns.load();
    if (ns == 0) return nullopt;
    return clock::time_point(chrono::duration_cast<clock::duration>(chrono::nanoseconds(ns)));
}

bool cancellation_token::expired(clock::time_point now) const noexcept {
    if (is_cancelled()) return true;
    auto dl = deadline();
    return dl && now >= *dl;
}

}  // namespace polyrun
