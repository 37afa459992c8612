#include "polyrun/engine/concurrency_limiter.hpp"
#include <algorithm>

namespace polyrun {
using namespace std;

admission_token::admission_token(concurrency_limiter *limiter)
    : limiter(limiter) {}

admission_token::admission_token(admission_token &&other) noexcept
    : limiter(other.limiter) {
    other.limiter = nullptr;
}

admission_token &admission_token::operator=(admission_token &&other) noexcept {
    if (this != &other) {
        release();
        limiter = other.limiter;
        other.limiter = nullptr;
    }
    return *this;
}

admission_token::~admission_token() {
    release();
}

void admission_token::release() {
    if (limiter) {
        limiter->release();
        limiter = nullptr;
    }
}

concurrency_limiter::concurrency_limiter(size_t max_concurrency)
    : max_concurrency(max<size_t>(max_concurrency, 1)) {}

optional<admission_token> concurrency_limiter::acquire(chrono::milliseconds timeout) {
    unique_lock<mutex> lock(mut);
    if (!cond.wait_for(lock, timeout, [this] { return used < max_concurrency; }))
        return nullopt;
    ++used;
    return admission_token(this);
}

size_t concurrency_limiter::in_use() const {
    lock_guard<mutex> lock(mut);
    return used;
}

size_t concurrency_limiter::capacity() const {
    return max_concurrency;
}

void concurrency_limiter::release() {
    {
        lock_guard<mutex> lock(mut);
        --used;
    }
    cond.notify_one();
}

}  // namespace polyrun
