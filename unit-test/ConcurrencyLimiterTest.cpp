#include <thread>
#include "gtest/gtest.h"
#include "polyrun/engine/concurrency_limiter.hpp"

using namespace std;
using namespace polyrun;

TEST(ConcurrencyLimiterTest, AcquireUpToCapacity) {
    concurrency_limiter limiter(2);
    auto a = limiter.acquire(chrono::milliseconds(0));
    auto b = limiter.acquire(chrono::milliseconds(0));
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(limiter.in_use(), 2u);

    auto c = limiter.acquire(chrono::milliseconds(20));
    EXPECT_FALSE(c);
    EXPECT_EQ(limiter.in_use(), 2u);
}

TEST(ConcurrencyLimiterTest, TokenReleasedOnDestruction) {
    concurrency_limiter limiter(1);
    {
        auto token = limiter.acquire(chrono::milliseconds(0));
        ASSERT_TRUE(token);
        EXPECT_EQ(limiter.in_use(), 1u);
    }
    EXPECT_EQ(limiter.in_use(), 0u);
    EXPECT_TRUE(limiter.acquire(chrono::milliseconds(0)));
}

TEST(ConcurrencyLimiterTest, ReleaseIsIdempotentAndMoveSafe) {
    concurrency_limiter limiter(1);
    auto token = limiter.acquire(chrono::milliseconds(0));
    ASSERT_TRUE(token);

    admission_token moved = move(*token);
    token.reset();
    EXPECT_EQ(limiter.in_use(), 1u);

    moved.release();
    moved.release();
    EXPECT_EQ(limiter.in_use(), 0u);
}

TEST(ConcurrencyLimiterTest, WaiterGetsReleasedSlot) {
    concurrency_limiter limiter(1);
    auto token = limiter.acquire(chrono::milliseconds(0));
    ASSERT_TRUE(token);

    thread releaser([&] {
        this_thread::sleep_for(chrono::milliseconds(50));
        token->release();
    });

    auto waited = limiter.acquire(chrono::seconds(5));
    releaser.join();
    EXPECT_TRUE(waited);
    EXPECT_EQ(limiter.in_use(), 1u);
    EXPECT_EQ(limiter.capacity(), 1u);
}
