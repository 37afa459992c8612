#include "gtest/gtest.h"
#include "polyrun/runner/cancellation.hpp"
#include "polyrun/runner/limits.hpp"

using namespace std;
using namespace polyrun;

TEST(LimitsTest, OverrideAppliesOnlySetFields) {
    resource_limits base;
    base.timeout_ms = 10000;
    base.memory_bytes = 256LL << 20;
    base.max_output_bytes = 1 << 20;

    limits_override overrides;
    overrides.timeout_ms = 2000;
    resource_limits result = overrides.apply(base);
    EXPECT_EQ(result.timeout_ms, 2000);
    EXPECT_EQ(result.memory_bytes, 256LL << 20);
    EXPECT_EQ(result.max_output_bytes, 1 << 20);
}

TEST(LimitsTest, ClampToCeiling) {
    resource_limits limits;
    limits.timeout_ms = 120000;
    limits.cpu_time_ms = -1;
    limits.memory_bytes = 1024;

    resource_limits ceiling;
    ceiling.timeout_ms = 60000;
    ceiling.cpu_time_ms = 60000;
    ceiling.memory_bytes = -1;

    resource_limits result = limits.clamp(ceiling);
    EXPECT_EQ(result.timeout_ms, 60000);
    // 不限制的项收紧为上限
    EXPECT_EQ(result.cpu_time_ms, 60000);
    // 上限不限制时保持原值
    EXPECT_EQ(result.memory_bytes, 1024);
}

TEST(LimitsTest, OverrideMustBePositive) {
    limits_override overrides;
    EXPECT_TRUE(overrides.is_valid());
    overrides.memory_bytes = 0;
    EXPECT_FALSE(overrides.is_valid());
    overrides.memory_bytes = 1;
    overrides.timeout_ms = -5;
    EXPECT_FALSE(overrides.is_valid());
}

TEST(LimitsTest, ParseJson) {
    auto j = nlohmann::json::parse(R"({"timeoutMs": 1500, "memoryBytes": 1048576, "processLimit": 8})");
    limits_override overrides = j.get<limits_override>();
    EXPECT_EQ(*overrides.timeout_ms, 1500);
    EXPECT_EQ(*overrides.memory_bytes, 1048576);
    EXPECT_EQ(*overrides.proc_limit, 8);
    EXPECT_FALSE(overrides.cpu_time_ms);

    resource_limits limits;
    limits.cpu_time_ms = 3000;
    j.get_to(limits);
    EXPECT_EQ(limits.timeout_ms, 1500);
    EXPECT_EQ(limits.cpu_time_ms, 3000);
    EXPECT_EQ(nlohmann::json(limits).at("processLimit"), 8);
}

TEST(CancellationTest, CancelAndDeadline) {
    cancellation_token token;
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_FALSE(token.expired());
    EXPECT_FALSE(token.deadline());

    auto now = cancellation_token::clock::now();
    token.set_deadline(now + chrono::seconds(10));
    EXPECT_FALSE(token.expired(now));
    EXPECT_TRUE(token.expired(now + chrono::seconds(11)));
    ASSERT_TRUE(token.deadline());

    token.cancel();
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_TRUE(token.expired(now));
}
