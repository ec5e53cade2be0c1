#include <chrono>
#include <map>
#include <string>

#include "gtest/gtest.h"

#include "manual_clock.hh"
#include "memory_store.hh"
#include "rate_limiter.hh"

namespace {

using namespace std::chrono;

struct RateLimiterTest : public ::testing::Test
{
    ManualClock clock;
    MemoryStore store{clock};
    RateLimiter limiter{store, clock};
};

TEST_F(RateLimiterTest, AdmitsUpToTheLimitWithinAWindow)
{
    for (int i = 0; i < 5; ++i) {
        auto result = limiter.CheckLimit("client", 5, milliseconds(1000));
        EXPECT_TRUE(result.allowed) << "attempt " << i;
        EXPECT_EQ(5, result.limit);
        EXPECT_EQ(4 - i, result.remaining);
        EXPECT_FALSE(result.degraded);
    }
    auto result = limiter.CheckLimit("client", 5, milliseconds(1000));
    EXPECT_FALSE(result.allowed);
    EXPECT_EQ(0, result.remaining);
}

TEST_F(RateLimiterTest, WindowSlides)
{
    for (int i = 0; i < 5; ++i)
        limiter.CheckLimit("client", 5, milliseconds(1000));
    EXPECT_FALSE(limiter.CheckLimit("client", 5, milliseconds(1000)).allowed);

    clock.Advance(milliseconds(1000));
    auto result = limiter.CheckLimit("client", 5, milliseconds(1000));
    EXPECT_TRUE(result.allowed);
}

TEST_F(RateLimiterTest, ResetCountsFromTheOldestAttempt)
{
    auto first = limiter.CheckLimit("user-1", 3, milliseconds(60000));
    EXPECT_TRUE(first.allowed);
    EXPECT_EQ(2, first.remaining);
    EXPECT_EQ(60000, first.resetInMs);

    clock.Advance(milliseconds(1));
    auto second = limiter.CheckLimit("user-1", 3, milliseconds(60000));
    EXPECT_TRUE(second.allowed);
    EXPECT_EQ(1, second.remaining);

    clock.Advance(milliseconds(1));
    auto third = limiter.CheckLimit("user-1", 3, milliseconds(60000));
    EXPECT_TRUE(third.allowed);
    EXPECT_EQ(0, third.remaining);

    clock.Advance(milliseconds(1));
    auto fourth = limiter.CheckLimit("user-1", 3, milliseconds(60000));
    EXPECT_FALSE(fourth.allowed);
    EXPECT_EQ(0, fourth.remaining);
    EXPECT_NEAR(60000, fourth.resetInMs, 1000);
    EXPECT_EQ(59997, fourth.resetInMs);
    EXPECT_EQ(60, fourth.RetryAfterSeconds());
}

TEST_F(RateLimiterTest, DeniedAttemptsAreRecorded)
{
    limiter.CheckLimit("client", 2, milliseconds(1000));
    limiter.CheckLimit("client", 2, milliseconds(1000));
    clock.Advance(milliseconds(500));
    EXPECT_FALSE(limiter.CheckLimit("client", 2, milliseconds(1000)).allowed);

    // The first two attempts left the window, the denied one has not.
    clock.Advance(milliseconds(500));
    auto result = limiter.CheckLimit("client", 2, milliseconds(1000));
    EXPECT_TRUE(result.allowed);
    EXPECT_EQ(0, result.remaining);
    EXPECT_EQ(500, result.resetInMs);
}

TEST_F(RateLimiterTest, IdentifiersAreIndependent)
{
    limiter.CheckLimit("a", 1, milliseconds(1000));
    EXPECT_FALSE(limiter.CheckLimit("a", 1, milliseconds(1000)).allowed);
    EXPECT_TRUE(limiter.CheckLimit("b", 1, milliseconds(1000)).allowed);
}

TEST_F(RateLimiterTest, WindowKeysExpireInTheStore)
{
    limiter.CheckLimit("client", 5, milliseconds(1000));
    EXPECT_EQ(1, *store.ZCard("ratelimit:client"));
    clock.Advance(milliseconds(1000));
    EXPECT_EQ(0, *store.DbSize());
}

TEST_F(RateLimiterTest, OneRoundTripPerCheck)
{
    limiter.CheckPlan("key", Plan::Pro);
    EXPECT_EQ(1u, store.RoundTrips());
}

TEST_F(RateLimiterTest, BurstTierDeniesTheSixtyFirstRequest)
{
    for (int i = 0; i < 60; ++i) {
        auto result = limiter.CheckPlan("api-key", Plan::Free);
        ASSERT_TRUE(result.allowed) << "attempt " << i;
        clock.Advance(milliseconds(10));
    }
    auto result = limiter.CheckPlan("api-key", Plan::Free);
    EXPECT_FALSE(result.allowed);
    EXPECT_EQ("burst", result.tier);
    EXPECT_EQ(60, result.limit);

    clock.Advance(seconds(60));
    result = limiter.CheckPlan("api-key", Plan::Free);
    EXPECT_TRUE(result.allowed);
}

TEST_F(RateLimiterTest, DailyQuotaOutlastsTheBurstWindow)
{
    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(limiter.CheckPlan("api-key", Plan::Free).allowed)
            << "attempt " << i;
        clock.Advance(seconds(2));
    }
    auto result = limiter.CheckPlan("api-key", Plan::Free);
    EXPECT_FALSE(result.allowed);
    EXPECT_EQ("free", result.tier);
    EXPECT_EQ(100, result.limit);
    EXPECT_GT(result.resetInMs, 23 * 3600 * 1000);
}

TEST_F(RateLimiterTest, AdmittedResultReportsTheTightestTier)
{
    auto result = limiter.CheckPlan("api-key", Plan::Pro);
    EXPECT_TRUE(result.allowed);
    EXPECT_EQ("burst", result.tier);
    EXPECT_EQ(59, result.remaining);

    result = limiter.CheckTiers("api-key", {RateLimitTier{"hourly", 3,
                                                          hours(1)}});
    EXPECT_EQ("hourly", result.tier);
    EXPECT_EQ(2, result.remaining);
}

TEST_F(RateLimiterTest, FallsBackToLocalCountersWhenTheStoreIsDown)
{
    store.SetOnline(false);

    auto result = limiter.CheckLimit("client", 2, milliseconds(1000));
    EXPECT_TRUE(result.allowed);
    EXPECT_TRUE(result.degraded);
    EXPECT_EQ(1, result.remaining);
    EXPECT_EQ(1000, result.resetInMs);

    clock.Advance(milliseconds(100));
    result = limiter.CheckLimit("client", 2, milliseconds(1000));
    EXPECT_TRUE(result.allowed);
    EXPECT_EQ(0, result.remaining);
    EXPECT_EQ(900, result.resetInMs);

    result = limiter.CheckLimit("client", 2, milliseconds(1000));
    EXPECT_FALSE(result.allowed);
    EXPECT_TRUE(result.degraded);

    clock.Advance(milliseconds(900));
    EXPECT_TRUE(limiter.CheckLimit("client", 2, milliseconds(1000)).allowed);
    EXPECT_EQ(0u, store.RoundTrips());
}

TEST_F(RateLimiterTest, ZeroLimitDeniesEveryAttempt)
{
    auto result = limiter.CheckLimit("blocked", 0, milliseconds(1000));
    EXPECT_FALSE(result.allowed);
    EXPECT_FALSE(result.degraded);
    EXPECT_EQ(0, result.remaining);

    store.SetOnline(false);
    result = limiter.CheckLimit("blocked", 0, milliseconds(1000));
    EXPECT_FALSE(result.allowed);
    EXPECT_TRUE(result.degraded);
    EXPECT_EQ(0, result.remaining);

    result = limiter.CheckLimit("blocked", 0, milliseconds(1000));
    EXPECT_FALSE(result.allowed);
    EXPECT_EQ(0, result.remaining);
}

TEST_F(RateLimiterTest, DegradedFlagCoversEveryTier)
{
    store.SetOnline(false);
    auto result = limiter.CheckPlan("api-key", Plan::Enterprise);
    EXPECT_TRUE(result.allowed);
    EXPECT_TRUE(result.degraded);
    EXPECT_EQ(2u, limiter.LocalWindowCount());
}

TEST_F(RateLimiterTest, PruneLocalDropsFinishedWindows)
{
    store.SetOnline(false);
    limiter.CheckLimit("short", 5, milliseconds(1000));
    limiter.CheckLimit("long", 5, milliseconds(60000));
    EXPECT_EQ(2u, limiter.LocalWindowCount());

    clock.Advance(milliseconds(1000));
    EXPECT_EQ(1u, limiter.PruneLocal());
    EXPECT_EQ(1u, limiter.LocalWindowCount());
}

TEST(ThrottleHeaders, AllowedResult)
{
    RateLimitResult result{true, 100, 42, 1500, false, "free"};
    auto headers = ThrottleHeaders(result, FromEpochMs(1709985600000LL));
    EXPECT_EQ("100", headers["X-RateLimit-Limit"]);
    EXPECT_EQ("42", headers["X-RateLimit-Remaining"]);
    EXPECT_EQ("1709985602", headers["X-RateLimit-Reset"]);
    EXPECT_EQ(0u, headers.count("Retry-After"));
}

TEST(ThrottleHeaders, DeniedResultAddsRetryAfter)
{
    RateLimitResult result{false, 60, 0, 59001, false, "burst"};
    auto headers = ThrottleHeaders(result, FromEpochMs(1709985600000LL));
    EXPECT_EQ("0", headers["X-RateLimit-Remaining"]);
    EXPECT_EQ("60", headers["Retry-After"]);
}

TEST(Plans, TiersAndParsing)
{
    EXPECT_EQ(100, PlanTier(Plan::Free).limit);
    EXPECT_EQ(10000, PlanTier(Plan::Pro).limit);
    EXPECT_EQ(100000, PlanTier(Plan::Enterprise).limit);
    EXPECT_EQ(hours(24), PlanTier(Plan::Free).window);
    EXPECT_EQ(60, BurstTier().limit);
    EXPECT_EQ(minutes(1), BurstTier().window);

    Plan plan = Plan::Free;
    ASSERT_TRUE(ParsePlan("Enterprise", plan));
    EXPECT_EQ(Plan::Enterprise, plan);
    EXPECT_FALSE(ParsePlan("platinum", plan));
    EXPECT_EQ(Plan::Enterprise, plan);
}

} // namespace
