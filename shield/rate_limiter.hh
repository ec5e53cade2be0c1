#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include "clock.hh"
#include "remote_store.hh"

// The outcome of an admission check. A denial is a normal result.
struct RateLimitResult
{
    bool allowed;
    int64_t limit;
    int64_t remaining;
    int64_t resetInMs;
    bool degraded;     // Decided by the per-process fallback.
    std::string tier;  // The tier that produced this result, if any.

    // Seconds a denied client should wait, rounded up; zero when allowed.
    int64_t RetryAfterSeconds() const noexcept;
};

struct RateLimitTier
{
    std::string name;
    int64_t limit;
    std::chrono::milliseconds window;
};

enum class Plan
{
    Free,
    Pro,
    Enterprise
};

// Daily quota of a plan: 100, 10000, or 100000 requests.
RateLimitTier
PlanTier(Plan plan);

// Short-term burst limit applied on top of every plan: 60 per minute.
RateLimitTier
BurstTier();

// Parses "free", "pro" or "enterprise", case-insensitively.
bool
ParsePlan(const std::string &name, Plan &plan);

/**
 * Sliding-window admission control on top of a RemoteStore.
 *
 * Each identifier owns a sorted set of attempt timestamps in the shared store.
 * A check prunes timestamps that left the window, counts the rest, and records
 * the current attempt whether it is admitted or not, so a denied client that
 * retries immediately gains nothing. The whole sequence goes out as one
 * pipelined batch; it is not atomic, so concurrent bursts from one identifier
 * may briefly overshoot the limit.
 *
 * When the store is unavailable, a per-process fixed-window counter takes
 * over. It is coarser, but keeps basic abuse protection.
 */
class RateLimiter
{
    using LockGuard = std::lock_guard<std::mutex>;

    // Above this many local windows, expired ones are pruned inline.
    static constexpr std::size_t kMaxLocalWindows = 10000;

    struct LocalWindow
    {
        int64_t count;
        TimePoint resetAt;
    };

    struct Window
    {
        std::string key;
        int64_t limit;
        std::chrono::milliseconds window;
        std::string tier;
    };

    RemoteStore &store;
    const Clock &clock;

    mutable std::mutex mtx;  // Protects localWindows and rng.
    std::unordered_map<std::string, LocalWindow> localWindows;
    std::mt19937_64 rng;

    std::vector<RateLimitResult> Check(const std::vector<Window> &windows);
    RateLimitResult CheckLocal(const Window &window, TimePoint now);
    std::string Member(int64_t nowMs);

public:
    RateLimiter(RemoteStore &store, const Clock &clock);
    RateLimiter(const RateLimiter &limiter) = delete;
    RateLimiter& operator=(const RateLimiter &limiter) = delete;

    RateLimitResult CheckLimit(
        const std::string &identifier,
        int64_t limit,
        std::chrono::milliseconds window);
    RateLimitResult CheckTiers(
        const std::string &identifier,
        const std::vector<RateLimitTier> &tiers);
    RateLimitResult CheckPlan(const std::string &identifier, Plan plan);

    std::size_t PruneLocal();
    std::size_t LocalWindowCount() const;
};

/**
 * Standard throttling response headers for a result: X-RateLimit-Limit,
 * X-RateLimit-Remaining, X-RateLimit-Reset (epoch seconds), and Retry-After
 * when the request was denied.
 */
std::map<std::string, std::string>
ThrottleHeaders(const RateLimitResult &result, TimePoint now);
