#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include <boost/algorithm/string/case_conv.hpp>

#include "rate_limiter.hh"

// Define here to avoid link errors
constexpr std::size_t RateLimiter::kMaxLocalWindows;

namespace {

constexpr int64_t kDayMs = 24 * 60 * 60 * 1000;
constexpr int64_t kMinuteMs = 60 * 1000;
constexpr size_t kCommandsPerWindow = 5;

int64_t
CeilDiv(int64_t num, int64_t den) noexcept
{
    return num <= 0 ? 0 : (num + den - 1) / den;
}

} // namespace

int64_t
RateLimitResult::RetryAfterSeconds() const noexcept
{
    return allowed ? 0 : CeilDiv(resetInMs, 1000);
}

RateLimitTier
PlanTier(Plan plan)
{
    switch (plan) {
    case Plan::Pro:
        return RateLimitTier{"pro", 10000, std::chrono::milliseconds(kDayMs)};
    case Plan::Enterprise:
        return RateLimitTier{"enterprise", 100000,
                             std::chrono::milliseconds(kDayMs)};
    case Plan::Free:
    default:
        return RateLimitTier{"free", 100, std::chrono::milliseconds(kDayMs)};
    }
}

RateLimitTier
BurstTier()
{
    return RateLimitTier{"burst", 60, std::chrono::milliseconds(kMinuteMs)};
}

bool
ParsePlan(const std::string &name, Plan &plan)
{
    auto lower = boost::algorithm::to_lower_copy(name);
    if (lower == "free")
        plan = Plan::Free;
    else if (lower == "pro")
        plan = Plan::Pro;
    else if (lower == "enterprise")
        plan = Plan::Enterprise;
    else
        return false;
    return true;
}

/**
 * Initializes a limiter.
 *
 * @param store The shared store holding the sliding windows.
 * @param clock The clock used for timestamps; it should agree across
 *  processes sharing the store.
 */
RateLimiter::RateLimiter(RemoteStore &store, const Clock &clock)
    : store(store),
      clock(clock),
      mtx(),
      localWindows(),
      rng(std::random_device()())
{}

/**
 * Checks and records one attempt against a single sliding window.
 *
 * @param identifier Who is making the request, e.g. an API key or an IP.
 * @param limit The number of attempts admitted per window.
 * @param window The length of the window.
 * @return The decision, the attempts left, and the time until the oldest
 *  attempt in the window expires.
 */
RateLimitResult
RateLimiter::CheckLimit(
    const std::string &identifier,
    int64_t limit,
    std::chrono::milliseconds window)
{
    return Check({Window{"ratelimit:" + identifier, limit, window, ""}}).front();
}

/**
 * Checks one attempt against several tiers at once, e.g. a daily quota and a
 * burst limit. Every tier records the attempt.
 *
 * @return The logical AND of all tiers. When denied, the result of the
 *  denying tier with the longest reset; when admitted, the result of the tier
 *  with the fewest attempts left.
 */
RateLimitResult
RateLimiter::CheckTiers(
    const std::string &identifier,
    const std::vector<RateLimitTier> &tiers)
{
    std::vector<Window> windows;
    for (const auto &tier : tiers) {
        windows.push_back(Window{"ratelimit:" + tier.name + ':' + identifier,
                                 tier.limit, tier.window, tier.name});
    }
    auto results = Check(windows);
    if (results.empty())
        return RateLimitResult{true, 0, 0, 0, false, ""};

    const RateLimitResult *denied = nullptr;
    const RateLimitResult *tightest = &results.front();
    bool degraded = false;
    for (const auto &result : results) {
        degraded = degraded or result.degraded;
        if (not result.allowed) {
            if (not denied or result.resetInMs > denied->resetInMs)
                denied = &result;
        }
        else if (result.remaining < tightest->remaining)
            tightest = &result;
    }
    auto decision = denied ? *denied : *tightest;
    decision.degraded = degraded;
    return decision;
}

/**
 * Checks one attempt against a plan's daily quota and the burst limit.
 */
RateLimitResult
RateLimiter::CheckPlan(const std::string &identifier, Plan plan)
{
    return CheckTiers(identifier, {PlanTier(plan), BurstTier()});
}

/**
 * Drops local fallback windows whose period is over.
 *
 * @return The number of windows dropped.
 */
std::size_t
RateLimiter::PruneLocal()
{
    LockGuard lck(mtx);
    auto now = clock.Now();
    std::size_t pruned = 0;
    for (auto item = localWindows.begin(); item != localWindows.end();) {
        if (item->second.resetAt <= now) {
            item = localWindows.erase(item);
            ++pruned;
        }
        else
            ++item;
    }
    return pruned;
}

std::size_t
RateLimiter::LocalWindowCount() const
{
    LockGuard lck(mtx);
    return localWindows.size();
}

/**
 * Evaluates the windows in one pipelined batch, or locally if the store is
 * unavailable.
 */
std::vector<RateLimitResult>
RateLimiter::Check(const std::vector<Window> &windows)
{
    auto now = clock.Now();
    auto nowMs = ToEpochMs(now);

    std::vector<StoreCommand> commands;
    commands.reserve(windows.size() * kCommandsPerWindow);
    for (const auto &w : windows) {
        auto windowStart = nowMs - w.window.count();
        commands.push_back({"ZREMRANGEBYSCORE", w.key, "0",
                            std::to_string(windowStart)});
        commands.push_back({"ZCARD", w.key});
        commands.push_back({"ZRANGE", w.key, "0", "0", "WITHSCORES"});
        commands.push_back({"ZADD", w.key, std::to_string(nowMs),
                            Member(nowMs)});
        commands.push_back({"PEXPIRE", w.key,
                            std::to_string(w.window.count())});
    }

    std::vector<RateLimitResult> results;
    auto replies = store.Pipeline(commands);
    if (not replies) {
        for (const auto &w : windows)
            results.push_back(CheckLocal(w, now));
        return results;
    }

    for (size_t i = 0; i < windows.size(); ++i) {
        const auto &w = windows[i];
        const auto *reply = &(*replies)[i * kCommandsPerWindow];
        auto count = reply[1].AsInteger();
        auto oldest = ParseScoredMembers(reply[2]);
        int64_t oldestMs = oldest.empty()
            ? nowMs : static_cast<int64_t>(oldest.front().second);

        bool allowed = count < w.limit;
        auto remaining = std::max<int64_t>(
            0, w.limit - count - (allowed ? 1 : 0));
        auto resetInMs = std::max<int64_t>(
            0, oldestMs + w.window.count() - nowMs);
        results.push_back(RateLimitResult{allowed, w.limit, remaining,
                                          resetInMs, false, w.tier});
    }
    return results;
}

/**
 * Fixed-window fallback, local to this process.
 */
RateLimitResult
RateLimiter::CheckLocal(const Window &w, TimePoint now)
{
    LockGuard lck(mtx);
    if (localWindows.size() > kMaxLocalWindows) {
        for (auto item = localWindows.begin(); item != localWindows.end();) {
            if (item->second.resetAt <= now)
                item = localWindows.erase(item);
            else
                ++item;
        }
    }

    auto item = localWindows.find(w.key);
    if (item == localWindows.end() or now >= item->second.resetAt) {
        localWindows[w.key] = LocalWindow{1, now + w.window};
        return RateLimitResult{w.limit >= 1, w.limit,
                               std::max<int64_t>(0, w.limit - 1),
                               w.window.count(), true, w.tier};
    }

    auto &entry = item->second;
    ++entry.count;
    bool allowed = entry.count <= w.limit;
    auto resetInMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.resetAt - now).count();
    return RateLimitResult{allowed, w.limit,
                           std::max<int64_t>(0, w.limit - entry.count),
                           resetInMs, true, w.tier};
}

// A unique sorted-set member for an attempt made at nowMs.
std::string
RateLimiter::Member(int64_t nowMs)
{
    static const char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    uint64_t bits;
    {
        LockGuard lck(mtx);
        bits = rng();
    }
    std::string suffix;
    for (int i = 0; i < 10; ++i) {
        suffix += kDigits[bits % 36];
        bits /= 36;
    }
    return std::to_string(nowMs) + '-' + suffix;
}

std::map<std::string, std::string>
ThrottleHeaders(const RateLimitResult &result, TimePoint now)
{
    std::map<std::string, std::string> headers;
    headers["X-RateLimit-Limit"] = std::to_string(result.limit);
    headers["X-RateLimit-Remaining"] = std::to_string(result.remaining);
    headers["X-RateLimit-Reset"] = std::to_string(
        CeilDiv(ToEpochMs(now) + result.resetInMs, 1000));
    if (not result.allowed)
        headers["Retry-After"] = std::to_string(result.RetryAfterSeconds());
    return headers;
}
