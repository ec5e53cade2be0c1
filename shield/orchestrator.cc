#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "orchestrator.hh"
#include "shield_error.hh"

namespace {

constexpr char kEnvelopeTag[] = "shield1";

std::chrono::seconds
GraceTtl(std::chrono::seconds ttl, double graceFactor)
{
    return std::chrono::seconds(
        static_cast<int64_t>(std::ceil(ttl.count() * graceFactor)));
}

} // namespace

std::string
EncodeEnvelope(const CacheEnvelope &envelope)
{
    std::ostringstream oss;
    oss << kEnvelopeTag << ' ' << ToEpochMs(envelope.storedAt) << ' '
        << envelope.ttl.count() << '\n' << envelope.payload;
    return oss.str();
}

bool
DecodeEnvelope(const std::string &text, CacheEnvelope &envelope)
{
    auto newline = text.find('\n');
    if (newline == std::string::npos)
        return false;
    std::istringstream header(text.substr(0, newline));
    std::string tag;
    int64_t storedAtMs = 0, ttl = 0;
    if (not (header >> tag >> storedAtMs >> ttl) or tag != kEnvelopeTag
        or ttl <= 0)
        return false;
    envelope.storedAt = FromEpochMs(storedAtMs);
    envelope.ttl = std::chrono::seconds(ttl);
    envelope.payload = text.substr(newline + 1);
    return true;
}

/**
 * Initializes an orchestrator.
 *
 * @param local The process-local cache.
 * @param remote The shared store; it may be unavailable at any time.
 * @param clock The clock used to age remote values.
 * @param config Timeouts, grace factor, and the size of the worker pool.
 */
CacheOrchestrator::CacheOrchestrator(
    LocalCache &local,
    RemoteStore &remote,
    const Clock &clock,
    const OrchestratorConfig &config)
    : local(local),
      remote(remote),
      clock(clock),
      config(config),
      mtx(),
      inFlight(),
      fetches(0),
      refreshes(0),
      lastResortServed(0),
      pool(config.workers > 0 ? config.workers : 1)
{}

/**
 * Dtor. Waits for outstanding fetches and refreshes.
 */
CacheOrchestrator::~CacheOrchestrator()
{
    pool.join();
}

/**
 * Returns the value cached under a key, fetching it on a miss.
 *
 * @param key The cache key.
 * @param ttl How long a value stays servable; it is stale after 80% of it.
 * @param fetchFn Produces the value from the upstream.
 * @return The value, possibly stale, or as a last resort expired by less
 *  than graceFactor x ttl if the upstream fetch failed.
 * @throw ShieldError(UpstreamFetchFailed) if the fetch failed or timed out
 *  and no usable value exists.
 */
std::string
CacheOrchestrator::WithCache(
    const std::string &key,
    std::chrono::seconds ttl,
    FetchFn fetchFn)
{
    auto hit = local.Get(key);
    if (hit) {
        if (hit->isStale)
            Refresh(key, ttl, fetchFn);
        return hit->value;
    }

    boost::optional<std::string> remoteLastResort;
    auto stored = remote.Get(key);
    if (stored and *stored) {
        CacheEnvelope envelope;
        if (not DecodeEnvelope(**stored, envelope))
            envelope = CacheEnvelope{clock.Now(), ttl, **stored};
        auto age = clock.Now() - envelope.storedAt;
        if (age < ttl) {
            local.Set(key, envelope.payload, ttl, envelope.storedAt);
            if (age >= ttl * LocalCache::kStaleFraction)
                Refresh(key, ttl, fetchFn);
            return envelope.payload;
        }
        if (age < GraceTtl(ttl, config.graceFactor))
            remoteLastResort = envelope.payload;
    }

    std::string failure;
    auto future = StartFetch(key, ttl, fetchFn, true);
    if (future.wait_for(config.fetchTimeout) != std::future_status::ready) {
        failure = "timed out after "
            + std::to_string(config.fetchTimeout.count()) + " ms";
    }
    else {
        try {
            return future.get();
        }
        catch (std::exception &err) {
            failure = err.what();
        }
        catch (...) {
            failure = "unknown error";
        }
    }

    auto lastResort = local.GetLastResort(key);
    if (not lastResort)
        lastResort = remoteLastResort;
    if (lastResort) {
        ++lastResortServed;
        std::cerr << "[Cache] ERROR: fetch " << key << " failed (" << failure
                  << "), serving expired value" << std::endl;
        return *lastResort;
    }
    throw ShieldError(ShieldErr::UpstreamFetchFailed,
                      key + ": " + failure + "; data temporarily unavailable");
}

/**
 * Removes a key from both layers.
 */
void
CacheOrchestrator::Invalidate(const std::string &key)
{
    local.Remove(key);
    remote.Del(key);
}

/**
 * Deletes every key matching a glob pattern from both layers.
 *
 * @details Fetches already in flight for matching keys are not cancelled, so
 *  their results may land after the sweep.
 */
InvalidateCount
CacheOrchestrator::InvalidatePattern(const std::string &pattern)
{
    InvalidateCount count{local.RemoveMatching(pattern), boost::none};
    count.remote = remote.DelPattern(pattern);
    return count;
}

OrchestratorStats
CacheOrchestrator::Stats()
{
    OrchestratorStats stats{local.Stats(), remote.Name(), false, boost::none,
        fetches, refreshes, lastResortServed};
    if (remote.Available())
        stats.remoteKeys = remote.DbSize();
    stats.remoteHealthy = remote.Healthy();
    return stats;
}

/**
 * Returns the outstanding fetch for a key, or starts one on the pool.
 *
 * @param reuseFresh If set, and the key became fresh in the local cache
 *  since the caller missed, that value is returned instead of fetching. This
 *  closes the window between a caller's miss and a concurrent fetch landing.
 * @details The fetch task writes through before its future becomes ready, and
 *  leaves the in-flight map afterwards, so a caller never misses both.
 */
std::shared_future<std::string>
CacheOrchestrator::StartFetch(
    const std::string &key,
    std::chrono::seconds ttl,
    const FetchFn &fetchFn,
    bool reuseFresh)
{
    LockGuard lck(mtx);
    auto item = inFlight.find(key);
    if (item != inFlight.end())
        return item->second;

    if (reuseFresh) {
        auto hit = local.Get(key);
        if (hit and not hit->isStale) {
            std::promise<std::string> ready;
            ready.set_value(hit->value);
            return ready.get_future().share();
        }
    }

    ++fetches;
    auto task = std::make_shared<std::packaged_task<std::string()>>(
        [this, key, ttl, fetchFn] {
            std::string value;
            try {
                value = fetchFn();
            }
            catch (std::exception &err) {
                std::cerr << "[Cache] ERROR: fetch " << key << ": "
                          << err.what() << std::endl;
                throw;
            }
            catch (...) {
                std::cerr << "[Cache] ERROR: fetch " << key
                          << ": unknown error" << std::endl;
                throw;
            }
            WriteThrough(key, value, ttl);
            return value;
        });
    auto future = task->get_future().share();
    inFlight.emplace(key, future);

    boost::asio::post(pool, [this, task, key] {
        (*task)();
        LockGuard lck(mtx);
        inFlight.erase(key);
    });
    return future;
}

/**
 * Refreshes a stale key in the background. Fire and forget: the caller is
 * never delayed, and failures are logged by the fetch task.
 */
void
CacheOrchestrator::Refresh(
    const std::string &key,
    std::chrono::seconds ttl,
    const FetchFn &fetchFn)
{
    ++refreshes;
    StartFetch(key, ttl, fetchFn, false);
}

void
CacheOrchestrator::WriteThrough(
    const std::string &key,
    const std::string &value,
    std::chrono::seconds ttl)
{
    auto now = clock.Now();
    local.Set(key, value, ttl, now);
    remote.SetWithTtl(key, EncodeEnvelope(CacheEnvelope{now, ttl, value}),
                      GraceTtl(ttl, config.graceFactor));
}
