#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

#include <boost/asio/thread_pool.hpp>
#include <boost/optional.hpp>

#include "clock.hh"
#include "local_cache.hh"
#include "remote_store.hh"

struct OrchestratorConfig
{
    // Upper bound on how long a caller waits for an upstream fetch.
    std::chrono::milliseconds fetchTimeout{10000};
    // Multiple of the TTL during which an expired value may be served when
    // the upstream is failing.
    double graceFactor = 2.0;
    // Threads running fetches and background refreshes.
    unsigned workers = 4;
};

struct OrchestratorStats
{
    LocalCacheStats local;
    std::string remoteName;
    bool remoteHealthy;
    boost::optional<int64_t> remoteKeys;
    uint64_t fetches;
    uint64_t refreshes;
    uint64_t lastResortServed;
};

// Keys removed by a pattern invalidation. remote is none if the remote store
// could not complete the sweep.
struct InvalidateCount
{
    std::size_t local;
    boost::optional<int64_t> remote;
};

// A remote value wrapped with the time it was produced and its TTL.
struct CacheEnvelope
{
    TimePoint storedAt;
    std::chrono::seconds ttl;
    std::string payload;
};

std::string
EncodeEnvelope(const CacheEnvelope &envelope);

// Returns false if the text was not written by EncodeEnvelope.
bool
DecodeEnvelope(const std::string &text, CacheEnvelope &envelope);

/**
 * Read-through, stale-while-revalidate cache over a LocalCache and a
 * RemoteStore.
 *
 * Lookups go to the local cache, then the remote store, then the caller's
 * fetch function, whose result is written through to both layers. A stale
 * local hit is served immediately while a background task refreshes it.
 * Within the process, concurrent misses on the same key share one upstream
 * fetch. The orchestrator is agnostic of TTL classes; callers choose the TTL.
 *
 * Fetch functions run on the orchestrator's own thread pool and may outlive
 * the call that started them, so they must not capture references to the
 * caller's stack. Destruction waits for every outstanding fetch.
 */
class CacheOrchestrator
{
public:
    // Returns the serialized value, or throws to signal an upstream failure.
    using FetchFn = std::function<std::string()>;

private:
    using LockGuard = std::lock_guard<std::mutex>;

    LocalCache &local;
    RemoteStore &remote;
    const Clock &clock;
    OrchestratorConfig config;

    std::mutex mtx;  // Protects inFlight.
    std::unordered_map<std::string, std::shared_future<std::string>> inFlight;

    std::atomic<uint64_t> fetches;
    std::atomic<uint64_t> refreshes;
    std::atomic<uint64_t> lastResortServed;

    boost::asio::thread_pool pool;

    std::shared_future<std::string> StartFetch(
        const std::string &key,
        std::chrono::seconds ttl,
        const FetchFn &fetchFn,
        bool reuseFresh);
    void Refresh(
        const std::string &key,
        std::chrono::seconds ttl,
        const FetchFn &fetchFn);
    void WriteThrough(
        const std::string &key,
        const std::string &value,
        std::chrono::seconds ttl);

public:
    CacheOrchestrator(
        LocalCache &local,
        RemoteStore &remote,
        const Clock &clock,
        const OrchestratorConfig &config = OrchestratorConfig());
    CacheOrchestrator(const CacheOrchestrator &orchestrator) = delete;
    CacheOrchestrator& operator=(const CacheOrchestrator &orchestrator) = delete;
    ~CacheOrchestrator();

    std::string WithCache(
        const std::string &key,
        std::chrono::seconds ttl,
        FetchFn fetchFn);
    void Invalidate(const std::string &key);
    InvalidateCount InvalidatePattern(const std::string &pattern);
    OrchestratorStats Stats();
};
