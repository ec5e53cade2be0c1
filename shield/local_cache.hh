#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/optional.hpp>

#include "clock.hh"

// A value found in the local cache.
struct CacheHit
{
    std::string value;
    bool isStale;  // Age is in [0.8 x ttl, ttl), a refresh is due.
    TimePoint storedAt;
    std::chrono::seconds ttl;
};

struct LocalCacheStats
{
    std::size_t size;
    std::size_t capacity;
    uint64_t hits;
    uint64_t misses;
    uint64_t staleHits;
    uint64_t evictions;
    uint64_t expirations;
    std::vector<std::string> keys;
};

/**
 * Bounded, TTL-aware, in-process key/value store.
 *
 * An entry is fresh while its age is below 80% of its TTL, stale until the TTL
 * is reached, and hard-expired afterwards. Hard-expired entries are never
 * served by Get, but they are retained until their age reaches graceFactor
 * times the TTL so that GetLastResort can still find them when the upstream
 * is failing. When the cache is full, inserting a new key evicts exactly one
 * entry, the one with the oldest storedAt.
 *
 * The cache is per process and never authoritative across processes.
 */
class LocalCache
{
    using LockGuard = std::lock_guard<std::mutex>;

    struct Entry
    {
        std::string value;
        TimePoint storedAt;
        std::chrono::seconds ttl;
        std::chrono::milliseconds staleAfter;
    };

    mutable std::mutex mtx;
    std::unordered_map<std::string, Entry> entries;
    std::size_t capacity;
    double graceFactor;
    const Clock &clock;

    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t staleHits = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;

    bool IsRetained(const Entry &entry, TimePoint now) const noexcept;
    void EvictOldest();

public:
    // Fraction of the TTL after which an entry is reported stale.
    static constexpr double kStaleFraction = 0.8;

    LocalCache(std::size_t capacity, double graceFactor, const Clock &clock);
    LocalCache(const LocalCache &cache) = delete;
    LocalCache& operator=(const LocalCache &cache) = delete;

    boost::optional<CacheHit> Get(const std::string &key);
    boost::optional<std::string> GetLastResort(const std::string &key);
    void Set(const std::string &key,
             const std::string &value,
             std::chrono::seconds ttl);
    void Set(const std::string &key,
             const std::string &value,
             std::chrono::seconds ttl,
             TimePoint storedAt);
    bool Remove(const std::string &key);
    std::size_t RemoveMatching(const std::string &pattern);
    bool Has(const std::string &key) const;
    void Clear();
    std::size_t Sweep();

    LocalCacheStats Stats() const;
    std::size_t Size() const;
    std::size_t Capacity() const noexcept { return capacity; }
};
