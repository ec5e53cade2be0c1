#include <algorithm>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <utility>

#include <fnmatch.h>

#include "local_cache.hh"

// Define here to avoid link errors
constexpr double LocalCache::kStaleFraction;

namespace {

std::chrono::milliseconds
Scale(std::chrono::seconds ttl, double factor)
{
    return std::chrono::milliseconds(
        static_cast<int64_t>(ttl.count() * 1000 * factor));
}

} // namespace

/**
 * Initializes an empty cache.
 *
 * @param capacity The maximum number of entries held at once. A capacity of
 *  zero is bumped to one.
 * @param graceFactor Multiple of an entry's TTL during which a hard-expired
 *  entry is still kept as a last-resort value. Values below one are treated
 *  as one, i.e., no grace period.
 * @param clock The clock used to measure ages.
 */
LocalCache::LocalCache(
    std::size_t capacity, double graceFactor, const Clock &clock)
    : mtx(),
      entries(),
      capacity(std::max<std::size_t>(capacity, 1)),
      graceFactor(std::max(graceFactor, 1.0)),
      clock(clock)
{}

/**
 * Looks up a key.
 *
 * @param key The key to look up.
 * @return The value and its staleness if the entry exists and its age is below
 *  its TTL, none otherwise. An entry past its retention window is purged.
 */
boost::optional<CacheHit>
LocalCache::Get(const std::string &key)
{
    LockGuard lck(mtx);
    auto item = entries.find(key);
    if (item == entries.end()) {
        ++misses;
        return boost::none;
    }

    auto now = clock.Now();
    const auto &entry = item->second;
    auto age = now - entry.storedAt;
    if (age >= entry.ttl) {
        if (not IsRetained(entry, now)) {
            entries.erase(item);
            ++expirations;
        }
        ++misses;
        return boost::none;
    }

    bool isStale = age >= entry.staleAfter;
    if (isStale)
        ++staleHits;
    else
        ++hits;
    return CacheHit{entry.value, isStale, entry.storedAt, entry.ttl};
}

/**
 * Looks up a key, accepting values past their TTL as long as they are within
 * the grace window.
 *
 * @param key The key to look up.
 * @return The value if the entry is younger than graceFactor x ttl.
 */
boost::optional<std::string>
LocalCache::GetLastResort(const std::string &key)
{
    LockGuard lck(mtx);
    auto item = entries.find(key);
    if (item == entries.end())
        return boost::none;
    if (not IsRetained(item->second, clock.Now())) {
        entries.erase(item);
        ++expirations;
        return boost::none;
    }
    return item->second.value;
}

/**
 * Stores a value that was produced now.
 */
void
LocalCache::Set(
    const std::string &key,
    const std::string &value,
    std::chrono::seconds ttl)
{
    Set(key, value, ttl, clock.Now());
}

/**
 * Stores a value, replacing any previous entry for the key.
 *
 * @param key The key.
 * @param value The serialized value.
 * @param ttl The time to live of the value.
 * @param storedAt When the value was produced. Values read back from the
 *  remote store keep their original production time, so their age is not
 *  reset by being copied into this cache.
 * @details If the key is new and the cache is full, the entry with the oldest
 *  storedAt is evicted first.
 */
void
LocalCache::Set(
    const std::string &key,
    const std::string &value,
    std::chrono::seconds ttl,
    TimePoint storedAt)
{
    if (ttl.count() <= 0)
        return;

    Entry entry{value, storedAt, ttl, Scale(ttl, kStaleFraction)};

    LockGuard lck(mtx);
    auto item = entries.find(key);
    if (item != entries.end()) {
        item->second = std::move(entry);
        return;
    }
    if (entries.size() >= capacity)
        EvictOldest();
    entries.emplace(key, std::move(entry));
}

/**
 * Deletes a key.
 *
 * @return True if the key was present.
 */
bool
LocalCache::Remove(const std::string &key)
{
    LockGuard lck(mtx);
    return entries.erase(key) > 0;
}

/**
 * Deletes every key matching a glob pattern, as understood by fnmatch(3).
 *
 * @return The number of entries deleted.
 */
std::size_t
LocalCache::RemoveMatching(const std::string &pattern)
{
    LockGuard lck(mtx);
    std::size_t removed = 0;
    for (auto item = entries.begin(); item != entries.end();) {
        if (fnmatch(pattern.c_str(), item->first.c_str(), 0) == 0) {
            item = entries.erase(item);
            ++removed;
        }
        else
            ++item;
    }
    return removed;
}

/**
 * Checks whether a key would be served by Get, without counting a hit or a
 * miss.
 */
bool
LocalCache::Has(const std::string &key) const
{
    LockGuard lck(mtx);
    auto item = entries.find(key);
    if (item == entries.end())
        return false;
    return clock.Now() - item->second.storedAt < item->second.ttl;
}

void
LocalCache::Clear()
{
    LockGuard lck(mtx);
    entries.clear();
}

/**
 * Purges every entry past its retention window.
 *
 * @return The number of entries purged.
 * @details Get checks expiry inline, so the sweep only bounds memory and
 *  correctness does not depend on it running.
 */
std::size_t
LocalCache::Sweep()
{
    LockGuard lck(mtx);
    auto now = clock.Now();
    std::size_t purged = 0;
    for (auto item = entries.begin(); item != entries.end();) {
        if (IsRetained(item->second, now)) {
            ++item;
            continue;
        }
        item = entries.erase(item);
        ++purged;
    }
    expirations += purged;
    return purged;
}

LocalCacheStats
LocalCache::Stats() const
{
    LockGuard lck(mtx);
    LocalCacheStats stats{entries.size(), capacity, hits, misses, staleHits,
        evictions, expirations, {}};
    stats.keys.reserve(entries.size());
    for (const auto &item : entries)
        stats.keys.push_back(item.first);
    std::sort(stats.keys.begin(), stats.keys.end());
    return stats;
}

std::size_t
LocalCache::Size() const
{
    LockGuard lck(mtx);
    return entries.size();
}

bool
LocalCache::IsRetained(const Entry &entry, TimePoint now) const noexcept
{
    return now - entry.storedAt < Scale(entry.ttl, graceFactor);
}

// Must be called with the lock held.
void
LocalCache::EvictOldest()
{
    auto oldest = entries.end();
    for (auto item = entries.begin(); item != entries.end(); ++item) {
        if (oldest == entries.end()
            or item->second.storedAt < oldest->second.storedAt)
            oldest = item;
    }
    if (oldest == entries.end())
        return;
    entries.erase(oldest);
    ++evictions;
}
