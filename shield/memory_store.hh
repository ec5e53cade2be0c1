#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

#include "clock.hh"
#include "hyperloglog.hh"
#include "remote_store.hh"

/**
 * Shared-store backend living inside the process.
 *
 * Implements the command subset used by shield (strings, counters, TTLs,
 * sorted sets and HyperLogLog) with the same reply shapes as Redis, so it can
 * stand in for a shared store in single-process deployments and in tests.
 * SetOnline(false) simulates an outage: every batch then fails.
 */
class MemoryStore : public RemoteStore
{
    using LockGuard = std::lock_guard<std::mutex>;

    struct SortedSet
    {
        std::unordered_map<std::string, double> scores;
        std::set<std::pair<double, std::string>> ordered;

        bool Add(const std::string &member, double score);
        int64_t RemoveRangeByScore(
            double min, bool minOpen, double max, bool maxOpen);
    };

    enum class Kind { String, ZSet, Hll };

    struct Item
    {
        Kind kind;
        std::string str;
        std::shared_ptr<SortedSet> zset;
        std::shared_ptr<HyperLogLog> hll;
        boost::optional<TimePoint> expireAt;
    };

    mutable std::mutex mtx;
    std::unordered_map<std::string, Item> items;
    std::atomic_bool online;
    std::atomic<uint64_t> batches;
    const Clock &clock;

    Item* Find(const std::string &key, TimePoint now);
    Item& FindOrCreate(const std::string &key, Kind kind, TimePoint now);
    StoreReply Apply(const StoreCommand &command, TimePoint now);
    StoreReply Range(const StoreCommand &command, TimePoint now, bool reverse);

protected:
    std::vector<StoreReply> Execute(
        const std::vector<StoreCommand> &commands) override;

public:
    explicit MemoryStore(const Clock &clock);

    bool Available() const override { return online; }
    std::string Name() const override { return "Memory"; }

    void SetOnline(bool isOnline) noexcept { online = isOnline; }

    // Number of batches executed, i.e., round trips a networked backend
    // would have made.
    uint64_t RoundTrips() const noexcept { return batches; }
};
