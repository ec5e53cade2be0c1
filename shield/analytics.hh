#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/thread_pool.hpp>
#include <boost/optional.hpp>

#include "clock.hh"
#include "remote_store.hh"

// One completed client request.
struct RequestEvent
{
    std::string endpoint;
    std::string method = "GET";
    int statusCode = 200;
    double latencyMs = 0;
    std::string apiKey;  // Empty when anonymous.
    std::string ip;      // Empty when unknown.
    boost::optional<TimePoint> timestamp;  // Defaults to the tracking time.
};

struct AnalyticsSummary
{
    std::string dateKey;
    int64_t totalRequests = 0;
    int64_t dailyRequests = 0;
    int64_t uniqueApiKeys = 0;  // Approximate.
    int64_t uniqueIps = 0;      // Approximate.
    int64_t avgLatencyMs = 0;
    std::map<int, int64_t> statusBreakdown;
    std::vector<std::pair<std::string, int64_t>> topEndpoints;
    bool available = false;  // False when the store could not be read.
};

/**
 * Best-effort usage counters kept in the shared store.
 *
 * Every event bumps a set of global, daily, hourly, per-endpoint and
 * per-status counters, latency sums, and approximate unique-client sets
 * (HyperLogLog), all in a single pipelined round trip. Per-day keys expire 30
 * days after their day ends; the expiry is an absolute time derived from the
 * day, so re-sending it on every event does not extend it.
 *
 * Tracking must never affect the request path: Track hands the event to a
 * background thread and returns, and failures are only logged. Events are
 * dropped, not queued, while the store is unavailable, and Track drops new
 * events while maxPending of them are still waiting to be recorded.
 */
class UsageAnalytics
{
    static constexpr int64_t kRetentionDays = 30;
    static constexpr int64_t kTopEndpoints = 10;

    RemoteStore &store;
    const Clock &clock;
    std::size_t maxPending;
    std::atomic<uint64_t> dropped;
    std::atomic<uint64_t> pending;
    boost::asio::thread_pool pool;

public:
    UsageAnalytics(
        RemoteStore &store,
        const Clock &clock,
        unsigned workers = 1,
        std::size_t maxPending = 10000);
    UsageAnalytics(const UsageAnalytics &analytics) = delete;
    UsageAnalytics& operator=(const UsageAnalytics &analytics) = delete;
    ~UsageAnalytics();

    void Track(const RequestEvent &event);
    bool Record(const RequestEvent &event);
    AnalyticsSummary Summarize(const std::string &dateKey);
    AnalyticsSummary SummarizeToday();

    // Events that could not be recorded.
    uint64_t Dropped() const noexcept { return dropped; }
    // Events tracked but not recorded yet.
    uint64_t Pending() const noexcept { return pending; }
};
