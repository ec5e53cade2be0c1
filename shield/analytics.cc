#include <algorithm>
#include <cmath>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include <boost/asio/post.hpp>

#include "analytics.hh"

// Define here to avoid link errors
constexpr int64_t UsageAnalytics::kRetentionDays;
constexpr int64_t UsageAnalytics::kTopEndpoints;

namespace {

constexpr int64_t kDaySeconds = 24 * 60 * 60;

// Status codes reported in a summary's breakdown.
constexpr int kStatusCodes[] = {
    200, 201, 204, 301, 302, 304, 400, 401, 402, 403, 404, 429,
    500, 502, 503, 504
};

const std::string kTotalKey = "analytics:requests:total";

std::string
DailyKey(const std::string &date)
{
    return "analytics:requests:daily:" + date;
}

std::string
LatencySumKey(const std::string &date)
{
    return "analytics:latency:sum:" + date;
}

std::string
LatencyCountKey(const std::string &date)
{
    return "analytics:latency:count:" + date;
}

std::string
EndpointRankKey(const std::string &date)
{
    return "analytics:endpoints:" + date;
}

std::string
StatusKey(int status, const std::string &date)
{
    return "analytics:status:" + std::to_string(status) + ':' + date;
}

std::string
UniqueApiKeysKey(const std::string &date)
{
    return "analytics:unique:apikeys:" + date;
}

std::string
UniqueIpsKey(const std::string &date)
{
    return "analytics:unique:ips:" + date;
}

} // namespace

/**
 * Initializes the counters.
 *
 * @param store The shared store.
 * @param clock The clock that stamps events without a timestamp.
 * @param workers Threads recording tracked events.
 * @param maxPending Bound on the events waiting to be recorded. A bound of
 *  zero is bumped to one.
 */
UsageAnalytics::UsageAnalytics(
    RemoteStore &store,
    const Clock &clock,
    unsigned workers,
    std::size_t maxPending)
    : store(store),
      clock(clock),
      maxPending(maxPending > 0 ? maxPending : 1),
      dropped(0),
      pending(0),
      pool(workers > 0 ? workers : 1)
{}

/**
 * Dtor. Records the events still pending.
 */
UsageAnalytics::~UsageAnalytics()
{
    pool.join();
}

/**
 * Records an event in the background. Never blocks on the store and never
 * throws; call it once the request it describes has completed.
 *
 * @details The event is dropped if maxPending events are already waiting,
 *  which bounds the backlog a slow store can build up.
 */
void
UsageAnalytics::Track(const RequestEvent &event)
{
    if (++pending > maxPending) {
        --pending;
        ++dropped;
        std::cerr << "[Analytics] ERROR: event for " << event.endpoint
                  << " dropped, " << maxPending << " events pending"
                  << std::endl;
        return;
    }
    try {
        auto stamped = event;
        if (not stamped.timestamp)
            stamped.timestamp = clock.Now();
        boost::asio::post(pool, [this, stamped] {
            Record(stamped);
            --pending;
        });
    }
    catch (std::exception &err) {
        --pending;
        ++dropped;
        std::cerr << "[Analytics] ERROR: cannot queue event: " << err.what()
                  << std::endl;
    }
}

/**
 * Records an event synchronously, in one round trip.
 *
 * @return True if the store accepted the batch.
 */
bool
UsageAnalytics::Record(const RequestEvent &event)
{
    auto when = event.timestamp ? *event.timestamp : clock.Now();
    auto date = DateKey(when);
    auto hour = HourKey(when);
    auto expireAt = std::to_string(
        DayStartEpochSeconds(date) + (kRetentionDays + 1) * kDaySeconds);
    auto endpoint = event.endpoint.empty() ? "unknown" : event.endpoint;
    auto latency = std::max<int64_t>(0, std::llround(event.latencyMs));

    std::vector<std::string> dayKeys = {
        DailyKey(date),
        "analytics:requests:hourly:" + hour,
        "analytics:endpoint:" + endpoint + ':' + date,
        StatusKey(event.statusCode, date),
        LatencySumKey(date),
        LatencyCountKey(date),
        EndpointRankKey(date)
    };

    std::vector<StoreCommand> commands = {
        {"INCR", kTotalKey},
        {"INCR", dayKeys[0]},
        {"INCR", dayKeys[1]},
        {"INCR", dayKeys[2]},
        {"INCR", dayKeys[3]},
        {"INCRBY", dayKeys[4], std::to_string(latency)},
        {"INCR", dayKeys[5]},
        {"ZINCRBY", dayKeys[6], "1", endpoint}
    };
    if (not event.apiKey.empty()) {
        dayKeys.push_back(UniqueApiKeysKey(date));
        commands.push_back({"PFADD", dayKeys.back(), event.apiKey});
    }
    if (not event.ip.empty()) {
        dayKeys.push_back(UniqueIpsKey(date));
        commands.push_back({"PFADD", dayKeys.back(), event.ip});
    }
    for (const auto &key : dayKeys)
        commands.push_back({"EXPIREAT", key, expireAt});

    if (store.Pipeline(commands))
        return true;
    ++dropped;
    std::cerr << "[Analytics] ERROR: event for " << endpoint
              << " dropped, store unavailable" << std::endl;
    return false;
}

/**
 * Reads the counters of one day in a single round trip.
 *
 * @param dateKey The UTC day, YYYY-MM-DD.
 * @return The summary; all zeros with available unset if the store is down.
 */
AnalyticsSummary
UsageAnalytics::Summarize(const std::string &dateKey)
{
    AnalyticsSummary summary;
    summary.dateKey = dateKey;

    std::vector<StoreCommand> commands = {
        {"GET", kTotalKey},
        {"GET", DailyKey(dateKey)},
        {"PFCOUNT", UniqueApiKeysKey(dateKey)},
        {"PFCOUNT", UniqueIpsKey(dateKey)},
        {"GET", LatencySumKey(dateKey)},
        {"GET", LatencyCountKey(dateKey)},
        {"ZREVRANGE", EndpointRankKey(dateKey), "0",
         std::to_string(kTopEndpoints - 1), "WITHSCORES"}
    };
    const size_t kFixed = commands.size();
    for (auto status : kStatusCodes)
        commands.push_back({"GET", StatusKey(status, dateKey)});

    auto replies = store.Pipeline(commands);
    if (not replies)
        return summary;

    const auto &r = *replies;
    summary.available = true;
    summary.totalRequests = r[0].AsInteger();
    summary.dailyRequests = r[1].AsInteger();
    summary.uniqueApiKeys = r[2].AsInteger();
    summary.uniqueIps = r[3].AsInteger();
    auto latencySum = r[4].AsInteger();
    auto latencyCount = r[5].AsInteger();
    if (latencyCount > 0)
        summary.avgLatencyMs = static_cast<int64_t>(std::llround(
            static_cast<double>(latencySum) / latencyCount));
    for (const auto &member : ParseScoredMembers(r[6]))
        summary.topEndpoints.emplace_back(
            member.first, static_cast<int64_t>(std::llround(member.second)));

    size_t i = kFixed;
    for (auto status : kStatusCodes) {
        auto count = r[i++].AsInteger();
        if (count > 0)
            summary.statusBreakdown[status] = count;
    }
    return summary;
}

AnalyticsSummary
UsageAnalytics::SummarizeToday()
{
    return Summarize(DateKey(clock.Now()));
}
