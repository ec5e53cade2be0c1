#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

// One store command and its arguments, e.g. {"INCRBY", "hits", "3"}.
using StoreCommand = std::vector<std::string>;

/**
 * The reply to one store command.
 *
 * Integers and bulk strings are both carried as text in value. Array replies,
 * such as the member/score pairs of ZRANGE ... WITHSCORES, are flattened into
 * elements.
 */
struct StoreReply
{
    bool nil = false;
    std::string value;
    std::vector<std::string> elements;

    static StoreReply Nil();
    static StoreReply Of(std::string value);
    static StoreReply Of(int64_t value);
    static StoreReply Array(std::vector<std::string> elements);

    // Parses value as an integer; nil or non-numeric replies read as zero.
    int64_t AsInteger() const noexcept;
};

// A sorted-set member with its score.
using ScoredMember = std::pair<std::string, double>;

// One page of a key scan. A cursor of "0" means the scan is complete.
struct ScanPage
{
    std::string cursor;
    std::vector<std::string> keys;
};

/**
 * Uniform interface over a shared key/value store.
 *
 * Backends implement Execute, which sends a batch of commands in a single
 * round trip and returns one reply per command. This class builds the typed
 * operations on top of it so every backend exposes identical semantics.
 *
 * Every operation returns none when the store is unavailable for that call.
 * Failures are caught and logged here, at the adapter boundary, and are never
 * propagated to callers.
 */
class RemoteStore
{
protected:
    /**
     * Sends a batch of commands in one round trip.
     *
     * @return One reply per command, in order. Implementations throw
     *  ShieldError (StoreUnavailable or Timeout) on any failure; a command
     *  error fails the whole batch.
     */
    virtual std::vector<StoreReply> Execute(
        const std::vector<StoreCommand> &commands) = 0;

    boost::optional<StoreReply> One(const StoreCommand &command);

public:
    virtual ~RemoteStore() = default;

    // Whether an operation issued now would be attempted.
    virtual bool Available() const = 0;
    // Whether the store is known to be serving. A backend that never gates
    // attempts reports the outcome of its most recent call here.
    virtual bool Healthy() const { return Available(); }
    virtual std::string Name() const = 0;

    boost::optional<std::vector<StoreReply>> Pipeline(
        const std::vector<StoreCommand> &commands);

    boost::optional<boost::optional<std::string>> Get(const std::string &key);
    boost::optional<bool> SetWithTtl(
        const std::string &key,
        const std::string &value,
        std::chrono::seconds ttl);
    boost::optional<int64_t> Del(const std::string &key);
    boost::optional<int64_t> Incr(const std::string &key);
    boost::optional<int64_t> IncrBy(const std::string &key, int64_t delta);
    boost::optional<bool> Expire(
        const std::string &key, std::chrono::seconds ttl);
    boost::optional<bool> ExpireAt(
        const std::string &key, int64_t epochSeconds);
    boost::optional<bool> PExpire(
        const std::string &key, std::chrono::milliseconds ttl);
    boost::optional<int64_t> ZAdd(
        const std::string &key, double score, const std::string &member);
    boost::optional<int64_t> ZCard(const std::string &key);
    boost::optional<int64_t> ZRemRangeByScore(
        const std::string &key, double min, double max);
    boost::optional<std::vector<ScoredMember>> ZRangeWithScores(
        const std::string &key, int64_t start, int64_t stop);
    boost::optional<std::vector<ScoredMember>> ZRevRangeWithScores(
        const std::string &key, int64_t start, int64_t stop);
    boost::optional<double> ZIncrBy(
        const std::string &key, double delta, const std::string &member);
    boost::optional<bool> PfAdd(
        const std::string &key, const std::string &element);
    boost::optional<int64_t> PfCount(const std::string &key);
    boost::optional<int64_t> DbSize();
    boost::optional<ScanPage> Scan(
        const std::string &cursor, const std::string &pattern, int64_t count);
    boost::optional<int64_t> DelPattern(const std::string &pattern);
    bool Ping();
};

// Formats a score the way the store expects it.
std::string
FormatScore(double score);

// Decodes the flattened member/score pairs of a WITHSCORES reply.
std::vector<ScoredMember>
ParseScoredMembers(const StoreReply &reply);
