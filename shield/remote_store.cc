#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "remote_store.hh"
#include "shield_error.hh"

namespace {
// Keys requested per SCAN page.
constexpr int64_t kScanCount = 500;
} // namespace

StoreReply
StoreReply::Nil()
{
    StoreReply reply;
    reply.nil = true;
    return reply;
}

StoreReply
StoreReply::Of(std::string value)
{
    StoreReply reply;
    reply.value = std::move(value);
    return reply;
}

StoreReply
StoreReply::Of(int64_t value)
{
    return Of(std::to_string(value));
}

StoreReply
StoreReply::Array(std::vector<std::string> elements)
{
    StoreReply reply;
    reply.elements = std::move(elements);
    return reply;
}

int64_t
StoreReply::AsInteger() const noexcept
{
    if (nil or value.empty())
        return 0;
    char *end = nullptr;
    auto parsed = std::strtoll(value.c_str(), &end, 10);
    if (end == value.c_str())
        return 0;
    return parsed;
}

std::string
FormatScore(double score)
{
    if (std::isinf(score))
        return score > 0 ? "+inf" : "-inf";
    std::ostringstream oss;
    oss.precision(17);
    oss << score;
    return oss.str();
}

std::vector<ScoredMember>
ParseScoredMembers(const StoreReply &reply)
{
    std::vector<ScoredMember> members;
    const auto &elems = reply.elements;
    for (size_t i = 0; i + 1 < elems.size(); i += 2)
        members.emplace_back(elems[i], std::strtod(elems[i + 1].c_str(), nullptr));
    return members;
}

/**
 * Sends a batch of commands in a single round trip.
 *
 * @param commands The commands to send.
 * @return The replies, or none if the store is unavailable or the batch
 *  failed. Failures are logged.
 */
boost::optional<std::vector<StoreReply>>
RemoteStore::Pipeline(const std::vector<StoreCommand> &commands)
{
    if (commands.empty())
        return std::vector<StoreReply>();
    if (not Available())
        return boost::none;
    try {
        auto replies = Execute(commands);
        if (replies.size() != commands.size()) {
            std::cerr << "[" << Name() << "] ERROR: expected "
                      << commands.size() << " replies, got "
                      << replies.size() << std::endl;
            return boost::none;
        }
        return replies;
    }
    catch (std::exception &err) {
        std::cerr << "[" << Name() << "] ERROR: " << commands.front().front()
                  << (commands.size() > 1 ? " (pipeline)" : "")
                  << ": " << err.what() << std::endl;
    }
    return boost::none;
}

boost::optional<StoreReply>
RemoteStore::One(const StoreCommand &command)
{
    auto replies = Pipeline({command});
    if (not replies)
        return boost::none;
    return replies->front();
}

/**
 * Gets a plain value.
 *
 * @return none if the store is unavailable; otherwise an inner optional that
 *  is empty when the key does not exist.
 */
boost::optional<boost::optional<std::string>>
RemoteStore::Get(const std::string &key)
{
    auto reply = One({"GET", key});
    if (not reply)
        return boost::none;
    if (reply->nil)
        return boost::make_optional(boost::optional<std::string>());
    return boost::make_optional(boost::make_optional(reply->value));
}

boost::optional<bool>
RemoteStore::SetWithTtl(
    const std::string &key,
    const std::string &value,
    std::chrono::seconds ttl)
{
    auto reply = One({"SET", key, value, "EX", std::to_string(ttl.count())});
    if (not reply)
        return boost::none;
    return not reply->nil;
}

boost::optional<int64_t>
RemoteStore::Del(const std::string &key)
{
    auto reply = One({"DEL", key});
    if (not reply)
        return boost::none;
    return reply->AsInteger();
}

boost::optional<int64_t>
RemoteStore::Incr(const std::string &key)
{
    auto reply = One({"INCR", key});
    if (not reply)
        return boost::none;
    return reply->AsInteger();
}

boost::optional<int64_t>
RemoteStore::IncrBy(const std::string &key, int64_t delta)
{
    auto reply = One({"INCRBY", key, std::to_string(delta)});
    if (not reply)
        return boost::none;
    return reply->AsInteger();
}

boost::optional<bool>
RemoteStore::Expire(const std::string &key, std::chrono::seconds ttl)
{
    auto reply = One({"EXPIRE", key, std::to_string(ttl.count())});
    if (not reply)
        return boost::none;
    return reply->AsInteger() == 1;
}

boost::optional<bool>
RemoteStore::ExpireAt(const std::string &key, int64_t epochSeconds)
{
    auto reply = One({"EXPIREAT", key, std::to_string(epochSeconds)});
    if (not reply)
        return boost::none;
    return reply->AsInteger() == 1;
}

boost::optional<bool>
RemoteStore::PExpire(const std::string &key, std::chrono::milliseconds ttl)
{
    auto reply = One({"PEXPIRE", key, std::to_string(ttl.count())});
    if (not reply)
        return boost::none;
    return reply->AsInteger() == 1;
}

boost::optional<int64_t>
RemoteStore::ZAdd(
    const std::string &key, double score, const std::string &member)
{
    auto reply = One({"ZADD", key, FormatScore(score), member});
    if (not reply)
        return boost::none;
    return reply->AsInteger();
}

boost::optional<int64_t>
RemoteStore::ZCard(const std::string &key)
{
    auto reply = One({"ZCARD", key});
    if (not reply)
        return boost::none;
    return reply->AsInteger();
}

boost::optional<int64_t>
RemoteStore::ZRemRangeByScore(const std::string &key, double min, double max)
{
    auto reply = One(
        {"ZREMRANGEBYSCORE", key, FormatScore(min), FormatScore(max)});
    if (not reply)
        return boost::none;
    return reply->AsInteger();
}

boost::optional<std::vector<ScoredMember>>
RemoteStore::ZRangeWithScores(
    const std::string &key, int64_t start, int64_t stop)
{
    auto reply = One({"ZRANGE", key, std::to_string(start),
                      std::to_string(stop), "WITHSCORES"});
    if (not reply)
        return boost::none;
    return ParseScoredMembers(*reply);
}

boost::optional<std::vector<ScoredMember>>
RemoteStore::ZRevRangeWithScores(
    const std::string &key, int64_t start, int64_t stop)
{
    auto reply = One({"ZREVRANGE", key, std::to_string(start),
                      std::to_string(stop), "WITHSCORES"});
    if (not reply)
        return boost::none;
    return ParseScoredMembers(*reply);
}

boost::optional<double>
RemoteStore::ZIncrBy(
    const std::string &key, double delta, const std::string &member)
{
    auto reply = One({"ZINCRBY", key, FormatScore(delta), member});
    if (not reply)
        return boost::none;
    return std::strtod(reply->value.c_str(), nullptr);
}

boost::optional<bool>
RemoteStore::PfAdd(const std::string &key, const std::string &element)
{
    auto reply = One({"PFADD", key, element});
    if (not reply)
        return boost::none;
    return reply->AsInteger() == 1;
}

boost::optional<int64_t>
RemoteStore::PfCount(const std::string &key)
{
    auto reply = One({"PFCOUNT", key});
    if (not reply)
        return boost::none;
    return reply->AsInteger();
}

boost::optional<int64_t>
RemoteStore::DbSize()
{
    auto reply = One({"DBSIZE"});
    if (not reply)
        return boost::none;
    return reply->AsInteger();
}

boost::optional<ScanPage>
RemoteStore::Scan(
    const std::string &cursor, const std::string &pattern, int64_t count)
{
    auto reply = One({"SCAN", cursor, "MATCH", pattern,
                      "COUNT", std::to_string(count)});
    if (not reply)
        return boost::none;
    if (reply->elements.empty()) {
        std::cerr << "[" << Name() << "] ERROR: SCAN: malformed reply"
                  << std::endl;
        return boost::none;
    }
    ScanPage page;
    page.cursor = reply->elements.front();
    page.keys.assign(reply->elements.begin() + 1, reply->elements.end());
    return page;
}

/**
 * Deletes every key matching a glob pattern.
 *
 * Walks the key space with SCAN and deletes each page with one DEL. Keys
 * written while the scan runs may survive it.
 *
 * @return The number of keys deleted, or none if any call failed. Pages
 *  deleted before a failure stay deleted.
 */
boost::optional<int64_t>
RemoteStore::DelPattern(const std::string &pattern)
{
    int64_t deleted = 0;
    std::string cursor = "0";
    do {
        auto page = Scan(cursor, pattern, kScanCount);
        if (not page)
            return boost::none;
        if (not page->keys.empty()) {
            StoreCommand del{"DEL"};
            del.insert(del.end(), page->keys.begin(), page->keys.end());
            auto reply = One(del);
            if (not reply)
                return boost::none;
            deleted += reply->AsInteger();
        }
        cursor = page->cursor;
    } while (cursor != "0");
    return deleted;
}

bool
RemoteStore::Ping()
{
    auto reply = One({"PING"});
    return reply.is_initialized();
}
