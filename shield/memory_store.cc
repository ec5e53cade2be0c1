#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iterator>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <fnmatch.h>

#include <boost/algorithm/string/case_conv.hpp>

#include "memory_store.hh"
#include "shield_error.hh"

namespace {

int64_t
ParseInteger(const std::string &text)
{
    errno = 0;
    char *end = nullptr;
    auto value = std::strtoll(text.c_str(), &end, 10);
    if (text.empty() or *end != '\0' or errno == ERANGE)
        throw std::invalid_argument("value is not an integer or out of range");
    return value;
}

double
ParseDouble(const std::string &text)
{
    auto lower = boost::algorithm::to_lower_copy(text);
    if (lower == "+inf" or lower == "inf")
        return HUGE_VAL;
    if (lower == "-inf")
        return -HUGE_VAL;
    char *end = nullptr;
    auto value = std::strtod(text.c_str(), &end);
    if (text.empty() or *end != '\0' or std::isnan(value))
        throw std::invalid_argument("value is not a valid float");
    return value;
}

// Parses a score range bound, where a leading '(' makes it exclusive.
double
ParseBound(const std::string &text, bool &open)
{
    open = not text.empty() and text.front() == '(';
    return ParseDouble(open ? text.substr(1) : text);
}

void
RequireArgs(const StoreCommand &command, size_t count)
{
    if (command.size() < count)
        throw std::invalid_argument(
            "wrong number of arguments for '" + command.front() + "'");
}

} // namespace

bool
MemoryStore::SortedSet::Add(const std::string &member, double score)
{
    auto item = scores.find(member);
    if (item != scores.end()) {
        ordered.erase({item->second, member});
        item->second = score;
        ordered.emplace(score, member);
        return false;
    }
    scores.emplace(member, score);
    ordered.emplace(score, member);
    return true;
}

int64_t
MemoryStore::SortedSet::RemoveRangeByScore(
    double min, bool minOpen, double max, bool maxOpen)
{
    int64_t removed = 0;
    auto item = ordered.lower_bound({min, std::string()});
    while (item != ordered.end()) {
        auto score = item->first;
        if (score > max or (maxOpen and score == max))
            break;
        if (minOpen and score == min) {
            ++item;
            continue;
        }
        scores.erase(item->second);
        item = ordered.erase(item);
        ++removed;
    }
    return removed;
}

/**
 * Initializes an empty, online store.
 *
 * @param clock The clock used to evaluate key expiry.
 */
MemoryStore::MemoryStore(const Clock &clock)
    : mtx(), items(), online(true), batches(0), clock(clock)
{}

/**
 * Applies a batch of commands atomically with respect to other batches.
 *
 * @throw ShieldError(StoreUnavailable) if the store is offline or a command
 *  is rejected.
 */
std::vector<StoreReply>
MemoryStore::Execute(const std::vector<StoreCommand> &commands)
{
    if (not online)
        throw ShieldError(ShieldErr::StoreUnavailable, "memory store offline");

    LockGuard lck(mtx);
    ++batches;
    auto now = clock.Now();
    std::vector<StoreReply> replies;
    replies.reserve(commands.size());
    try {
        for (const auto &command : commands) {
            if (command.empty())
                throw std::invalid_argument("empty command");
            replies.push_back(Apply(command, now));
        }
    }
    catch (std::invalid_argument &err) {
        throw ShieldError(ShieldErr::StoreUnavailable, err.what());
    }
    return replies;
}

MemoryStore::Item*
MemoryStore::Find(const std::string &key, TimePoint now)
{
    auto item = items.find(key);
    if (item == items.end())
        return nullptr;
    if (item->second.expireAt and *item->second.expireAt <= now) {
        items.erase(item);
        return nullptr;
    }
    return &item->second;
}

MemoryStore::Item&
MemoryStore::FindOrCreate(const std::string &key, Kind kind, TimePoint now)
{
    auto found = Find(key, now);
    if (found) {
        if (found->kind != kind)
            throw std::invalid_argument(
                "WRONGTYPE Operation against a key holding the wrong kind "
                "of value");
        return *found;
    }

    Item item{kind, std::string(), nullptr, nullptr, boost::none};
    if (kind == Kind::ZSet)
        item.zset = std::make_shared<SortedSet>();
    else if (kind == Kind::Hll)
        item.hll = std::make_shared<HyperLogLog>();
    return items.emplace(key, std::move(item)).first->second;
}

StoreReply
MemoryStore::Apply(const StoreCommand &command, TimePoint now)
{
    auto name = boost::algorithm::to_upper_copy(command.front());

    if (name == "PING")
        return StoreReply::Of(std::string("PONG"));

    if (name == "DBSIZE") {
        int64_t count = 0;
        for (auto item = items.begin(); item != items.end();) {
            if (item->second.expireAt and *item->second.expireAt <= now) {
                item = items.erase(item);
                continue;
            }
            ++count;
            ++item;
        }
        return StoreReply::Of(count);
    }

    RequireArgs(command, 2);
    const auto &key = command[1];

    // The whole key space fits in one page, so the cursor is always "0".
    if (name == "SCAN") {
        std::string pattern = "*";
        for (size_t i = 2; i + 1 < command.size(); i += 2) {
            if (boost::algorithm::to_upper_copy(command[i]) == "MATCH")
                pattern = command[i + 1];
        }
        std::vector<std::string> elements{"0"};
        for (const auto &item : items) {
            if (item.second.expireAt and *item.second.expireAt <= now)
                continue;
            if (fnmatch(pattern.c_str(), item.first.c_str(), 0) == 0)
                elements.push_back(item.first);
        }
        return StoreReply::Array(std::move(elements));
    }

    if (name == "GET") {
        auto item = Find(key, now);
        if (not item)
            return StoreReply::Nil();
        if (item->kind != Kind::String)
            throw std::invalid_argument("WRONGTYPE GET on a non-string key");
        return StoreReply::Of(item->str);
    }

    if (name == "SET") {
        RequireArgs(command, 3);
        boost::optional<TimePoint> expireAt;
        for (size_t i = 3; i + 1 < command.size(); i += 2) {
            auto option = boost::algorithm::to_upper_copy(command[i]);
            auto amount = ParseInteger(command[i + 1]);
            if (amount <= 0)
                throw std::invalid_argument("invalid expire time in 'set'");
            if (option == "EX")
                expireAt = now + std::chrono::seconds(amount);
            else if (option == "PX")
                expireAt = now + std::chrono::milliseconds(amount);
            else
                throw std::invalid_argument("syntax error");
        }
        items.erase(key);
        items.emplace(key, Item{Kind::String, command[2], nullptr, nullptr,
                                expireAt});
        return StoreReply::Of(std::string("OK"));
    }

    if (name == "DEL") {
        int64_t removed = 0;
        for (size_t i = 1; i < command.size(); ++i) {
            if (Find(command[i], now)) {
                items.erase(command[i]);
                ++removed;
            }
        }
        return StoreReply::Of(removed);
    }

    if (name == "INCR" or name == "INCRBY") {
        int64_t delta = 1;
        if (name == "INCRBY") {
            RequireArgs(command, 3);
            delta = ParseInteger(command[2]);
        }
        auto &item = FindOrCreate(key, Kind::String, now);
        int64_t current = item.str.empty() ? 0 : ParseInteger(item.str);
        current += delta;
        item.str = std::to_string(current);
        return StoreReply::Of(current);
    }

    if (name == "EXPIRE" or name == "PEXPIRE" or name == "EXPIREAT") {
        RequireArgs(command, 3);
        auto amount = ParseInteger(command[2]);
        auto item = Find(key, now);
        if (not item)
            return StoreReply::Of(int64_t(0));
        if (name == "EXPIRE")
            item->expireAt = now + std::chrono::seconds(amount);
        else if (name == "PEXPIRE")
            item->expireAt = now + std::chrono::milliseconds(amount);
        else
            item->expireAt = FromEpochMs(amount * 1000);
        if (*item->expireAt <= now)
            items.erase(key);
        return StoreReply::Of(int64_t(1));
    }

    if (name == "ZADD") {
        RequireArgs(command, 4);
        if ((command.size() - 2) % 2 != 0)
            throw std::invalid_argument("syntax error");
        std::vector<std::pair<double, std::string>> pairs;
        for (size_t i = 2; i + 1 < command.size(); i += 2)
            pairs.emplace_back(ParseDouble(command[i]), command[i + 1]);
        auto &item = FindOrCreate(key, Kind::ZSet, now);
        int64_t added = 0;
        for (const auto &pair : pairs)
            added += item.zset->Add(pair.second, pair.first) ? 1 : 0;
        return StoreReply::Of(added);
    }

    if (name == "ZINCRBY") {
        RequireArgs(command, 4);
        auto delta = ParseDouble(command[2]);
        auto &item = FindOrCreate(key, Kind::ZSet, now);
        auto current = item.zset->scores.find(command[3]);
        double score = delta
            + (current == item.zset->scores.end() ? 0.0 : current->second);
        item.zset->Add(command[3], score);
        return StoreReply::Of(FormatScore(score));
    }

    if (name == "ZCARD") {
        auto item = Find(key, now);
        if (not item)
            return StoreReply::Of(int64_t(0));
        if (item->kind != Kind::ZSet)
            throw std::invalid_argument("WRONGTYPE ZCARD on a non-zset key");
        return StoreReply::Of(static_cast<int64_t>(item->zset->scores.size()));
    }

    if (name == "ZREMRANGEBYSCORE") {
        RequireArgs(command, 4);
        bool minOpen = false, maxOpen = false;
        auto min = ParseBound(command[2], minOpen);
        auto max = ParseBound(command[3], maxOpen);
        auto item = Find(key, now);
        if (not item)
            return StoreReply::Of(int64_t(0));
        if (item->kind != Kind::ZSet)
            throw std::invalid_argument("WRONGTYPE on a non-zset key");
        auto removed = item->zset->RemoveRangeByScore(min, minOpen, max, maxOpen);
        if (item->zset->scores.empty())
            items.erase(key);
        return StoreReply::Of(removed);
    }

    if (name == "ZRANGE")
        return Range(command, now, false);
    if (name == "ZREVRANGE")
        return Range(command, now, true);

    if (name == "PFADD") {
        auto &item = FindOrCreate(key, Kind::Hll, now);
        bool changed = false;
        for (size_t i = 2; i < command.size(); ++i)
            changed = item.hll->Add(command[i]) or changed;
        return StoreReply::Of(int64_t(changed ? 1 : 0));
    }

    if (name == "PFCOUNT") {
        HyperLogLog merged;
        for (size_t i = 1; i < command.size(); ++i) {
            auto item = Find(command[i], now);
            if (not item)
                continue;
            if (item->kind != Kind::Hll)
                throw std::invalid_argument("WRONGTYPE PFCOUNT on a non-hll key");
            merged.Merge(*item->hll);
        }
        return StoreReply::Of(static_cast<int64_t>(merged.Count()));
    }

    throw std::invalid_argument("unknown command '" + command.front() + "'");
}

/**
 * Serves ZRANGE and ZREVRANGE by rank, with negative ranks counted from the
 * end, and the optional WITHSCORES flag.
 */
StoreReply
MemoryStore::Range(const StoreCommand &command, TimePoint now, bool reverse)
{
    RequireArgs(command, 4);
    auto start = ParseInteger(command[2]);
    auto stop = ParseInteger(command[3]);
    bool withScores = command.size() > 4
        and boost::algorithm::to_upper_copy(command[4]) == "WITHSCORES";

    auto item = Find(command[1], now);
    if (not item)
        return StoreReply::Array({});
    if (item->kind != Kind::ZSet)
        throw std::invalid_argument("WRONGTYPE on a non-zset key");

    std::vector<std::pair<double, std::string>> ordered(
        item->zset->ordered.begin(), item->zset->ordered.end());
    if (reverse)
        std::reverse(ordered.begin(), ordered.end());

    auto size = static_cast<int64_t>(ordered.size());
    if (start < 0)
        start = std::max<int64_t>(size + start, 0);
    if (stop < 0)
        stop = size + stop;
    stop = std::min(stop, size - 1);

    std::vector<std::string> elements;
    for (auto i = start; i <= stop; ++i) {
        elements.push_back(ordered[i].second);
        if (withScores)
            elements.push_back(FormatScore(ordered[i].first));
    }
    return StoreReply::Array(std::move(elements));
}
