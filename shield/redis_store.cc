#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>
#include <sys/time.h>
#include <vector>

#include <hiredis.h>

#include "redis_store.hh"
#include "shield_error.hh"

// Define here to avoid link errors
constexpr std::chrono::milliseconds RedisStore::kMinBackoff;
constexpr std::chrono::milliseconds RedisStore::kMaxBackoff;

namespace {

struct timeval
ToTimeval(std::chrono::milliseconds ms)
{
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
    return tv;
}

// Owns a reply returned by hiredis.
struct ReplyGuard
{
    redisReply *rp;
    explicit ReplyGuard(void *rp) : rp(static_cast<redisReply*>(rp)) {}
    ReplyGuard(const ReplyGuard &guard) = delete;
    ReplyGuard& operator=(const ReplyGuard &guard) = delete;
    ~ReplyGuard() { if (rp) freeReplyObject(rp); }
};

// Nested arrays, like the key list of a SCAN reply, are flattened.
void
AppendElements(const redisReply *rp, std::vector<std::string> &elements)
{
    for (size_t i = 0; i < rp->elements; ++i) {
        auto elem = rp->element[i];
        if (elem->type == REDIS_REPLY_ARRAY)
            AppendElements(elem, elements);
        else if (elem->type == REDIS_REPLY_INTEGER)
            elements.push_back(std::to_string(elem->integer));
        else if (elem->str)
            elements.emplace_back(elem->str, elem->len);
        else
            elements.emplace_back();
    }
}

StoreReply
Convert(const redisReply *rp)
{
    switch (rp->type) {
    case REDIS_REPLY_NIL:
        return StoreReply::Nil();
    case REDIS_REPLY_INTEGER:
        return StoreReply::Of(static_cast<int64_t>(rp->integer));
    case REDIS_REPLY_STRING:
    case REDIS_REPLY_STATUS:
        return StoreReply::Of(std::string(rp->str, rp->len));
    case REDIS_REPLY_ARRAY: {
        std::vector<std::string> elements;
        elements.reserve(rp->elements);
        AppendElements(rp, elements);
        return StoreReply::Array(std::move(elements));
    }
    default:
        throw ShieldError(ShieldErr::StoreUnavailable, "unexpected reply type");
    }
}

} // namespace

bool
ParseRedisUrl(const std::string &url, RedisEndpoint &endpoint)
{
    const std::string scheme = "redis://";
    if (url.compare(0, scheme.size(), scheme) != 0)
        return false;
    auto rest = url.substr(scheme.size());

    RedisEndpoint parsed;
    auto at = rest.rfind('@');
    if (at != std::string::npos) {
        auto credentials = rest.substr(0, at);
        rest = rest.substr(at + 1);
        // Both ":password" and "user:password" carry the password last.
        auto colon = credentials.find(':');
        parsed.password = colon == std::string::npos
            ? credentials : credentials.substr(colon + 1);
    }

    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        auto db = rest.substr(slash + 1);
        rest = rest.substr(0, slash);
        if (not db.empty()) {
            if (db.find_first_not_of("0123456789") != std::string::npos)
                return false;
            parsed.database = static_cast<unsigned>(std::stoul(db));
        }
    }

    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        auto port = rest.substr(colon + 1);
        rest = rest.substr(0, colon);
        if (port.empty() or port.size() > 5
            or port.find_first_not_of("0123456789") != std::string::npos)
            return false;
        parsed.port = static_cast<unsigned>(std::stoul(port));
        if (parsed.port == 0 or parsed.port > 65535)
            return false;
    }
    if (rest.empty())
        return false;
    parsed.host = rest;

    endpoint = parsed;
    return true;
}

/**
 * Initializes the backend. The connection is established lazily, on the first
 * operation.
 *
 * @param endpoint Where Redis listens, and how to authenticate.
 * @param connectTimeout The bound on establishing the connection.
 * @param commandTimeout The bound on each round trip.
 * @param clock The clock used to schedule reconnect attempts.
 */
RedisStore::RedisStore(
    const RedisEndpoint &endpoint,
    std::chrono::milliseconds connectTimeout,
    std::chrono::milliseconds commandTimeout,
    const Clock &clock)
    : endpoint(endpoint),
      connectTimeout(connectTimeout),
      commandTimeout(commandTimeout),
      clock(clock),
      mtx(),
      available(false),
      nextAttempt(clock.Now())
{}

RedisStore::~RedisStore()
{
    Disconnect();
}

/**
 * Whether an operation would be attempted: either connected, or disconnected
 * with the reconnect backoff elapsed.
 */
bool
RedisStore::Available() const
{
    if (available)
        return true;
    LockGuard lck(mtx);
    return clock.Now() >= nextAttempt;
}

/**
 * Sends the commands back to back and then reads all replies, so the batch
 * costs a single round trip.
 *
 * @throw ShieldError on connection failures, timeouts, or error replies. The
 *  connection is dropped on any failure other than an error reply.
 */
std::vector<StoreReply>
RedisStore::Execute(const std::vector<StoreCommand> &commands)
{
    LockGuard lck(mtx);
    if (not rc) {
        if (clock.Now() < nextAttempt)
            throw ShieldError(ShieldErr::StoreUnavailable, "backing off");
        Connect();
    }

    for (const auto &command : commands) {
        std::vector<const char*> argv;
        std::vector<size_t> argvlen;
        argv.reserve(command.size());
        argvlen.reserve(command.size());
        for (const auto &arg : command) {
            argv.push_back(arg.data());
            argvlen.push_back(arg.size());
        }
        if (redisAppendCommandArgv(rc, static_cast<int>(argv.size()),
                                   argv.data(), argvlen.data()) != REDIS_OK) {
            MarkFailed();
            throw ShieldError(ShieldErr::StoreUnavailable, "cannot queue command");
        }
    }

    std::vector<StoreReply> replies;
    replies.reserve(commands.size());
    std::string commandError;
    for (size_t i = 0; i < commands.size(); ++i) {
        void *raw = nullptr;
        if (redisGetReply(rc, &raw) != REDIS_OK or raw == nullptr) {
            bool timedOut = rc->err == REDIS_ERR_IO
                and (errno == EAGAIN or errno == EWOULDBLOCK);
            std::string reason = rc->errstr;
            MarkFailed();
            throw ShieldError(
                timedOut ? ShieldErr::Timeout : ShieldErr::StoreUnavailable,
                reason);
        }
        ReplyGuard guard(raw);
        if (guard.rp->type == REDIS_REPLY_ERROR) {
            // Keep draining so the connection stays in sync.
            if (commandError.empty())
                commandError = commands[i].front() + ": "
                    + std::string(guard.rp->str, guard.rp->len);
            replies.push_back(StoreReply::Nil());
            continue;
        }
        replies.push_back(Convert(guard.rp));
    }
    if (not commandError.empty())
        throw ShieldError(ShieldErr::StoreUnavailable, commandError);
    failedAttempts = 0;
    return replies;
}

// Must be called with the lock held.
void
RedisStore::Connect()
{
    auto rcNew = redisConnectWithTimeout(
        endpoint.host.c_str(), static_cast<int>(endpoint.port),
        ToTimeval(connectTimeout));
    if (rcNew == nullptr or rcNew->err) {
        std::string reason = rcNew ? rcNew->errstr : "cannot allocate context";
        if (rcNew) redisFree(rcNew);
        MarkFailed();
        throw ShieldError(ShieldErr::StoreUnavailable,
                          "cannot connect: " + reason);
    }
    rc = rcNew;
    if (redisSetTimeout(rc, ToTimeval(commandTimeout)) != REDIS_OK) {
        MarkFailed();
        throw ShieldError(ShieldErr::StoreUnavailable, "cannot set timeout");
    }

    if (not endpoint.password.empty()) {
        ReplyGuard auth(redisCommand(rc, "AUTH %s", endpoint.password.c_str()));
        if (not auth.rp or auth.rp->type == REDIS_REPLY_ERROR) {
            MarkFailed();
            throw ShieldError(ShieldErr::StoreUnavailable, "AUTH failed");
        }
    }
    if (endpoint.database != 0) {
        ReplyGuard select(redisCommand(rc, "SELECT %u", endpoint.database));
        if (not select.rp or select.rp->type == REDIS_REPLY_ERROR) {
            MarkFailed();
            throw ShieldError(ShieldErr::StoreUnavailable, "SELECT failed");
        }
    }

    available = true;
    failedAttempts = 0;
    std::cerr << "[Redis] INFO: connected to " << endpoint.host << ':'
              << endpoint.port << '/' << endpoint.database << std::endl;
}

// Must be called with the lock held, or from the dtor.
void
RedisStore::Disconnect() noexcept
{
    if (rc) {
        redisFree(rc);
        rc = nullptr;
    }
    available = false;
}

/**
 * Drops the connection and schedules the next reconnect attempt.
 */
void
RedisStore::MarkFailed()
{
    bool wasAvailable = available;
    Disconnect();
    auto backoff = kMinBackoff * (1 << std::min(failedAttempts, 4u));
    backoff = std::min(backoff, kMaxBackoff);
    ++failedAttempts;
    nextAttempt = clock.Now() + backoff;
    if (wasAvailable)
        std::cerr << "[Redis] INFO: disconnected" << std::endl;
}
