#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include <hiredis.h>

#include "clock.hh"
#include "remote_store.hh"

// Connection settings parsed from a redis:// URL.
struct RedisEndpoint
{
    std::string host = "127.0.0.1";
    unsigned port = 6379;
    std::string password;
    unsigned database = 0;
};

// Parses redis://[:password@]host[:port][/db]. Returns false if malformed.
bool
ParseRedisUrl(const std::string &url, RedisEndpoint &endpoint);

/**
 * Persistent-connection backend on top of hiredis.
 *
 * A single connection is shared by all callers and guarded by a mutex. The
 * available flag is raised when a connection is established and dropped on
 * any error or disconnect; while it is down, operations fail immediately
 * without I/O until the reconnect backoff has elapsed. The backoff starts at
 * 200 ms and doubles on each failed attempt, capped at 3 s.
 */
class RedisStore : public RemoteStore
{
    using LockGuard = std::lock_guard<std::mutex>;

    static constexpr std::chrono::milliseconds kMinBackoff{200};
    static constexpr std::chrono::milliseconds kMaxBackoff{3000};

    RedisEndpoint endpoint;
    std::chrono::milliseconds connectTimeout;
    std::chrono::milliseconds commandTimeout;
    const Clock &clock;

    mutable std::mutex mtx;
    redisContext *rc = nullptr;
    std::atomic_bool available;
    unsigned failedAttempts = 0;
    TimePoint nextAttempt;

    void Connect();
    void Disconnect() noexcept;
    void MarkFailed();

protected:
    std::vector<StoreReply> Execute(
        const std::vector<StoreCommand> &commands) override;

public:
    RedisStore(
        const RedisEndpoint &endpoint,
        std::chrono::milliseconds connectTimeout,
        std::chrono::milliseconds commandTimeout,
        const Clock &clock);
    RedisStore(const RedisStore &store) = delete;
    RedisStore& operator=(const RedisStore &store) = delete;
    ~RedisStore();

    bool Available() const override;
    bool Healthy() const override { return Connected(); }
    std::string Name() const override { return "Redis"; }

    // Connected right now, as opposed to merely allowed to try.
    bool Connected() const noexcept { return available; }
};
