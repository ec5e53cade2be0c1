#pragma once

#include <memory>
#include <sstream>
#include <string>

#include <boost/asio.hpp>

#include "analytics.hh"
#include "clock.hh"
#include "orchestrator.hh"
#include "rate_limiter.hh"

/**
 * The operations server.
 *
 * A line-oriented TCP front for the request-handling layer and for
 * operational dashboards. Each connection gets its own thread and may send
 * any number of commands, one per line:
 *  - |limit <identifier> <plan>|: checks and records a request against the
 *    plan's daily quota and the burst limit, and replies with the decision
 *    and the throttling headers.
 *  - |track <endpoint> <status> <latencyMs> [apiKey] [ip]|: records a
 *    completed request.
 *  - |summary [dateKey]|: usage counters of a day, today by default.
 *  - |stats|: local cache and remote store state.
 *  - |invalidate <key>|: drops a key from both cache layers.
 *  - |invalidate --match <glob>|: drops every matching key from both layers
 *    and replies with the number removed from each.
 * Replies start with "ok" or "err <Reason>". Multi-line replies end with an
 * empty line.
 *
 * All components are owned by the caller and shared by reference.
 */
class ShieldServer
{
public:
    using TcpStream = boost::asio::ip::tcp::iostream;

private:
    // The IP address and port where the server listens for requests.
    std::string ipAddr;
    unsigned port;

    CacheOrchestrator &cache;
    RateLimiter &limiter;
    UsageAnalytics &analytics;
    const Clock &clock;

    void Listen(boost::asio::ip::tcp::acceptor &acceptor);
    void HandleConnection(std::unique_ptr<TcpStream> conn);
    std::string Limit(std::istringstream &args);
    std::string Track(std::istringstream &args);
    std::string Summary(std::istringstream &args);
    std::string Stats();
    std::string Invalidate(std::istringstream &args);

public:
    ShieldServer(
        const std::string &ipAddr,
        unsigned port,
        CacheOrchestrator &cache,
        RateLimiter &limiter,
        UsageAnalytics &analytics,
        const Clock &clock);

    // Listens for requests on a loop. Throws ShieldError(ListenFailed) if the
    // address cannot be bound.
    void Run();

    // Executes one command line and returns the full reply.
    std::string Dispatch(const std::string &line);
};
