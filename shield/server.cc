#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include <boost/asio.hpp>

#include "server.hh"
#include "shield_error.hh"

/**
 * Initializes a server. Nothing listens until Run is executed.
 *
 * @param ipAddr The IP address where the server listens for requests.
 * @param port The port number where the server listens for requests.
 * @param cache The cache orchestrator, for stats and invalidation.
 * @param limiter The rate limiter.
 * @param analytics The usage counters.
 * @param clock The clock used to stamp throttle headers.
 */
ShieldServer::ShieldServer(
    const std::string &ipAddr,
    unsigned port,
    CacheOrchestrator &cache,
    RateLimiter &limiter,
    UsageAnalytics &analytics,
    const Clock &clock)
    : ipAddr(ipAddr),
      port(port),
      cache(cache),
      limiter(limiter),
      analytics(analytics),
      clock(clock)
{}

/**
 * Listens for requests in a loop, and launches a thread to handle each
 * connection.
 *
 * @throw ShieldError(ListenFailed) if the address is invalid or cannot be
 *  bound. Errors on individual connections are logged and never end the loop.
 */
void
ShieldServer::Run()
{
    using namespace boost::asio;
    io_service io_service;
    ip::tcp::acceptor acceptor(io_service);
    Listen(acceptor);
    std::cerr << "[Shield] INFO: listening on " << ipAddr << ':' << port
              << std::endl;

    for (;;) {
        try {
            std::unique_ptr<TcpStream> conn(new TcpStream);
            acceptor.accept(*conn->rdbuf());
            std::thread thr(
                &ShieldServer::HandleConnection, this, std::move(conn));
            thr.detach();
        }
        catch (std::exception &err) {
            std::cerr << "[Shield] ERROR: " << err.what() << std::endl;
        }
    }
}

void
ShieldServer::Listen(boost::asio::ip::tcp::acceptor &acceptor)
{
    using namespace boost::asio;
    if (port > 65535)
        throw ShieldError(ShieldErr::ListenFailed,
                          "port out of range: " + std::to_string(port));
    boost::system::error_code ec;
    auto address = ip::address::from_string(ipAddr, ec);
    if (not ec) {
        ip::tcp::endpoint endpoint(address, static_cast<unsigned short>(port));
        acceptor.open(endpoint.protocol(), ec);
        if (not ec)
            acceptor.set_option(ip::tcp::acceptor::reuse_address(true), ec);
        if (not ec)
            acceptor.bind(endpoint, ec);
        if (not ec)
            acceptor.listen(socket_base::max_connections, ec);
    }
    if (ec)
        throw ShieldError(ShieldErr::ListenFailed,
                          ipAddr + ":" + std::to_string(port) + ": "
                          + ec.message());
}

/**
 * Serves the commands of one connection until the peer closes it.
 *
 * @param conn A pointer to a TCP stream.
 */
void
ShieldServer::HandleConnection(std::unique_ptr<TcpStream> conn)
{
    try {
        conn->exceptions(std::ios::badbit);
        std::string line;
        while (std::getline(*conn, line)) {
            if (not line.empty() and line.back() == '\r')
                line.pop_back();
            if (line.empty())
                continue;
            *conn << Dispatch(line);
            conn->flush();
        }
    }
    catch (std::exception &err) {
        std::cerr << "[Shield] ERROR: connection: " << err.what() << std::endl;
    }
}

/**
 * Executes one command.
 *
 * @param line The command and its arguments, separated by spaces.
 * @return The reply, terminated by a newline.
 */
std::string
ShieldServer::Dispatch(const std::string &line)
{
    std::istringstream args(line);
    std::string command;
    args >> command;

    if (command == "limit")
        return Limit(args);
    if (command == "track")
        return Track(args);
    if (command == "summary")
        return Summary(args);
    if (command == "stats")
        return Stats();
    if (command == "invalidate")
        return Invalidate(args);
    return "err BadCommand\n";
}

std::string
ShieldServer::Limit(std::istringstream &args)
{
    std::string identifier, planName;
    Plan plan = Plan::Free;
    if (not (args >> identifier >> planName) or not ParsePlan(planName, plan))
        return "err BadArgs\n";

    auto result = limiter.CheckPlan(identifier, plan);
    std::ostringstream oss;
    oss << "ok " << (result.allowed ? "allowed" : "denied") << ' '
        << result.limit << ' ' << result.remaining << ' '
        << result.resetInMs << '\n';
    for (const auto &header : ThrottleHeaders(result, clock.Now()))
        oss << header.first << ": " << header.second << '\n';
    oss << '\n';
    return oss.str();
}

std::string
ShieldServer::Track(std::istringstream &args)
{
    RequestEvent event;
    if (not (args >> event.endpoint >> event.statusCode >> event.latencyMs))
        return "err BadArgs\n";
    args >> event.apiKey >> event.ip;
    analytics.Track(event);
    return "ok\n";
}

std::string
ShieldServer::Summary(std::istringstream &args)
{
    std::string dateKey;
    args >> dateKey;
    if (not dateKey.empty() and DayStartEpochSeconds(dateKey) < 0)
        return "err BadArgs\n";

    auto summary = dateKey.empty()
        ? analytics.SummarizeToday() : analytics.Summarize(dateKey);
    std::ostringstream oss;
    oss << "ok date=" << summary.dateKey
        << " available=" << summary.available
        << " total=" << summary.totalRequests
        << " daily=" << summary.dailyRequests
        << " uniqueApiKeys=" << summary.uniqueApiKeys
        << " uniqueIps=" << summary.uniqueIps
        << " avgLatencyMs=" << summary.avgLatencyMs << '\n';
    for (const auto &status : summary.statusBreakdown)
        oss << "status " << status.first << ' ' << status.second << '\n';
    for (const auto &endpoint : summary.topEndpoints)
        oss << "endpoint " << endpoint.first << ' ' << endpoint.second << '\n';
    oss << '\n';
    return oss.str();
}

std::string
ShieldServer::Stats()
{
    auto stats = cache.Stats();
    std::ostringstream oss;
    oss << "ok size=" << stats.local.size
        << " capacity=" << stats.local.capacity
        << " hits=" << stats.local.hits
        << " staleHits=" << stats.local.staleHits
        << " misses=" << stats.local.misses
        << " fetches=" << stats.fetches
        << " remote=" << stats.remoteName
        << " healthy=" << stats.remoteHealthy
        << " remoteKeys=";
    if (stats.remoteKeys)
        oss << *stats.remoteKeys;
    else
        oss << "unknown";
    oss << '\n';
    for (const auto &key : stats.local.keys)
        oss << "key " << key << '\n';
    oss << '\n';
    return oss.str();
}

std::string
ShieldServer::Invalidate(std::istringstream &args)
{
    std::string key;
    if (not (args >> key))
        return "err BadArgs\n";
    if (key != "--match") {
        cache.Invalidate(key);
        return "ok\n";
    }

    std::string pattern;
    if (not (args >> pattern))
        return "err BadArgs\n";
    auto count = cache.InvalidatePattern(pattern);
    std::ostringstream oss;
    oss << "ok local=" << count.local << " remote=";
    if (count.remote)
        oss << *count.remote;
    else
        oss << "unknown";
    oss << '\n';
    return oss.str();
}
