#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <ostream>
#include <string>

#include <boost/program_options.hpp>

#include "config.hh"
#include "redis_store.hh"
#include "rest_store.hh"

namespace {
namespace po = boost::program_options;

// Environment variables and the options they map to.
const std::map<std::string, std::string> kEnvOptions = {
    {"REDIS_URL", "redis-url"},
    {"UPSTASH_REDIS_REST_URL", "rest-url"},
    {"UPSTASH_REDIS_REST_TOKEN", "rest-token"},
    {"SHIELD_LISTEN_ADDR", "listen-addr"},
    {"SHIELD_LISTEN_PORT", "listen-port"},
    {"SHIELD_CACHE_CAPACITY", "cache-capacity"},
    {"SHIELD_SWEEP_INTERVAL", "sweep-interval"},
    {"SHIELD_STORE_TIMEOUT_MS", "store-timeout-ms"},
    {"SHIELD_CONNECT_TIMEOUT_MS", "connect-timeout-ms"},
    {"SHIELD_FETCH_TIMEOUT_MS", "fetch-timeout-ms"},
    {"SHIELD_GRACE_FACTOR", "grace-factor"},
    {"SHIELD_WORKERS", "workers"},
    {"SHIELD_ANALYTICS_QUEUE", "analytics-queue"},
};

std::string
MapEnvironment(const std::string &variable)
{
    auto item = kEnvOptions.find(variable);
    return item == kEnvOptions.end() ? std::string() : item->second;
}

} // namespace

bool
LoadConfig(
    int argc, const char *const argv[], ShieldConfig &config, std::ostream &out)
{
    int64_t sweepInterval = config.sweepInterval.count();
    int64_t storeTimeout = config.storeTimeout.count();
    int64_t connectTimeout = config.connectTimeout.count();
    int64_t fetchTimeout = config.fetchTimeout.count();

    po::options_description desc("shield options");
    desc.add_options()
        ("help,h", "print this message")
        ("redis-url", po::value(&config.redisUrl),
         "redis://[:password@]host[:port][/db] (REDIS_URL)")
        ("rest-url", po::value(&config.restUrl),
         "REST store URL (UPSTASH_REDIS_REST_URL)")
        ("rest-token", po::value(&config.restToken),
         "REST store bearer token (UPSTASH_REDIS_REST_TOKEN)")
        ("listen-addr", po::value(&config.listenAddr),
         "operations server address")
        ("listen-port", po::value(&config.listenPort),
         "operations server port")
        ("cache-capacity", po::value(&config.cacheCapacity),
         "local cache capacity, in entries")
        ("sweep-interval", po::value(&sweepInterval),
         "seconds between local cache sweeps")
        ("store-timeout-ms", po::value(&storeTimeout),
         "bound on one store round trip")
        ("connect-timeout-ms", po::value(&connectTimeout),
         "bound on connecting to Redis")
        ("fetch-timeout-ms", po::value(&fetchTimeout),
         "bound on an upstream fetch")
        ("grace-factor", po::value(&config.graceFactor),
         "multiple of the TTL during which expired values back failed fetches")
        ("workers", po::value(&config.workers),
         "threads for fetches and refreshes")
        ("analytics-queue", po::value(&config.analyticsQueue),
         "analytics events pending before new ones are dropped");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::store(po::parse_environment(desc, MapEnvironment), vm);
    po::notify(vm);

    if (vm.count("help")) {
        out << desc << '\n';
        return false;
    }

    if (sweepInterval <= 0 or storeTimeout <= 0 or connectTimeout <= 0
        or fetchTimeout <= 0 or config.graceFactor < 1.0
        or config.cacheCapacity == 0 or config.workers == 0
        or config.analyticsQueue == 0)
        throw po::error("durations, capacities and workers must be positive, "
                        "and grace-factor at least 1");

    config.sweepInterval = std::chrono::seconds(sweepInterval);
    config.storeTimeout = std::chrono::milliseconds(storeTimeout);
    config.connectTimeout = std::chrono::milliseconds(connectTimeout);
    config.fetchTimeout = std::chrono::milliseconds(fetchTimeout);
    return true;
}

std::unique_ptr<FailoverStore>
MakeRemoteStore(const ShieldConfig &config, const Clock &clock)
{
    std::unique_ptr<FailoverStore> store(new FailoverStore);

    if (not config.restUrl.empty() and not config.restToken.empty()) {
        RestEndpoint endpoint;
        if (ParseRestUrl(config.restUrl, endpoint)) {
            store->Add(std::make_shared<RestStore>(
                endpoint, config.restToken, config.storeTimeout));
            std::cerr << "[Shield] INFO: using REST store at "
                      << endpoint.host << std::endl;
        }
        else
            std::cerr << "[Shield] ERROR: malformed REST store URL, "
                      << "skipping it" << std::endl;
    }

    if (not config.redisUrl.empty()) {
        RedisEndpoint endpoint;
        if (ParseRedisUrl(config.redisUrl, endpoint)) {
            store->Add(std::make_shared<RedisStore>(
                endpoint, config.connectTimeout, config.storeTimeout, clock));
            std::cerr << "[Shield] INFO: using Redis at " << endpoint.host
                      << ':' << endpoint.port << std::endl;
        }
        else
            std::cerr << "[Shield] ERROR: malformed Redis URL, skipping it"
                      << std::endl;
    }

    if (store->Empty())
        std::cerr << "[Shield] INFO: no remote store configured, "
                  << "using local cache and local rate limits only"
                  << std::endl;
    return store;
}
