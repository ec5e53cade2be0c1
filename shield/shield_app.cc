#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>

#include "analytics.hh"
#include "clock.hh"
#include "config.hh"
#include "local_cache.hh"
#include "orchestrator.hh"
#include "periodic_task.hh"
#include "rate_limiter.hh"
#include "server.hh"

int
main(int argc, char *argv[])
{
    ShieldConfig config;
    try {
        if (not LoadConfig(argc, argv, config, std::cout))
            exit(EXIT_SUCCESS);
    }
    catch (std::exception &err) {
        std::cerr << "Error: " << err.what() << '\n';
        std::cerr << "Usage: ./" << argv[0] << " --help\n";
        exit(EXIT_FAILURE);
    }

    SystemClock clock;
    auto store = MakeRemoteStore(config, clock);
    LocalCache localCache(config.cacheCapacity, config.graceFactor, clock);
    OrchestratorConfig cacheConfig;
    cacheConfig.fetchTimeout = config.fetchTimeout;
    cacheConfig.graceFactor = config.graceFactor;
    cacheConfig.workers = config.workers;
    CacheOrchestrator cache(localCache, *store, clock, cacheConfig);
    RateLimiter limiter(*store, clock);
    UsageAnalytics analytics(*store, clock, 1, config.analyticsQueue);

    PeriodicTask sweeper("Sweep", config.sweepInterval, [&] {
        localCache.Sweep();
        limiter.PruneLocal();
    });
    sweeper.Start();

    ShieldServer server(
        config.listenAddr, config.listenPort, cache, limiter, analytics, clock);
    try {
        server.Run();
    }
    catch (std::exception &err) {
        std::cerr << "Error: " << err.what() << '\n';
        exit(EXIT_FAILURE);
    }
    exit(EXIT_SUCCESS);
}
