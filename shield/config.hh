#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <ostream>
#include <string>

#include "clock.hh"
#include "failover_store.hh"

struct ShieldConfig
{
    // Remote store selection. Both empty means local-only mode.
    std::string redisUrl;
    std::string restUrl;
    std::string restToken;

    // Where the operations server listens.
    std::string listenAddr = "0.0.0.0";
    unsigned listenPort = 7400;

    std::size_t cacheCapacity = 1000;
    std::chrono::seconds sweepInterval{60};
    std::chrono::milliseconds storeTimeout{2000};
    std::chrono::milliseconds connectTimeout{5000};
    std::chrono::milliseconds fetchTimeout{10000};
    double graceFactor = 2.0;
    unsigned workers = 4;
    // Analytics events waiting to be recorded before new ones are dropped.
    std::size_t analyticsQueue = 10000;
};

/**
 * Loads the configuration from the command line and then the environment, so
 * that an option given on the command line wins over its variable.
 *
 * @param argc The argument count.
 * @param argv The arguments.
 * @param config The configuration to fill in.
 * @param out Where usage is printed when --help is given.
 * @return False if --help was given and the program should exit.
 * @throw boost::program_options::error on malformed options.
 */
bool
LoadConfig(
    int argc, const char *const argv[], ShieldConfig &config, std::ostream &out);

/**
 * Builds the remote store from the configuration: the REST backend first when
 * both its URL and token are set, then the Redis backend when its URL is set.
 * A malformed URL is logged and its backend skipped. With no backend, the
 * returned store is never available.
 */
std::unique_ptr<FailoverStore>
MakeRemoteStore(const ShieldConfig &config, const Clock &clock);
