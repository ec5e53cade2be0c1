#pragma once

#include <chrono>
#include <map>
#include <string>

// TTLs by data-volatility class.
namespace CacheTtl {
constexpr std::chrono::seconds kMarketPrice{30};
constexpr std::chrono::seconds kMarketHistory{300};
constexpr std::chrono::seconds kNewsFeed{300};
constexpr std::chrono::seconds kTrending{300};
constexpr std::chrono::seconds kBreaking{60};
constexpr std::chrono::seconds kSearch{600};
constexpr std::chrono::seconds kArticle{3600};
constexpr std::chrono::seconds kSources{3600};
constexpr std::chrono::seconds kUserData{300};
constexpr std::chrono::seconds kAiResponse{86400};
} // namespace CacheTtl

/**
 * Builds a key from a prefix and request parameters, e.g.
 * "coins:limit=10&page=2". Parameters are sorted by name and empty values are
 * left out, so equivalent requests share a key.
 */
std::string
GenerateCacheKey(
    const std::string &prefix,
    const std::map<std::string, std::string> &params);

std::string
MarketPriceKey(const std::string &coinId);

std::string
MarketHistoryKey(const std::string &coinId, unsigned days);

std::string
NewsFeedKey(
    const std::string &source,
    const std::string &category,
    unsigned page,
    unsigned limit);

std::string
SearchKey(const std::string &query, unsigned page = 0);
