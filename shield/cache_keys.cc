#include <cctype>
#include <map>
#include <string>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include "cache_keys.hh"

namespace {
constexpr size_t kMaxQueryLength = 50;
}

std::string
GenerateCacheKey(
    const std::string &prefix,
    const std::map<std::string, std::string> &params)
{
    std::string joined;
    for (const auto &param : params) {
        if (param.second.empty())
            continue;
        if (not joined.empty())
            joined += '&';
        joined += param.first + '=' + param.second;
    }
    return prefix + ':' + (joined.empty() ? "default" : joined);
}

std::string
MarketPriceKey(const std::string &coinId)
{
    return "market:price:" + coinId;
}

std::string
MarketHistoryKey(const std::string &coinId, unsigned days)
{
    return "market:history:" + coinId + ':' + std::to_string(days) + 'd';
}

std::string
NewsFeedKey(
    const std::string &source,
    const std::string &category,
    unsigned page,
    unsigned limit)
{
    std::string key = "news";
    if (not source.empty())
        key += ":s:" + source;
    if (not category.empty())
        key += ":c:" + category;
    if (page)
        key += ":p:" + std::to_string(page);
    if (limit)
        key += ":l:" + std::to_string(limit);
    return key;
}

/**
 * Normalizes a search query into a key: lower case, trimmed, runs of
 * whitespace collapsed into one dash, at most 50 characters.
 */
std::string
SearchKey(const std::string &query, unsigned page)
{
    auto trimmed = boost::algorithm::to_lower_copy(
        boost::algorithm::trim_copy(query));
    std::string normalized;
    bool inSpace = false;
    for (char c : trimmed) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            inSpace = true;
            continue;
        }
        if (inSpace)
            normalized += '-';
        inSpace = false;
        normalized += c;
    }
    if (normalized.size() > kMaxQueryLength)
        normalized.resize(kMaxQueryLength);

    auto key = "search:" + normalized;
    if (page)
        key += ":p" + std::to_string(page);
    return key;
}
