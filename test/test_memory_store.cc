#include <chrono>
#include <cmath>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "hyperloglog.hh"
#include "manual_clock.hh"
#include "memory_store.hh"

namespace {

using namespace std::chrono;

struct MemoryStoreTest : public ::testing::Test
{
    ManualClock clock;
    MemoryStore store{clock};
};

TEST_F(MemoryStoreTest, GetSetDel)
{
    auto missing = store.Get("k");
    ASSERT_TRUE(missing);
    EXPECT_FALSE(*missing);

    ASSERT_TRUE(store.SetWithTtl("k", "v", seconds(10)));
    auto found = store.Get("k");
    ASSERT_TRUE(found);
    ASSERT_TRUE(*found);
    EXPECT_EQ("v", **found);

    EXPECT_EQ(1, *store.Del("k"));
    EXPECT_EQ(0, *store.Del("k"));
    EXPECT_FALSE(*store.Get("k"));
}

TEST_F(MemoryStoreTest, KeysExpire)
{
    store.SetWithTtl("k", "v", seconds(10));
    clock.Advance(milliseconds(9999));
    EXPECT_TRUE(*store.Get("k"));
    clock.Advance(milliseconds(1));
    EXPECT_FALSE(*store.Get("k"));
    EXPECT_EQ(0, *store.DbSize());
}

TEST_F(MemoryStoreTest, Counters)
{
    EXPECT_EQ(1, *store.Incr("n"));
    EXPECT_EQ(2, *store.Incr("n"));
    EXPECT_EQ(12, *store.IncrBy("n", 10));
    EXPECT_EQ("12", **store.Get("n"));
}

TEST_F(MemoryStoreTest, ExpireSetsTtlOnExistingKeysOnly)
{
    EXPECT_FALSE(*store.Expire("missing", seconds(5)));

    store.Incr("n");
    EXPECT_TRUE(*store.PExpire("n", milliseconds(1500)));
    clock.Advance(milliseconds(1499));
    EXPECT_EQ("1", **store.Get("n"));
    clock.Advance(milliseconds(1));
    EXPECT_FALSE(*store.Get("n"));
}

TEST_F(MemoryStoreTest, ExpireAtUsesAbsoluteTime)
{
    store.Incr("n");
    auto deadline = ToEpochMs(clock.Now()) / 1000 + 60;
    EXPECT_TRUE(*store.ExpireAt("n", deadline));
    clock.Advance(seconds(59));
    EXPECT_TRUE(*store.Get("n"));
    clock.Advance(seconds(1));
    EXPECT_FALSE(*store.Get("n"));

    store.Incr("past");
    EXPECT_TRUE(*store.ExpireAt("past", deadline - 3600));
    EXPECT_FALSE(*store.Get("past"));
}

TEST_F(MemoryStoreTest, SortedSetRangesAndRemoval)
{
    EXPECT_EQ(1, *store.ZAdd("z", 30, "c"));
    EXPECT_EQ(1, *store.ZAdd("z", 10, "a"));
    EXPECT_EQ(1, *store.ZAdd("z", 20, "b"));
    EXPECT_EQ(0, *store.ZAdd("z", 25, "b"));
    EXPECT_EQ(3, *store.ZCard("z"));

    auto all = *store.ZRangeWithScores("z", 0, -1);
    ASSERT_EQ(3u, all.size());
    EXPECT_EQ("a", all[0].first);
    EXPECT_EQ(10, all[0].second);
    EXPECT_EQ("b", all[1].first);
    EXPECT_EQ(25, all[1].second);

    auto first = *store.ZRangeWithScores("z", 0, 0);
    ASSERT_EQ(1u, first.size());
    EXPECT_EQ("a", first[0].first);

    auto top = *store.ZRevRangeWithScores("z", 0, 1);
    ASSERT_EQ(2u, top.size());
    EXPECT_EQ("c", top[0].first);
    EXPECT_EQ("b", top[1].first);

    // Both bounds are inclusive.
    EXPECT_EQ(2, *store.ZRemRangeByScore("z", 0, 25));
    EXPECT_EQ(1, *store.ZCard("z"));
}

TEST_F(MemoryStoreTest, ExclusiveAndInfiniteBounds)
{
    store.ZAdd("z", 1, "a");
    store.ZAdd("z", 2, "b");
    store.ZAdd("z", 3, "c");

    auto removed = store.Pipeline({{"ZREMRANGEBYSCORE", "z", "(1", "+inf"}});
    ASSERT_TRUE(removed);
    EXPECT_EQ(2, (*removed)[0].AsInteger());
    EXPECT_EQ(1, *store.ZCard("z"));

    removed = store.Pipeline({{"ZREMRANGEBYSCORE", "z", "-inf", "(1"}});
    EXPECT_EQ(0, (*removed)[0].AsInteger());
}

TEST_F(MemoryStoreTest, EmptySortedSetsDisappear)
{
    store.ZAdd("z", 1, "a");
    store.ZRemRangeByScore("z", 0, 10);
    EXPECT_EQ(0, *store.DbSize());
    EXPECT_TRUE(store.ZRangeWithScores("z", 0, -1)->empty());
}

TEST_F(MemoryStoreTest, ZIncrByAccumulates)
{
    EXPECT_EQ(1, *store.ZIncrBy("rank", 1, "/news"));
    EXPECT_EQ(2, *store.ZIncrBy("rank", 1, "/news"));
    EXPECT_EQ(5, *store.ZIncrBy("rank", 5, "/prices"));
    auto top = *store.ZRevRangeWithScores("rank", 0, 0);
    ASSERT_EQ(1u, top.size());
    EXPECT_EQ("/prices", top[0].first);
}

TEST_F(MemoryStoreTest, PfCountIsCloseForSmallSets)
{
    EXPECT_EQ(0, *store.PfCount("hll"));
    EXPECT_TRUE(*store.PfAdd("hll", "alice"));
    EXPECT_FALSE(*store.PfAdd("hll", "alice"));
    for (int i = 0; i < 99; ++i)
        store.PfAdd("hll", "user-" + std::to_string(i));
    EXPECT_NEAR(100, *store.PfCount("hll"), 2);
}

TEST_F(MemoryStoreTest, WrongTypeFailsTheBatch)
{
    store.Incr("n");
    EXPECT_FALSE(store.ZAdd("n", 1, "a"));
    EXPECT_FALSE(store.Pipeline({{"INCR", "m"}, {"ZCARD", "n"}}));
    EXPECT_FALSE(store.Pipeline({{"NOSUCHCOMMAND", "n"}}));
}

TEST_F(MemoryStoreTest, PipelineRepliesInOrder)
{
    auto replies = store.Pipeline({
        {"INCR", "a"},
        {"INCRBY", "a", "4"},
        {"GET", "a"},
        {"GET", "missing"},
        {"PING"}
    });
    ASSERT_TRUE(replies);
    ASSERT_EQ(5u, replies->size());
    EXPECT_EQ(1, (*replies)[0].AsInteger());
    EXPECT_EQ(5, (*replies)[1].AsInteger());
    EXPECT_EQ("5", (*replies)[2].value);
    EXPECT_TRUE((*replies)[3].nil);
    EXPECT_EQ("PONG", (*replies)[4].value);
    EXPECT_EQ(1u, store.RoundTrips());
}

TEST_F(MemoryStoreTest, OfflineStoreFailsEveryOperation)
{
    store.Incr("n");
    store.SetOnline(false);
    EXPECT_FALSE(store.Available());
    EXPECT_FALSE(store.Healthy());
    EXPECT_FALSE(store.Get("n"));
    EXPECT_FALSE(store.Incr("n"));
    EXPECT_FALSE(store.DbSize());
    EXPECT_FALSE(store.Ping());

    store.SetOnline(true);
    EXPECT_TRUE(store.Healthy());
    EXPECT_EQ(2, *store.Incr("n"));
}

TEST_F(MemoryStoreTest, ScanMatchesGlobsAndSkipsExpiredKeys)
{
    store.SetWithTtl("market:price:btc", "67000", seconds(30));
    store.SetWithTtl("market:price:eth", "3500", seconds(5));
    store.SetWithTtl("market:chart:btc", "[]", seconds(30));
    clock.Advance(seconds(5));

    auto page = store.Scan("0", "market:price:*", 100);
    ASSERT_TRUE(page);
    EXPECT_EQ("0", page->cursor);
    ASSERT_EQ(1u, page->keys.size());
    EXPECT_EQ("market:price:btc", page->keys[0]);

    page = store.Scan("0", "market:*:btc", 100);
    ASSERT_TRUE(page);
    EXPECT_EQ(2u, page->keys.size());
}

TEST_F(MemoryStoreTest, DelPatternRemovesEveryMatchingKey)
{
    store.SetWithTtl("search:bitcoin", "[]", seconds(30));
    store.SetWithTtl("search:bitcoin:p2", "[]", seconds(30));
    store.Incr("search:count");
    store.SetWithTtl("news:feed", "[]", seconds(30));

    EXPECT_EQ(3, *store.DelPattern("search:*"));
    EXPECT_EQ(1, *store.DbSize());
    EXPECT_EQ(0, *store.DelPattern("search:*"));
    EXPECT_TRUE(*store.Get("news:feed"));

    store.SetOnline(false);
    EXPECT_FALSE(store.DelPattern("*"));
}

TEST(HyperLogLog, EstimatesLargeCardinalities)
{
    HyperLogLog hll;
    for (int i = 0; i < 10000; ++i)
        hll.Add("10.0." + std::to_string(i / 256) + "." + std::to_string(i % 256));
    // Duplicates leave the estimate unchanged.
    for (int i = 0; i < 1000; ++i)
        hll.Add("10.0." + std::to_string(i / 256) + "." + std::to_string(i % 256));
    EXPECT_NEAR(10000.0, static_cast<double>(hll.Count()), 300.0);
}

TEST(HyperLogLog, MergeIsUnion)
{
    HyperLogLog a, b;
    for (int i = 0; i < 500; ++i)
        a.Add("key-" + std::to_string(i));
    for (int i = 250; i < 750; ++i)
        b.Add("key-" + std::to_string(i));
    a.Merge(b);
    EXPECT_NEAR(750.0, static_cast<double>(a.Count()), 25.0);
}

TEST(HyperLogLog, MurmurHashIsStable)
{
    const std::string key = "shield";
    EXPECT_EQ(MurmurHash64A(key.data(), key.size(), 0),
              MurmurHash64A(key.data(), key.size(), 0));
    EXPECT_NE(MurmurHash64A(key.data(), key.size(), 0),
              MurmurHash64A(key.data(), key.size(), 1));
}

} // namespace
