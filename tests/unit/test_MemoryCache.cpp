#include <gtest/gtest.h>
#include "thumb/MemoryCache.hpp"

using namespace tf::thumb;
using tf::types::Bytes;

namespace {
Bytes blob(const size_t n, const uint8_t fill = 0xAB) { return Bytes(n, fill); }
}

TEST(MemoryCacheTest, PutGetAndByteAccounting) {
    MemoryCache c(10);
    c.put("a", blob(100));
    c.put("b", blob(50));

    EXPECT_EQ(c.size(), 2u);
    EXPECT_EQ(c.bytes(), 150u);
    EXPECT_EQ(c.bytes(), c.residentBytes());
    ASSERT_TRUE(c.get("a"));
    EXPECT_EQ(c.get("a")->size(), 100u);
}

TEST(MemoryCacheTest, ReplaceAdjustsBytes) {
    MemoryCache c(10);
    c.put("a", blob(100));
    c.put("a", blob(30));
    EXPECT_EQ(c.size(), 1u);
    EXPECT_EQ(c.bytes(), 30u);
}

TEST(MemoryCacheTest, EvictsLeastRecentlyUsedBeyondCapacity) {
    MemoryCache c(3);
    c.put("a", blob(1));
    c.put("b", blob(1));
    c.put("c", blob(1));
    ASSERT_TRUE(c.get("a")); // a becomes most recent

    EXPECT_EQ(c.put("d", blob(1)), 1u);
    EXPECT_FALSE(c.contains("b"));
    EXPECT_TRUE(c.contains("a"));
    EXPECT_TRUE(c.contains("c"));
    EXPECT_TRUE(c.contains("d"));
    EXPECT_EQ(c.bytes(), 3u);
}

TEST(MemoryCacheTest, PeekDoesNotRefreshRecency) {
    MemoryCache c(2);
    c.put("a", blob(1));
    c.put("b", blob(1));
    ASSERT_TRUE(c.peek("a"));
    c.put("c", blob(1));
    EXPECT_FALSE(c.contains("a"));
}

TEST(MemoryCacheTest, PutIfAbsentKeepsExisting) {
    MemoryCache c(4);
    c.put("a", blob(10, 1));
    EXPECT_FALSE(c.putIfAbsent("a", blob(20, 2)));
    EXPECT_EQ(c.peek("a")->front(), 1);
    EXPECT_TRUE(c.putIfAbsent("b", blob(5)));
    EXPECT_EQ(c.bytes(), 15u);
}

TEST(MemoryCacheTest, RemoveIfByPrefix) {
    MemoryCache c(10);
    c.put("/x/1.jpg", blob(10));
    c.put("/x/2.jpg", blob(10));
    c.put("/y/3.jpg", blob(10));

    EXPECT_EQ(c.removeIf([](const std::string& k) { return k.starts_with("/x/"); }), 2u);
    EXPECT_EQ(c.size(), 1u);
    EXPECT_EQ(c.bytes(), 10u);
}

TEST(MemoryCacheTest, CleanupBelowThresholdDoesNothing) {
    MemoryCache c(100, 85, 12);
    for (int i = 0; i < 8; ++i) c.put("k" + std::to_string(i), blob(100));
    const auto r = c.cleanup(1000); // 800 < 850
    EXPECT_EQ(r.evictedEntries, 0u);
    EXPECT_EQ(c.size(), 8u);
}

TEST(MemoryCacheTest, CleanupDropsOldestAndRespectsBudget) {
    MemoryCache c(100, 85, 12);
    for (int i = 0; i < 20; ++i) c.put("k" + std::to_string(i), blob(100));

    const auto r = c.cleanup(1000);
    EXPECT_GE(r.evictedEntries, 10u);
    EXPECT_LE(c.bytes(), 1000u);
    EXPECT_EQ(c.bytes(), c.residentBytes());
    EXPECT_FALSE(c.contains("k0"));
    EXPECT_TRUE(c.contains("k19"));
}

TEST(MemoryCacheTest, CleanupAtThresholdDropsAFraction) {
    MemoryCache c(100, 50, 25);
    for (int i = 0; i < 8; ++i) c.put("k" + std::to_string(i), blob(100));

    const auto r = c.cleanup(1000); // 800 >= 500, drop 25% of 8
    EXPECT_EQ(r.evictedEntries, 2u);
    EXPECT_EQ(r.evictedBytes, 200u);
    EXPECT_FALSE(c.contains("k0"));
    EXPECT_FALSE(c.contains("k1"));
}

TEST(MemoryCacheTest, ClearResetsBytes) {
    MemoryCache c(10);
    c.put("a", blob(10));
    c.clear();
    EXPECT_EQ(c.size(), 0u);
    EXPECT_EQ(c.bytes(), 0u);
}
