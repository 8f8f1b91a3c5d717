#include <gtest/gtest.h>
#include "thumb/Deduplicator.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace tf::thumb;

TEST(DeduplicatorTest, SecondAcquireFailsWhileReserved) {
    Deduplicator d;
    const auto first = d.tryAcquire("a.jpg");
    ASSERT_TRUE(first.has_value());
    EXPECT_FALSE(d.tryAcquire("a.jpg").has_value());
    EXPECT_TRUE(d.isReserved("a.jpg"));
    EXPECT_EQ(d.size(), 1u);
}

TEST(DeduplicatorTest, ReleaseAllowsReacquire) {
    Deduplicator d;
    const auto id = d.tryAcquire("a.jpg");
    ASSERT_TRUE(id);
    EXPECT_TRUE(d.release("a.jpg", *id));
    EXPECT_FALSE(d.isReserved("a.jpg"));

    const auto again = d.tryAcquire("a.jpg");
    ASSERT_TRUE(again);
    EXPECT_NE(*again, *id);
}

TEST(DeduplicatorTest, StaleIdReleaseIsNoop) {
    Deduplicator d;
    const auto old = d.tryAcquire("a.jpg");
    ASSERT_TRUE(old);
    const auto fresh = d.forceAcquire("a.jpg");

    EXPECT_FALSE(d.release("a.jpg", *old));
    EXPECT_TRUE(d.isReserved("a.jpg"));
    EXPECT_TRUE(d.release("a.jpg", fresh));
    EXPECT_FALSE(d.isReserved("a.jpg"));
}

TEST(DeduplicatorTest, ReleaseOfUnknownPathReturnsFalse) {
    Deduplicator d;
    EXPECT_FALSE(d.release("nothing", 42));
}

TEST(DeduplicatorTest, ConcurrentAcquireGrantsExactlyOne) {
    Deduplicator d;
    std::atomic<int> granted{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i)
        threads.emplace_back([&] {
            if (d.tryAcquire("shared.png")) granted.fetch_add(1);
        });
    for (auto& t : threads) t.join();

    EXPECT_EQ(granted.load(), 1);
    EXPECT_EQ(d.size(), 1u);
}

TEST(DeduplicatorTest, ClearDropsEverything) {
    Deduplicator d;
    ASSERT_TRUE(d.tryAcquire("a"));
    ASSERT_TRUE(d.tryAcquire("b"));
    d.clear();
    EXPECT_EQ(d.size(), 0u);
    EXPECT_TRUE(d.tryAcquire("a"));
}
