#include <gtest/gtest.h>
#include "thumb/SaveQueue.hpp"
#include "thumb/Context.hpp"
#include "thumb/StoreLoader.hpp"
#include "config/Config.hpp"
#include "fakes.hpp"

using namespace tf::thumb;
using namespace tf::types;
using namespace std::chrono_literals;
using tf::test::InMemoryStore;
using tf::test::bytesFor;

namespace {
ThumbRecord rec(const std::string& key, const Category c = Category::File) {
    return {key, bytesFor(key), 10, fingerprint(key, 10), c};
}
}

TEST(SaveQueueTest, LatestWriteWins) {
    SaveQueue q;
    q.insert("a.jpg", Bytes{1}, 1, 0);
    q.insert("a.jpg", Bytes{2, 2}, 2, 0);
    EXPECT_EQ(q.size(), 1u);
    EXPECT_EQ(q.peek("a.jpg")->size(), 2u);
}

TEST(SaveQueueTest, SuccessSupersedesQueuedFailure) {
    SaveQueue q;
    q.insertFailure("a.jpg", "generation_failed", "boom");
    q.insert(rec("a.jpg"));
    const auto d = q.drain();
    EXPECT_EQ(d.records.size(), 1u);
    EXPECT_TRUE(d.failures.empty());
}

TEST(SaveQueueTest, DrainEmptiesQueue) {
    SaveQueue q;
    q.insert(rec("a"));
    q.insert(rec("b"));
    q.insertFailure("c", "generation_failed", "x");

    const auto d = q.drain();
    EXPECT_EQ(d.size(), 3u);
    EXPECT_TRUE(q.empty());
    EXPECT_FALSE(q.contains("c"));
}

TEST(SaveQueueTest, DrainedRecordsReadableUntilWritten) {
    SaveQueue q;
    q.insert(rec("a"));
    q.insert(rec("b"));

    const auto d = q.drain();
    EXPECT_TRUE(q.empty());
    EXPECT_TRUE(q.contains("a"));
    EXPECT_EQ(q.peek("a"), bytesFor("a"));

    EXPECT_TRUE(q.erase("b"));
    EXPECT_FALSE(q.peek("b"));

    q.finishWrite();
    EXPECT_FALSE(q.contains("a"));
    EXPECT_FALSE(q.peek("a"));
}

TEST(SaveQueueTest, ShouldFlushOnThresholdOrInterval) {
    SaveQueue q;
    const auto now = std::chrono::steady_clock::now();
    EXPECT_FALSE(q.shouldFlush(now - 10s, 1000ms, 50));

    q.insert(rec("a"));
    EXPECT_FALSE(q.shouldFlush(now, 1000ms, 50));
    EXPECT_TRUE(q.shouldFlush(now - 2s, 1000ms, 50));
    EXPECT_TRUE(q.shouldFlush(now, 1000ms, 1));
}

TEST(SaveQueueTest, EraseIfPrefixDropsRecordsAndFailures) {
    SaveQueue q;
    q.insert(rec("/x/a"));
    q.insertFailure("/x/b", "r", "m");
    q.insert(rec("/y/c"));
    EXPECT_EQ(q.eraseIfPrefix("/x/"), 2u);
    EXPECT_EQ(q.size(), 1u);
}

TEST(SaveQueueTest, FlushWritesInChunks) {
    SaveQueue q;
    for (int i = 0; i < 10; ++i) q.insert(rec("k" + std::to_string(i)));
    q.insertFailure("broken", "generation_failed", "bad header");

    InMemoryStore store;
    std::vector<size_t> chunks;
    const auto written = SaveQueue::flushTo(store, q.drain(), 4,
                                            [&](const size_t n, std::chrono::microseconds) { chunks.push_back(n); });

    EXPECT_EQ(written, 10u);
    EXPECT_EQ(chunks, (std::vector<size_t>{4, 4, 2}));
    EXPECT_EQ(store.count(), 10u);
    EXPECT_TRUE(store.isFailed("broken"));
}

TEST(SaveQueueTest, FailedBatchFallsBackToSingleSaves) {
    SaveQueue q;
    for (int i = 0; i < 3; ++i) q.insert(rec("k" + std::to_string(i)));

    InMemoryStore store;
    store.failNextBatch();
    EXPECT_EQ(SaveQueue::flushTo(store, q.drain(), 8), 3u);
    EXPECT_EQ(store.count(), 3u);
}

TEST(SaveFlusherTest, FlushNowPersistsEverything) {
    SaveQueue q;
    InMemoryStore store;
    tf::config::DatabaseConfig cfg;
    SaveFlusher flusher(q, store, cfg);

    q.insert(rec("a"));
    q.insert(rec("folder", Category::Folder));
    EXPECT_EQ(flusher.flushNow(), 2u);
    EXPECT_TRUE(q.empty());
    EXPECT_FALSE(q.contains("a"));
    ASSERT_TRUE(store.record("folder"));
    EXPECT_EQ(store.record("folder")->category, Category::Folder);
}

TEST(SaveFlusherTest, BackgroundFlushHonoursThreshold) {
    SaveQueue q;
    InMemoryStore store;
    tf::config::DatabaseConfig cfg;
    cfg.save_delay_ms = 60000;
    cfg.batch_save_threshold = 3;

    SaveFlusher flusher(q, store, cfg);
    flusher.start();
    for (int i = 0; i < 3; ++i) q.insert(rec("k" + std::to_string(i)));

    EXPECT_TRUE(tf::test::waitFor([&] { return store.count() == 3; }));
    flusher.stop();
}

TEST(SaveFlusherTest, WriteWindowStaysWithinBounds) {
    SaveQueue q;
    InMemoryStore store;
    tf::config::DatabaseConfig cfg;
    SaveFlusher flusher(q, store, cfg);

    for (int round = 0; round < 20; ++round) {
        for (size_t i = 0; i < cfg.write_batch_max; ++i) q.insert(rec(std::to_string(round) + "_" + std::to_string(i)));
        flusher.flushNow();
    }
    EXPECT_GE(flusher.writeWindow(), cfg.write_batch_min);
    EXPECT_LE(flusher.writeWindow(), cfg.write_batch_max);
}

TEST(StoreLoaderTest, IndexHitDuringFlushIsServedFromQueue) {
    InMemoryStore store;
    tf::test::FakeDecoder decoder;
    tf::test::CollectingSink sink;
    Context ctx(tf::config::ThumbnailConfig{}, store, decoder, sink);
    StoreLoader loader(ctx);

    // drained by the flusher but not yet in the store
    ctx.saveQueue.insert(rec("/d/a.jpg"));
    ctx.index.present.insert("/d/a.jpg");
    ctx.saveQueue.drain();
    ASSERT_FALSE(store.has("/d/a.jpg"));

    EXPECT_EQ(loader.load({"/d/a.jpg"}, ctx.epoch.load()), 1u);
    EXPECT_TRUE(ctx.index.present.contains("/d/a.jpg"));
    EXPECT_TRUE(ctx.cache.contains("/d/a.jpg"));
    EXPECT_TRUE(sink.saw("/d/a.jpg"));
}

TEST(StoreLoaderTest, MissingEverywhereDropsStaleIndexEntry) {
    InMemoryStore store;
    tf::test::FakeDecoder decoder;
    tf::test::CollectingSink sink;
    Context ctx(tf::config::ThumbnailConfig{}, store, decoder, sink);
    StoreLoader loader(ctx);

    ctx.index.present.insert("/d/gone.jpg");
    EXPECT_EQ(loader.load({"/d/gone.jpg"}, ctx.epoch.load()), 0u);
    EXPECT_FALSE(ctx.index.present.contains("/d/gone.jpg"));
}
