#include <gtest/gtest.h>
#include "db/SqliteStore.hpp"
#include "fakes.hpp"

using namespace tf::db;
using namespace tf::types;
using tf::test::TempDir;
using tf::test::bytesFor;

class SqliteStoreTest : public ::testing::Test {
protected:
    TempDir dir;
    std::unique_ptr<SqliteStore> store;

    void SetUp() override { store = std::make_unique<SqliteStore>(dir.path() / "thumbs.db"); }

    static ThumbRecord rec(const std::string& key, const Category c = Category::File, const int64_t size = 42) {
        return {key, bytesFor(key), size, fingerprint(key, size), c};
    }
};

TEST_F(SqliteStoreTest, SaveAndLoadByCategory) {
    store->save(rec("/a/1.jpg"));
    const auto b = store->load("/a/1.jpg", Category::File);
    ASSERT_TRUE(b);
    EXPECT_EQ(*b, bytesFor("/a/1.jpg"));
    EXPECT_FALSE(store->load("/a/1.jpg", Category::Folder));
    EXPECT_FALSE(store->load("/a/missing.jpg", Category::File));
}

TEST_F(SqliteStoreTest, SaveBatchUpsertsAndCounts) {
    store->saveBatch({rec("/a/1.jpg"), rec("/a/2.jpg"), rec("/a", Category::Folder)});
    store->saveBatch({rec("/a/1.jpg", Category::File, 7)});
    EXPECT_EQ(store->count(), 3u);

    const auto files = store->listKeysByCategory(Category::File);
    EXPECT_EQ(files.size(), 2u);
    const auto folders = store->listKeysByCategory(Category::Folder);
    ASSERT_EQ(folders.size(), 1u);
    EXPECT_EQ(folders.front(), "/a");
}

TEST_F(SqliteStoreTest, MarkFailedIncrementsRetryCount) {
    store->markFailed("/bad.jpg", "generation_failed", "truncated");
    store->markFailed("/bad.jpg", "generation_failed", "still truncated");

    const auto f = store->failedRecord("/bad.jpg");
    ASSERT_TRUE(f);
    EXPECT_EQ(f->retry_count, 1);
    EXPECT_EQ(f->error_message, "still truncated");
    EXPECT_EQ(store->failedCount(), 1u);
    EXPECT_EQ(store->listFailedKeys(), std::vector<std::string>{"/bad.jpg"});
}

TEST_F(SqliteStoreTest, SuccessfulSaveClearsFailure) {
    store->markFailed("/x.jpg", "generation_failed", "boom");
    store->save(rec("/x.jpg"));
    EXPECT_EQ(store->failedCount(), 0u);
}

TEST_F(SqliteStoreTest, ClearFailedAndRemove) {
    store->markFailed("/x.jpg", "r", "m");
    store->markFailed("/y.jpg", "r", "m");
    EXPECT_EQ(store->clearFailed(), 2u);

    store->save(rec("/z.jpg"));
    store->remove("/z.jpg");
    EXPECT_EQ(store->count(), 0u);
}

TEST_F(SqliteStoreTest, FindEarliestChildMatchesBothSeparators) {
    store->save(rec("/lib/series/01.jpg"));
    store->save(rec("/lib/series", Category::Folder));
    store->save(rec("/lib/seriesB/01.jpg"));

    const auto child = store->findEarliestChild("/lib/series/");
    ASSERT_TRUE(child);
    EXPECT_EQ(child->key, "/lib/series/01.jpg");

    store->save(rec("C:\\books\\vol1.zip::01.png"));
    const auto win = store->findEarliestChild("C:\\books");
    ASSERT_TRUE(win);
    EXPECT_EQ(win->key, "C:\\books\\vol1.zip::01.png");

    EXPECT_FALSE(store->findEarliestChild("/lib/empty"));
}

TEST_F(SqliteStoreTest, PrefixWildcardsAreLiteral) {
    store->save(rec("/a_b/1.jpg"));
    store->save(rec("/axb/1.jpg"));
    EXPECT_EQ(store->cleanupByPrefix("/a_b/"), 1u);
    EXPECT_EQ(store->count(), 1u);
}

TEST_F(SqliteStoreTest, CleanupExpiredHonoursFolderExclusion) {
    store->save(rec("/f.jpg"));
    store->save(rec("/dir", Category::Folder));
    store->touchBatch({"/f.jpg", "/dir"});

    EXPECT_EQ(store->cleanupExpired(1, true), 0u);
    EXPECT_EQ(store->cleanupExpired(0, true), 0u);
    EXPECT_EQ(store->count(), 2u);
}

TEST_F(SqliteStoreTest, CleanupInvalidPathsDropsMissingSources) {
    const auto real = dir.touch("present.jpg");
    const auto archive = dir.touch("book.zip");
    store->save(rec(real));
    store->save(rec(archive + "::01.png"));
    store->save(rec((dir.path() / "gone.jpg").string()));

    EXPECT_EQ(store->cleanupInvalidPaths(), 1u);
    EXPECT_EQ(store->count(), 2u);
}

TEST_F(SqliteStoreTest, DetailedStats) {
    store->save(rec("/a.jpg"));
    store->save(rec("/dir", Category::Folder));
    store->markFailed("/bad.jpg", "r", "m");

    const auto s = store->detailedStats();
    EXPECT_EQ(s.total, 2u);
    EXPECT_EQ(s.folders, 1u);
    EXPECT_EQ(s.failed, 1u);
    EXPECT_EQ(s.fileBytes, static_cast<int64_t>(bytesFor("/a.jpg").size() + bytesFor("/dir").size()));
    EXPECT_NO_THROW(store->vacuum());
}

TEST_F(SqliteStoreTest, ReopenKeepsData) {
    store->save(rec("/persist.jpg"));
    store.reset();
    store = std::make_unique<SqliteStore>(dir.path() / "thumbs.db");
    EXPECT_TRUE(store->load("/persist.jpg", Category::File));
}

TEST(SqliteStoreOpenTest, UnopenablePathThrows) {
    TempDir dir;
    const auto blocker = dir.touch("file");
    EXPECT_THROW(SqliteStore(std::filesystem::path(blocker) / "sub" / "x.db"), std::exception);
}
