#include <gtest/gtest.h>
#include "types/Task.hpp"
#include "types/Thumbnail.hpp"

using namespace tf::types;

TEST(FileTypeTest, ClassifiesByExtension) {
    EXPECT_EQ(detectFileType("/p/a.jpg"), FileType::Image);
    EXPECT_EQ(detectFileType("/p/A.PNG"), FileType::Image);
    EXPECT_EQ(detectFileType("/p/book.cbz"), FileType::Archive);
    EXPECT_EQ(detectFileType("/p/clip.mkv"), FileType::Video);
    EXPECT_EQ(detectFileType("/p/notes.txt"), FileType::Other);
}

TEST(FileTypeTest, ArchiveEntriesAreArchives) {
    EXPECT_EQ(detectFileType("b.zip::cover.png"), FileType::Archive);
    EXPECT_EQ(detectFileType("/p/b.rar::dir/01.jpg"), FileType::Archive);
}

TEST(FileTypeTest, FolderHeuristics) {
    EXPECT_EQ(detectFileType("c/"), FileType::Folder);
    EXPECT_EQ(detectFileType("c\\"), FileType::Folder);
    EXPECT_EQ(detectFileType("/nonexistent/thumbforge/Vol. 1 (2020)"), FileType::Folder);
    EXPECT_EQ(detectFileType("/nonexistent/thumbforge/plain"), FileType::Folder);
    EXPECT_EQ(detectFileType(""), FileType::Other);
}

TEST(FileTypeTest, LikelyFolder) {
    EXPECT_TRUE(isLikelyFolder("/a/b/"));
    EXPECT_TRUE(isLikelyFolder("/a/b"));
    EXPECT_FALSE(isLikelyFolder("/a/b.jpg"));
    EXPECT_FALSE(isLikelyFolder("/a/b.zip::c"));
}

TEST(FileTypeTest, StageNeeds) {
    const auto image = stageNeedsFor(FileType::Image);
    EXPECT_FALSE(image.decode);
    EXPECT_TRUE(image.scale);
    EXPECT_TRUE(image.encode);

    const auto archive = stageNeedsFor(FileType::Archive);
    EXPECT_TRUE(archive.decode && archive.scale && archive.encode);

    const auto folder = stageNeedsFor(FileType::Folder);
    EXPECT_TRUE(folder.decode);
    EXPECT_FALSE(folder.scale || folder.encode);
}

TEST(FileTypeTest, LaneRoundTripsThroughStrings) {
    for (const auto lane : ALL_LANES) EXPECT_EQ(laneFromString(to_string(lane)), lane);
    EXPECT_THROW(laneFromString("urgent"), std::invalid_argument);
}

TEST(ThumbnailTypesTest, CategoryForKey) {
    EXPECT_EQ(categoryForKey("/books/series"), Category::Folder);
    EXPECT_EQ(categoryForKey("/books/a.jpg"), Category::File);
    EXPECT_EQ(categoryForKey("/books/b::c"), Category::File);
}

TEST(ThumbnailTypesTest, FingerprintIsStableAndSizeSensitive) {
    EXPECT_EQ(fingerprint("a.jpg", 100), fingerprint("a.jpg", 100));
    EXPECT_NE(fingerprint("a.jpg", 100), fingerprint("a.jpg", 101));
    EXPECT_NE(fingerprint("a.jpg", 100), fingerprint("b.jpg", 100));
    // FNV-1a 32-bit of "a" followed by "0"
    EXPECT_EQ(static_cast<uint32_t>(fingerprint("a", 0)), 0x1B24B714u);
}
