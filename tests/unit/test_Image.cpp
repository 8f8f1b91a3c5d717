#include <gtest/gtest.h>
#include "preview/image.hpp"

#include <string>
#include <vector>

using namespace tf::preview::image;

namespace {

// Binary PPM (P6) filled with one colour
std::vector<uint8_t> ppm(const int width, const int height) {
    const auto header = "P6\n" + std::to_string(width) + " " + std::to_string(height) + "\n255\n";
    std::vector<uint8_t> buf(header.begin(), header.end());
    for (int i = 0; i < width * height; ++i) buf.insert(buf.end(), {200, 120, 40});
    return buf;
}

bool isJpeg(const std::vector<uint8_t>& b) {
    return b.size() > 4 && b[0] == 0xFF && b[1] == 0xD8 && b[b.size() - 2] == 0xFF && b[b.size() - 1] == 0xD9;
}

}

TEST(ImageTest, SmallImageIsReencodedAtItsOwnSize) {
    const auto src = ppm(8, 6);
    const auto out = thumbnail_from_buffer(src.data(), src.size(), 256, 85);
    EXPECT_TRUE(isJpeg(out));
}

TEST(ImageTest, LargeImageIsDownscaled) {
    const auto src = ppm(600, 300);
    const auto out = thumbnail_from_buffer(src.data(), src.size(), 64, 85);
    EXPECT_TRUE(isJpeg(out));

    const auto full = thumbnail_from_buffer(src.data(), src.size(), 0, 85);
    EXPECT_LT(out.size(), full.size());
}

TEST(ImageTest, UndecodableBufferThrows) {
    const std::vector<uint8_t> junk(64, 0x5A);
    EXPECT_THROW(thumbnail_from_buffer(junk.data(), junk.size(), 256, 85), std::runtime_error);
    EXPECT_THROW(thumbnail_from_buffer(junk.data(), 2, 256, 85), std::runtime_error);
}

TEST(ImageTest, MissingFileThrows) {
    EXPECT_THROW(thumbnail_from_file("/nonexistent/thumbforge/none.png", 256, 85), std::runtime_error);
}

TEST(ImageTest, DecodableNamesIgnoreCase) {
    EXPECT_TRUE(is_decodable_name("Cover.JPG"));
    EXPECT_TRUE(is_decodable_name("a/b/page.png"));
    EXPECT_FALSE(is_decodable_name("notes.txt"));
    EXPECT_FALSE(is_decodable_name("README"));
}
