#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tf::preview::image {

void compress_to_jpeg(const uint8_t* rgb_data, int width, int height, std::vector<uint8_t>& out_buf, int quality = 85);

// Decodes, downsizes so the longest side is at most max_side, and re-encodes as JPEG.
// Images already within bounds are re-encoded at their own size.
std::vector<uint8_t> thumbnail_from_file(const std::string& path, unsigned int max_side, int quality);

std::vector<uint8_t> thumbnail_from_buffer(const uint8_t* data, size_t size, unsigned int max_side, int quality);

// Names whose extension stb_image can decode
bool is_decodable_name(std::string_view name);

}
