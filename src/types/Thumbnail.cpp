#include "types/Thumbnail.hpp"

#include <stdexcept>

namespace tf::types {

std::string to_string(const Category c) {
    return c == Category::Folder ? "folder" : "file";
}

Category categoryFromString(const std::string_view s) {
    if (s == "file") return Category::File;
    if (s == "folder") return Category::Folder;
    throw std::invalid_argument("Invalid thumbnail category: " + std::string(s));
}

Category categoryForKey(const std::string_view key) {
    if (key.find("::") != std::string_view::npos) return Category::File;
    if (key.find('.') != std::string_view::npos) return Category::File;
    return Category::Folder;
}

int32_t fingerprint(const std::string_view key, const int64_t size) {
    constexpr uint32_t FNV_OFFSET = 2166136261u;
    constexpr uint32_t FNV_PRIME = 16777619u;

    uint32_t h = FNV_OFFSET;
    const auto mix = [&h](const std::string_view s) {
        for (const unsigned char c : s) {
            h ^= c;
            h *= FNV_PRIME;
        }
    };

    mix(key);
    mix(std::to_string(size));
    return static_cast<int32_t>(h);
}

}
