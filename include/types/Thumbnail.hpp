#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tf::types {

using Bytes = std::vector<uint8_t>;

enum class Category { File, Folder };

std::string to_string(Category c);
Category categoryFromString(std::string_view s);

// Keys without "::" and without any '.' are stored as folders
Category categoryForKey(std::string_view key);

struct ThumbRecord {
    std::string key;
    Bytes bytes;
    int64_t size = 0;    // source size in bytes, 0 when unknown
    int32_t ghash = 0;   // fingerprint of key + size
    Category category = Category::File;
};

struct FailedRecord {
    std::string key;
    std::string reason;
    int retry_count = 0;
    int64_t last_attempt = 0;
    std::string error_message;
};

// FNV-1a 32-bit over the key bytes followed by the decimal size
int32_t fingerprint(std::string_view key, int64_t size);

}
