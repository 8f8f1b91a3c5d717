#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tf::preview::archive {

struct EntryRef {
    std::string archive;  // on-disk archive path
    std::string entry;    // empty when the key names the archive itself
};

// "book.zip::pages/01.png" -> {"book.zip", "pages/01.png"}
EntryRef split_key(const std::string& key);

// Image entries (decodable by stb) in name order
std::vector<std::string> list_image_entries(const std::string& archivePath);

std::vector<uint8_t> read_entry(const std::string& archivePath, const std::string& entryName);

// Bytes of the named entry, or of the first image entry when ref.entry is empty
std::vector<uint8_t> read_cover(const EntryRef& ref);

}
