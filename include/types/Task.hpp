#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace tf::types {

enum class FileType { Image, Archive, Video, Folder, Other };

enum class Lane : uint8_t { Visible = 0, Prefetch = 1, Background = 2 };

constexpr std::array<Lane, 3> ALL_LANES{Lane::Visible, Lane::Prefetch, Lane::Background};

constexpr size_t laneIndex(const Lane l) { return static_cast<size_t>(l); }

struct GenerateTask {
    std::string path;
    std::string directory;
    FileType file_type = FileType::Other;
    Lane lane = Lane::Visible;
    size_t center_distance = 0;
    size_t original_index = 0;
    std::string dedup_key;
    uint64_t dedup_request_id = 0;
    uint64_t request_epoch = 0;
};

// Classifies a request path. A trailing separator, an on-disk directory or an
// extension-less name is a folder; `archive.ext::inner` is an archive entry.
FileType detectFileType(std::string_view path);

// Store lookups try the folder category first when this holds
bool isLikelyFolder(std::string_view path);

// Stages a task of this type must pass through before emitting
struct StageNeeds {
    bool decode = false;
    bool scale = false;
    bool encode = false;
};

StageNeeds stageNeedsFor(FileType type);

std::string to_string(FileType type);
std::string to_string(Lane lane);
Lane laneFromString(std::string_view s);

}
