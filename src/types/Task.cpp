#include "types/Task.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <unordered_set>

namespace tf::types {

namespace {

const std::unordered_set<std::string> ARCHIVE_EXTS{"zip", "cbz", "rar", "cbr", "7z", "cb7"};

const std::unordered_set<std::string> VIDEO_EXTS{
    "mp4", "mkv", "avi", "mov", "webm", "wmv", "flv", "m4v", "mpg", "mpeg", "3gp", "ts"
};

const std::unordered_set<std::string> IMAGE_EXTS{
    "jpg", "jpeg", "png", "gif", "webp", "bmp", "avif", "jxl",
    "heic", "heif", "tiff", "tif", "svg", "ico"
};

std::string lowerExtension(std::string_view name) {
    const auto slash = name.find_last_of("/\\");
    if (slash != std::string_view::npos) name.remove_prefix(slash + 1);
    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot + 1 >= name.size()) return {};
    std::string ext(name.substr(dot + 1));
    std::ranges::transform(ext, ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext;
}

}

FileType detectFileType(std::string_view path) {
    if (path.empty()) return FileType::Other;
    if (path.back() == '/' || path.back() == '\\') return FileType::Folder;

    if (const auto sep = path.find("::"); sep != std::string_view::npos) {
        if (ARCHIVE_EXTS.contains(lowerExtension(path.substr(0, sep)))) return FileType::Archive;
    }

    const auto ext = lowerExtension(path);
    if (ARCHIVE_EXTS.contains(ext)) return FileType::Archive;
    if (VIDEO_EXTS.contains(ext)) return FileType::Video;
    if (IMAGE_EXTS.contains(ext)) return FileType::Image;

    std::error_code ec;
    if (std::filesystem::is_directory(std::filesystem::path(path), ec)) return FileType::Folder;

    if (ext.empty()) return FileType::Folder;

    // "Vol. 1 (2020)" style names are directories, not extensions
    if (ext.size() > 5 || ext.find_first_of(" ()") != std::string::npos) return FileType::Folder;

    return FileType::Other;
}

bool isLikelyFolder(std::string_view path) {
    if (path.empty()) return false;
    if (path.back() == '/' || path.back() == '\\') return true;
    if (path.find("::") != std::string_view::npos) return false;
    const auto ext = lowerExtension(path);
    if (ext.empty()) return true;
    return ext.size() > 5 || ext.find_first_of(" ()") != std::string::npos;
}

StageNeeds stageNeedsFor(const FileType type) {
    switch (type) {
        case FileType::Image:
        case FileType::Other: return {false, true, true};
        case FileType::Archive:
        case FileType::Video: return {true, true, true};
        case FileType::Folder: return {true, false, false};
    }
    return {};
}

std::string to_string(const FileType type) {
    switch (type) {
        case FileType::Image: return "image";
        case FileType::Archive: return "archive";
        case FileType::Video: return "video";
        case FileType::Folder: return "folder";
        case FileType::Other: return "other";
    }
    return "unknown";
}

std::string to_string(const Lane lane) {
    switch (lane) {
        case Lane::Visible: return "visible";
        case Lane::Prefetch: return "prefetch";
        case Lane::Background: return "background";
    }
    return "unknown";
}

Lane laneFromString(const std::string_view s) {
    if (s == "visible") return Lane::Visible;
    if (s == "prefetch") return Lane::Prefetch;
    if (s == "background") return Lane::Background;
    throw std::invalid_argument("Invalid lane: " + std::string(s));
}

}
