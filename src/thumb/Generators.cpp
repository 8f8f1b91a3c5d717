#include "thumb/Generators.hpp"
#include "thumb/Context.hpp"
#include "thumb/Decoder.hpp"
#include "thumb/Store.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <stdexcept>

using namespace tf::thumb;
using namespace tf::types;
namespace fs = std::filesystem;

namespace {

int64_t sourceSize(const std::string& path) {
    std::error_code ec;
    const auto sz = fs::file_size(fs::path(path), ec);
    return ec ? 0 : static_cast<int64_t>(sz);
}

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string trimSeparators(std::string p) {
    while (p.size() > 1 && (p.back() == '/' || p.back() == '\\')) p.pop_back();
    return p;
}

std::vector<fs::directory_entry> sortedEntries(const std::string& dir) {
    std::vector<fs::directory_entry> out;
    std::error_code ec;
    fs::directory_iterator it(fs::path(dir), fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        tf::log::Registry::thumb()->debug("[Generators] Cannot read directory {}: {}", dir, ec.message());
        return out;
    }
    for (const auto end = fs::directory_iterator(); it != end; it.increment(ec)) {
        if (ec) break;
        out.push_back(*it);
    }
    std::ranges::sort(out, {}, [](const fs::directory_entry& e) { return e.path().filename().string(); });
    return out;
}

constexpr std::array COVER_NAMES{"cover", "folder", "thumb"};
constexpr std::array COVER_EXTS{".jpg", ".jpeg", ".png", ".gif", ".webp", ".bmp", ".avif", ".jxl"};

}

Generators::Generators(Context& ctx) : ctx_(ctx) {}

GenerateResult Generators::generate(const GenerateTask& task) {
    switch (task.file_type) {
        case FileType::Folder: return folder(task.path);
        case FileType::Archive: return archive(task.path);
        case FileType::Video: return video(task.path);
        case FileType::Image:
        case FileType::Other: return file(task.path);
    }
    throw std::logic_error("Unhandled file type");
}

GenerateResult Generators::file(const std::string& path) {
    auto bytes = ctx_.decoder.generateFileThumbnail(path);
    if (bytes.empty()) throw std::runtime_error("Decoder produced an empty thumbnail");

    const auto size = sourceSize(path);
    ThumbRecord rec{path, bytes, size, fingerprint(path, size), Category::File};
    return {std::move(bytes), std::move(rec)};
}

GenerateResult Generators::archive(const std::string& path) {
    const auto sep = path.find("::");
    const auto archivePath = sep == std::string::npos ? path : path.substr(0, sep);

    std::error_code ec;
    const auto size = fs::file_size(fs::path(archivePath), ec);
    if (ec) throw std::runtime_error("Cannot stat archive " + archivePath + ": " + ec.message());

    auto bytes = ctx_.decoder.generateArchiveThumbnail(path);
    if (bytes.empty()) throw std::runtime_error("Decoder produced an empty thumbnail");

    const auto sz = static_cast<int64_t>(size);
    ThumbRecord rec{path, bytes, sz, fingerprint(path, sz), Category::File};
    return {std::move(bytes), std::move(rec)};
}

GenerateResult Generators::video(const std::string& path) {
    auto bytes = ctx_.decoder.generateVideoThumbnail(path);
    if (bytes.empty()) throw std::runtime_error("Decoder produced an empty thumbnail");

    const auto size = sourceSize(path);
    ThumbRecord rec{path, bytes, size, fingerprint(path, size), Category::File};
    return {std::move(bytes), std::move(rec)};
}

GenerateResult Generators::folder(const std::string& path) {
    if (auto existing = ctx_.store.load(path, Category::Folder)) return {std::move(*existing), std::nullopt};

    const auto dir = trimSeparators(path);

    if (auto child = ctx_.store.findEarliestChild(dir)) {
        log::Registry::thumb()->debug("[Generators] Binding folder {} to child thumbnail {}", path, child->key);
        bindFolder_(path, child->bytes);
        return {std::move(child->bytes), std::nullopt};
    }

    {
        std::error_code ec;
        size_t count = 0;
        fs::directory_iterator it(fs::path(dir), fs::directory_options::skip_permission_denied, ec);
        for (const auto end = fs::directory_iterator(); !ec && it != end && count <= LARGE_FOLDER_ENTRIES; it.increment(ec))
            ++count;
        if (count > LARGE_FOLDER_ENTRIES)
            throw std::runtime_error("Folder has more than " + std::to_string(LARGE_FOLDER_ENTRIES) + " entries, skipped");
    }

    if (const auto cover = findCoverImage(dir)) {
        try {
            auto bytes = ctx_.decoder.generateFileThumbnail(*cover);
            if (!bytes.empty()) {
                bindFolder_(path, bytes);
                return {std::move(bytes), std::nullopt};
            }
        } catch (const std::exception& e) {
            log::Registry::thumb()->debug("[Generators] Cover image {} unusable: {}", *cover, e.what());
        }
    }

    for (const auto& candidate : findCandidates(dir, ctx_.cfg.thumbnails.folder_search_depth, FOLDER_CANDIDATES)) {
        try {
            Bytes bytes;
            switch (detectFileType(candidate)) {
                case FileType::Archive: bytes = ctx_.decoder.generateArchiveThumbnail(candidate); break;
                case FileType::Video: bytes = ctx_.decoder.generateVideoThumbnail(candidate); break;
                default: bytes = ctx_.decoder.generateFileThumbnail(candidate); break;
            }
            if (bytes.empty()) continue;
            bindFolder_(path, bytes);
            return {std::move(bytes), std::nullopt};
        } catch (const std::exception& e) {
            log::Registry::thumb()->debug("[Generators] Skipping folder candidate {}: {}", candidate, e.what());
        }
    }

    throw std::runtime_error("No usable image found in folder " + path);
}

void Generators::bindFolder_(const std::string& path, const Bytes& bytes) {
    try {
        ctx_.store.save(ThumbRecord{path, bytes, 0, 0, Category::Folder});
    } catch (const std::exception& e) {
        log::Registry::db()->warn("[Generators] Failed to persist folder thumbnail {}: {}", path, e.what());
    }
}

std::optional<std::string> Generators::findCoverImage(const std::string& dir) {
    for (const auto& entry : sortedEntries(dir)) {
        std::error_code ec;
        if (!entry.is_regular_file(ec)) continue;

        const auto name = lower(entry.path().filename().string());
        const auto ext = lower(entry.path().extension().string());

        const bool named = std::ranges::any_of(COVER_NAMES, [&](const char* n) { return name.starts_with(n); });
        const bool image = std::ranges::find(COVER_EXTS, ext) != COVER_EXTS.end();
        if (named && image) return entry.path().string();
    }
    return std::nullopt;
}

std::vector<std::string> Generators::findCandidates(const std::string& dir, const unsigned int depth, const size_t maxCount) {
    std::vector<std::string> results;

    const auto walk = [&](const auto& self, const std::string& d, const unsigned int remaining) -> void {
        if (remaining == 0 || results.size() >= maxCount) return;

        for (const auto& entry : sortedEntries(d)) {
            if (results.size() >= maxCount) break;

            std::error_code ec;
            if (entry.is_regular_file(ec)) {
                const auto p = entry.path().string();
                const auto t = detectFileType(p);
                if (t == FileType::Image || t == FileType::Archive || t == FileType::Video) results.push_back(p);
            } else if (entry.is_directory(ec)) {
                self(self, entry.path().string(), remaining - 1);
            }
        }
    };

    walk(walk, dir, depth);
    return results;
}
