#include "preview/archive.hpp"
#include "preview/image.hpp"
#include "log/Registry.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <array>
#include <memory>
#include <stdexcept>

using la_archive = ::archive;

namespace tf::preview::archive {

namespace {

constexpr size_t MAX_ENTRY_BYTES = 256 * 1024 * 1024;

using ArchivePtr = std::unique_ptr<la_archive, decltype(&archive_read_free)>;

std::string error_of(la_archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown error";
}

ArchivePtr open_archive(const std::string& path) {
    ArchivePtr a(archive_read_new(), &archive_read_free);
    if (!a) throw std::runtime_error("Failed to allocate archive reader");
    archive_read_support_format_all(a.get());
    archive_read_support_filter_all(a.get());

    if (archive_read_open_filename(a.get(), path.c_str(), 10240) != ARCHIVE_OK)
        throw std::runtime_error("Failed to open archive " + path + ": " + error_of(a.get()));
    return a;
}

std::string normalize(std::string name) {
    std::ranges::replace(name, '\\', '/');
    while (!name.empty() && name.front() == '/') name.erase(name.begin());
    return name;
}

}

EntryRef split_key(const std::string& key) {
    const auto sep = key.find("::");
    if (sep == std::string::npos) return {key, {}};
    return {key.substr(0, sep), key.substr(sep + 2)};
}

std::vector<std::string> list_image_entries(const std::string& archivePath) {
    auto a = open_archive(archivePath);

    std::vector<std::string> names;
    archive_entry* entry = nullptr;
    while (archive_read_next_header(a.get(), &entry) == ARCHIVE_OK) {
        if (archive_entry_filetype(entry) != AE_IFREG) continue;
        const char* name = archive_entry_pathname(entry);
        if (name && image::is_decodable_name(name)) names.emplace_back(name);
        archive_read_data_skip(a.get());
    }

    std::ranges::sort(names);
    return names;
}

std::vector<uint8_t> read_entry(const std::string& archivePath, const std::string& entryName) {
    auto a = open_archive(archivePath);
    const auto wanted = normalize(entryName);

    archive_entry* entry = nullptr;
    int rc;
    while ((rc = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK) {
        const char* name = archive_entry_pathname(entry);
        if (!name || normalize(name) != wanted) {
            archive_read_data_skip(a.get());
            continue;
        }

        std::vector<uint8_t> data;
        if (archive_entry_size_is_set(entry)) {
            const auto size = archive_entry_size(entry);
            if (size < 0 || static_cast<size_t>(size) > MAX_ENTRY_BYTES)
                throw std::runtime_error("Archive entry too large: " + entryName);
            data.reserve(static_cast<size_t>(size));
        }

        std::array<uint8_t, 64 * 1024> buf{};
        for (;;) {
            const la_ssize_t n = archive_read_data(a.get(), buf.data(), buf.size());
            if (n < 0) throw std::runtime_error("Failed to read " + entryName + ": " + error_of(a.get()));
            if (n == 0) break;
            data.insert(data.end(), buf.begin(), buf.begin() + n);
            if (data.size() > MAX_ENTRY_BYTES) throw std::runtime_error("Archive entry too large: " + entryName);
        }
        return data;
    }

    if (rc != ARCHIVE_EOF)
        throw std::runtime_error("Failed to scan archive " + archivePath + ": " + error_of(a.get()));
    throw std::runtime_error("Entry " + entryName + " not found in " + archivePath);
}

std::vector<uint8_t> read_cover(const EntryRef& ref) {
    if (!ref.entry.empty()) return read_entry(ref.archive, ref.entry);

    const auto images = list_image_entries(ref.archive);
    if (images.empty()) throw std::runtime_error("No image entries in archive " + ref.archive);
    log::Registry::preview()->debug("[archive] Using {} as cover of {}", images.front(), ref.archive);
    return read_entry(ref.archive, images.front());
}

}
