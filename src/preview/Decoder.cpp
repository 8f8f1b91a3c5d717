#include "preview/Decoder.hpp"
#include "preview/archive.hpp"
#include "preview/image.hpp"
#include "preview/video.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace tf::preview;
using namespace tf::types;

Decoder::Decoder(const unsigned int thumbnailSize, const int jpegQuality)
    : size_(thumbnailSize), quality_(jpegQuality) {
    if (size_ == 0) throw std::invalid_argument("Thumbnail size must be positive");
    if (quality_ < 1 || quality_ > 100) throw std::invalid_argument("JPEG quality must be within 1..100");
}

Bytes Decoder::generateFileThumbnail(const std::string& path) {
    return image::thumbnail_from_file(path, size_, quality_);
}

Bytes Decoder::generateArchiveThumbnail(const std::string& path) {
    const auto ref = archive::split_key(path);
    const auto raw = archive::read_cover(ref);
    log::Registry::preview()->trace("[Decoder] Read {} bytes from {}", raw.size(), path);
    return image::thumbnail_from_buffer(raw.data(), raw.size(), size_, quality_);
}

Bytes Decoder::generateVideoThumbnail(const std::string& path) {
    const auto frame = video::extract_frame(path);
    return image::thumbnail_from_buffer(frame.data(), frame.size(), size_, quality_);
}
