#pragma once

#include "thumb/Decoder.hpp"

namespace tf::preview {

// stb/TurboJPEG for images, libarchive for archive entries, ffmpeg for video frames
class Decoder final : public thumb::Decoder {
public:
    Decoder(unsigned int thumbnailSize, int jpegQuality);

    types::Bytes generateFileThumbnail(const std::string& path) override;
    types::Bytes generateArchiveThumbnail(const std::string& path) override;
    types::Bytes generateVideoThumbnail(const std::string& path) override;

private:
    unsigned int size_;
    int quality_;
};

}
