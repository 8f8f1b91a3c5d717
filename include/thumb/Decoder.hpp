#pragma once

#include "types/Thumbnail.hpp"

#include <string>

namespace tf::thumb {

// Produces encoded thumbnail bytes for a source path. Every method throws
// std::runtime_error (or a subclass) when the source cannot be rendered.
class Decoder {
public:
    virtual ~Decoder() = default;

    virtual types::Bytes generateFileThumbnail(const std::string& path) = 0;
    virtual types::Bytes generateArchiveThumbnail(const std::string& path) = 0;
    virtual types::Bytes generateVideoThumbnail(const std::string& path) = 0;
};

}
