#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_RESIZE_IMPLEMENTATION

#include "preview/image.hpp"

#include <stb/stb_image.h>
#include <stb/stb_image_resize.h>
#include <turbojpeg.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <memory>
#include <stdexcept>

namespace tf::preview::image {

namespace {

using StbPixels = std::unique_ptr<unsigned char, decltype(&stbi_image_free)>;

std::vector<uint8_t> scale_and_encode(StbPixels decoded, const int width, const int height,
                                      const unsigned int max_side, const int quality) {
    int new_w = width, new_h = height;
    const int longest = std::max(width, height);
    if (max_side > 0 && longest > static_cast<int>(max_side)) {
        const float ratio = static_cast<float>(max_side) / static_cast<float>(longest);
        new_w = std::max(1, static_cast<int>(static_cast<float>(width) * ratio));
        new_h = std::max(1, static_cast<int>(static_cast<float>(height) * ratio));
    }

    std::vector<uint8_t> compressed;
    if (new_w == width && new_h == height) {
        compress_to_jpeg(decoded.get(), width, height, compressed, quality);
        return compressed;
    }

    std::vector<uint8_t> resized(static_cast<size_t>(new_w) * new_h * 3);
    const int ok = stbir_resize_uint8(decoded.get(), width, height, 0, resized.data(), new_w, new_h, 0, 3);
    decoded.reset();
    if (!ok) throw std::runtime_error("Image resize failed");

    compress_to_jpeg(resized.data(), new_w, new_h, compressed, quality);
    return compressed;
}

}

void compress_to_jpeg(const uint8_t* rgb_data, const int width, const int height, std::vector<uint8_t>& out_buf,
                      const int quality) {
    tjhandle tj = tjInitCompress();
    if (!tj) throw std::runtime_error("Failed to initialize TurboJPEG compressor");

    unsigned char* jpeg_buf = nullptr;
    unsigned long jpeg_size = 0;

    if (tjCompress2(
            tj,
            rgb_data,
            width,
            0, // pitch (0 = auto)
            height,
            TJPF_RGB,
            &jpeg_buf,
            &jpeg_size,
            TJSAMP_420,
            quality,
            TJFLAG_FASTDCT) != 0) {
        const std::string err = tjGetErrorStr();
        if (jpeg_buf) tjFree(jpeg_buf);
        tjDestroy(tj);
        throw std::runtime_error("JPEG compression failed: " + err);
    }

    out_buf.assign(jpeg_buf, jpeg_buf + jpeg_size);
    tjFree(jpeg_buf);
    tjDestroy(tj);
}

std::vector<uint8_t> thumbnail_from_file(const std::string& path, const unsigned int max_side, const int quality) {
    int width = 0, height = 0, channels = 0;
    StbPixels data(stbi_load(path.c_str(), &width, &height, &channels, 3), &stbi_image_free);
    if (!data) {
        const char* reason = stbi_failure_reason();
        throw std::runtime_error("Failed to load image " + path + ": " + (reason ? reason : "unknown error"));
    }
    return scale_and_encode(std::move(data), width, height, max_side, quality);
}

std::vector<uint8_t> thumbnail_from_buffer(const uint8_t* data, const size_t size,
                                           const unsigned int max_side, const int quality) {
    if (size < 4) throw std::runtime_error("Buffer too small to be a valid image");

    int width = 0, height = 0, channels = 0;
    StbPixels decoded(stbi_load_from_memory(data, static_cast<int>(size), &width, &height, &channels, 3),
                      &stbi_image_free);
    if (!decoded) {
        const char* reason = stbi_failure_reason();
        throw std::runtime_error(
            std::string("Failed to decode image from memory: ") + (reason ? reason : "unknown error"));
    }
    return scale_and_encode(std::move(decoded), width, height, max_side, quality);
}

bool is_decodable_name(std::string_view name) {
    static constexpr std::array<std::string_view, 9> EXTS{
        "jpg", "jpeg", "png", "gif", "bmp", "tga", "psd", "pnm", "ppm"
    };

    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos) return false;
    std::string ext(name.substr(dot + 1));
    std::ranges::transform(ext, ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return std::ranges::find(EXTS, ext) != EXTS.end();
}

}
