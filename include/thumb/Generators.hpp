#pragma once

#include "types/Task.hpp"
#include "types/Thumbnail.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tf::thumb {

struct Context;

struct GenerateResult {
    types::Bytes bytes;
    // Record to hand to the save queue; folders write their own binding
    std::optional<types::ThumbRecord> save;
};

// Per-type thumbnail strategies on top of the Decoder. Each throws on failure.
class Generators {
public:
    static constexpr size_t LARGE_FOLDER_ENTRIES = 1000;
    static constexpr size_t FOLDER_CANDIDATES = 5;

    explicit Generators(Context& ctx);

    GenerateResult generate(const types::GenerateTask& task);

    GenerateResult file(const std::string& path);
    GenerateResult archive(const std::string& path);
    GenerateResult video(const std::string& path);
    GenerateResult folder(const std::string& path);

    // cover.* / folder.* / thumb.* image directly inside dir
    static std::optional<std::string> findCoverImage(const std::string& dir);

    // Images, archives and videos in name order, descending at most depth levels
    static std::vector<std::string> findCandidates(const std::string& dir, unsigned int depth, size_t maxCount);

private:
    Context& ctx_;

    void bindFolder_(const std::string& path, const types::Bytes& bytes);
};

}
