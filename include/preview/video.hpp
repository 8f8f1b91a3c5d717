#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tf::preview::video {

// Runs argv (looked up on PATH) and returns its stdout. Throws when the
// program cannot be started, exits non-zero, or writes more than maxBytes.
std::vector<uint8_t> capture_stdout(const std::vector<std::string>& argv, size_t maxBytes);

// Runs `ffmpeg` and captures one PNG frame at seekSeconds from its stdout
std::vector<uint8_t> extract_frame(const std::string& path, double seekSeconds = 1.0);

}
