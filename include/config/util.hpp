#pragma once

#include <cctype>
#include <cstdint>
#include <string>
#include <stdexcept>

namespace tf::config {

// Accepts "512", "512K", "256MB", "2G", "1gb". A bare number is MiB.
inline uintmax_t parseByteSize(const std::string& str) {
    auto s = str;
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    if (s.empty()) throw std::invalid_argument("Size string cannot be empty");

    if (s.size() > 1 && (s.back() == 'B' || s.back() == 'b')) s.pop_back();

    uintmax_t unit = 1024 * 1024;
    switch (s.back()) {
        case 'K': case 'k': unit = 1024; s.pop_back(); break;
        case 'M': case 'm': unit = 1024 * 1024; s.pop_back(); break;
        case 'G': case 'g': unit = 1024ull * 1024 * 1024; s.pop_back(); break;
        default: break;
    }

    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s.front())))
        throw std::invalid_argument("Invalid size string: " + str);

    size_t consumed = 0;
    const auto value = std::stoull(s, &consumed);
    if (consumed != s.size()) throw std::invalid_argument("Invalid size string: " + str);
    return value * unit;
}

inline std::string formatByteSize(const uintmax_t bytes) {
    constexpr uintmax_t GiB = 1024ull * 1024 * 1024, MiB = 1024 * 1024;
    if (bytes != 0 && bytes % GiB == 0) return std::to_string(bytes / GiB) + "GB";
    if (bytes % MiB == 0) return std::to_string(bytes / MiB) + "MB";
    return std::to_string(bytes / 1024) + "KB";
}

}
