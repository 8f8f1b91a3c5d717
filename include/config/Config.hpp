#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace tf::config {

// Hardware-derived defaults
unsigned int hardwareCores();
unsigned int defaultWorkerThreads();
size_t defaultMemoryCacheEntries();
uintmax_t defaultMemoryCacheByteBudget();

struct ThumbnailsConfig {
    unsigned int worker_threads = defaultWorkerThreads();
    unsigned int thumbnail_size = 256;
    int jpeg_quality = 85;
    unsigned int folder_search_depth = 3;
    size_t memory_cache_entries = defaultMemoryCacheEntries();
    uintmax_t memory_cache_byte_budget = defaultMemoryCacheByteBudget();
    unsigned int decay_threshold_percent = 85;
    unsigned int decay_drop_percent = 12;
    unsigned int cleanup_every_requests = 100;
};

struct LaneQuota {
    unsigned int visible = 0;
    unsigned int prefetch = 0;
    unsigned int background = 0;

    [[nodiscard]] unsigned int total() const { return visible + prefetch + background; }
    bool operator==(const LaneQuota&) const = default;
};

struct SchedulerConfig {
    unsigned int visible_boost_factor = 8;
    unsigned int side_boost_factor = 4;
    LaneQuota visible_heavy{8, 1, 1};
    LaneQuota balanced{6, 2, 1};
    LaneQuota side_heavy{4, 3, 3};
    unsigned int pop_timeout_ms = 50;
    unsigned int idle_backoff_ms = 10;
    size_t output_batch_size = 8;
};

struct AdaptiveConfig {
    bool enabled = true;
    unsigned int min_active_workers = 0; // 0 -> clamp(workers / 3, 2, workers)
    unsigned int tick_ms = 500;
    size_t scale_up_backlog = 24;
    uint64_t scale_up_avg_ms = 40;
    uint64_t scale_down_avg_ms = 160;
    unsigned int scale_down_fail_percent = 18;
};

struct StagesConfig {
    unsigned int decode_max_active = 0;  // 0 -> workers / 2
    unsigned int scale_max_active = 0;   // 0 -> workers * 3 / 4
    unsigned int encode_max_active = 0;  // 0 -> workers * 2 / 3
    unsigned int backoff_ms = 5;
};

struct DatabaseConfig {
    std::filesystem::path path = "thumbnails.db";
    uint64_t save_delay_ms = 2000;
    size_t batch_save_threshold = 50;
    size_t read_batch_min = 16;
    size_t read_batch_max = 64;
    size_t write_batch_min = 32;
    size_t write_batch_max = 256;
    uint64_t batch_target_ms = 16;
};

struct HttpConfig {
    bool enabled = true;
    std::string host = "127.0.0.1";
    uint16_t port = 33380;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum thumbforge = spdlog::level::info;  // startup/shutdown
    spdlog::level::level_enum thumb      = spdlog::level::warn;  // failed renders
    spdlog::level::level_enum scheduler  = spdlog::level::warn;
    spdlog::level::level_enum cache      = spdlog::level::warn;
    spdlog::level::level_enum db         = spdlog::level::err;
    spdlog::level::level_enum http       = spdlog::level::warn;
    spdlog::level::level_enum preview    = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    bool file_enabled = false;
    std::filesystem::path log_dir = "logs";
    LogLevelsConfig levels;
};

// Engine-facing subset, handed to thumb::Service by value
struct ThumbnailConfig {
    ThumbnailsConfig thumbnails;
    SchedulerConfig scheduler;
    AdaptiveConfig adaptive;
    StagesConfig stages;
    DatabaseConfig database;

    [[nodiscard]] unsigned int minActiveWorkers() const;
    [[nodiscard]] unsigned int decodeMaxActive() const;
    [[nodiscard]] unsigned int scaleMaxActive() const;
    [[nodiscard]] unsigned int encodeMaxActive() const;
};

struct Config {
    ThumbnailsConfig thumbnails;
    SchedulerConfig scheduler;
    AdaptiveConfig adaptive;
    StagesConfig stages;
    DatabaseConfig database;
    HttpConfig http;
    LoggingConfig logging;

    [[nodiscard]] ThumbnailConfig engine() const;
};

Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const ThumbnailsConfig& c);
void from_json(const nlohmann::json& j, ThumbnailsConfig& c);
void to_json(nlohmann::json& j, const LaneQuota& c);
void from_json(const nlohmann::json& j, LaneQuota& c);
void to_json(nlohmann::json& j, const SchedulerConfig& c);
void from_json(const nlohmann::json& j, SchedulerConfig& c);
void to_json(nlohmann::json& j, const AdaptiveConfig& c);
void from_json(const nlohmann::json& j, AdaptiveConfig& c);
void to_json(nlohmann::json& j, const StagesConfig& c);
void from_json(const nlohmann::json& j, StagesConfig& c);
void to_json(nlohmann::json& j, const DatabaseConfig& c);
void from_json(const nlohmann::json& j, DatabaseConfig& c);
void to_json(nlohmann::json& j, const HttpConfig& c);
void from_json(const nlohmann::json& j, HttpConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void from_json(const nlohmann::json& j, LogLevelsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);

} // namespace tf::config
