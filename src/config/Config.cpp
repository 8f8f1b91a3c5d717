#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <algorithm>
#include <thread>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace tf::config {

unsigned int hardwareCores() {
    const auto n = std::thread::hardware_concurrency();
    return n == 0 ? 4 : n;
}

unsigned int defaultWorkerThreads() {
    return std::clamp(hardwareCores() * 3 / 2, 4u, 16u);
}

size_t defaultMemoryCacheEntries() {
    const auto cores = hardwareCores();
    if (cores >= 8) return 2048;
    if (cores >= 4) return 1024;
    return 512;
}

uintmax_t defaultMemoryCacheByteBudget() {
    const auto cores = hardwareCores();
    constexpr uintmax_t MiB = 1024 * 1024;
    if (cores >= 8) return 512 * MiB;
    if (cores >= 4) return 256 * MiB;
    return 128 * MiB;
}

unsigned int ThumbnailConfig::minActiveWorkers() const {
    const auto workers = std::max(1u, thumbnails.worker_threads);
    if (adaptive.min_active_workers > 0) return std::min(adaptive.min_active_workers, workers);
    return std::clamp(workers / 3, std::min(2u, workers), workers);
}

unsigned int ThumbnailConfig::decodeMaxActive() const {
    if (stages.decode_max_active > 0) return stages.decode_max_active;
    return std::max(1u, thumbnails.worker_threads / 2);
}

unsigned int ThumbnailConfig::scaleMaxActive() const {
    if (stages.scale_max_active > 0) return stages.scale_max_active;
    return std::max(1u, thumbnails.worker_threads * 3 / 4);
}

unsigned int ThumbnailConfig::encodeMaxActive() const {
    if (stages.encode_max_active > 0) return stages.encode_max_active;
    return std::max(1u, thumbnails.worker_threads * 2 / 3);
}

ThumbnailConfig Config::engine() const {
    return {thumbnails, scheduler, adaptive, stages, database};
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["thumbnails"]) YAML::convert<ThumbnailsConfig>::decode(node, cfg.thumbnails);
    if (auto node = root["scheduler"]) YAML::convert<SchedulerConfig>::decode(node, cfg.scheduler);
    if (auto node = root["adaptive"]) YAML::convert<AdaptiveConfig>::decode(node, cfg.adaptive);
    if (auto node = root["stages"]) YAML::convert<StagesConfig>::decode(node, cfg.stages);
    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["http"]) YAML::convert<HttpConfig>::decode(node, cfg.http);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    if (cfg.thumbnails.worker_threads == 0)
        throw std::runtime_error("thumbnails.worker_threads must be at least 1");
    if (cfg.database.read_batch_max < cfg.database.read_batch_min)
        throw std::runtime_error("database.read_batch_max must not be below read_batch_min");

    return cfg;
}

static std::string levelStr(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"thumbnails", c.thumbnails},
        {"scheduler", c.scheduler},
        {"adaptive", c.adaptive},
        {"stages", c.stages},
        {"database", c.database},
        {"http", c.http},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("thumbnails")) j.at("thumbnails").get_to(c.thumbnails);
    if (j.contains("scheduler")) j.at("scheduler").get_to(c.scheduler);
    if (j.contains("adaptive")) j.at("adaptive").get_to(c.adaptive);
    if (j.contains("stages")) j.at("stages").get_to(c.stages);
    if (j.contains("database")) j.at("database").get_to(c.database);
    if (j.contains("http")) j.at("http").get_to(c.http);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

void to_json(nlohmann::json& j, const ThumbnailsConfig& c) {
    j = {
        {"worker_threads", c.worker_threads},
        {"thumbnail_size", c.thumbnail_size},
        {"jpeg_quality", c.jpeg_quality},
        {"folder_search_depth", c.folder_search_depth},
        {"memory_cache_entries", c.memory_cache_entries},
        {"memory_cache_byte_budget", c.memory_cache_byte_budget},
        {"decay_threshold_percent", c.decay_threshold_percent},
        {"decay_drop_percent", c.decay_drop_percent},
        {"cleanup_every_requests", c.cleanup_every_requests}
    };
}

void from_json(const nlohmann::json& j, ThumbnailsConfig& c) {
    c.worker_threads = j.value("worker_threads", defaultWorkerThreads());
    c.thumbnail_size = j.value("thumbnail_size", 256u);
    c.jpeg_quality = j.value("jpeg_quality", 85);
    c.folder_search_depth = j.value("folder_search_depth", 3u);
    c.memory_cache_entries = j.value("memory_cache_entries", defaultMemoryCacheEntries());
    c.memory_cache_byte_budget = j.value("memory_cache_byte_budget", defaultMemoryCacheByteBudget());
    c.decay_threshold_percent = j.value("decay_threshold_percent", 85u);
    c.decay_drop_percent = j.value("decay_drop_percent", 12u);
    c.cleanup_every_requests = j.value("cleanup_every_requests", 100u);
}

void to_json(nlohmann::json& j, const LaneQuota& c) {
    j = nlohmann::json::array({c.visible, c.prefetch, c.background});
}

void from_json(const nlohmann::json& j, LaneQuota& c) {
    c.visible = j.at(0).get<unsigned int>();
    c.prefetch = j.at(1).get<unsigned int>();
    c.background = j.at(2).get<unsigned int>();
}

void to_json(nlohmann::json& j, const SchedulerConfig& c) {
    j = {
        {"visible_boost_factor", c.visible_boost_factor},
        {"side_boost_factor", c.side_boost_factor},
        {"visible_heavy_quota", c.visible_heavy},
        {"balanced_quota", c.balanced},
        {"side_heavy_quota", c.side_heavy},
        {"pop_timeout_ms", c.pop_timeout_ms},
        {"idle_backoff_ms", c.idle_backoff_ms},
        {"output_batch_size", c.output_batch_size}
    };
}

void from_json(const nlohmann::json& j, SchedulerConfig& c) {
    c.visible_boost_factor = j.value("visible_boost_factor", 8u);
    c.side_boost_factor = j.value("side_boost_factor", 4u);
    c.visible_heavy = j.value("visible_heavy_quota", LaneQuota{8, 1, 1});
    c.balanced = j.value("balanced_quota", LaneQuota{6, 2, 1});
    c.side_heavy = j.value("side_heavy_quota", LaneQuota{4, 3, 3});
    c.pop_timeout_ms = j.value("pop_timeout_ms", 50u);
    c.idle_backoff_ms = j.value("idle_backoff_ms", 10u);
    c.output_batch_size = j.value("output_batch_size", static_cast<size_t>(8));
}

void to_json(nlohmann::json& j, const AdaptiveConfig& c) {
    j = {
        {"enabled", c.enabled},
        {"min_active_workers", c.min_active_workers},
        {"tick_ms", c.tick_ms},
        {"scale_up_backlog", c.scale_up_backlog},
        {"scale_up_avg_ms", c.scale_up_avg_ms},
        {"scale_down_avg_ms", c.scale_down_avg_ms},
        {"scale_down_fail_percent", c.scale_down_fail_percent}
    };
}

void from_json(const nlohmann::json& j, AdaptiveConfig& c) {
    c.enabled = j.value("enabled", true);
    c.min_active_workers = j.value("min_active_workers", 0u);
    c.tick_ms = j.value("tick_ms", 500u);
    c.scale_up_backlog = j.value("scale_up_backlog", static_cast<size_t>(24));
    c.scale_up_avg_ms = j.value("scale_up_avg_ms", static_cast<uint64_t>(40));
    c.scale_down_avg_ms = j.value("scale_down_avg_ms", static_cast<uint64_t>(160));
    c.scale_down_fail_percent = j.value("scale_down_fail_percent", 18u);
}

void to_json(nlohmann::json& j, const StagesConfig& c) {
    j = {
        {"decode_max_active", c.decode_max_active},
        {"scale_max_active", c.scale_max_active},
        {"encode_max_active", c.encode_max_active},
        {"backoff_ms", c.backoff_ms}
    };
}

void from_json(const nlohmann::json& j, StagesConfig& c) {
    c.decode_max_active = j.value("decode_max_active", 0u);
    c.scale_max_active = j.value("scale_max_active", 0u);
    c.encode_max_active = j.value("encode_max_active", 0u);
    c.backoff_ms = j.value("backoff_ms", 5u);
}

void to_json(nlohmann::json& j, const DatabaseConfig& c) {
    j = {
        {"path", c.path.string()},
        {"save_delay_ms", c.save_delay_ms},
        {"batch_save_threshold", c.batch_save_threshold},
        {"read_batch_min", c.read_batch_min},
        {"read_batch_max", c.read_batch_max},
        {"write_batch_min", c.write_batch_min},
        {"write_batch_max", c.write_batch_max},
        {"batch_target_ms", c.batch_target_ms}
    };
}

void from_json(const nlohmann::json& j, DatabaseConfig& c) {
    c.path = j.value("path", std::string("thumbnails.db"));
    c.save_delay_ms = j.value("save_delay_ms", static_cast<uint64_t>(2000));
    c.batch_save_threshold = j.value("batch_save_threshold", static_cast<size_t>(50));
    c.read_batch_min = j.value("read_batch_min", static_cast<size_t>(16));
    c.read_batch_max = j.value("read_batch_max", static_cast<size_t>(64));
    c.write_batch_min = j.value("write_batch_min", static_cast<size_t>(32));
    c.write_batch_max = j.value("write_batch_max", static_cast<size_t>(256));
    c.batch_target_ms = j.value("batch_target_ms", static_cast<uint64_t>(16));
}

void to_json(nlohmann::json& j, const HttpConfig& c) {
    j = {
        {"enabled", c.enabled},
        {"host", c.host},
        {"port", c.port}
    };
}

void from_json(const nlohmann::json& j, HttpConfig& c) {
    c.enabled = j.value("enabled", true);
    c.host = j.value("host", std::string("127.0.0.1"));
    c.port = j.value("port", static_cast<uint16_t>(33380));
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"thumbforge", levelStr(c.thumbforge)},
        {"thumb", levelStr(c.thumb)},
        {"scheduler", levelStr(c.scheduler)},
        {"cache", levelStr(c.cache)},
        {"db", levelStr(c.db)},
        {"http", levelStr(c.http)},
        {"preview", levelStr(c.preview)}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.thumbforge = spdlog::level::from_str(j.value("thumbforge", std::string("info")));
    c.thumb = spdlog::level::from_str(j.value("thumb", std::string("warn")));
    c.scheduler = spdlog::level::from_str(j.value("scheduler", std::string("warn")));
    c.cache = spdlog::level::from_str(j.value("cache", std::string("warn")));
    c.db = spdlog::level::from_str(j.value("db", std::string("err")));
    c.http = spdlog::level::from_str(j.value("http", std::string("warn")));
    c.preview = spdlog::level::from_str(j.value("preview", std::string("warn")));
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelStr(c.console_log_level)},
        {"file_log_level", levelStr(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LogLevelsConfig& c) {
    c.console_log_level = spdlog::level::from_str(j.value("console_log_level", std::string("info")));
    c.file_log_level = spdlog::level::from_str(j.value("file_log_level", std::string("warn")));
    if (j.contains("subsystem_levels")) j.at("subsystem_levels").get_to(c.subsystem_levels);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"file_enabled", c.file_enabled},
        {"log_dir", c.log_dir.string()},
        {"log_levels", c.levels}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    c.file_enabled = j.value("file_enabled", false);
    c.log_dir = j.value("log_dir", std::string("logs"));
    if (j.contains("log_levels")) j.at("log_levels").get_to(c.levels);
}

} // namespace tf::config
