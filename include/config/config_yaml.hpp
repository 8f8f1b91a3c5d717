#pragma once

#include "config/Config.hpp"
#include "config/util.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace tf::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<ThumbnailsConfig> {
    static Node encode(const ThumbnailsConfig& rhs) {
        Node node;
        node["worker_threads"] = rhs.worker_threads;
        node["thumbnail_size"] = rhs.thumbnail_size;
        node["jpeg_quality"] = rhs.jpeg_quality;
        node["folder_search_depth"] = rhs.folder_search_depth;
        node["memory_cache_entries"] = rhs.memory_cache_entries;
        node["memory_cache_budget"] = formatByteSize(rhs.memory_cache_byte_budget);
        node["decay_threshold_percent"] = rhs.decay_threshold_percent;
        node["decay_drop_percent"] = rhs.decay_drop_percent;
        node["cleanup_every_requests"] = rhs.cleanup_every_requests;
        return node;
    }

    static bool decode(const Node& node, ThumbnailsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.worker_threads = node["worker_threads"].as<unsigned int>(rhs.worker_threads);
        rhs.thumbnail_size = node["thumbnail_size"].as<unsigned int>(rhs.thumbnail_size);
        rhs.jpeg_quality = node["jpeg_quality"].as<int>(rhs.jpeg_quality);
        rhs.folder_search_depth = node["folder_search_depth"].as<unsigned int>(rhs.folder_search_depth);
        rhs.memory_cache_entries = node["memory_cache_entries"].as<size_t>(rhs.memory_cache_entries);
        if (node["memory_cache_budget"])
            rhs.memory_cache_byte_budget = parseByteSize(node["memory_cache_budget"].as<std::string>());
        rhs.decay_threshold_percent = node["decay_threshold_percent"].as<unsigned int>(rhs.decay_threshold_percent);
        rhs.decay_drop_percent = node["decay_drop_percent"].as<unsigned int>(rhs.decay_drop_percent);
        rhs.cleanup_every_requests = node["cleanup_every_requests"].as<unsigned int>(rhs.cleanup_every_requests);
        return true;
    }
};

template<>
struct convert<LaneQuota> {
    static Node encode(const LaneQuota& rhs) {
        Node node;
        node.SetStyle(EmitterStyle::Flow);
        node.push_back(rhs.visible);
        node.push_back(rhs.prefetch);
        node.push_back(rhs.background);
        return node;
    }

    static bool decode(const Node& node, LaneQuota& rhs) {
        if (!node.IsSequence() || node.size() != 3) return false;
        rhs.visible = node[0].as<unsigned int>();
        rhs.prefetch = node[1].as<unsigned int>();
        rhs.background = node[2].as<unsigned int>();
        return rhs.total() > 0;
    }
};

template<>
struct convert<SchedulerConfig> {
    static Node encode(const SchedulerConfig& rhs) {
        Node node;
        node["visible_boost_factor"] = rhs.visible_boost_factor;
        node["side_boost_factor"] = rhs.side_boost_factor;
        node["visible_heavy_quota"] = rhs.visible_heavy;
        node["balanced_quota"] = rhs.balanced;
        node["side_heavy_quota"] = rhs.side_heavy;
        node["pop_timeout_ms"] = rhs.pop_timeout_ms;
        node["idle_backoff_ms"] = rhs.idle_backoff_ms;
        node["output_batch_size"] = rhs.output_batch_size;
        return node;
    }

    static bool decode(const Node& node, SchedulerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.visible_boost_factor = node["visible_boost_factor"].as<unsigned int>(rhs.visible_boost_factor);
        rhs.side_boost_factor = node["side_boost_factor"].as<unsigned int>(rhs.side_boost_factor);
        if (node["visible_heavy_quota"]) rhs.visible_heavy = node["visible_heavy_quota"].as<LaneQuota>();
        if (node["balanced_quota"]) rhs.balanced = node["balanced_quota"].as<LaneQuota>();
        if (node["side_heavy_quota"]) rhs.side_heavy = node["side_heavy_quota"].as<LaneQuota>();
        rhs.pop_timeout_ms = node["pop_timeout_ms"].as<unsigned int>(rhs.pop_timeout_ms);
        rhs.idle_backoff_ms = node["idle_backoff_ms"].as<unsigned int>(rhs.idle_backoff_ms);
        rhs.output_batch_size = node["output_batch_size"].as<size_t>(rhs.output_batch_size);
        return true;
    }
};

template<>
struct convert<AdaptiveConfig> {
    static Node encode(const AdaptiveConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["min_active_workers"] = rhs.min_active_workers;
        node["tick_ms"] = rhs.tick_ms;
        node["scale_up_backlog"] = rhs.scale_up_backlog;
        node["scale_up_avg_ms"] = rhs.scale_up_avg_ms;
        node["scale_down_avg_ms"] = rhs.scale_down_avg_ms;
        node["scale_down_fail_percent"] = rhs.scale_down_fail_percent;
        return node;
    }

    static bool decode(const Node& node, AdaptiveConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(rhs.enabled);
        rhs.min_active_workers = node["min_active_workers"].as<unsigned int>(rhs.min_active_workers);
        rhs.tick_ms = node["tick_ms"].as<unsigned int>(rhs.tick_ms);
        rhs.scale_up_backlog = node["scale_up_backlog"].as<size_t>(rhs.scale_up_backlog);
        rhs.scale_up_avg_ms = node["scale_up_avg_ms"].as<uint64_t>(rhs.scale_up_avg_ms);
        rhs.scale_down_avg_ms = node["scale_down_avg_ms"].as<uint64_t>(rhs.scale_down_avg_ms);
        rhs.scale_down_fail_percent = node["scale_down_fail_percent"].as<unsigned int>(rhs.scale_down_fail_percent);
        return true;
    }
};

template<>
struct convert<StagesConfig> {
    static Node encode(const StagesConfig& rhs) {
        Node node;
        node["decode_max_active"] = rhs.decode_max_active;
        node["scale_max_active"] = rhs.scale_max_active;
        node["encode_max_active"] = rhs.encode_max_active;
        node["backoff_ms"] = rhs.backoff_ms;
        return node;
    }

    static bool decode(const Node& node, StagesConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.decode_max_active = node["decode_max_active"].as<unsigned int>(rhs.decode_max_active);
        rhs.scale_max_active = node["scale_max_active"].as<unsigned int>(rhs.scale_max_active);
        rhs.encode_max_active = node["encode_max_active"].as<unsigned int>(rhs.encode_max_active);
        rhs.backoff_ms = node["backoff_ms"].as<unsigned int>(rhs.backoff_ms);
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["path"] = rhs.path.string();
        node["save_delay_ms"] = rhs.save_delay_ms;
        node["batch_save_threshold"] = rhs.batch_save_threshold;
        node["read_batch_min"] = rhs.read_batch_min;
        node["read_batch_max"] = rhs.read_batch_max;
        node["write_batch_min"] = rhs.write_batch_min;
        node["write_batch_max"] = rhs.write_batch_max;
        node["batch_target_ms"] = rhs.batch_target_ms;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.path = node["path"].as<std::string>(rhs.path.string());
        rhs.save_delay_ms = node["save_delay_ms"].as<uint64_t>(rhs.save_delay_ms);
        rhs.batch_save_threshold = node["batch_save_threshold"].as<size_t>(rhs.batch_save_threshold);
        rhs.read_batch_min = node["read_batch_min"].as<size_t>(rhs.read_batch_min);
        rhs.read_batch_max = node["read_batch_max"].as<size_t>(rhs.read_batch_max);
        rhs.write_batch_min = node["write_batch_min"].as<size_t>(rhs.write_batch_min);
        rhs.write_batch_max = node["write_batch_max"].as<size_t>(rhs.write_batch_max);
        rhs.batch_target_ms = node["batch_target_ms"].as<uint64_t>(rhs.batch_target_ms);
        return true;
    }
};

template<>
struct convert<HttpConfig> {
    static Node encode(const HttpConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        return node;
    }

    static bool decode(const Node& node, HttpConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(rhs.enabled);
        rhs.host = node["host"].as<std::string>(rhs.host);
        rhs.port = node["port"].as<uint16_t>(rhs.port);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["thumbforge"] = to_std_string(spdlog::level::to_string_view(rhs.thumbforge));
        node["thumb"]      = to_std_string(spdlog::level::to_string_view(rhs.thumb));
        node["scheduler"]  = to_std_string(spdlog::level::to_string_view(rhs.scheduler));
        node["cache"]      = to_std_string(spdlog::level::to_string_view(rhs.cache));
        node["db"]         = to_std_string(spdlog::level::to_string_view(rhs.db));
        node["http"]       = to_std_string(spdlog::level::to_string_view(rhs.http));
        node["preview"]    = to_std_string(spdlog::level::to_string_view(rhs.preview));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.thumbforge = spdlog::level::from_str(node["thumbforge"].as<std::string>("info"));
        rhs.thumb = spdlog::level::from_str(node["thumb"].as<std::string>("warn"));
        rhs.scheduler = spdlog::level::from_str(node["scheduler"].as<std::string>("warn"));
        rhs.cache = spdlog::level::from_str(node["cache"].as<std::string>("warn"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("err"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("warn"));
        rhs.preview = spdlog::level::from_str(node["preview"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["file_enabled"] = rhs.file_enabled;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.file_enabled = node["file_enabled"].as<bool>(rhs.file_enabled);
        rhs.log_dir = node["log_dir"].as<std::string>(rhs.log_dir.string());
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
