#include "types/stats/EngineStats.hpp"

#include <nlohmann/json.hpp>

using namespace tf::types;

void LatencyStats::observe_us(uint64_t us) noexcept {
    count.v.fetch_add(1, std::memory_order_relaxed);
    total_us.v.fetch_add(us, std::memory_order_relaxed);

    uint64_t cur = max_us.v.load(std::memory_order_relaxed);
    while (us > cur && !max_us.v.compare_exchange_weak(cur, us, std::memory_order_relaxed)) {
        // cur updated by compare_exchange_weak
    }
}

void EngineStats::record_processed(const Lane lane) noexcept {
    processed[laneIndex(lane)].v.fetch_add(1, std::memory_order_relaxed);
}

void EngineStats::record_completed(const uint64_t us) noexcept {
    completed.v.fetch_add(1, std::memory_order_relaxed);
    generation.observe_us(us);
}

void EngineStats::record_failed(const uint64_t us) noexcept {
    failed.v.fetch_add(1, std::memory_order_relaxed);
    generation.observe_us(us);
}

void EngineStats::record_stale() noexcept {
    stale_discarded.v.fetch_add(1, std::memory_order_relaxed);
}

void EngineStats::record_pruned(const uint64_t n) noexcept {
    if (n) pruned_tasks.v.fetch_add(n, std::memory_order_relaxed);
}

void EngineStats::record_decay_evictions(const uint64_t n) noexcept {
    if (n) decay_evictions.v.fetch_add(n, std::memory_order_relaxed);
}

void EngineStats::record_hit() noexcept {
    cache_hits.v.fetch_add(1, std::memory_order_relaxed);
}

void EngineStats::record_miss() noexcept {
    cache_misses.v.fetch_add(1, std::memory_order_relaxed);
}

void EngineStats::fill(CacheStatsSnapshot& s) const noexcept {
    for (size_t i = 0; i < processed.size(); ++i)
        s.processed[i] = processed[i].v.load(std::memory_order_relaxed);

    s.completed = completed.v.load(std::memory_order_relaxed);
    s.failed = failed.v.load(std::memory_order_relaxed);
    s.stale_discarded = stale_discarded.v.load(std::memory_order_relaxed);
    s.pruned_tasks = pruned_tasks.v.load(std::memory_order_relaxed);
    s.decay_evictions = decay_evictions.v.load(std::memory_order_relaxed);
    s.cache_hits = cache_hits.v.load(std::memory_order_relaxed);
    s.cache_misses = cache_misses.v.load(std::memory_order_relaxed);

    s.gen_count = generation.count.v.load(std::memory_order_relaxed);
    s.gen_total_us = generation.total_us.v.load(std::memory_order_relaxed);
    s.gen_max_us = generation.max_us.v.load(std::memory_order_relaxed);
}

double EngineStats::avg_gen_ms(const CacheStatsSnapshot& s) noexcept {
    return s.gen_count ? (static_cast<double>(s.gen_total_us) / 1000.0) / static_cast<double>(s.gen_count) : 0.0;
}

double EngineStats::hit_rate(const CacheStatsSnapshot& s) noexcept {
    const auto denom = s.cache_hits + s.cache_misses;
    return denom ? static_cast<double>(s.cache_hits) / static_cast<double>(denom) : 0.0;
}

void tf::types::to_json(nlohmann::json& j, const StageStatsSnapshot& s) {
    j = nlohmann::json{
        {"name", s.name},
        {"max_active", s.max_active},
        {"active", s.active},
        {"acquired", s.acquired},
        {"rejected", s.rejected},
        {"wait_count", s.wait_count},
        {"wait_total_us", s.wait_total_us},
    };
}

void tf::types::to_json(nlohmann::json& j, const CacheStatsSnapshot& s) {
    j = nlohmann::json{
        {"memory_count", s.memory_count},
        {"memory_bytes", s.memory_bytes},
        {"memory_byte_budget", s.memory_byte_budget},
        {"store_count", s.store_count},
        {"indexed_count", s.indexed_count},
        {"indexed_folder_count", s.indexed_folder_count},
        {"failed_count", s.failed_count},
        {"save_queue_length", s.save_queue_length},

        {"queue_length", s.queue_length},
        {"lanes", {
            {"visible", {{"queued", s.lane_depths[0]}, {"processed", s.processed[0]}}},
            {"prefetch", {{"queued", s.lane_depths[1]}, {"processed", s.processed[1]}}},
            {"background", {{"queued", s.lane_depths[2]}, {"processed", s.processed[2]}}},
        }},

        {"active_workers", s.active_workers},
        {"worker_budget", s.worker_budget},
        {"worker_threads", s.worker_threads},

        {"completed", s.completed},
        {"failed", s.failed},
        {"stale_discarded", s.stale_discarded},
        {"pruned_tasks", s.pruned_tasks},
        {"decay_evictions", s.decay_evictions},
        {"hit_rate", EngineStats::hit_rate(s)},

        {"generation", {
            {"count", s.gen_count},
            {"avg_ms", EngineStats::avg_gen_ms(s)},
            {"max_ms", static_cast<double>(s.gen_max_us) / 1000.0},
        }},

        {"db_read_window", s.db_read_window},
        {"paused", s.paused},
        {"stages", s.stages},
    };
}
