#pragma once

#include "types/Task.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace tf::types {

// 64-byte cache line padding helper to avoid false sharing.
constexpr std::size_t kCacheLine = 64;

template <typename T>
struct alignas(kCacheLine) PaddedAtomic {
    std::atomic<T> v{0};
    char pad[kCacheLine - (sizeof(std::atomic<T>) % kCacheLine ? (sizeof(std::atomic<T>) % kCacheLine) : kCacheLine)]{};
};

struct LatencyStats {
    PaddedAtomic<uint64_t> count;
    PaddedAtomic<uint64_t> total_us;
    PaddedAtomic<uint64_t> max_us;

    void observe_us(uint64_t us) noexcept;
};

struct StageStatsSnapshot {
    std::string name;
    unsigned int max_active{};
    unsigned int active{};
    uint64_t acquired{};
    uint64_t rejected{};
    uint64_t wait_count{};
    uint64_t wait_total_us{};
};

struct CacheStatsSnapshot {
    uint64_t memory_count{};
    uint64_t memory_bytes{};
    uint64_t memory_byte_budget{};
    uint64_t store_count{};
    uint64_t indexed_count{};
    uint64_t indexed_folder_count{};
    uint64_t failed_count{};
    uint64_t save_queue_length{};

    uint64_t queue_length{};
    std::array<uint64_t, 3> lane_depths{};
    std::array<uint64_t, 3> processed{};

    unsigned int active_workers{};
    unsigned int worker_budget{};
    unsigned int worker_threads{};

    uint64_t completed{};
    uint64_t failed{};
    uint64_t stale_discarded{};
    uint64_t pruned_tasks{};
    uint64_t decay_evictions{};
    uint64_t cache_hits{};
    uint64_t cache_misses{};

    uint64_t gen_count{};
    uint64_t gen_total_us{};
    uint64_t gen_max_us{};

    size_t db_read_window{};
    bool paused{};

    std::vector<StageStatsSnapshot> stages;
};

// Process-lifetime counters owned by the engine context
struct EngineStats {
    std::array<PaddedAtomic<uint64_t>, 3> processed;
    PaddedAtomic<uint64_t> completed;
    PaddedAtomic<uint64_t> failed;
    PaddedAtomic<uint64_t> stale_discarded;
    PaddedAtomic<uint64_t> pruned_tasks;
    PaddedAtomic<uint64_t> decay_evictions;
    PaddedAtomic<uint64_t> cache_hits;
    PaddedAtomic<uint64_t> cache_misses;

    LatencyStats generation;

    void record_processed(Lane lane) noexcept;
    void record_completed(uint64_t us) noexcept;
    void record_failed(uint64_t us) noexcept;
    void record_stale() noexcept;
    void record_pruned(uint64_t n) noexcept;
    void record_decay_evictions(uint64_t n) noexcept;
    void record_hit() noexcept;
    void record_miss() noexcept;

    // Copies counter values into s; leaves gauges alone
    void fill(CacheStatsSnapshot& s) const noexcept;

    static double avg_gen_ms(const CacheStatsSnapshot& s) noexcept;
    static double hit_rate(const CacheStatsSnapshot& s) noexcept;
};

void to_json(nlohmann::json& j, const StageStatsSnapshot& s);
void to_json(nlohmann::json& j, const CacheStatsSnapshot& s);

} // namespace tf::types
