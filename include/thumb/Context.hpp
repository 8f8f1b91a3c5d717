#pragma once

#include "config/Config.hpp"
#include "thumb/Deduplicator.hpp"
#include "thumb/MemoryCache.hpp"
#include "thumb/Index.hpp"
#include "thumb/SaveQueue.hpp"
#include "thumb/LaneScheduler.hpp"
#include "thumb/StageLimiter.hpp"
#include "types/stats/EngineStats.hpp"

#include <atomic>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace tf::thumb {

class Store;
class Decoder;
class ReadySink;

// All state shared between the service front end, the workers and the
// background services. Owned by exactly one Service.
struct Context {
    Context(config::ThumbnailConfig cfg, Store& store, Decoder& decoder, ReadySink& sink);

    const config::ThumbnailConfig cfg;

    Store& store;
    Decoder& decoder;
    ReadySink& sink;

    Deduplicator dedup;
    MemoryCache cache;
    Index index;
    SaveQueue saveQueue;
    LaneScheduler scheduler;

    StageLimiter decodeStage;
    StageLimiter scaleStage;
    StageLimiter encodeStage;

    types::EngineStats stats;

    std::atomic<uint64_t> epoch{1};
    std::atomic<bool> paused{false};
    std::atomic<unsigned int> workerBudget;
    std::atomic<unsigned int> activeWorkers{0};
    std::atomic<uint64_t> requestCount{0};

    [[nodiscard]] std::string currentDirectory() const;

    // Bumps the epoch and returns the new value when the directory changes
    std::optional<uint64_t> switchDirectory(const std::string& directory);

    // Same epoch and (no directory or the current one)
    [[nodiscard]] bool isCurrent(const types::GenerateTask& task) const;
    [[nodiscard]] bool isCurrentEpoch(uint64_t requestEpoch) const;

    void release(const types::GenerateTask& task);
    void release(const std::vector<types::GenerateTask>& tasks);

    // Runs the memory cache decay and records how much it evicted
    void cleanupCache();

    void emit(const std::vector<std::string>& paths);

private:
    mutable std::shared_mutex dirMutex_;
    std::string currentDir_;
};

}
