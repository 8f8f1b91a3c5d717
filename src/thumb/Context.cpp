#include "thumb/Context.hpp"
#include "thumb/ReadySink.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <mutex>

using namespace tf::thumb;
using namespace tf::types;

Context::Context(config::ThumbnailConfig c, Store& s, Decoder& d, ReadySink& r)
    : cfg(std::move(c)),
      store(s),
      decoder(d),
      sink(r),
      cache(cfg.thumbnails.memory_cache_entries,
            cfg.thumbnails.decay_threshold_percent,
            cfg.thumbnails.decay_drop_percent),
      scheduler(cfg.scheduler),
      decodeStage("decode", cfg.decodeMaxActive()),
      scaleStage("scale", cfg.scaleMaxActive()),
      encodeStage("encode", cfg.encodeMaxActive()),
      workerBudget(cfg.adaptive.enabled ? cfg.minActiveWorkers() : std::max(1u, cfg.thumbnails.worker_threads)) {}

std::string Context::currentDirectory() const {
    std::shared_lock lock(dirMutex_);
    return currentDir_;
}

std::optional<uint64_t> Context::switchDirectory(const std::string& directory) {
    std::unique_lock lock(dirMutex_);
    if (currentDir_ == directory) return std::nullopt;
    currentDir_ = directory;
    return epoch.fetch_add(1, std::memory_order_acq_rel) + 1;
}

bool Context::isCurrentEpoch(const uint64_t requestEpoch) const {
    return requestEpoch == epoch.load(std::memory_order_acquire);
}

bool Context::isCurrent(const GenerateTask& task) const {
    if (!isCurrentEpoch(task.request_epoch)) return false;
    if (task.directory.empty()) return true;
    std::shared_lock lock(dirMutex_);
    return task.directory == currentDir_;
}

void Context::release(const GenerateTask& task) {
    dedup.release(task.dedup_key, task.dedup_request_id);
}

void Context::release(const std::vector<GenerateTask>& tasks) {
    for (const auto& t : tasks) release(t);
}

void Context::cleanupCache() {
    const auto r = cache.cleanup(cfg.thumbnails.memory_cache_byte_budget);
    stats.record_decay_evictions(r.evictedEntries);
}

void Context::emit(const std::vector<std::string>& paths) {
    if (paths.empty()) return;
    try {
        sink.onThumbnailsReady(paths);
    } catch (const std::exception& e) {
        log::Registry::thumb()->error("[Context] Ready sink threw for {} paths: {}", paths.size(), e.what());
    }
}
