#include "thumb/Service.hpp"
#include "thumb/Context.hpp"
#include "thumb/Generators.hpp"
#include "thumb/WorkerPool.hpp"
#include "thumb/AdaptiveController.hpp"
#include "thumb/StoreLoader.hpp"
#include "thumb/SaveQueue.hpp"
#include "thumb/Store.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <unordered_set>

using namespace tf::thumb;
using namespace tf::types;

ClearScope tf::thumb::clearScopeFromString(const std::string& s) {
    if (s == "memory") return ClearScope::Memory;
    if (s == "failed") return ClearScope::Failed;
    if (s == "queue") return ClearScope::Queue;
    if (s == "all") return ClearScope::All;
    throw std::invalid_argument("Invalid cache scope: " + s);
}

Service::Service(config::ThumbnailConfig cfg, Store& store, Decoder& decoder, ReadySink& sink)
    : ctx_(std::make_unique<Context>(std::move(cfg), store, decoder, sink)),
      generators_(std::make_unique<Generators>(*ctx_)),
      pool_(std::make_unique<WorkerPool>(*ctx_, *generators_)),
      controller_(std::make_unique<AdaptiveController>(*ctx_)),
      flusher_(std::make_unique<SaveFlusher>(ctx_->saveQueue, store, ctx_->cfg.database)),
      loader_(std::make_unique<StoreLoader>(*ctx_)) {}

Service::~Service() {
    try {
        stop();
    } catch (const std::exception& e) {
        log::Registry::thumb()->error("[Service] Error during shutdown: {}", e.what());
    }
}

void Service::start() {
    if (running_) return;

    ctx_->index.clear();
    ctx_->index.load(ctx_->store);

    flusher_->start();
    loader_->start();
    pool_->start();
    if (ctx_->cfg.adaptive.enabled) controller_->start();

    running_ = true;
    log::Registry::thumb()->info("[Service] Started with {} workers, budget {}",
                                 pool_->workerCount(), ctx_->workerBudget.load());
}

void Service::stop() {
    if (!running_) return;

    controller_->stop();
    pool_->stop();
    loader_->stop();
    ctx_->release(ctx_->scheduler.clear());
    flusher_->stop();

    running_ = false;
    log::Registry::thumb()->info("[Service] Stopped");
}

void Service::requestVisibleThumbnails(const std::vector<std::string>& paths,
                                       const std::string& directory,
                                       const std::optional<size_t> centerIndex,
                                       const Lane lane) {
    auto& ctx = *ctx_;

    if (const auto every = ctx.cfg.thumbnails.cleanup_every_requests;
        every > 0 && ctx.requestCount.fetch_add(1, std::memory_order_relaxed) % every == 0)
        ctx.cleanupCache();

    if (const auto epoch = ctx.switchDirectory(directory)) {
        const auto dropped = ctx.scheduler.clear();
        ctx.release(dropped);
        log::Registry::scheduler()->debug("[Service] Directory switched to '{}' (epoch {}), dropped {} queued tasks",
                                          directory, *epoch, dropped.size());
    }

    if (!paths.empty() && lane != Lane::Background) {
        const std::unordered_set<std::string> window(paths.begin(), paths.end());
        const auto pruned = ctx.scheduler.pruneLaneDirectoryExcept(lane, directory, window);
        ctx.release(pruned);
        ctx.stats.record_pruned(pruned.size());
    }

    const auto epoch = ctx.epoch.load(std::memory_order_acquire);
    const auto center = centerIndex.value_or(paths.size() / 2);

    std::vector<std::string> cached, stored;
    std::vector<GenerateTask> tasks;

    for (size_t i = 0; i < paths.size(); ++i) {
        const auto& path = paths[i];

        if (ctx.cache.contains(path) || ctx.saveQueue.contains(path)) {
            ctx.stats.record_hit();
            cached.push_back(path);
            continue;
        }

        ctx.stats.record_miss();
        if (ctx.index.failed.contains(path)) continue;

        if (ctx.index.present.contains(path) || ctx.index.folders.contains(path)) {
            stored.push_back(path);
            continue;
        }

        const auto id = ctx.dedup.tryAcquire(path);
        if (!id) continue;

        GenerateTask t;
        t.path = path;
        t.directory = directory;
        t.file_type = detectFileType(path);
        t.lane = lane;
        t.center_distance = i > center ? i - center : center - i;
        t.original_index = i;
        t.dedup_key = path;
        t.dedup_request_id = *id;
        t.request_epoch = epoch;
        tasks.push_back(std::move(t));
    }

    ctx.emit(cached);
    if (!stored.empty()) loader_->submit(std::move(stored), epoch);
    if (!tasks.empty()) ctx.release(ctx.scheduler.enqueueTasks(std::move(tasks)));
}

size_t Service::warmDirectory(const std::string& dir) {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        log::Registry::thumb()->warn("[Service] Cannot warm {}: {}", dir, ec.message());
        return 0;
    }

    std::vector<std::string> paths;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code typeEc;
        auto p = it->path().string();
        if (it->is_directory(typeEc)) p.push_back('/');
        paths.push_back(std::move(p));
    }
    if (ec) log::Registry::thumb()->warn("[Service] Listing {} stopped early: {}", dir, ec.message());

    std::ranges::sort(paths);
    log::Registry::thumb()->info("[Service] Warming {} entries from {}", paths.size(), dir);
    requestVisibleThumbnails(paths, dir, std::nullopt, Lane::Background);
    return paths.size();
}

size_t Service::cancelRequests(const std::string& directory) {
    const auto removed = ctx_->scheduler.clearDirectory(directory);
    ctx_->release(removed);
    log::Registry::scheduler()->debug("[Service] Cancelled {} tasks for '{}'", removed.size(), directory);
    return removed.size();
}

std::optional<Bytes> Service::loadFromStore_(const std::string& key) const {
    const auto primary = isLikelyFolder(key) ? Category::Folder : Category::File;
    const auto secondary = primary == Category::Folder ? Category::File : Category::Folder;

    try {
        if (auto b = ctx_->store.load(key, primary)) return b;
        return ctx_->store.load(key, secondary);
    } catch (const std::exception& e) {
        log::Registry::db()->error("[Service] Failed to load thumbnail {}: {}", key, e.what());
        return std::nullopt;
    }
}

std::optional<Bytes> Service::lookupThumbnail(const std::string& key) {
    if (auto b = ctx_->cache.peek(key)) return b;
    if (auto b = ctx_->saveQueue.peek(key)) return b;

    auto b = loadFromStore_(key);
    if (b) ctx_->cache.putIfAbsent(key, *b);
    return b;
}

std::unordered_map<std::string, Bytes> Service::getCachedThumbnails(const std::vector<std::string>& paths) {
    std::unordered_map<std::string, Bytes> out;
    for (const auto& p : paths) {
        if (auto b = ctx_->cache.get(p)) out.emplace(p, std::move(*b));
        else if (auto q = ctx_->saveQueue.peek(p)) out.emplace(p, std::move(*q));
        else if (auto s = loadFromStore_(p)) {
            ctx_->cache.putIfAbsent(p, *s);
            out.emplace(p, std::move(*s));
        }
    }
    return out;
}

CacheStatsSnapshot Service::getCacheStats() const {
    const auto& ctx = *ctx_;
    CacheStatsSnapshot s;

    s.memory_count = ctx.cache.size();
    s.memory_bytes = ctx.cache.bytes();
    s.memory_byte_budget = ctx.cfg.thumbnails.memory_cache_byte_budget;

    try {
        s.store_count = ctx.store.count();
    } catch (const std::exception& e) {
        log::Registry::db()->warn("[Service] Failed to count stored thumbnails: {}", e.what());
    }

    s.indexed_count = ctx.index.present.size();
    s.indexed_folder_count = ctx.index.folders.size();
    s.failed_count = ctx.index.failed.size();
    s.save_queue_length = ctx.saveQueue.size();

    const auto depths = ctx.scheduler.depths();
    s.lane_depths = {depths.counts[0], depths.counts[1], depths.counts[2]};
    s.queue_length = depths.total();

    s.active_workers = ctx.activeWorkers.load(std::memory_order_relaxed);
    s.worker_budget = ctx.workerBudget.load(std::memory_order_relaxed);
    s.worker_threads = ctx.cfg.thumbnails.worker_threads;

    ctx.stats.fill(s);

    s.db_read_window = loader_->readWindow();
    s.paused = ctx.paused.load(std::memory_order_relaxed);
    s.stages = {ctx.decodeStage.snapshot(), ctx.scaleStage.snapshot(), ctx.encodeStage.snapshot()};
    return s;
}

void Service::removeThumbnail(const std::string& path) {
    ctx_->cache.remove(path);
    ctx_->saveQueue.erase(path);
    ctx_->index.erase(path);
    if (const auto queued = ctx_->scheduler.removePath(path)) ctx_->release(*queued);
    ctx_->store.remove(path);
}

void Service::regenerateThumbnail(const std::string& path, const std::string& directory) {
    ctx_->cache.remove(path);
    ctx_->saveQueue.erase(path);
    ctx_->index.erase(path);

    GenerateTask t;
    t.path = path;
    t.directory = directory;
    t.file_type = detectFileType(path);
    t.lane = Lane::Visible;
    t.center_distance = 0;
    t.original_index = 0;
    t.dedup_key = path;
    t.dedup_request_id = ctx_->dedup.forceAcquire(path);
    t.request_epoch = ctx_->epoch.load(std::memory_order_acquire);

    if (const auto previous = ctx_->scheduler.replacePath(path, std::move(t))) ctx_->release(*previous);
    log::Registry::thumb()->debug("[Service] Regenerating {}", path);
}

void Service::clearCache(const ClearScope scope) {
    if (scope == ClearScope::Memory || scope == ClearScope::All) {
        ctx_->cache.clear();
        log::Registry::cache()->info("[Service] Memory cache cleared");
    }

    if (scope == ClearScope::Failed || scope == ClearScope::All) clearFailed();

    if (scope == ClearScope::Queue || scope == ClearScope::All) {
        const auto dropped = ctx_->scheduler.clear();
        ctx_->release(dropped);
        log::Registry::scheduler()->info("[Service] Dropped {} queued tasks", dropped.size());
    }
}

void Service::pauseScheduler() {
    ctx_->paused.store(true, std::memory_order_release);
    log::Registry::scheduler()->info("[Service] Scheduler paused");
}

void Service::resumeScheduler() {
    ctx_->paused.store(false, std::memory_order_release);
    log::Registry::scheduler()->info("[Service] Scheduler resumed");
}

bool Service::isPaused() const {
    return ctx_->paused.load(std::memory_order_acquire);
}

uint64_t Service::cleanupExpired(const unsigned int days, const bool excludeFolders) {
    flushSaveQueue();
    const auto n = ctx_->store.cleanupExpired(days, excludeFolders);
    if (n > 0) {
        ctx_->index.clear();
        ctx_->index.load(ctx_->store);
    }
    return n;
}

uint64_t Service::cleanupByPrefix(const std::string& prefix) {
    ctx_->cache.removeIf([&prefix](const std::string& k) { return k.starts_with(prefix); });
    ctx_->saveQueue.eraseIfPrefix(prefix);
    ctx_->index.eraseIfPrefix(prefix);
    return ctx_->store.cleanupByPrefix(prefix);
}

uint64_t Service::cleanupInvalidPaths() {
    flushSaveQueue();
    const auto n = ctx_->store.cleanupInvalidPaths();
    if (n > 0) {
        ctx_->index.clear();
        ctx_->index.load(ctx_->store);
    }
    return n;
}

uint64_t Service::clearFailed() {
    const auto inMemory = ctx_->index.failed.size();
    ctx_->index.failed.clear();
    const auto inStore = ctx_->store.clearFailed();
    log::Registry::cache()->info("[Service] Cleared failure blacklist ({} in memory, {} stored)", inMemory, inStore);
    return inMemory + inStore;
}

void Service::vacuum() {
    ctx_->store.vacuum();
}

StoreStats Service::detailedStats() const {
    return ctx_->store.detailedStats();
}

size_t Service::flushSaveQueue() {
    return flusher_->flushNow();
}

unsigned int Service::adaptNow() {
    return controller_->tick();
}
