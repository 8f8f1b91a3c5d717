#include "thumb/StoreLoader.hpp"
#include "thumb/Context.hpp"
#include "thumb/Store.hpp"
#include "types/Task.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <chrono>

using namespace tf::thumb;
using namespace tf::types;
using namespace std::chrono;

StoreLoader::StoreLoader(Context& ctx)
    : AsyncService("StoreLoader"),
      ctx_(ctx),
      readMin_(std::max<size_t>(1, ctx.cfg.database.read_batch_min)),
      readMax_(std::max(readMin_, ctx.cfg.database.read_batch_max)),
      targetMs_(std::max<uint64_t>(4, ctx.cfg.database.batch_target_ms)),
      readWindow_(readMin_) {}

StoreLoader::~StoreLoader() {
    stop();
}

void StoreLoader::submit(std::vector<std::string> paths, const uint64_t epoch) {
    if (paths.empty()) return;
    {
        std::scoped_lock lock(mutex_);
        queue_.push_back({std::move(paths), epoch});
    }
    cv_.notify_one();
}

size_t StoreLoader::pending() const {
    std::scoped_lock lock(mutex_);
    return queue_.size();
}

void StoreLoader::handleInterrupt() {
    { std::scoped_lock lock(mutex_); }
    cv_.notify_all();
}

void StoreLoader::runLoop() {
    while (!interruptFlag_.load(std::memory_order_acquire)) {
        Batch batch;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return interruptFlag_.load(std::memory_order_acquire) || !queue_.empty(); });
            if (interruptFlag_.load(std::memory_order_acquire)) break;
            batch = std::move(queue_.front());
            queue_.pop_front();
        }
        load(batch.paths, batch.epoch);
    }
}

size_t StoreLoader::load(const std::vector<std::string>& paths, const uint64_t epoch) {
    size_t total = 0;
    size_t offset = 0;

    while (offset < paths.size()) {
        const auto window = readWindow();
        const auto end = std::min(paths.size(), offset + window);
        const auto started = steady_clock::now();

        std::vector<std::string> loaded;
        loaded.reserve(end - offset);

        for (size_t i = offset; i < end; ++i) {
            const auto& path = paths[i];
            const auto primary = isLikelyFolder(path) ? Category::Folder : Category::File;
            const auto secondary = primary == Category::Folder ? Category::File : Category::Folder;

            // save queue first: a record leaves it only once the store has it
            std::optional<Bytes> bytes = ctx_.saveQueue.peek(path);
            try {
                if (!bytes) bytes = ctx_.store.load(path, primary);
                if (!bytes) bytes = ctx_.store.load(path, secondary);
            } catch (const std::exception& e) {
                log::Registry::db()->error("[StoreLoader] Failed to load thumbnail {}: {}", path, e.what());
                continue;
            }

            if (!bytes) {
                // index was out of date; let the next request regenerate it
                ctx_.index.present.erase(path);
                ctx_.index.folders.erase(path);
                continue;
            }

            ctx_.cache.put(path, std::move(*bytes));
            loaded.push_back(path);
        }

        if (!loaded.empty()) {
            try {
                ctx_.store.touchBatch(loaded);
            } catch (const std::exception& e) {
                log::Registry::db()->warn("[StoreLoader] Failed to update access time for {} keys: {}",
                                          loaded.size(), e.what());
            }

            if (ctx_.isCurrentEpoch(epoch)) {
                const auto emitSize = std::clamp<size_t>(window, 8, 64);
                for (size_t i = 0; i < loaded.size(); i += emitSize) {
                    const auto last = std::min(loaded.size(), i + emitSize);
                    ctx_.emit(std::vector<std::string>(loaded.begin() + static_cast<std::ptrdiff_t>(i),
                                                       loaded.begin() + static_cast<std::ptrdiff_t>(last)));
                }
            }
            total += loaded.size();
        }

        const auto elapsedMs = static_cast<uint64_t>(duration_cast<milliseconds>(steady_clock::now() - started).count());
        adjustWindow_(end - offset, elapsedMs);
        offset = end;
    }

    if (ctx_.cache.overBudget(ctx_.cfg.thumbnails.memory_cache_byte_budget)) ctx_.cleanupCache();
    return total;
}

void StoreLoader::adjustWindow_(const size_t chunkSize, const uint64_t elapsedMs) {
    auto window = readWindow();
    if (elapsedMs > targetMs_ && window > readMin_)
        window = std::max(readMin_, window > 4 ? window - 4 : readMin_);
    else if (elapsedMs < targetMs_ / 2 && chunkSize == window && window < readMax_)
        window = std::min(readMax_, window + 4);
    readWindow_.store(window, std::memory_order_relaxed);
}
