#include "thumb/SaveQueue.hpp"
#include "thumb/Store.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace tf::thumb;
using namespace tf::types;
using namespace std::chrono;

void SaveQueue::insert(const std::string& pathKey, Bytes bytes, const int64_t size, const int32_t fingerprint,
                       const Category category) {
    insert(ThumbRecord{pathKey, std::move(bytes), size, fingerprint, category});
}

void SaveQueue::insert(ThumbRecord record) {
    std::scoped_lock lock(mutex_);
    failures_.erase(record.key);
    auto key = record.key;
    records_.insert_or_assign(std::move(key), std::move(record));
}

void SaveQueue::insertFailure(const std::string& key, std::string reason, std::string message) {
    std::scoped_lock lock(mutex_);
    failures_.insert_or_assign(key, Failure{key, std::move(reason), std::move(message)});
}

std::optional<Bytes> SaveQueue::peek(const std::string& key) const {
    std::scoped_lock lock(mutex_);
    if (const auto it = records_.find(key); it != records_.end()) return it->second.bytes;
    if (const auto it = writing_.find(key); it != writing_.end()) return it->second;
    return std::nullopt;
}

bool SaveQueue::contains(const std::string& key) const {
    std::scoped_lock lock(mutex_);
    return records_.contains(key) || writing_.contains(key);
}

bool SaveQueue::erase(const std::string& key) {
    std::scoped_lock lock(mutex_);
    const auto n = records_.erase(key) + failures_.erase(key) + writing_.erase(key);
    return n > 0;
}

size_t SaveQueue::eraseIfPrefix(const std::string& prefix) {
    std::scoped_lock lock(mutex_);
    const auto pred = [&prefix](const auto& kv) { return kv.first.starts_with(prefix); };
    return std::erase_if(records_, pred) + std::erase_if(failures_, pred) + std::erase_if(writing_, pred);
}

size_t SaveQueue::size() const {
    std::scoped_lock lock(mutex_);
    return records_.size() + failures_.size();
}

bool SaveQueue::empty() const {
    return size() == 0;
}

bool SaveQueue::shouldFlush(const steady_clock::time_point lastFlush,
                            const milliseconds interval,
                            const size_t countThreshold) const {
    const auto len = size();
    if (len == 0) return false;
    return steady_clock::now() - lastFlush >= interval || len >= countThreshold;
}

SaveQueue::Drained SaveQueue::drain() {
    Drained out;
    std::scoped_lock lock(mutex_);
    out.records.reserve(records_.size());
    writing_.clear();
    for (auto& [key, rec] : records_) {
        writing_.emplace(key, rec.bytes);
        out.records.push_back(std::move(rec));
    }
    out.failures.reserve(failures_.size());
    for (auto& [_, f] : failures_) out.failures.push_back(std::move(f));
    records_.clear();
    failures_.clear();
    return out;
}

void SaveQueue::finishWrite() {
    std::scoped_lock lock(mutex_);
    writing_.clear();
}

size_t SaveQueue::flushTo(Store& store, const Drained& items, size_t chunkSize,
                          const std::function<void(size_t, microseconds)>& onChunk) {
    chunkSize = std::max<size_t>(1, chunkSize);
    size_t written = 0;

    for (size_t i = 0; i < items.records.size(); i += chunkSize) {
        const auto end = std::min(items.records.size(), i + chunkSize);
        const std::vector chunk(items.records.begin() + static_cast<std::ptrdiff_t>(i),
                                items.records.begin() + static_cast<std::ptrdiff_t>(end));

        const auto start = steady_clock::now();
        try {
            store.saveBatch(chunk);
            written += chunk.size();
        } catch (const std::exception& e) {
            log::Registry::db()->warn("[SaveQueue] Batch save of {} records failed, retrying one by one: {}",
                                      chunk.size(), e.what());
            for (const auto& rec : chunk) {
                try {
                    store.save(rec);
                    ++written;
                } catch (const std::exception& ie) {
                    log::Registry::db()->error("[SaveQueue] Failed to save thumbnail {}: {}", rec.key, ie.what());
                }
            }
        }
        if (onChunk) onChunk(chunk.size(), duration_cast<microseconds>(steady_clock::now() - start));
    }

    for (const auto& f : items.failures) {
        try {
            store.markFailed(f.key, f.reason, f.message);
        } catch (const std::exception& e) {
            log::Registry::db()->error("[SaveQueue] Failed to record failure for {}: {}", f.key, e.what());
        }
    }

    return written;
}

SaveFlusher::SaveFlusher(SaveQueue& queue, Store& store, const config::DatabaseConfig& cfg)
    : AsyncService("SaveFlusher"),
      queue_(queue),
      store_(store),
      interval_(cfg.save_delay_ms),
      threshold_(std::max<size_t>(1, cfg.batch_save_threshold)),
      writeMin_(std::max<size_t>(1, cfg.write_batch_min)),
      writeMax_(std::max(std::max<size_t>(1, cfg.write_batch_min), cfg.write_batch_max)),
      target_(std::max<uint64_t>(4, cfg.batch_target_ms)),
      writeWindow_(writeMin_),
      lastFlush_(steady_clock::now()) {}

SaveFlusher::~SaveFlusher() {
    stop();
}

void SaveFlusher::runLoop() {
    while (!interruptFlag_.load(std::memory_order_acquire)) {
        if (!sleepFor(milliseconds(500))) break;
        bool due;
        {
            std::scoped_lock lock(flushMutex_);
            due = queue_.shouldFlush(lastFlush_, interval_, threshold_);
        }
        if (due) flushNow();
    }

    if (const auto n = flushNow(); n > 0)
        log::Registry::db()->info("[SaveFlusher] Flushed {} remaining thumbnails on shutdown", n);
}

size_t SaveFlusher::flushNow() {
    std::scoped_lock lock(flushMutex_);
    const auto items = queue_.drain();
    lastFlush_ = steady_clock::now();
    if (items.empty()) return 0;

    log::Registry::db()->debug("[SaveFlusher] Writing {} thumbnails and {} failures",
                               items.records.size(), items.failures.size());

    size_t written = 0;
    try {
        written = SaveQueue::flushTo(store_, items, writeWindow(),
                                     [this](const size_t n, const microseconds took) { adjustWindow_(n, took); });
    } catch (const std::exception&) {
        queue_.finishWrite();
        throw;
    }
    queue_.finishWrite();
    return written;
}

void SaveFlusher::adjustWindow_(const size_t chunk, const microseconds took) {
    auto window = writeWindow_.load(std::memory_order_relaxed);
    if (took > target_) window = window > writeMin_ + 16 ? window - 16 : writeMin_;
    else if (took < target_ / 2 && chunk >= window) window = std::min(writeMax_, window + 16);
    writeWindow_.store(window, std::memory_order_relaxed);
}
