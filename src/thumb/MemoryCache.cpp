#include "thumb/MemoryCache.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <mutex>

using namespace tf::thumb;
using namespace tf::types;

MemoryCache::MemoryCache(const size_t capacity,
                         const unsigned int decayThresholdPercent,
                         const unsigned int decayDropPercent)
    : capacity_(std::max<size_t>(1, capacity)),
      decayThresholdPercent_(std::min(100u, decayThresholdPercent)),
      decayDropPercent_(std::min(100u, decayDropPercent)) {}

std::optional<Bytes> MemoryCache::peek(const std::string& key) const {
    std::shared_lock lock(mutex_);
    const auto it = map_.find(key);
    if (it == map_.end()) return std::nullopt;
    return it->second->bytes;
}

std::optional<Bytes> MemoryCache::get(const std::string& key) {
    std::unique_lock lock(mutex_);
    const auto it = map_.find(key);
    if (it == map_.end()) return std::nullopt;
    lru_.splice(lru_.begin(), lru_, it->second);
    return it->second->bytes;
}

bool MemoryCache::contains(const std::string& key) const {
    std::shared_lock lock(mutex_);
    return map_.contains(key);
}

size_t MemoryCache::put(const std::string& key, Bytes bytes) {
    std::unique_lock lock(mutex_);

    if (const auto it = map_.find(key); it != map_.end()) {
        const auto oldSize = it->second->bytes.size();
        const auto newSize = bytes.size();
        it->second->bytes = std::move(bytes);
        lru_.splice(lru_.begin(), lru_, it->second);
        bytes_.store(bytes_.load(std::memory_order_relaxed) - oldSize + newSize, std::memory_order_release);
        return 0;
    }

    const auto size = bytes.size();
    lru_.push_front({key, std::move(bytes)});
    map_.emplace(key, lru_.begin());
    bytes_.store(bytes_.load(std::memory_order_relaxed) + size, std::memory_order_release);

    CleanupResult r;
    while (map_.size() > capacity_) evictBack_(r);
    return r.evictedEntries;
}

bool MemoryCache::putIfAbsent(const std::string& key, Bytes bytes) {
    {
        std::shared_lock lock(mutex_);
        if (map_.contains(key)) return false;
    }

    std::unique_lock lock(mutex_);
    if (map_.contains(key)) return false;

    const auto size = bytes.size();
    lru_.push_front({key, std::move(bytes)});
    map_.emplace(key, lru_.begin());
    bytes_.store(bytes_.load(std::memory_order_relaxed) + size, std::memory_order_release);

    CleanupResult r;
    while (map_.size() > capacity_) evictBack_(r);
    return true;
}

bool MemoryCache::remove(const std::string& key) {
    std::unique_lock lock(mutex_);
    const auto it = map_.find(key);
    if (it == map_.end()) return false;
    bytes_.store(bytes_.load(std::memory_order_relaxed) - it->second->bytes.size(), std::memory_order_release);
    lru_.erase(it->second);
    map_.erase(it);
    return true;
}

size_t MemoryCache::removeIf(const std::function<bool(const std::string&)>& pred) {
    std::unique_lock lock(mutex_);
    size_t removed = 0;
    uint64_t freed = 0;
    for (auto it = lru_.begin(); it != lru_.end();) {
        if (pred(it->key)) {
            freed += it->bytes.size();
            map_.erase(it->key);
            it = lru_.erase(it);
            ++removed;
        } else ++it;
    }
    bytes_.store(bytes_.load(std::memory_order_relaxed) - freed, std::memory_order_release);
    return removed;
}

void MemoryCache::clear() {
    std::unique_lock lock(mutex_);
    map_.clear();
    lru_.clear();
    bytes_.store(0, std::memory_order_release);
}

MemoryCache::CleanupResult MemoryCache::cleanup(const uint64_t maxBytes) {
    const auto trigger = maxBytes / 100 * decayThresholdPercent_ + maxBytes % 100 * decayThresholdPercent_ / 100;

    size_t toDrop = 0;
    {
        std::shared_lock lock(mutex_);
        if (lru_.empty() || bytes_.load(std::memory_order_acquire) < trigger) return {};
        toDrop = std::max<size_t>(1, lru_.size() * decayDropPercent_ / 100);
    }

    CleanupResult r;
    std::unique_lock lock(mutex_);

    // another thread may have cleaned up between the two phases
    if (lru_.empty() || bytes_.load(std::memory_order_relaxed) < trigger) return r;

    for (size_t i = 0; i < toDrop && !lru_.empty(); ++i) evictBack_(r);
    while (!lru_.empty() && bytes_.load(std::memory_order_relaxed) > maxBytes) evictBack_(r);

    if (r.evictedEntries)
        log::Registry::cache()->debug("[MemoryCache] Decay evicted {} entries ({} bytes), {} bytes resident",
                                      r.evictedEntries, r.evictedBytes, bytes_.load(std::memory_order_relaxed));
    return r;
}

bool MemoryCache::overBudget(const uint64_t maxBytes) const {
    return bytes() > maxBytes;
}

size_t MemoryCache::size() const {
    std::shared_lock lock(mutex_);
    return map_.size();
}

uint64_t MemoryCache::residentBytes() const {
    std::shared_lock lock(mutex_);
    uint64_t total = 0;
    for (const auto& e : lru_) total += e.bytes.size();
    return total;
}

std::vector<std::string> MemoryCache::keys() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> out;
    out.reserve(lru_.size());
    for (const auto& e : lru_) out.push_back(e.key);
    return out;
}

void MemoryCache::evictBack_(CleanupResult& r) {
    auto& victim = lru_.back();
    const auto size = victim.bytes.size();
    map_.erase(victim.key);
    lru_.pop_back();
    bytes_.store(bytes_.load(std::memory_order_relaxed) - size, std::memory_order_release);
    ++r.evictedEntries;
    r.evictedBytes += size;
}
