#pragma once

#include "types/Thumbnail.hpp"

#include <atomic>
#include <functional>
#include <list>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tf::thumb {

// Entry-capped LRU of encoded thumbnails with byte accounting.
// bytes() always equals the sum of resident entry sizes; it is only
// written while the exclusive lock is held.
class MemoryCache {
public:
    struct CleanupResult {
        size_t evictedEntries = 0;
        uint64_t evictedBytes = 0;
    };

    explicit MemoryCache(size_t capacity,
                         unsigned int decayThresholdPercent = 85,
                         unsigned int decayDropPercent = 12);

    // No recency update
    [[nodiscard]] std::optional<types::Bytes> peek(const std::string& key) const;

    // Marks key most recently used
    [[nodiscard]] std::optional<types::Bytes> get(const std::string& key);

    [[nodiscard]] bool contains(const std::string& key) const;

    // Insert or replace; evicts LRU entries beyond capacity. Returns evicted count.
    size_t put(const std::string& key, types::Bytes bytes);

    // Inserts only when absent; true if inserted
    bool putIfAbsent(const std::string& key, types::Bytes bytes);

    bool remove(const std::string& key);
    size_t removeIf(const std::function<bool(const std::string&)>& pred);
    void clear();

    // Two-phase decay: decide under the shared lock, evict under the exclusive
    // lock after re-checking. Leaves bytes() <= maxBytes.
    CleanupResult cleanup(uint64_t maxBytes);

    [[nodiscard]] bool overBudget(uint64_t maxBytes) const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const { return capacity_; }
    [[nodiscard]] uint64_t bytes() const { return bytes_.load(std::memory_order_acquire); }

    // Recomputed from entries
    [[nodiscard]] uint64_t residentBytes() const;

    [[nodiscard]] std::vector<std::string> keys() const;

private:
    struct Entry {
        std::string key;
        types::Bytes bytes;
    };

    using List = std::list<Entry>;

    const size_t capacity_;
    const unsigned int decayThresholdPercent_;
    const unsigned int decayDropPercent_;

    mutable std::shared_mutex mutex_;
    List lru_; // front = most recent
    std::unordered_map<std::string, List::iterator> map_;
    std::atomic<uint64_t> bytes_{0};

    void evictBack_(CleanupResult& r);
};

}
