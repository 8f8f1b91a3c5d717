#pragma once

#include "types/Thumbnail.hpp"
#include "concurrency/AsyncService.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tf::config { struct DatabaseConfig; }

namespace tf::thumb {

class Store;

// Write-behind buffer between the workers and the store. Latest write per key
// wins. Doubles as a read tier until its contents reach the store: drained
// records stay readable until finishWrite().
class SaveQueue {
public:
    struct Failure {
        std::string key;
        std::string reason;
        std::string message;
    };

    struct Drained {
        std::vector<types::ThumbRecord> records;
        std::vector<Failure> failures;

        [[nodiscard]] bool empty() const { return records.empty() && failures.empty(); }
        [[nodiscard]] size_t size() const { return records.size() + failures.size(); }
    };

    void insert(const std::string& pathKey, types::Bytes bytes, int64_t size, int32_t fingerprint,
                types::Category category = types::Category::File);
    void insert(types::ThumbRecord record);
    void insertFailure(const std::string& key, std::string reason, std::string message);

    [[nodiscard]] std::optional<types::Bytes> peek(const std::string& key) const;
    [[nodiscard]] bool contains(const std::string& key) const;

    bool erase(const std::string& key);
    size_t eraseIfPrefix(const std::string& prefix);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;

    // Interval elapsed or count threshold reached, and something is queued
    [[nodiscard]] bool shouldFlush(std::chrono::steady_clock::time_point lastFlush,
                                   std::chrono::milliseconds interval,
                                   size_t countThreshold) const;

    Drained drain();

    // The last drained batch has been written (or given up on)
    void finishWrite();

    // Writes in chunks of at most chunkSize through saveBatch(); a failing
    // chunk is retried item by item. Returns the number of records written.
    static size_t flushTo(Store& store, const Drained& items, size_t chunkSize,
                          const std::function<void(size_t, std::chrono::microseconds)>& onChunk = {});

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, types::ThumbRecord> records_;
    std::unordered_map<std::string, Failure> failures_;
    std::unordered_map<std::string, types::Bytes> writing_;
};

// Polls the queue every 500 ms and writes it out when due. Whatever remains
// is flushed synchronously when the service stops.
class SaveFlusher final : public concurrency::AsyncService {
public:
    SaveFlusher(SaveQueue& queue, Store& store, const config::DatabaseConfig& cfg);
    ~SaveFlusher() override;

    // Drain and write everything now on the calling thread
    size_t flushNow();

    [[nodiscard]] size_t writeWindow() const { return writeWindow_.load(std::memory_order_relaxed); }

protected:
    void runLoop() override;

private:
    SaveQueue& queue_;
    Store& store_;
    std::chrono::milliseconds interval_;
    size_t threshold_;
    size_t writeMin_, writeMax_;
    std::chrono::milliseconds target_;
    std::atomic<size_t> writeWindow_;
    std::mutex flushMutex_;
    std::chrono::steady_clock::time_point lastFlush_;

    void adjustWindow_(size_t chunk, std::chrono::microseconds took);
};

}
