#pragma once

#include "concurrency/AsyncService.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace tf::thumb {

struct Context;

// Serves index hits: reads batches from the store off the request path,
// fills the memory cache and emits ready notifications. The read window
// adapts to keep each chunk near database.batch_target_ms.
class StoreLoader final : public concurrency::AsyncService {
public:
    explicit StoreLoader(Context& ctx);
    ~StoreLoader() override;

    void submit(std::vector<std::string> paths, uint64_t epoch);

    // Synchronous variant; returns the number of thumbnails loaded
    size_t load(const std::vector<std::string>& paths, uint64_t epoch);

    [[nodiscard]] size_t readWindow() const { return readWindow_.load(std::memory_order_relaxed); }
    [[nodiscard]] size_t pending() const;

protected:
    void runLoop() override;
    void handleInterrupt() override;

private:
    struct Batch {
        std::vector<std::string> paths;
        uint64_t epoch = 0;
    };

    Context& ctx_;
    const size_t readMin_;
    const size_t readMax_;
    const uint64_t targetMs_;
    std::atomic<size_t> readWindow_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Batch> queue_;

    void adjustWindow_(size_t chunkSize, uint64_t elapsedMs);
};

}
