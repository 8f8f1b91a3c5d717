#pragma once

#include "types/stats/EngineStats.hpp"

#include <atomic>
#include <chrono>
#include <string>

namespace tf::thumb {

// Caps concurrent entries into one pipeline stage (decode, scale, encode)
class StageLimiter {
public:
    StageLimiter(std::string name, unsigned int maxActive);

    [[nodiscard]] bool tryAcquire();
    void release();

    // Polls tryAcquire() every `poll` until `deadline` passes
    [[nodiscard]] bool acquireFor(std::chrono::milliseconds deadline, std::chrono::milliseconds poll);

    [[nodiscard]] unsigned int active() const { return active_.load(std::memory_order_acquire); }
    [[nodiscard]] unsigned int maxActive() const { return maxActive_; }
    [[nodiscard]] const std::string& name() const { return name_; }

    [[nodiscard]] types::StageStatsSnapshot snapshot() const;

private:
    const std::string name_;
    const unsigned int maxActive_;
    std::atomic<unsigned int> active_{0};

    types::PaddedAtomic<uint64_t> acquired_;
    types::PaddedAtomic<uint64_t> rejected_;
    types::LatencyStats waits_;
};

// Holds a stage slot for the lifetime of the token
class StageToken {
public:
    StageToken() = default;
    explicit StageToken(StageLimiter* stage) : stage_(stage) {}
    ~StageToken() { reset(); }

    StageToken(const StageToken&) = delete;
    StageToken& operator=(const StageToken&) = delete;

    StageToken(StageToken&& o) noexcept : stage_(o.stage_) { o.stage_ = nullptr; }
    StageToken& operator=(StageToken&& o) noexcept {
        if (this != &o) {
            reset();
            stage_ = o.stage_;
            o.stage_ = nullptr;
        }
        return *this;
    }

    // Empty token when the stage is saturated
    static StageToken tryAcquire(StageLimiter& stage) {
        return stage.tryAcquire() ? StageToken(&stage) : StageToken();
    }

    explicit operator bool() const { return stage_ != nullptr; }

    void reset() {
        if (stage_) stage_->release();
        stage_ = nullptr;
    }

private:
    StageLimiter* stage_ = nullptr;
};

}
