#include "thumb/StageLimiter.hpp"

#include <algorithm>
#include <thread>

using namespace tf::thumb;
using namespace std::chrono;

StageLimiter::StageLimiter(std::string name, const unsigned int maxActive)
    : name_(std::move(name)), maxActive_(std::max(1u, maxActive)) {}

bool StageLimiter::tryAcquire() {
    auto cur = active_.load(std::memory_order_acquire);
    while (cur < maxActive_) {
        if (active_.compare_exchange_weak(cur, cur + 1, std::memory_order_acq_rel)) {
            acquired_.v.fetch_add(1, std::memory_order_relaxed);
            return true;
        }
    }
    rejected_.v.fetch_add(1, std::memory_order_relaxed);
    return false;
}

void StageLimiter::release() {
    active_.fetch_sub(1, std::memory_order_acq_rel);
}

bool StageLimiter::acquireFor(const milliseconds deadline, const milliseconds poll) {
    const auto start = steady_clock::now();
    const auto until = start + deadline;
    while (true) {
        if (tryAcquire()) {
            if (const auto waited = steady_clock::now() - start; waited > microseconds(0))
                waits_.observe_us(static_cast<uint64_t>(duration_cast<microseconds>(waited).count()));
            return true;
        }
        if (steady_clock::now() >= until) return false;
        std::this_thread::sleep_for(poll);
    }
}

tf::types::StageStatsSnapshot StageLimiter::snapshot() const {
    types::StageStatsSnapshot s;
    s.name = name_;
    s.max_active = maxActive_;
    s.active = active();
    s.acquired = acquired_.v.load(std::memory_order_relaxed);
    s.rejected = rejected_.v.load(std::memory_order_relaxed);
    s.wait_count = waits_.count.v.load(std::memory_order_relaxed);
    s.wait_total_us = waits_.total_us.v.load(std::memory_order_relaxed);
    return s;
}
