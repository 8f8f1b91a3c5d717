#include "thumb/AdaptiveController.hpp"
#include "thumb/Context.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace tf::thumb;
using namespace std::chrono;

unsigned int tf::thumb::decideBudget(const unsigned int current, const AdaptiveSample& sample,
                                     const config::AdaptiveConfig& cfg, const unsigned int minActive,
                                     const unsigned int poolSize) {
    const auto cap = std::max(1u, poolSize);
    const auto floor = std::clamp(minActive, 1u, cap);
    const auto budget = std::clamp(current, floor, cap);

    const auto total = sample.completed + sample.failed;
    if (total == 0) {
        if (sample.backlog >= cfg.scale_up_backlog) return std::min(cap, budget + 1);
        return budget;
    }

    const auto avgMs = sample.elapsed_us / total / 1000;
    const auto failPercent = sample.failed * 100 / total;

    if (avgMs > cfg.scale_down_avg_ms || failPercent > cfg.scale_down_fail_percent)
        return budget > floor ? budget - 1 : floor;

    if (sample.backlog >= cfg.scale_up_backlog && avgMs <= cfg.scale_up_avg_ms)
        return std::min(cap, budget + 1);

    return budget;
}

AdaptiveController::AdaptiveController(Context& ctx)
    : AsyncService("AdaptiveController"), ctx_(ctx) {}

AdaptiveController::~AdaptiveController() {
    stop();
}

unsigned int AdaptiveController::tick() {
    const auto completed = ctx_.stats.completed.v.load(std::memory_order_relaxed);
    const auto failed = ctx_.stats.failed.v.load(std::memory_order_relaxed);
    const auto elapsed = ctx_.stats.generation.total_us.v.load(std::memory_order_relaxed);

    AdaptiveSample sample;
    sample.completed = completed - lastCompleted_;
    sample.failed = failed - lastFailed_;
    sample.elapsed_us = elapsed - lastElapsedUs_;
    sample.backlog = ctx_.scheduler.size();

    lastCompleted_ = completed;
    lastFailed_ = failed;
    lastElapsedUs_ = elapsed;

    const auto current = ctx_.workerBudget.load(std::memory_order_acquire);
    const auto next = decideBudget(current, sample, ctx_.cfg.adaptive, ctx_.cfg.minActiveWorkers(),
                                   ctx_.cfg.thumbnails.worker_threads);

    if (next != current) {
        ctx_.workerBudget.store(next, std::memory_order_release);
        log::Registry::scheduler()->debug(
            "[AdaptiveController] Budget {} -> {} (done {}, failed {}, backlog {})",
            current, next, sample.completed, sample.failed, sample.backlog);
    }
    return next;
}

void AdaptiveController::runLoop() {
    const milliseconds period(std::max(10u, ctx_.cfg.adaptive.tick_ms));
    while (sleepFor(period)) tick();
}
