#pragma once

#include "concurrency/AsyncService.hpp"
#include "config/Config.hpp"

#include <cstdint>

namespace tf::thumb {

struct Context;

// Work observed during one controller tick
struct AdaptiveSample {
    uint64_t completed = 0;
    uint64_t failed = 0;
    uint64_t elapsed_us = 0; // generation time summed over completed + failed
    size_t backlog = 0;
};

// Next active worker budget, always within [minActive, poolSize]
unsigned int decideBudget(unsigned int current, const AdaptiveSample& sample,
                          const config::AdaptiveConfig& cfg, unsigned int minActive, unsigned int poolSize);

class AdaptiveController final : public concurrency::AsyncService {
public:
    explicit AdaptiveController(Context& ctx);
    ~AdaptiveController() override;

    // One sample/decide/apply round; returns the budget now in force
    unsigned int tick();

protected:
    void runLoop() override;

private:
    Context& ctx_;
    uint64_t lastCompleted_ = 0;
    uint64_t lastFailed_ = 0;
    uint64_t lastElapsedUs_ = 0;
};

}
