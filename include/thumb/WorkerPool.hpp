#pragma once

#include "types/Task.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace tf::thumb {

struct Context;
class Generators;

// Fixed set of threads draining the lane scheduler. The number of threads
// doing work at once is capped by Context::workerBudget, not by the pool size.
class WorkerPool {
public:
    enum class Outcome { Completed, Failed, Stale, Requeued, Superseded };

    WorkerPool(Context& ctx, Generators& generators);
    ~WorkerPool();

    void start();
    void stop();

    [[nodiscard]] unsigned int workerCount() const { return static_cast<unsigned int>(threads_.size()); }
    [[nodiscard]] bool isRunning() const { return !threads_.empty() && !stopFlag_.load(); }

    // One task through the stage limits and the fault boundary; always leaves
    // the reservation released unless the task was re-queued. A task that
    // cannot re-queue because a regenerate request took its path is dropped.
    Outcome processTask(const types::GenerateTask& task, std::vector<std::string>& batch);

private:
    Context& ctx_;
    Generators& generators_;
    std::vector<std::thread> threads_;
    std::atomic<bool> stopFlag_{false};

    void spawnWorker(unsigned int id);
    void workerLoop(unsigned int id);
    bool claimSlot_();
    void flushBatch_(std::vector<std::string>& batch);
};

}
