#pragma once

#include "types/Task.hpp"
#include "config/Config.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tf::thumb {

struct LaneDepths {
    std::array<size_t, 3> counts{};

    size_t& operator[](const types::Lane l) { return counts[types::laneIndex(l)]; }
    size_t operator[](const types::Lane l) const { return counts[types::laneIndex(l)]; }

    [[nodiscard]] size_t total() const { return counts[0] + counts[1] + counts[2]; }
    [[nodiscard]] size_t side() const { return counts[1] + counts[2]; }
};

// Quota in force for the given backlog:
//   visible >= side * visible_boost_factor  -> visible_heavy (8:1:1)
//   side > visible * side_boost_factor      -> side_heavy    (4:3:3)
//   otherwise                               -> balanced      (6:2:1)
const config::LaneQuota& activeQuota(const LaneDepths& depths, const config::SchedulerConfig& cfg);

// Lane to draw from on this tick. When the quota's lane is empty the first
// non-empty lane in Visible, Prefetch, Background order is used instead.
types::Lane preferredLaneForTick(uint64_t tick, const LaneDepths& depths, const config::SchedulerConfig& cfg);

// Three-lane blocking task queue. Inside a lane tasks are ordered by
// center_distance, then enqueue order; re-queued tasks go ahead of both.
// A path is queued at most once.
class LaneScheduler {
public:
    explicit LaneScheduler(config::SchedulerConfig cfg);

    // Returns the tasks that were not queued because their path already was
    std::vector<types::GenerateTask> enqueueTasks(std::vector<types::GenerateTask> tasks);

    // Re-queue at the head of the task's lane. Returns false and leaves the
    // queue untouched when the path was queued again meanwhile; the queued
    // task holds the newer reservation.
    [[nodiscard]] bool pushFront(types::GenerateTask task);

    [[nodiscard]] std::optional<types::GenerateTask> popWithTimeout(std::chrono::milliseconds timeout);
    [[nodiscard]] std::optional<types::GenerateTask> tryPop();

    // All removal operations hand back what they dropped so reservations can be released
    std::vector<types::GenerateTask> clear();
    std::vector<types::GenerateTask> clearDirectory(const std::string& directory);
    std::vector<types::GenerateTask> pruneLaneDirectoryExcept(types::Lane lane, const std::string& directory,
                                                              const std::unordered_set<std::string>& keep);
    std::optional<types::GenerateTask> removePath(const std::string& path);
    std::optional<types::GenerateTask> replacePath(const std::string& path, types::GenerateTask task);

    [[nodiscard]] bool contains(const std::string& path) const;
    [[nodiscard]] LaneDepths depths() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;

    // Wakes all waiters; subsequent pops return immediately
    void shutdown();
    void reopen();

private:
    using OrderKey = std::tuple<int, size_t, int64_t>; // bucket, distance, seq
    using LaneQueue = std::map<OrderKey, types::GenerateTask>;

    struct Slot {
        types::Lane lane;
        OrderKey key;
    };

    const config::SchedulerConfig cfg_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::array<LaneQueue, 3> lanes_;
    std::unordered_map<std::string, Slot> byPath_;
    std::array<std::atomic<size_t>, 3> counts_{};
    int64_t nextSeq_ = 0;
    int64_t frontSeq_ = 0;
    uint64_t tick_ = 0;
    bool shutdown_ = false;

    void insertLocked_(types::GenerateTask task, int bucket, int64_t seq);
    types::GenerateTask eraseLocked_(const std::string& path);
    std::optional<types::GenerateTask> popLocked_();
    std::vector<types::GenerateTask> removeIfLocked_(const std::function<bool(const types::GenerateTask&)>& pred);
    LaneDepths depthsLocked_() const;
};

}
