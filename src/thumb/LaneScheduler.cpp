#include "thumb/LaneScheduler.hpp"
#include "log/Registry.hpp"

using namespace tf::thumb;
using namespace tf::types;
using namespace tf::config;

const LaneQuota& tf::thumb::activeQuota(const LaneDepths& depths, const SchedulerConfig& cfg) {
    const auto visible = depths[Lane::Visible];
    const auto side = depths.side();

    if (visible >= side * cfg.visible_boost_factor) return cfg.visible_heavy;
    if (side > visible * cfg.side_boost_factor) return cfg.side_heavy;
    return cfg.balanced;
}

Lane tf::thumb::preferredLaneForTick(const uint64_t tick, const LaneDepths& depths, const SchedulerConfig& cfg) {
    const auto& q = activeQuota(depths, cfg);

    Lane preferred = Lane::Visible;
    if (const auto total = q.total(); total > 0) {
        const auto slot = tick % total;
        if (slot < q.visible) preferred = Lane::Visible;
        else if (slot < q.visible + q.prefetch) preferred = Lane::Prefetch;
        else preferred = Lane::Background;
    }

    if (depths[preferred] > 0) return preferred;
    for (const auto lane : ALL_LANES)
        if (depths[lane] > 0) return lane;
    return preferred;
}

LaneScheduler::LaneScheduler(SchedulerConfig cfg) : cfg_(std::move(cfg)) {}

std::vector<GenerateTask> LaneScheduler::enqueueTasks(std::vector<GenerateTask> tasks) {
    std::vector<GenerateTask> rejected;
    size_t added = 0;
    {
        std::scoped_lock lock(mutex_);
        for (auto& t : tasks) {
            if (byPath_.contains(t.path)) {
                rejected.push_back(std::move(t));
                continue;
            }
            insertLocked_(std::move(t), 1, nextSeq_++);
            ++added;
        }
    }

    if (added == 1) cv_.notify_one();
    else if (added > 1) cv_.notify_all();
    return rejected;
}

bool LaneScheduler::pushFront(GenerateTask task) {
    {
        std::scoped_lock lock(mutex_);
        if (byPath_.contains(task.path)) return false;
        insertLocked_(std::move(task), 0, --frontSeq_);
    }
    cv_.notify_one();
    return true;
}

std::optional<GenerateTask> LaneScheduler::popWithTimeout(const std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return shutdown_ || !byPath_.empty(); })) return std::nullopt;
    if (shutdown_) return std::nullopt;
    return popLocked_();
}

std::optional<GenerateTask> LaneScheduler::tryPop() {
    std::scoped_lock lock(mutex_);
    if (shutdown_) return std::nullopt;
    return popLocked_();
}

std::vector<GenerateTask> LaneScheduler::clear() {
    std::scoped_lock lock(mutex_);
    std::vector<GenerateTask> out;
    out.reserve(byPath_.size());
    for (auto& lane : lanes_) {
        for (auto& [_, t] : lane) out.push_back(std::move(t));
        lane.clear();
    }
    byPath_.clear();
    for (auto& c : counts_) c.store(0, std::memory_order_release);
    return out;
}

std::vector<GenerateTask> LaneScheduler::clearDirectory(const std::string& directory) {
    std::scoped_lock lock(mutex_);
    return removeIfLocked_([&](const GenerateTask& t) { return t.directory == directory; });
}

std::vector<GenerateTask> LaneScheduler::pruneLaneDirectoryExcept(const Lane lane, const std::string& directory,
                                                                  const std::unordered_set<std::string>& keep) {
    std::scoped_lock lock(mutex_);
    return removeIfLocked_([&](const GenerateTask& t) {
        return t.lane == lane && t.directory == directory && !keep.contains(t.path);
    });
}

std::optional<GenerateTask> LaneScheduler::removePath(const std::string& path) {
    std::scoped_lock lock(mutex_);
    if (!byPath_.contains(path)) return std::nullopt;
    return eraseLocked_(path);
}

std::optional<GenerateTask> LaneScheduler::replacePath(const std::string& path, GenerateTask task) {
    std::optional<GenerateTask> previous;
    {
        std::scoped_lock lock(mutex_);
        if (byPath_.contains(path)) previous = eraseLocked_(path);
        if (task.path != path && byPath_.contains(task.path)) eraseLocked_(task.path);
        insertLocked_(std::move(task), 1, nextSeq_++);
    }
    cv_.notify_one();
    return previous;
}

bool LaneScheduler::contains(const std::string& path) const {
    std::scoped_lock lock(mutex_);
    return byPath_.contains(path);
}

LaneDepths LaneScheduler::depths() const {
    LaneDepths d;
    for (size_t i = 0; i < counts_.size(); ++i) d.counts[i] = counts_[i].load(std::memory_order_acquire);
    return d;
}

size_t LaneScheduler::size() const {
    return depths().total();
}

bool LaneScheduler::empty() const {
    return size() == 0;
}

void LaneScheduler::shutdown() {
    {
        std::scoped_lock lock(mutex_);
        shutdown_ = true;
    }
    cv_.notify_all();
}

void LaneScheduler::reopen() {
    std::scoped_lock lock(mutex_);
    shutdown_ = false;
}

void LaneScheduler::insertLocked_(GenerateTask task, const int bucket, const int64_t seq) {
    const auto lane = task.lane;
    const OrderKey key{bucket, bucket == 0 ? 0 : task.center_distance, seq};
    byPath_.insert_or_assign(task.path, Slot{lane, key});
    lanes_[laneIndex(lane)].emplace(key, std::move(task));
    counts_[laneIndex(lane)].fetch_add(1, std::memory_order_acq_rel);
}

GenerateTask LaneScheduler::eraseLocked_(const std::string& path) {
    const auto slotIt = byPath_.find(path);
    const auto slot = slotIt->second;
    byPath_.erase(slotIt);

    auto& lane = lanes_[laneIndex(slot.lane)];
    const auto it = lane.find(slot.key);
    auto task = std::move(it->second);
    lane.erase(it);
    counts_[laneIndex(slot.lane)].fetch_sub(1, std::memory_order_acq_rel);
    return task;
}

std::optional<GenerateTask> LaneScheduler::popLocked_() {
    if (byPath_.empty()) return std::nullopt;

    const auto lane = preferredLaneForTick(tick_++, depthsLocked_(), cfg_);
    auto& q = lanes_[laneIndex(lane)];
    if (q.empty()) return std::nullopt;

    auto node = q.extract(q.begin());
    byPath_.erase(node.mapped().path);
    counts_[laneIndex(lane)].fetch_sub(1, std::memory_order_acq_rel);
    return std::move(node.mapped());
}

std::vector<GenerateTask> LaneScheduler::removeIfLocked_(const std::function<bool(const GenerateTask&)>& pred) {
    std::vector<GenerateTask> removed;
    for (size_t i = 0; i < lanes_.size(); ++i) {
        auto& lane = lanes_[i];
        for (auto it = lane.begin(); it != lane.end();) {
            if (pred(it->second)) {
                byPath_.erase(it->second.path);
                removed.push_back(std::move(it->second));
                it = lane.erase(it);
                counts_[i].fetch_sub(1, std::memory_order_acq_rel);
            } else ++it;
        }
    }
    if (!removed.empty())
        log::Registry::scheduler()->debug("[LaneScheduler] Dropped {} queued tasks", removed.size());
    return removed;
}

LaneDepths LaneScheduler::depthsLocked_() const {
    LaneDepths d;
    for (size_t i = 0; i < lanes_.size(); ++i) d.counts[i] = lanes_[i].size();
    return d;
}
