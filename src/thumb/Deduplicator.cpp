#include "thumb/Deduplicator.hpp"

using namespace tf::thumb;

std::optional<uint64_t> Deduplicator::tryAcquire(const std::string& path) {
    std::scoped_lock lock(mutex_);
    if (inFlight_.contains(path)) return std::nullopt;
    const auto id = nextId_.fetch_add(1, std::memory_order_relaxed);
    inFlight_.emplace(path, id);
    return id;
}

uint64_t Deduplicator::forceAcquire(const std::string& path) {
    std::scoped_lock lock(mutex_);
    const auto id = nextId_.fetch_add(1, std::memory_order_relaxed);
    inFlight_[path] = id;
    return id;
}

bool Deduplicator::release(const std::string& path, const uint64_t id) {
    std::scoped_lock lock(mutex_);
    const auto it = inFlight_.find(path);
    if (it == inFlight_.end() || it->second != id) return false;
    inFlight_.erase(it);
    return true;
}

bool Deduplicator::isReserved(const std::string& path) const {
    std::scoped_lock lock(mutex_);
    return inFlight_.contains(path);
}

size_t Deduplicator::size() const {
    std::scoped_lock lock(mutex_);
    return inFlight_.size();
}

void Deduplicator::clear() {
    std::scoped_lock lock(mutex_);
    inFlight_.clear();
}
