#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace tf::thumb {

// In-flight reservations keyed by path. At most one id is outstanding per path.
class Deduplicator {
public:
    // Fresh id iff no reservation is outstanding for path
    [[nodiscard]] std::optional<uint64_t> tryAcquire(const std::string& path);

    // Supersedes any holder; the superseded id's release() becomes a no-op
    uint64_t forceAcquire(const std::string& path);

    // Clears the reservation only if id is the latest holder
    bool release(const std::string& path, uint64_t id);

    [[nodiscard]] bool isReserved(const std::string& path) const;
    [[nodiscard]] size_t size() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, uint64_t> inFlight_;
    std::atomic<uint64_t> nextId_{1};
};

}
