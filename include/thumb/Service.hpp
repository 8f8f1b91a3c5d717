#pragma once

#include "config/Config.hpp"
#include "types/Task.hpp"
#include "types/Thumbnail.hpp"
#include "types/stats/EngineStats.hpp"
#include "thumb/Store.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tf::thumb {

struct Context;
class Decoder;
class ReadySink;
class Generators;
class WorkerPool;
class AdaptiveController;
class SaveFlusher;
class StoreLoader;

enum class ClearScope {
    Memory, // memory tier only
    Failed, // failure blacklist, in memory and in the store
    Queue,  // queued generation tasks
    All
};

ClearScope clearScopeFromString(const std::string& s);

// Front end of the thumbnail engine. Owns every piece of shared state and
// the threads working on it; nothing here blocks on generation.
class Service {
public:
    Service(config::ThumbnailConfig cfg, Store& store, Decoder& decoder, ReadySink& sink);
    ~Service();

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    // Loads the persistent index and starts workers and background services
    void start();

    // Stops all threads and flushes the save queue
    void stop();

    [[nodiscard]] bool isRunning() const { return running_; }

    // Classifies each path as cached, stored or missing. Cached paths are
    // reported at once, stored ones are loaded in the background and missing
    // ones are queued for generation. Switching directory cancels queued work.
    void requestVisibleThumbnails(const std::vector<std::string>& paths,
                                  const std::string& directory,
                                  std::optional<size_t> centerIndex = std::nullopt,
                                  types::Lane lane = types::Lane::Visible);

    // Queues every entry of dir on the background lane. A missing or
    // unreadable directory is logged and queues nothing.
    size_t warmDirectory(const std::string& dir);

    // Drops queued tasks for a directory; returns how many
    size_t cancelRequests(const std::string& directory);

    // Memory tier, then save queue, then store
    [[nodiscard]] std::optional<types::Bytes> lookupThumbnail(const std::string& key);

    [[nodiscard]] std::unordered_map<std::string, types::Bytes> getCachedThumbnails(const std::vector<std::string>& paths);

    [[nodiscard]] types::CacheStatsSnapshot getCacheStats() const;

    void removeThumbnail(const std::string& path);

    // Forces a fresh generation even if one is queued or in flight
    void regenerateThumbnail(const std::string& path, const std::string& directory);

    void clearCache(ClearScope scope);

    void pauseScheduler();
    void resumeScheduler();
    [[nodiscard]] bool isPaused() const;

    // Store maintenance
    uint64_t cleanupExpired(unsigned int days, bool excludeFolders);
    uint64_t cleanupByPrefix(const std::string& prefix);
    uint64_t cleanupInvalidPaths();
    uint64_t clearFailed();
    void vacuum();
    [[nodiscard]] StoreStats detailedStats() const;

    // Writes everything in the save queue now; returns records written
    size_t flushSaveQueue();

    // Runs one adaptive controller round immediately
    unsigned int adaptNow();

private:
    std::unique_ptr<Context> ctx_;
    std::unique_ptr<Generators> generators_;
    std::unique_ptr<WorkerPool> pool_;
    std::unique_ptr<AdaptiveController> controller_;
    std::unique_ptr<SaveFlusher> flusher_;
    std::unique_ptr<StoreLoader> loader_;
    bool running_ = false;

    std::optional<types::Bytes> loadFromStore_(const std::string& key) const;
};

}
