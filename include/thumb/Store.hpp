#pragma once

#include "types/Thumbnail.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tf::thumb {

// Durable thumbnail storage. Implementations throw std::runtime_error on
// storage failure; absence is reported through empty optionals.
struct StoreStats {
    uint64_t total = 0;
    uint64_t folders = 0;
    uint64_t failed = 0;
    int64_t fileBytes = 0;
};

class Store {
public:
    virtual ~Store() = default;

    virtual std::optional<types::Bytes> load(const std::string& key, types::Category category) = 0;

    virtual void save(const types::ThumbRecord& record) = 0;
    virtual void saveBatch(const std::vector<types::ThumbRecord>& records) = 0;

    virtual std::vector<std::string> listKeysByCategory(types::Category category) = 0;
    virtual std::vector<std::string> listFailedKeys() = 0;

    virtual void markFailed(const std::string& key, const std::string& reason, const std::string& message) = 0;
    virtual void remove(const std::string& key) = 0;

    virtual void touch(const std::string& key) = 0;
    virtual void touchBatch(const std::vector<std::string>& keys) {
        for (const auto& k : keys) touch(k);
    }

    // Oldest file-category record stored under folder/ (or folder\)
    virtual std::optional<types::ThumbRecord> findEarliestChild(const std::string& folder) = 0;

    virtual uint64_t count() = 0;

    // Maintenance
    virtual uint64_t cleanupExpired(unsigned int days, bool excludeFolders) = 0;
    virtual uint64_t cleanupByPrefix(const std::string& prefix) = 0;
    virtual uint64_t clearFailed() = 0;
    virtual uint64_t failedCount() = 0;
    // Drops records whose source path no longer exists on disk
    virtual uint64_t cleanupInvalidPaths() = 0;
    virtual void vacuum() = 0;
    virtual StoreStats detailedStats() = 0;
};

}
