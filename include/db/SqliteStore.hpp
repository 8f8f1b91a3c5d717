#pragma once

#include "thumb/Store.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace tf::db {

// thumb::Store over a single SQLite connection in WAL mode. All access is
// serialized through mutex_.
class SqliteStore final : public thumb::Store {
public:
    static constexpr int SCHEMA_VERSION = 1;

    explicit SqliteStore(const std::filesystem::path& path);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    std::optional<types::Bytes> load(const std::string& key, types::Category category) override;

    void save(const types::ThumbRecord& record) override;
    void saveBatch(const std::vector<types::ThumbRecord>& records) override;

    std::vector<std::string> listKeysByCategory(types::Category category) override;
    std::vector<std::string> listFailedKeys() override;

    void markFailed(const std::string& key, const std::string& reason, const std::string& message) override;
    void remove(const std::string& key) override;

    void touch(const std::string& key) override;
    void touchBatch(const std::vector<std::string>& keys) override;

    std::optional<types::ThumbRecord> findEarliestChild(const std::string& folder) override;

    uint64_t count() override;

    uint64_t cleanupExpired(unsigned int days, bool excludeFolders) override;
    uint64_t cleanupByPrefix(const std::string& prefix) override;
    uint64_t clearFailed() override;
    uint64_t failedCount() override;
    uint64_t cleanupInvalidPaths() override;
    void vacuum() override;
    thumb::StoreStats detailedStats() override;

    std::optional<types::FailedRecord> failedRecord(const std::string& key);

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;

    void migrate_();
    void upsert_(const types::ThumbRecord& record, int64_t now);
    uint64_t scalar_(const char* sql);
};

}
