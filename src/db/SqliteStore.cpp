#include "db/SqliteStore.hpp"
#include "db/Statement.hpp"
#include "db/Transactions.hpp"
#include "log/Registry.hpp"

#include <sqlite3.h>
#include <chrono>
#include <system_error>

using namespace tf::db;
using namespace tf::types;

namespace {

int64_t nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// LIKE pattern matching everything below prefix; '%', '_' and '\' are escaped
std::string likePrefix(const std::string& prefix) {
    std::string out;
    out.reserve(prefix.size() + 2);
    for (const char c : prefix) {
        if (c == '%' || c == '_' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('%');
    return out;
}

// Filesystem part of a key: archive entries resolve to the archive itself
std::string sourceOf(const std::string& key) {
    auto src = key.substr(0, key.find("::"));
    while (src.size() > 1 && (src.back() == '/' || src.back() == '\\')) src.pop_back();
    return src;
}

constexpr auto SCHEMA = R"SQL(
CREATE TABLE IF NOT EXISTS thumbs (
    key      TEXT PRIMARY KEY,
    size     INTEGER NOT NULL DEFAULT 0,
    date     INTEGER NOT NULL,
    accessed INTEGER NOT NULL,
    ghash    INTEGER NOT NULL DEFAULT 0,
    category TEXT NOT NULL DEFAULT 'file',
    value    BLOB NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_thumbs_category ON thumbs(category);
CREATE INDEX IF NOT EXISTS idx_thumbs_accessed ON thumbs(accessed);
CREATE TABLE IF NOT EXISTS failed_thumbnails (
    key           TEXT PRIMARY KEY,
    reason        TEXT NOT NULL,
    retry_count   INTEGER NOT NULL DEFAULT 0,
    last_attempt  INTEGER NOT NULL,
    error_message TEXT
);
CREATE TABLE IF NOT EXISTS metadata (
    key   TEXT PRIMARY KEY,
    value TEXT
);
)SQL";

}

SqliteStore::SqliteStore(const std::filesystem::path& path) : path_(path) {
    if (path_.has_parent_path() && !std::filesystem::exists(path_.parent_path()))
        std::filesystem::create_directories(path_.parent_path());

    const int rc = sqlite3_open_v2(path_.string().c_str(), &db_,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        const SqliteError err("open " + path_.string(), db_, rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw err;
    }

    sqlite3_busy_timeout(db_, 5000);
    try {
        execSql(db_, "PRAGMA journal_mode=WAL;");
        execSql(db_, "PRAGMA synchronous=NORMAL;");
        execSql(db_, "PRAGMA temp_store=MEMORY;");
        migrate_();
    } catch (const std::exception& e) {
        log::Registry::db()->error("[SqliteStore] Failed to initialize {}: {}", path_.string(), e.what());
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }

    log::Registry::db()->info("[SqliteStore] Opened thumbnail store at {}", path_.string());
}

SqliteStore::~SqliteStore() {
    if (db_) sqlite3_close(db_);
}

void SqliteStore::migrate_() {
    execSql(db_, SCHEMA);
    Statement st(db_, "INSERT INTO metadata(key, value) VALUES('schema_version', ?1) "
                      "ON CONFLICT(key) DO UPDATE SET value = excluded.value");
    st.bind(1, std::to_string(SCHEMA_VERSION));
    st.run();
}

std::optional<Bytes> SqliteStore::load(const std::string& key, const Category category) {
    std::scoped_lock lock(mutex_);
    Statement st(db_, "SELECT value FROM thumbs WHERE key = ?1 AND category = ?2");
    st.bind(1, key).bind(2, to_string(category));
    if (!st.step()) return std::nullopt;
    return st.blobAt(0);
}

void SqliteStore::upsert_(const ThumbRecord& record, const int64_t now) {
    Statement st(db_, R"SQL(
        INSERT INTO thumbs(key, size, date, accessed, ghash, category, value)
        VALUES(?1, ?2, ?3, ?3, ?4, ?5, ?6)
        ON CONFLICT(key) DO UPDATE SET
            size = excluded.size, accessed = excluded.accessed, ghash = excluded.ghash,
            category = excluded.category, value = excluded.value
    )SQL");
    st.bind(1, record.key)
      .bind(2, record.size)
      .bind(3, now)
      .bind(4, static_cast<int64_t>(record.ghash))
      .bind(5, to_string(record.category))
      .bind(6, record.bytes);
    st.run();

    Statement clear(db_, "DELETE FROM failed_thumbnails WHERE key = ?1");
    clear.bind(1, record.key);
    clear.run();
}

void SqliteStore::save(const ThumbRecord& record) {
    std::scoped_lock lock(mutex_);
    upsert_(record, nowSeconds());
}

void SqliteStore::saveBatch(const std::vector<ThumbRecord>& records) {
    if (records.empty()) return;
    std::scoped_lock lock(mutex_);
    const auto now = nowSeconds();
    Transactions::exec(db_, "SqliteStore::saveBatch", [&] {
        for (const auto& r : records) upsert_(r, now);
    });
}

std::vector<std::string> SqliteStore::listKeysByCategory(const Category category) {
    std::scoped_lock lock(mutex_);
    Statement st(db_, "SELECT key FROM thumbs WHERE category = ?1");
    st.bind(1, to_string(category));
    std::vector<std::string> keys;
    while (st.step()) keys.push_back(st.textAt(0));
    return keys;
}

std::vector<std::string> SqliteStore::listFailedKeys() {
    std::scoped_lock lock(mutex_);
    Statement st(db_, "SELECT key FROM failed_thumbnails");
    std::vector<std::string> keys;
    while (st.step()) keys.push_back(st.textAt(0));
    return keys;
}

void SqliteStore::markFailed(const std::string& key, const std::string& reason, const std::string& message) {
    std::scoped_lock lock(mutex_);
    Statement st(db_, R"SQL(
        INSERT INTO failed_thumbnails(key, reason, retry_count, last_attempt, error_message)
        VALUES(?1, ?2, 0, ?3, ?4)
        ON CONFLICT(key) DO UPDATE SET
            reason = excluded.reason, retry_count = retry_count + 1,
            last_attempt = excluded.last_attempt, error_message = excluded.error_message
    )SQL");
    st.bind(1, key).bind(2, reason).bind(3, nowSeconds()).bind(4, message);
    st.run();
}

std::optional<FailedRecord> SqliteStore::failedRecord(const std::string& key) {
    std::scoped_lock lock(mutex_);
    Statement st(db_, "SELECT key, reason, retry_count, last_attempt, error_message "
                      "FROM failed_thumbnails WHERE key = ?1");
    st.bind(1, key);
    if (!st.step()) return std::nullopt;
    FailedRecord r;
    r.key = st.textAt(0);
    r.reason = st.textAt(1);
    r.retry_count = static_cast<int>(st.int64At(2));
    r.last_attempt = st.int64At(3);
    r.error_message = st.textAt(4);
    return r;
}

void SqliteStore::remove(const std::string& key) {
    std::scoped_lock lock(mutex_);
    Transactions::exec(db_, "SqliteStore::remove", [&] {
        Statement a(db_, "DELETE FROM thumbs WHERE key = ?1");
        a.bind(1, key);
        a.run();
        Statement b(db_, "DELETE FROM failed_thumbnails WHERE key = ?1");
        b.bind(1, key);
        b.run();
    });
}

void SqliteStore::touch(const std::string& key) {
    std::scoped_lock lock(mutex_);
    Statement st(db_, "UPDATE thumbs SET accessed = ?1 WHERE key = ?2");
    st.bind(1, nowSeconds()).bind(2, key);
    st.run();
}

void SqliteStore::touchBatch(const std::vector<std::string>& keys) {
    if (keys.empty()) return;
    std::scoped_lock lock(mutex_);
    const auto now = nowSeconds();
    Transactions::exec(db_, "SqliteStore::touchBatch", [&] {
        Statement st(db_, "UPDATE thumbs SET accessed = ?1 WHERE key = ?2");
        for (const auto& k : keys) {
            st.reset();
            st.bind(1, now).bind(2, k);
            st.run();
        }
    });
}

std::optional<ThumbRecord> SqliteStore::findEarliestChild(const std::string& folder) {
    auto base = folder;
    while (!base.empty() && (base.back() == '/' || base.back() == '\\')) base.pop_back();

    std::scoped_lock lock(mutex_);
    Statement st(db_, R"SQL(
        SELECT key, value, size, ghash FROM thumbs
        WHERE category = 'file' AND (key LIKE ?1 ESCAPE '\' OR key LIKE ?2 ESCAPE '\')
        ORDER BY date ASC, key ASC LIMIT 1
    )SQL");
    st.bind(1, likePrefix(base + "/")).bind(2, likePrefix(base + "\\"));
    if (!st.step()) return std::nullopt;

    ThumbRecord r;
    r.key = st.textAt(0);
    r.bytes = st.blobAt(1);
    r.size = st.int64At(2);
    r.ghash = static_cast<int32_t>(st.int64At(3));
    r.category = Category::File;
    return r;
}

uint64_t SqliteStore::scalar_(const char* sql) {
    Statement st(db_, sql);
    if (!st.step()) return 0;
    return static_cast<uint64_t>(st.int64At(0));
}

uint64_t SqliteStore::count() {
    std::scoped_lock lock(mutex_);
    return scalar_("SELECT COUNT(*) FROM thumbs");
}

uint64_t SqliteStore::cleanupExpired(const unsigned int days, const bool excludeFolders) {
    std::scoped_lock lock(mutex_);
    const int64_t cutoff = nowSeconds() - static_cast<int64_t>(days) * 86400;
    Statement st(db_, excludeFolders
                          ? "DELETE FROM thumbs WHERE accessed < ?1 AND category <> 'folder'"
                          : "DELETE FROM thumbs WHERE accessed < ?1");
    st.bind(1, cutoff);
    st.run();
    const auto removed = static_cast<uint64_t>(st.changes());
    log::Registry::db()->info("[SqliteStore] Expired {} thumbnails older than {} days", removed, days);
    return removed;
}

uint64_t SqliteStore::cleanupByPrefix(const std::string& prefix) {
    std::scoped_lock lock(mutex_);
    Statement st(db_, "DELETE FROM thumbs WHERE key LIKE ?1 ESCAPE '\\'");
    st.bind(1, likePrefix(prefix));
    st.run();
    return static_cast<uint64_t>(st.changes());
}

uint64_t SqliteStore::clearFailed() {
    std::scoped_lock lock(mutex_);
    Statement st(db_, "DELETE FROM failed_thumbnails");
    st.run();
    return static_cast<uint64_t>(st.changes());
}

uint64_t SqliteStore::failedCount() {
    std::scoped_lock lock(mutex_);
    return scalar_("SELECT COUNT(*) FROM failed_thumbnails");
}

uint64_t SqliteStore::cleanupInvalidPaths() {
    std::scoped_lock lock(mutex_);

    std::vector<std::string> missing;
    {
        Statement st(db_, "SELECT key FROM thumbs");
        while (st.step()) {
            auto key = st.textAt(0);
            std::error_code ec;
            if (!std::filesystem::exists(sourceOf(key), ec) && !ec) missing.push_back(std::move(key));
        }
    }

    if (missing.empty()) return 0;

    Transactions::exec(db_, "SqliteStore::cleanupInvalidPaths", [&] {
        Statement st(db_, "DELETE FROM thumbs WHERE key = ?1");
        for (const auto& k : missing) {
            st.reset();
            st.bind(1, k);
            st.run();
        }
    });

    log::Registry::db()->info("[SqliteStore] Removed {} thumbnails with missing sources", missing.size());
    return missing.size();
}

void SqliteStore::vacuum() {
    std::scoped_lock lock(mutex_);
    execSql(db_, "VACUUM");
}

tf::thumb::StoreStats SqliteStore::detailedStats() {
    std::scoped_lock lock(mutex_);
    thumb::StoreStats s;
    s.total = scalar_("SELECT COUNT(*) FROM thumbs");
    s.folders = scalar_("SELECT COUNT(*) FROM thumbs WHERE category = 'folder'");
    s.failed = scalar_("SELECT COUNT(*) FROM failed_thumbnails");
    s.fileBytes = static_cast<int64_t>(scalar_("SELECT COALESCE(SUM(LENGTH(value)), 0) FROM thumbs"));
    return s;
}
