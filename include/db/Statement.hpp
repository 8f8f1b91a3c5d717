#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tf::db {

class SqliteError : public std::runtime_error {
public:
    SqliteError(const std::string& ctx, sqlite3* db, const int code)
        : std::runtime_error(ctx + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(code))), code_(code) {}

    [[nodiscard]] int code() const { return code_; }

private:
    int code_;
};

// Owns one prepared statement for the duration of a scope
class Statement {
public:
    Statement(sqlite3* db, const std::string_view sql) : db_(db) {
        const int rc = sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &stmt_, nullptr);
        if (rc != SQLITE_OK) throw SqliteError("prepare '" + std::string(sql) + "'", db, rc);
    }

    ~Statement() { if (stmt_) sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(const int idx, const std::string_view text) {
        check_(sqlite3_bind_text(stmt_, idx, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT));
        return *this;
    }

    Statement& bind(const int idx, const int64_t v) {
        check_(sqlite3_bind_int64(stmt_, idx, v));
        return *this;
    }

    Statement& bind(const int idx, const std::vector<uint8_t>& blob) {
        check_(sqlite3_bind_blob(stmt_, idx, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT));
        return *this;
    }

    // true while rows remain
    bool step() {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw SqliteError("step", db_, rc);
    }

    void run() { while (step()) {} }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    [[nodiscard]] int64_t int64At(const int col) const { return sqlite3_column_int64(stmt_, col); }

    [[nodiscard]] std::string textAt(const int col) const {
        const auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
        return p ? std::string(p, static_cast<size_t>(sqlite3_column_bytes(stmt_, col))) : std::string{};
    }

    [[nodiscard]] std::vector<uint8_t> blobAt(const int col) const {
        const auto* p = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, col));
        const int n = sqlite3_column_bytes(stmt_, col);
        if (!p || n <= 0) return {};
        return {p, p + n};
    }

    [[nodiscard]] int changes() const { return sqlite3_changes(db_); }

    operator sqlite3_stmt*() const { return stmt_; }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;

    void check_(const int rc) const {
        if (rc != SQLITE_OK) throw SqliteError("bind", db_, rc);
    }
};

}
