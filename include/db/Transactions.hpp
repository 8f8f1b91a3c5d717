#pragma once

#include "db/Statement.hpp"
#include "log/Registry.hpp"

#include <sqlite3.h>
#include <string>
#include <type_traits>

namespace tf::db {

inline void execSql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        const std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw std::runtime_error(std::string("sqlite exec '") + sql + "' failed: " + msg);
    }
}

class Transactions {
public:
    // Runs func inside BEGIN IMMEDIATE / COMMIT, rolling back and rethrowing on error
    template <typename Func>
    static auto exec(sqlite3* db, const std::string& ctx, Func&& func) -> decltype(func()) {
        log::Registry::db()->trace("[Transactions::exec] Starting transaction: {}", ctx);
        execSql(db, "BEGIN IMMEDIATE");

        try {
            if constexpr (std::is_void_v<decltype(func())>) {
                func();
                execSql(db, "COMMIT");
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
            } else {
                auto result = func();
                execSql(db, "COMMIT");
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                return result;
            }
        } catch (const std::exception& e) {
            log::Registry::db()->error("[Transactions::exec] Exception in transaction context '{}', rolling back: {}",
                                       ctx, e.what());
            sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
            throw;
        }
    }
};

}
