#include <gelfbridge/core/storage/sqlite_connection.hpp>
#include <gelfbridge/core/errors.hpp>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>

namespace GelfBridge {

SqliteConnection::SqliteConnection(const std::string& path, std::chrono::milliseconds busyTimeout)
    : path_(path) {
    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StorageError("Failed to open sqlite database '" + path + "': " + msg, isTransientCode(rc));
    }

    sqlite3_extended_result_codes(db_, 1);
    auto timeoutMs = std::min<int64_t>(busyTimeout.count(), std::numeric_limits<int>::max());
    sqlite3_busy_timeout(db_, static_cast<int>(timeoutMs));

    // WAL lets pooled connections write concurrently without SQLITE_BUSY storms
    char* err = nullptr;
    if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL", nullptr, nullptr, &err) != SQLITE_OK) {
        spdlog::debug("[SqliteConnection] WAL not enabled for '{}': {}", path_, err ? err : "unknown");
        sqlite3_free(err);
    }
}

SqliteConnection::~SqliteConnection() {
    for (auto& [sql, stmt] : statements_) {
        sqlite3_finalize(stmt);
    }
    statements_.clear();
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteConnection::isTransientCode(int rc) {
    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
        case SQLITE_PROTOCOL:
            return true;
        default:
            return false;
    }
}

void SqliteConnection::fail(int rc, const std::string& context) {
    bool transient = isTransientCode(rc);
    if ((rc & 0xff) == SQLITE_IOERR || (rc & 0xff) == SQLITE_CANTOPEN) {
        healthy_ = false;
    }
    throw StorageError(context + ": " + sqlite3_errmsg(db_) + " (code " + std::to_string(rc) + ")", transient);
}

sqlite3_stmt* SqliteConnection::statementFor(const std::string& sql) {
    auto it = statements_.find(sql);
    if (it != statements_.end()) {
        return it->second;
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        fail(rc, "Failed to prepare statement");
    }
    if (!stmt) {
        throw StorageError("Statement is empty: '" + sql + "'", false);
    }

    statements_.emplace(sql, stmt);
    return stmt;
}

size_t SqliteConnection::parameterCount(const std::string& sql) {
    return static_cast<size_t>(sqlite3_bind_parameter_count(statementFor(sql)));
}

void SqliteConnection::bind(sqlite3_stmt* stmt, const SqlParams& params) {
    for (size_t i = 0; i < params.size(); ++i) {
        const int idx = static_cast<int>(i) + 1;
        const SqlValue& v = params[i];
        int rc;

        if (auto s = std::get_if<std::string>(&v)) {
            rc = sqlite3_bind_text(stmt, idx, s->data(), static_cast<int>(s->size()), SQLITE_TRANSIENT);
        } else if (auto n = std::get_if<int64_t>(&v)) {
            rc = sqlite3_bind_int64(stmt, idx, *n);
        } else if (auto d = std::get_if<double>(&v)) {
            rc = sqlite3_bind_double(stmt, idx, *d);
        } else {
            rc = sqlite3_bind_null(stmt, idx);
        }

        if (rc != SQLITE_OK) {
            fail(rc, "Failed to bind parameter " + std::to_string(idx));
        }
    }
}

uint64_t SqliteConnection::execute(const std::string& sql, const SqlParams& params) {
    sqlite3_stmt* stmt = statementFor(sql);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    bind(stmt, params);

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        // RETURNING clauses produce rows; they are not needed
    }
    sqlite3_reset(stmt);

    if (rc != SQLITE_DONE) {
        fail(rc, "Failed to execute statement");
    }
    return static_cast<uint64_t>(sqlite3_changes(db_));
}

void SqliteConnection::exec(const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    sqlite3_free(err);
    if (rc != SQLITE_OK) {
        fail(rc, std::string("Failed to run '") + sql + "'");
    }
}

void SqliteConnection::begin() { exec("BEGIN"); }
void SqliteConnection::commit() { exec("COMMIT"); }

void SqliteConnection::rollback() {
    if (sqlite3_get_autocommit(db_)) return;  // no open transaction
    exec("ROLLBACK");
}

} // namespace GelfBridge
