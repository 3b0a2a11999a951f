#pragma once

#include <gelfbridge/core/storage/connection.hpp>
#include <sqlite3.h>

#include <chrono>
#include <string>
#include <unordered_map>

namespace GelfBridge {

/**
 * @class SqliteConnection
 * @brief Connection backed by one sqlite3 handle.
 *
 * Busy/locked/IO errors are transient; everything else (syntax, constraint,
 * type mismatch) is permanent. The write timeout becomes the busy timeout.
 */
class SqliteConnection : public Connection {
public:
    SqliteConnection(const std::string& path, std::chrono::milliseconds busyTimeout);
    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    size_t parameterCount(const std::string& sql) override;
    uint64_t execute(const std::string& sql, const SqlParams& params) override;

    void begin() override;
    void commit() override;
    void rollback() override;

    bool isHealthy() const override { return healthy_; }
    const char* backendName() const override { return "sqlite"; }

    static bool isTransientCode(int rc);

private:
    sqlite3_stmt* statementFor(const std::string& sql);
    void bind(sqlite3_stmt* stmt, const SqlParams& params);
    void exec(const char* sql);
    [[noreturn]] void fail(int rc, const std::string& context);

    std::string path_;
    sqlite3* db_ = nullptr;
    std::unordered_map<std::string, sqlite3_stmt*> statements_;
    bool healthy_ = true;
};

} // namespace GelfBridge
