#pragma once

#include <gelfbridge/core/storage/connection.hpp>
#include <libpq-fe.h>

#include <chrono>
#include <string>
#include <unordered_map>

namespace GelfBridge {

/**
 * @class PostgresConnection
 * @brief Connection backed by a libpq session.
 *
 * Statements are server-side prepared once per SQL text. SQLSTATE decides
 * transient vs permanent: connection (08), transaction rollback (40),
 * insufficient resources (53), lock not available, cancel/shutdown (57)
 * are retried; everything else is not.
 *
 * The write timeout bounds every round trip on the client side: connecting,
 * preparing and executing all run on a non-blocking socket under a poll()
 * deadline. A call that misses its deadline leaves the session unusable, so
 * the connection reports itself unhealthy and the error is transient. The
 * same timeout is applied as statement_timeout so the server abandons the
 * query too.
 */
class PostgresConnection : public Connection {
public:
    /**
     * @brief Connect and configure the session
     * @param conninfo libpq URL or keyword/value string
     * @param timeout Deadline for the connect and for each later round trip
     * @throws StorageError (transient) if the server is unreachable or silent
     */
    PostgresConnection(const std::string& conninfo, std::chrono::milliseconds timeout);
    ~PostgresConnection() override;

    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    size_t parameterCount(const std::string& sql) override;
    uint64_t execute(const std::string& sql, const SqlParams& params) override;

    void begin() override;
    void commit() override;
    void rollback() override;

    bool isHealthy() const override;
    const char* backendName() const override { return "postgres"; }

    static bool isTransientSqlState(const std::string& sqlstate);

private:
    using ResultPtr = std::unique_ptr<PGresult, decltype(&PQclear)>;

    void connect(const std::string& conninfo);
    const std::string& statementFor(const std::string& sql);
    void exec(const char* sql);
    void sent(int ok, const std::string& context);
    ResultPtr awaitResult(const std::string& context);
    void check(const ResultPtr& res, const std::string& context);
    void fail(const std::string& context, const std::string& detail);

    PGconn* conn_ = nullptr;
    std::chrono::milliseconds timeout_;
    bool broken_ = false;
    std::unordered_map<std::string, std::string> statements_;  // sql -> prepared name
    unsigned nextStatementId_ = 0;
};

} // namespace GelfBridge
