#include <gelfbridge/core/storage/postgres_connection.hpp>
#include <gelfbridge/core/errors.hpp>
#include <gelfbridge/core/utils/clock.hpp>

#include <spdlog/spdlog.h>
#include <poll.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

namespace GelfBridge {

namespace {

// Returns the poll revents, 0 once the deadline has passed, -1 on error
int waitSocket(int fd, short events, Clock::SteadyPoint deadline) {
    if (fd < 0) {
        errno = EBADF;
        return -1;
    }
    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::steady()).count();
        if (left <= 0) return 0;

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;
        int rc = ::poll(&pfd, 1, static_cast<int>(left));
        if (rc < 0) {
            if (errno == EINTR) continue;
            return -1;
        }
        if (rc == 0) continue;
        if (pfd.revents & POLLNVAL) {
            errno = EBADF;
            return -1;
        }
        return pfd.revents;
    }
}

} // namespace

PostgresConnection::PostgresConnection(const std::string& conninfo, std::chrono::milliseconds timeout)
    : timeout_(timeout) {
    std::string setTimeout = "SET statement_timeout = " + std::to_string(timeout.count());
    try {
        connect(conninfo);
        exec(setTimeout.c_str());
    } catch (const StorageError&) {
        if (conn_) {
            PQfinish(conn_);
            conn_ = nullptr;
        }
        throw;
    }
    spdlog::debug("[PostgresConnection] Connected to database '{}' on {}", PQdb(conn_), PQhost(conn_));
}

void PostgresConnection::connect(const std::string& conninfo) {
    conn_ = PQconnectStart(conninfo.c_str());
    if (!conn_) {
        throw StorageError("libpq could not allocate a connection", true);
    }
    if (PQstatus(conn_) == CONNECTION_BAD) {
        throw StorageError(std::string("Failed to connect to postgres: ") + PQerrorMessage(conn_), true);
    }

    const auto deadline = Clock::steady() + timeout_;
    PostgresPollingStatusType status = PGRES_POLLING_WRITING;
    while (status != PGRES_POLLING_OK) {
        if (status == PGRES_POLLING_FAILED) {
            throw StorageError(std::string("Failed to connect to postgres: ") + PQerrorMessage(conn_), true);
        }
        if (status == PGRES_POLLING_READING || status == PGRES_POLLING_WRITING) {
            // The socket may change between attempts when several hosts are listed
            int rc = waitSocket(PQsocket(conn_), status == PGRES_POLLING_READING ? POLLIN : POLLOUT, deadline);
            if (rc == 0) {
                throw StorageError("Timed out after " + std::to_string(timeout_.count()) +
                                   "ms connecting to postgres", true);
            }
            if (rc < 0) {
                throw StorageError(std::string("Failed to connect to postgres: ") + std::strerror(errno), true);
            }
        }
        status = PQconnectPoll(conn_);
    }

    if (PQsetnonblocking(conn_, 1) != 0) {
        throw StorageError(std::string("Failed to switch postgres socket to non-blocking: ") +
                           PQerrorMessage(conn_), true);
    }
}

PostgresConnection::~PostgresConnection() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresConnection::isHealthy() const {
    return conn_ && !broken_ && PQstatus(conn_) == CONNECTION_OK;
}

bool PostgresConnection::isTransientSqlState(const std::string& sqlstate) {
    if (sqlstate.size() != 5) return false;

    const std::string cls = sqlstate.substr(0, 2);
    if (cls == "08" || cls == "40" || cls == "53") return true;

    return sqlstate == "55P03"      // lock_not_available
        || sqlstate == "57014"      // query_canceled (statement_timeout)
        || sqlstate == "57P01"      // admin_shutdown
        || sqlstate == "57P02"      // crash_shutdown
        || sqlstate == "57P03";     // cannot_connect_now
}

void PostgresConnection::check(const ResultPtr& res, const std::string& context) {
    ExecStatusType status = res ? PQresultStatus(res.get()) : PGRES_FATAL_ERROR;
    if (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK) {
        return;
    }

    const char* state = res ? PQresultErrorField(res.get(), PG_DIAG_SQLSTATE) : nullptr;
    std::string sqlstate = state ? state : "";

    // A dead session is always worth another attempt on a fresh connection
    bool transient = !isHealthy() || isTransientSqlState(sqlstate);
    throw StorageError(context + ": " + PQerrorMessage(conn_) +
                       (sqlstate.empty() ? "" : " (SQLSTATE " + sqlstate + ")"),
                       transient);
}

void PostgresConnection::fail(const std::string& context, const std::string& detail) {
    broken_ = true;
    throw StorageError(context + ": " + detail, true);
}

void PostgresConnection::sent(int ok, const std::string& context) {
    if (!ok) {
        fail(context, PQerrorMessage(conn_));
    }
}

PostgresConnection::ResultPtr PostgresConnection::awaitResult(const std::string& context) {
    const auto deadline = Clock::steady() + timeout_;
    const int fd = PQsocket(conn_);

    // Push the whole query out, reading meanwhile so the server never stalls on us
    int flushed;
    while ((flushed = PQflush(conn_)) == 1) {
        int rc = waitSocket(fd, POLLIN | POLLOUT, deadline);
        if (rc == 0) fail(context, "timed out after " + std::to_string(timeout_.count()) + "ms");
        if (rc < 0) fail(context, std::strerror(errno));
        if ((rc & POLLIN) && !PQconsumeInput(conn_)) fail(context, PQerrorMessage(conn_));
    }
    if (flushed < 0) fail(context, PQerrorMessage(conn_));

    ResultPtr first(nullptr, &PQclear);
    while (true) {
        while (PQisBusy(conn_)) {
            int rc = waitSocket(fd, POLLIN, deadline);
            if (rc == 0) fail(context, "timed out after " + std::to_string(timeout_.count()) + "ms");
            if (rc < 0) fail(context, std::strerror(errno));
            if (!PQconsumeInput(conn_)) fail(context, PQerrorMessage(conn_));
        }
        PGresult* res = PQgetResult(conn_);
        if (!res) break;
        if (!first) {
            first.reset(res);
        } else {
            PQclear(res);
        }
    }
    return first;
}

void PostgresConnection::exec(const char* sql) {
    const std::string context = std::string("Failed to run '") + sql + "'";
    sent(PQsendQuery(conn_, sql), context);
    check(awaitResult(context), context);
}

const std::string& PostgresConnection::statementFor(const std::string& sql) {
    auto it = statements_.find(sql);
    if (it != statements_.end()) {
        return it->second;
    }

    std::string name = "gelfbridge_stmt_" + std::to_string(nextStatementId_++);
    sent(PQsendPrepare(conn_, name.c_str(), sql.c_str(), 0, nullptr), "Failed to prepare statement");
    check(awaitResult("Failed to prepare statement"), "Failed to prepare statement");

    return statements_.emplace(sql, std::move(name)).first->second;
}

size_t PostgresConnection::parameterCount(const std::string& sql) {
    const std::string& name = statementFor(sql);
    sent(PQsendDescribePrepared(conn_, name.c_str()), "Failed to describe statement");
    ResultPtr res = awaitResult("Failed to describe statement");
    check(res, "Failed to describe statement");
    return static_cast<size_t>(PQnparams(res.get()));
}

uint64_t PostgresConnection::execute(const std::string& sql, const SqlParams& params) {
    const std::string& name = statementFor(sql);

    // Text protocol: the server casts each value to the placeholder's type
    std::vector<std::string> text;
    std::vector<const char*> values;
    text.reserve(params.size());
    values.reserve(params.size());
    for (const auto& p : params) {
        if (isNull(p)) {
            text.emplace_back();
        } else {
            text.push_back(toText(p));
        }
    }
    for (size_t i = 0; i < params.size(); ++i) {
        values.push_back(isNull(params[i]) ? nullptr : text[i].c_str());
    }

    sent(PQsendQueryPrepared(conn_, name.c_str(), static_cast<int>(values.size()),
                             values.data(), nullptr, nullptr, 0),
         "Failed to execute statement");
    ResultPtr res = awaitResult("Failed to execute statement");
    check(res, "Failed to execute statement");

    const char* tuples = PQcmdTuples(res.get());
    return (tuples && *tuples) ? std::strtoull(tuples, nullptr, 10) : 0;
}

void PostgresConnection::begin() { exec("BEGIN"); }
void PostgresConnection::commit() { exec("COMMIT"); }

void PostgresConnection::rollback() {
    // A broken session is discarded by the pool and the server aborts its transaction
    if (broken_ || PQtransactionStatus(conn_) == PQTRANS_IDLE) return;
    exec("ROLLBACK");
}

} // namespace GelfBridge
