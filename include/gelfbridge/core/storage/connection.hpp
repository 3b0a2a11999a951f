#pragma once

#include <gelfbridge/core/storage/sql_value.hpp>
#include <functional>
#include <memory>
#include <string>

namespace GelfBridge {

/**
 * @class Connection
 * @brief One live database session.
 *
 * Implementations prepare statements lazily and cache them per SQL text.
 * Every failure is reported as StorageError with transient() telling the
 * writer whether a retry can succeed.
 */
class Connection {
public:
    virtual ~Connection() = default;

    /**
     * @brief Prepare sql and return its number of placeholders
     * @throws StorageError (permanent) if the statement does not prepare
     */
    virtual size_t parameterCount(const std::string& sql) = 0;

    /**
     * @brief Execute sql with params bound in order
     * @return Rows affected
     */
    virtual uint64_t execute(const std::string& sql, const SqlParams& params) = 0;

    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;

    // False once the session is known to be unusable
    virtual bool isHealthy() const = 0;

    virtual const char* backendName() const = 0;
};

using ConnectionPtr = std::unique_ptr<Connection>;

// Opens a new connection; throws StorageError (transient) if the server is unreachable
using ConnectionFactory = std::function<ConnectionPtr()>;

} // namespace GelfBridge
