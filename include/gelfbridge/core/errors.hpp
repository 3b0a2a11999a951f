#pragma once

#include <stdexcept>
#include <string>

namespace GelfBridge {

/**
 * @brief Invalid or inconsistent configuration, detected at startup
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Socket creation / bind / receive failure
 */
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief GELF chunk envelope violates the chunking protocol
 */
class MalformedChunkError : public std::runtime_error {
public:
    explicit MalformedChunkError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Complete payload could not be turned into a LogRecord
 */
class DecodeError : public std::runtime_error {
public:
    enum class Reason {
        INVALID_JSON,
        COMPRESSED,
        NOT_AN_OBJECT,
        MISSING_FIELD,
        INVALID_FIELD,
        UNSUPPORTED_VERSION
    };

    DecodeError(Reason reason, const std::string& what)
        : std::runtime_error(what), reason_(reason) {}

    Reason reason() const noexcept { return reason_; }

    static const char* toString(Reason reason);

private:
    Reason reason_;
};

/**
 * @brief Database failure. Transient failures are retried by the writer,
 * permanent ones drop the message.
 */
class StorageError : public std::runtime_error {
public:
    StorageError(const std::string& what, bool transient)
        : std::runtime_error(what), transient_(transient) {}

    bool transient() const noexcept { return transient_; }

private:
    bool transient_;
};

} // namespace GelfBridge
