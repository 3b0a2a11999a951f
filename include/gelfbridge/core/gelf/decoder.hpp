#pragma once

#include <gelfbridge/core/gelf/log_record.hpp>
#include <string>

namespace GelfBridge {

/**
 * @class MessageDecoder
 * @brief Complete payload -> validated LogRecord.
 *
 * Only uncompressed GELF is accepted. gzip/zlib payloads are rejected with
 * DecodeError::Reason::COMPRESSED rather than inflated.
 */
class MessageDecoder {
public:
    /**
     * @param payload Assembled message bytes
     * @param receivedEpoch Used as `timestamp` when the sender omitted it
     * @throws DecodeError on compressed input, invalid JSON, non-object,
     *         unknown version, missing/null host or short_message, invalid field values
     */
    LogRecord decode(std::string payload, double receivedEpoch) const;

    static bool isCompressed(const std::string& payload);
    static bool isSupportedVersion(const std::string& version);
};

} // namespace GelfBridge
