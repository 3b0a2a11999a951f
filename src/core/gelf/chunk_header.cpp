#include <gelfbridge/core/gelf/chunk_header.hpp>
#include <gelfbridge/core/errors.hpp>
#include <cstring>

namespace GelfBridge {

bool hasChunkMagic(const uint8_t* data, size_t len) {
    return len >= 2 && data[0] == Gelf::CHUNK_MAGIC_0 && data[1] == Gelf::CHUNK_MAGIC_1;
}

ChunkHeader parseChunkHeader(const uint8_t* data, size_t len) {
    if (!hasChunkMagic(data, len))
        throw MalformedChunkError("Missing GELF chunk magic");

    if (len < Gelf::CHUNK_HEADER_SIZE)
        throw MalformedChunkError("Chunk too small: expected at least 12 header bytes, got " +
                                  std::to_string(len));

    ChunkHeader header;
    std::memcpy(header.messageId.data(), data + 2, header.messageId.size());
    header.sequenceNumber = data[10];
    header.sequenceCount = data[11];

    if (header.sequenceCount == 0)
        throw MalformedChunkError("Sequence count is 0");

    if (header.sequenceCount > Gelf::MAX_CHUNKS)
        throw MalformedChunkError("Sequence count " + std::to_string(header.sequenceCount) +
                                  " exceeds GELF maximum of 128");

    if (header.sequenceNumber >= header.sequenceCount)
        throw MalformedChunkError("Sequence number " + std::to_string(header.sequenceNumber) +
                                  " out of range for count " + std::to_string(header.sequenceCount));

    return header;
}

std::string toHex(const MessageId& id) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(id.size() * 2);
    for (uint8_t b : id) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}

} // namespace GelfBridge
