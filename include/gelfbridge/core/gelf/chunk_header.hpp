#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace GelfBridge {

using MessageId = std::array<uint8_t, 8>;

namespace Gelf {
    constexpr uint8_t CHUNK_MAGIC_0 = 0x1e;
    constexpr uint8_t CHUNK_MAGIC_1 = 0x0f;
    constexpr size_t CHUNK_HEADER_SIZE = 12;   // magic(2) + id(8) + seq(1) + count(1)
    constexpr uint8_t MAX_CHUNKS = 128;
}

/**
 * @brief Parsed view of the 12-byte GELF chunk envelope
 *
 * Wire layout:
 *   [0..1]  magic 0x1e 0x0f
 *   [2..9]  message id
 *   [10]    sequence number (0-based)
 *   [11]    sequence count
 *   [12..]  chunk payload
 */
struct ChunkHeader {
    MessageId messageId{};
    uint8_t sequenceNumber = 0;
    uint8_t sequenceCount = 0;
};

/**
 * @brief True if the buffer starts with the chunk magic bytes
 */
bool hasChunkMagic(const uint8_t* data, size_t len);

/**
 * @brief Parse and validate a chunk header
 * @param data Pointer to datagram start (magic included)
 * @param len Datagram length
 * @return Parsed header; payload starts at data + Gelf::CHUNK_HEADER_SIZE
 * @throws MalformedChunkError if the datagram is shorter than the header or
 *         violates sequence-number < sequence-count <= 128
 */
ChunkHeader parseChunkHeader(const uint8_t* data, size_t len);

// Hex rendering of a message id for logs
std::string toHex(const MessageId& id);

} // namespace GelfBridge
