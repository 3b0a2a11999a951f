#pragma once

#include <gelfbridge/core/config/app_config.hpp>
#include <gelfbridge/core/gelf/chunk_header.hpp>
#include <gelfbridge/core/ingest/datagram.hpp>
#include <gelfbridge/core/metrics/pipeline_metrics.hpp>
#include <gelfbridge/core/utils/clock.hpp>

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace GelfBridge {

/**
 * @class ChunkReassembler
 * @brief GELF chunking state machine.
 *
 * Turns datagrams into complete payloads. Unchunked datagrams pass straight
 * through; chunks are collected per message id until every slot is filled,
 * then concatenated in sequence order and the entry is removed. Entries older
 * than the staleness timeout are evicted by sweep() (and lazily when a new
 * chunk for them arrives), so a late chunk always starts a fresh entry.
 *
 * The table is owned here and never exposed. One coarse mutex serializes
 * admit() from the pipeline thread with sweep() from the sweeper thread.
 */
class ChunkReassembler {
public:
    ChunkReassembler(const AppConfig::ReassemblyConfig& config, PipelineMetrics& metrics);

    ChunkReassembler(const ChunkReassembler&) = delete;
    ChunkReassembler& operator=(const ChunkReassembler&) = delete;

    /**
     * @brief Feed one datagram
     * @return The complete payload if this datagram finished a message (or was
     *         unchunked), std::nullopt otherwise. Malformed chunks are counted
     *         and dropped, never thrown.
     */
    std::optional<std::string> admit(const RawDatagram& datagram);
    std::optional<std::string> admit(const uint8_t* data, size_t len, Clock::SteadyPoint now);

    /**
     * @brief Drop partial messages whose first chunk is older than the timeout
     * @return Number of entries evicted
     */
    size_t sweep(Clock::SteadyPoint now);

    size_t pendingCount() const;

private:
    struct MessageIdHash {
        size_t operator()(const MessageId& id) const noexcept;
    };

    struct PartialMessage {
        uint8_t expectedCount = 0;
        uint8_t receivedCount = 0;
        std::vector<std::optional<std::string>> slots;
        Clock::SteadyPoint firstSeen{};
    };

    std::optional<std::string> admitChunk(const ChunkHeader& header,
                                          const uint8_t* payload, size_t payloadLen,
                                          Clock::SteadyPoint now);
    bool isStale(const PartialMessage& pm, Clock::SteadyPoint now) const;
    static std::string assemble(PartialMessage& pm);

    const std::chrono::milliseconds staleTimeout_;
    const size_t maxPendingMessages_;
    PipelineMetrics& metrics_;

    mutable std::mutex mtx_;
    std::unordered_map<MessageId, PartialMessage, MessageIdHash> messages_;
};

} // namespace GelfBridge
