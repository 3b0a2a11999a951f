#include <gelfbridge/core/gelf/reassembler.hpp>
#include <gelfbridge/core/errors.hpp>

#include <spdlog/spdlog.h>
#include <cstring>

namespace GelfBridge {

size_t ChunkReassembler::MessageIdHash::operator()(const MessageId& id) const noexcept {
    // Message ids are random or time-derived; folding the 8 bytes is enough
    uint64_t v;
    std::memcpy(&v, id.data(), sizeof(v));
    v ^= v >> 33;
    v *= 0xff51afd7ed558ccdULL;
    v ^= v >> 33;
    return static_cast<size_t>(v);
}

ChunkReassembler::ChunkReassembler(const AppConfig::ReassemblyConfig& config, PipelineMetrics& metrics)
    : staleTimeout_(config.staleTimeoutMs),
      maxPendingMessages_(config.maxPendingMessages),
      metrics_(metrics) {
    spdlog::info("[ChunkReassembler] Initialized (stale timeout: {}ms, max pending: {})",
                 staleTimeout_.count(), maxPendingMessages_);
}

std::optional<std::string> ChunkReassembler::admit(const RawDatagram& datagram) {
    return admit(datagram.bytes.data(), datagram.bytes.size(), datagram.receivedAt);
}

std::optional<std::string> ChunkReassembler::admit(const uint8_t* data, size_t len, Clock::SteadyPoint now) {
    // Fast path: anything without the chunk magic is a complete message
    if (!hasChunkMagic(data, len)) {
        bump(metrics_.messages_unchunked);
        return std::string(reinterpret_cast<const char*>(data), len);
    }

    ChunkHeader header;
    try {
        header = parseChunkHeader(data, len);
    } catch (const MalformedChunkError& e) {
        bump(metrics_.chunks_malformed);
        spdlog::warn("[ChunkReassembler] Dropped malformed chunk ({} bytes): {}", len, e.what());
        return std::nullopt;
    }

    bump(metrics_.chunks_admitted);
    const uint8_t* payload = data + Gelf::CHUNK_HEADER_SIZE;
    const size_t payloadLen = len - Gelf::CHUNK_HEADER_SIZE;

    // A single-chunk message never touches the table
    if (header.sequenceCount == 1) {
        bump(metrics_.partials_completed);
        return std::string(reinterpret_cast<const char*>(payload), payloadLen);
    }

    std::lock_guard<std::mutex> lock(mtx_);
    auto result = admitChunk(header, payload, payloadLen, now);
    metrics_.pending_partials.store(messages_.size(), std::memory_order_relaxed);
    return result;
}

std::optional<std::string> ChunkReassembler::admitChunk(const ChunkHeader& header,
                                                        const uint8_t* payload, size_t payloadLen,
                                                        Clock::SteadyPoint now) {
    auto it = messages_.find(header.messageId);

    // An entry past its deadline is gone even if the sweeper has not run yet
    if (it != messages_.end() && isStale(it->second, now)) {
        spdlog::debug("[ChunkReassembler] Evicting stale message {} on late chunk",
                      toHex(header.messageId));
        bump(metrics_.partials_evicted_stale);
        messages_.erase(it);
        it = messages_.end();
    }

    if (it == messages_.end()) {
        if (messages_.size() >= maxPendingMessages_) {
            bump(metrics_.chunks_rejected_table_full);
            spdlog::warn("[ChunkReassembler] Table full ({} pending), dropped chunk for message {}",
                         messages_.size(), toHex(header.messageId));
            return std::nullopt;
        }

        PartialMessage pm;
        pm.expectedCount = header.sequenceCount;
        pm.slots.resize(header.sequenceCount);
        pm.firstSeen = now;
        it = messages_.emplace(header.messageId, std::move(pm)).first;
    }

    PartialMessage& pm = it->second;

    // Senders disagreeing on the total is a protocol violation: drop everything
    if (pm.expectedCount != header.sequenceCount) {
        bump(metrics_.partials_discarded_conflict);
        spdlog::warn("[ChunkReassembler] Message {} declared {} chunks, earlier chunk declared {}; discarding",
                     toHex(header.messageId), header.sequenceCount, pm.expectedCount);
        messages_.erase(it);
        return std::nullopt;
    }

    auto& slot = pm.slots[header.sequenceNumber];
    if (slot.has_value()) {
        // Retransmit: last copy wins
        bump(metrics_.chunks_duplicate);
        spdlog::debug("[ChunkReassembler] Duplicate chunk {} for message {}",
                      header.sequenceNumber, toHex(header.messageId));
    } else {
        ++pm.receivedCount;
    }
    slot.emplace(reinterpret_cast<const char*>(payload), payloadLen);

    if (pm.receivedCount < pm.expectedCount) {
        return std::nullopt;
    }

    std::string assembled = assemble(pm);
    messages_.erase(it);
    bump(metrics_.partials_completed);
    return assembled;
}

bool ChunkReassembler::isStale(const PartialMessage& pm, Clock::SteadyPoint now) const {
    return now - pm.firstSeen >= staleTimeout_;
}

std::string ChunkReassembler::assemble(PartialMessage& pm) {
    size_t total = 0;
    for (const auto& slot : pm.slots) {
        total += slot->size();
    }

    std::string out;
    out.reserve(total);
    for (const auto& slot : pm.slots) {
        out.append(*slot);
    }
    return out;
}

size_t ChunkReassembler::sweep(Clock::SteadyPoint now) {
    std::lock_guard<std::mutex> lock(mtx_);

    size_t evicted = 0;
    for (auto it = messages_.begin(); it != messages_.end();) {
        if (isStale(it->second, now)) {
            spdlog::debug("[ChunkReassembler] Discarding incomplete message {} ({}/{} chunks)",
                          toHex(it->first), it->second.receivedCount, it->second.expectedCount);
            it = messages_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }

    if (evicted > 0) {
        bump(metrics_.partials_evicted_stale, evicted);
        spdlog::info("[ChunkReassembler] Sweep evicted {} incomplete messages ({} still pending)",
                     evicted, messages_.size());
    }
    metrics_.pending_partials.store(messages_.size(), std::memory_order_relaxed);
    return evicted;
}

size_t ChunkReassembler::pendingCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return messages_.size();
}

} // namespace GelfBridge
