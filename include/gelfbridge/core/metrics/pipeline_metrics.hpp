#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace GelfBridge {

/**
 * @brief Plain copy of the pipeline counters at one instant
 */
struct MetricSnapshot {
    // Receiver
    uint64_t datagrams_received = 0;
    uint64_t datagrams_oversized = 0;
    uint64_t datagrams_dropped_backpressure = 0;

    // Reassembler
    uint64_t messages_unchunked = 0;
    uint64_t chunks_admitted = 0;
    uint64_t chunks_malformed = 0;
    uint64_t chunks_duplicate = 0;
    uint64_t chunks_rejected_table_full = 0;
    uint64_t partials_completed = 0;
    uint64_t partials_discarded_conflict = 0;
    uint64_t partials_evicted_stale = 0;

    // Decoder / filter
    uint64_t records_decoded = 0;
    uint64_t decode_failures = 0;
    uint64_t decode_compressed = 0;
    uint64_t filter_failures = 0;

    // Writer
    uint64_t writes_enqueued = 0;
    uint64_t writes_succeeded = 0;
    uint64_t writes_failed = 0;
    uint64_t writes_retried = 0;
    uint64_t writes_exhausted = 0;
    uint64_t writes_abandoned = 0;

    // Gauges
    uint64_t intake_queue_depth = 0;
    uint64_t write_queue_depth = 0;
    uint64_t pending_partials = 0;

    std::string toString() const;
};

/**
 * @brief Counters shared by all pipeline stages.
 *
 * Every stage increments with relaxed ordering; readers take a snapshot().
 * Gauges are written by their owning stage.
 */
struct PipelineMetrics {
    std::atomic<uint64_t> datagrams_received{0};
    std::atomic<uint64_t> datagrams_oversized{0};
    std::atomic<uint64_t> datagrams_dropped_backpressure{0};

    std::atomic<uint64_t> messages_unchunked{0};
    std::atomic<uint64_t> chunks_admitted{0};
    std::atomic<uint64_t> chunks_malformed{0};
    std::atomic<uint64_t> chunks_duplicate{0};
    std::atomic<uint64_t> chunks_rejected_table_full{0};
    std::atomic<uint64_t> partials_completed{0};
    std::atomic<uint64_t> partials_discarded_conflict{0};
    std::atomic<uint64_t> partials_evicted_stale{0};

    std::atomic<uint64_t> records_decoded{0};
    std::atomic<uint64_t> decode_failures{0};
    std::atomic<uint64_t> decode_compressed{0};
    std::atomic<uint64_t> filter_failures{0};

    std::atomic<uint64_t> writes_enqueued{0};
    std::atomic<uint64_t> writes_succeeded{0};
    std::atomic<uint64_t> writes_failed{0};
    std::atomic<uint64_t> writes_retried{0};
    std::atomic<uint64_t> writes_exhausted{0};
    std::atomic<uint64_t> writes_abandoned{0};

    std::atomic<uint64_t> intake_queue_depth{0};
    std::atomic<uint64_t> write_queue_depth{0};
    std::atomic<uint64_t> pending_partials{0};

    MetricSnapshot snapshot() const;
};

inline void bump(std::atomic<uint64_t>& counter, uint64_t n = 1) {
    counter.fetch_add(n, std::memory_order_relaxed);
}

} // namespace GelfBridge
