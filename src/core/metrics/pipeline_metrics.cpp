#include <gelfbridge/core/metrics/pipeline_metrics.hpp>
#include <sstream>

namespace GelfBridge {

namespace {

inline uint64_t load(const std::atomic<uint64_t>& v) {
    return v.load(std::memory_order_relaxed);
}

} // anonymous namespace

MetricSnapshot PipelineMetrics::snapshot() const {
    MetricSnapshot s;
    s.datagrams_received = load(datagrams_received);
    s.datagrams_oversized = load(datagrams_oversized);
    s.datagrams_dropped_backpressure = load(datagrams_dropped_backpressure);

    s.messages_unchunked = load(messages_unchunked);
    s.chunks_admitted = load(chunks_admitted);
    s.chunks_malformed = load(chunks_malformed);
    s.chunks_duplicate = load(chunks_duplicate);
    s.chunks_rejected_table_full = load(chunks_rejected_table_full);
    s.partials_completed = load(partials_completed);
    s.partials_discarded_conflict = load(partials_discarded_conflict);
    s.partials_evicted_stale = load(partials_evicted_stale);

    s.records_decoded = load(records_decoded);
    s.decode_failures = load(decode_failures);
    s.decode_compressed = load(decode_compressed);
    s.filter_failures = load(filter_failures);

    s.writes_enqueued = load(writes_enqueued);
    s.writes_succeeded = load(writes_succeeded);
    s.writes_failed = load(writes_failed);
    s.writes_retried = load(writes_retried);
    s.writes_exhausted = load(writes_exhausted);
    s.writes_abandoned = load(writes_abandoned);

    s.intake_queue_depth = load(intake_queue_depth);
    s.write_queue_depth = load(write_queue_depth);
    s.pending_partials = load(pending_partials);
    return s;
}

std::string MetricSnapshot::toString() const {
    std::ostringstream os;
    os << "datagrams{received=" << datagrams_received
       << " oversized=" << datagrams_oversized
       << " backpressure_drops=" << datagrams_dropped_backpressure << "} "
       << "reassembly{unchunked=" << messages_unchunked
       << " chunks=" << chunks_admitted
       << " malformed=" << chunks_malformed
       << " duplicate=" << chunks_duplicate
       << " table_full=" << chunks_rejected_table_full
       << " completed=" << partials_completed
       << " conflict=" << partials_discarded_conflict
       << " stale=" << partials_evicted_stale
       << " pending=" << pending_partials << "} "
       << "decode{ok=" << records_decoded
       << " failed=" << decode_failures
       << " compressed=" << decode_compressed
       << " filter_failed=" << filter_failures << "} "
       << "writes{enqueued=" << writes_enqueued
       << " ok=" << writes_succeeded
       << " failed=" << writes_failed
       << " retried=" << writes_retried
       << " exhausted=" << writes_exhausted
       << " abandoned=" << writes_abandoned << "} "
       << "queues{intake=" << intake_queue_depth
       << " write=" << write_queue_depth << "}";
    return os.str();
}

} // namespace GelfBridge
