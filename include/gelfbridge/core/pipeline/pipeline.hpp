#pragma once

#include <gelfbridge/core/filter/filter_stage.hpp>
#include <gelfbridge/core/gelf/decoder.hpp>
#include <gelfbridge/core/gelf/reassembler.hpp>
#include <gelfbridge/core/ingest/datagram.hpp>
#include <gelfbridge/core/metrics/pipeline_metrics.hpp>
#include <gelfbridge/core/queues/bounded_queue.hpp>
#include <gelfbridge/core/writer/write_coordinator.hpp>

#include <atomic>
#include <thread>

namespace GelfBridge {

/**
 * @class Pipeline
 * @brief Single processing thread between the receiver and the writer.
 *
 * Pops datagrams from the intake queue and runs them through
 * reassemble -> decode -> filter -> enqueue. Per-message failures are counted
 * and logged here and never leave the stage. Blocking in enqueue() is how
 * database slowness reaches the intake queue and then the receiver.
 */
class Pipeline {
public:
    Pipeline(BoundedQueue<RawDatagram>& intake,
             ChunkReassembler& reassembler,
             const MessageDecoder& decoder,
             const FilterStage& filter,
             WriteCoordinator& writer,
             PipelineMetrics& metrics);
    ~Pipeline() noexcept;

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    void start();

    // Close the intake queue, process what is left in it, then join
    void stop();

    /**
     * @brief Run one datagram through every stage on the calling thread
     * @return true if it completed a message that was handed to the writer
     */
    bool handleDatagram(const RawDatagram& datagram);

private:
    void runLoop();

    BoundedQueue<RawDatagram>& intake_;
    ChunkReassembler& reassembler_;
    const MessageDecoder& decoder_;
    const FilterStage& filter_;
    WriteCoordinator& writer_;
    PipelineMetrics& metrics_;

    std::atomic<bool> isRunning_{false};
    std::thread thread_;
};

} // namespace GelfBridge
