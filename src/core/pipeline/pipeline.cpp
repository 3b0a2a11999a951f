#include <gelfbridge/core/pipeline/pipeline.hpp>
#include <gelfbridge/core/errors.hpp>

#include <spdlog/spdlog.h>

namespace GelfBridge {

Pipeline::Pipeline(BoundedQueue<RawDatagram>& intake,
                   ChunkReassembler& reassembler,
                   const MessageDecoder& decoder,
                   const FilterStage& filter,
                   WriteCoordinator& writer,
                   PipelineMetrics& metrics)
    : intake_(intake),
      reassembler_(reassembler),
      decoder_(decoder),
      filter_(filter),
      writer_(writer),
      metrics_(metrics) {
    spdlog::info("[Pipeline] Initialized (filter mode: {}, arity: {})", toString(filter_.mode()), filter_.arity());
}

Pipeline::~Pipeline() noexcept {
    spdlog::info("[DESTRUCTOR] Pipeline being destroyed...");
    stop();
}

void Pipeline::start() {
    if (isRunning_.exchange(true, std::memory_order_acq_rel)) return;
    thread_ = std::thread(&Pipeline::runLoop, this);
    spdlog::info("[Pipeline] Started");
}

void Pipeline::stop() {
    if (!isRunning_.exchange(false, std::memory_order_acq_rel)) return;

    intake_.close();
    if (thread_.joinable()) {
        thread_.join();
    }
    spdlog::info("[Pipeline] Stopped. decoded={} decode_failures={} (compressed={}) filter_failures={}",
                 metrics_.records_decoded.load(), metrics_.decode_failures.load(),
                 metrics_.decode_compressed.load(), metrics_.filter_failures.load());
}

void Pipeline::runLoop() {
    const auto timeout = std::chrono::milliseconds(50);

    while (true) {
        auto datagram = intake_.pop(timeout);
        if (!datagram.has_value()) {
            // pop() only comes back empty-handed on a closed queue once it is drained
            if (intake_.isClosed()) break;
            continue;
        }
        metrics_.intake_queue_depth.store(intake_.size(), std::memory_order_relaxed);

        try {
            handleDatagram(*datagram);
        } catch (const std::exception& e) {
            spdlog::error("[Pipeline] Unexpected failure on datagram from {}: {}", datagram->source, e.what());
        }
    }
}

bool Pipeline::handleDatagram(const RawDatagram& datagram) {
    auto payload = reassembler_.admit(datagram);
    if (!payload.has_value()) {
        return false;
    }

    FilteredPayload params;
    try {
        LogRecord record = decoder_.decode(std::move(*payload), datagram.receivedEpoch);
        bump(metrics_.records_decoded);
        if (spdlog::default_logger_raw()->should_log(spdlog::level::debug)) {
            auto level = record.level();
            spdlog::debug("[Pipeline] Decoded message from host '{}' (level {}, timestamp {:.3f})",
                          record.host(), level ? std::to_string(*level) : "unset", record.timestamp());
        }
        try {
            params = filter_.apply(record);
        } catch (const std::exception& e) {
            bump(metrics_.filter_failures);
            spdlog::warn("[Pipeline] Filter failed for message from {}: {}", datagram.source, e.what());
            return false;
        }
    } catch (const DecodeError& e) {
        bump(metrics_.decode_failures);
        if (e.reason() == DecodeError::Reason::COMPRESSED) {
            bump(metrics_.decode_compressed);
        }
        spdlog::warn("[Pipeline] Dropped undecodable message from {} ({}): {}",
                     datagram.source, DecodeError::toString(e.reason()), e.what());
        return false;
    }

    if (!writer_.enqueue(std::move(params))) {
        bump(metrics_.writes_abandoned);
        spdlog::warn("[Pipeline] Writer is shutting down, dropped message from {}", datagram.source);
        return false;
    }
    return true;
}

} // namespace GelfBridge
