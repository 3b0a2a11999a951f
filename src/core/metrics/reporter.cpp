#include <gelfbridge/core/metrics/reporter.hpp>
#include <spdlog/spdlog.h>

namespace GelfBridge {

MetricsReporter::MetricsReporter(const PipelineMetrics& metrics, std::chrono::milliseconds interval, Sink sink)
    : metrics_(metrics), interval_(interval), sink_(std::move(sink)) {}

MetricsReporter::~MetricsReporter() noexcept {
    stop();
}

void MetricsReporter::start() {
    if (started_.exchange(true, std::memory_order_acq_rel)) return;
    if (interval_.count() == 0) {
        spdlog::info("[MetricsReporter] Periodic reports disabled");
        return;
    }
    if (running_.exchange(true, std::memory_order_acq_rel)) return;
    worker_thread_ = std::thread(&MetricsReporter::loop, this);
    spdlog::info("[MetricsReporter] Started monitoring loop (interval: {}ms)", interval_.count());
}

void MetricsReporter::stop() {
    {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        running_.store(false, std::memory_order_release);
    }
    sleep_cv_.notify_all();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    // Final report even when periodic reports are disabled
    if (started_.exchange(false, std::memory_order_acq_rel)) {
        reportNow();
        spdlog::info("[MetricsReporter] Stopped");
    }
}

void MetricsReporter::reportNow() {
    auto snap = metrics_.snapshot();
    spdlog::info("[Metrics] {}", snap.toString());

    // Writer exhaustion is the one per-message failure surfaced as a process-level event
    if (snap.writes_exhausted > last_.writes_exhausted) {
        spdlog::error("[Metrics] {} writes abandoned after exhausting retries since last report",
                      snap.writes_exhausted - last_.writes_exhausted);
    }
    last_ = snap;

    if (sink_) {
        sink_(snap);
    }
}

void MetricsReporter::loop() {
    while (running_.load(std::memory_order_acquire)) {
        {
            std::unique_lock<std::mutex> lock(sleep_mutex_);
            sleep_cv_.wait_for(lock, interval_, [this]() {
                return !running_.load(std::memory_order_acquire);
            });
        }

        if (!running_.load(std::memory_order_acquire)) {
            break;
        }
        reportNow();
    }
}

} // namespace GelfBridge
