#pragma once

#include <gelfbridge/core/metrics/pipeline_metrics.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace GelfBridge {

/**
 * @class MetricsReporter
 * @brief Logs a counter snapshot on a fixed interval, and once more on stop().
 *
 * The optional sink receives each snapshot too; it is the hook for an
 * external metrics collector.
 */
class MetricsReporter {
public:
    using Sink = std::function<void(const MetricSnapshot&)>;

    MetricsReporter(const PipelineMetrics& metrics, std::chrono::milliseconds interval, Sink sink = nullptr);
    ~MetricsReporter() noexcept;

    void start();
    void stop();

    // Log one report immediately
    void reportNow();

private:
    void loop();

    const PipelineMetrics& metrics_;
    const std::chrono::milliseconds interval_;
    Sink sink_;
    MetricSnapshot last_{};

    std::atomic<bool> running_{false};
    std::atomic<bool> started_{false};
    std::thread worker_thread_;
    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;
};

} // namespace GelfBridge
