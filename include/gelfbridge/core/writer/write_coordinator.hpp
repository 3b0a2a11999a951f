#pragma once

#include <gelfbridge/core/config/app_config.hpp>
#include <gelfbridge/core/filter/filter_stage.hpp>
#include <gelfbridge/core/metrics/pipeline_metrics.hpp>
#include <gelfbridge/core/queues/bounded_queue.hpp>
#include <gelfbridge/core/storage/connection_pool.hpp>
#include <gelfbridge/core/utils/clock.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace GelfBridge {

struct WriteTask {
    FilteredPayload params;
    Clock::SteadyPoint enqueuedAt{};
    uint32_t attempts = 0;
};

/**
 * @class WriteCoordinator
 * @brief Bounded write queue drained by a fixed pool of database workers.
 *
 * enqueue() blocks while the queue is full, which is what pushes back on the
 * rest of the pipeline when the database is slow. Each worker leases a pooled
 * connection per attempt and executes the configured statement.
 *
 * Failure handling:
 * - transient StorageError (including pool exhaustion): exponential backoff,
 *   up to writer.max_attempts executions, then dropped as exhausted
 * - anything else: logged and dropped without retry
 *
 * With writer.batch_size > 1 a worker commits up to that many tasks in one
 * transaction; if the batch fails it is rolled back and every task is retried
 * on its own.
 *
 * No ordering between tasks is guaranteed.
 */
class WriteCoordinator {
public:
    WriteCoordinator(const AppConfig::WriterConfig& writer,
                     const AppConfig::DatabaseConfig& database,
                     ConnectionPool& pool,
                     PipelineMetrics& metrics);
    ~WriteCoordinator() noexcept;

    WriteCoordinator(const WriteCoordinator&) = delete;
    WriteCoordinator& operator=(const WriteCoordinator&) = delete;

    /**
     * @brief Prepare the statement once and compare its placeholders with arity
     * @throws ConfigError if the statement does not prepare or the count differs
     * @throws StorageError if no connection could be opened
     */
    void validateStatement(size_t arity);

    void start();

    /**
     * @brief Queue one payload, blocking while the queue is full
     * @return false if the coordinator is stopping and the payload was not queued
     */
    bool enqueue(FilteredPayload params);

    /**
     * @brief Stop accepting work, let workers drain the queue, then join them.
     *
     * Tasks still queued or waiting on a retry when the drain timeout expires
     * are abandoned and counted.
     */
    void stop();

    size_t queueDepth() const { return queue_.size(); }

private:
    enum class Outcome { WRITTEN, TRANSIENT, PERMANENT };

    void workerLoop(size_t workerId);
    void processBatch(std::vector<WriteTask>& batch);
    bool commitBatch(std::vector<WriteTask>& batch);
    void writeWithRetry(WriteTask& task);
    Outcome attempt(WriteTask& task, std::string& error);

    std::chrono::milliseconds backoffFor(uint32_t attempts) const;

    // Interruptible sleep; returns false if the drain deadline passed meanwhile
    bool sleepUnlessAbandoned(std::chrono::milliseconds duration);
    void abandon(size_t count, const char* where);

    const AppConfig::WriterConfig config_;
    const std::string sql_;
    const std::chrono::milliseconds acquireTimeout_;

    ConnectionPool& pool_;
    PipelineMetrics& metrics_;
    BoundedQueue<WriteTask> queue_;

    std::atomic<bool> isRunning_{false};
    std::atomic<bool> abandon_{false};
    std::vector<std::thread> workers_;

    std::mutex stateMtx_;
    std::condition_variable stateCv_;
    size_t activeWorkers_ = 0;
};

} // namespace GelfBridge
