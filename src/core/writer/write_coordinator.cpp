#include <gelfbridge/core/writer/write_coordinator.hpp>
#include <gelfbridge/core/errors.hpp>

#include <spdlog/spdlog.h>
#include <algorithm>

namespace GelfBridge {

namespace {
constexpr auto POP_TIMEOUT = std::chrono::milliseconds(100);
}

WriteCoordinator::WriteCoordinator(const AppConfig::WriterConfig& writer,
                                   const AppConfig::DatabaseConfig& database,
                                   ConnectionPool& pool,
                                   PipelineMetrics& metrics)
    : config_(writer),
      sql_(database.sql),
      acquireTimeout_(database.acquireTimeoutMs),
      pool_(pool),
      metrics_(metrics),
      queue_(writer.queueCapacity, OverflowPolicy::BLOCK_PRODUCER) {
    spdlog::info("[WriteCoordinator] Initialized (workers: {}, queue: {}, batch: {}, max attempts: {}, backoff: {}-{}ms)",
                 config_.workers, queue_.capacity(), config_.batchSize, config_.maxAttempts,
                 config_.initialBackoffMs, config_.maxBackoffMs);
}

WriteCoordinator::~WriteCoordinator() noexcept {
    spdlog::info("[DESTRUCTOR] WriteCoordinator being destroyed...");
    stop();
    spdlog::info("[DESTRUCTOR] WriteCoordinator destroyed successfully");
}

// ============================================================================
// Startup
// ============================================================================

void WriteCoordinator::validateStatement(size_t arity) {
    auto conn = pool_.acquire(acquireTimeout_);

    size_t placeholders = 0;
    try {
        placeholders = conn->parameterCount(sql_);
    } catch (const StorageError& e) {
        if (e.transient()) {
            throw;
        }
        throw ConfigError(std::string("database.sql does not prepare against the ") +
                          conn->backendName() + " backend: " + e.what());
    }

    if (placeholders != arity) {
        throw ConfigError("database.sql has " + std::to_string(placeholders) +
                          " placeholders but the filter produces " + std::to_string(arity) + " values");
    }

    spdlog::info("[WriteCoordinator] Statement validated on {} ({} placeholders)",
                 conn->backendName(), placeholders);
}

void WriteCoordinator::start() {
    if (isRunning_.exchange(true, std::memory_order_acq_rel)) return;

    const size_t n = std::max<size_t>(1, config_.workers);
    {
        std::lock_guard<std::mutex> lock(stateMtx_);
        activeWorkers_ = n;
    }
    workers_.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        workers_.emplace_back(&WriteCoordinator::workerLoop, this, i);
    }
    spdlog::info("[WriteCoordinator] Started {} workers", n);
}

bool WriteCoordinator::enqueue(FilteredPayload params) {
    WriteTask task;
    task.params = std::move(params);
    task.enqueuedAt = Clock::steady();

    PushResult result = queue_.push(std::move(task));
    metrics_.write_queue_depth.store(queue_.size(), std::memory_order_relaxed);

    if (result != PushResult::OK) {
        return false;
    }
    bump(metrics_.writes_enqueued);
    return true;
}

// ============================================================================
// Shutdown
// ============================================================================

void WriteCoordinator::stop() {
    if (!isRunning_.exchange(false, std::memory_order_acq_rel)) {
        // Never started: whatever was queued will not be written
        queue_.close();
        auto leftover = queue_.drain();
        if (!leftover.empty()) abandon(leftover.size(), "queue");
        return;
    }

    queue_.close();
    spdlog::info("[WriteCoordinator] Draining {} queued writes (timeout {}ms)...",
                 queue_.size(), config_.drainTimeoutMs);

    {
        std::unique_lock<std::mutex> lock(stateMtx_);
        bool drained = stateCv_.wait_for(lock, std::chrono::milliseconds(config_.drainTimeoutMs),
                                         [this] { return activeWorkers_ == 0; });
        if (!drained) {
            spdlog::warn("[WriteCoordinator] Drain timeout expired with {} writes queued, abandoning",
                         queue_.size());
            abandon_.store(true, std::memory_order_release);
        }
    }
    stateCv_.notify_all();

    // A worker inside a database call finishes it; the write timeout bounds that
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();

    auto leftover = queue_.drain();
    if (!leftover.empty()) abandon(leftover.size(), "queue");
    metrics_.write_queue_depth.store(0, std::memory_order_relaxed);

    spdlog::info("[WriteCoordinator] Stopped. succeeded={} failed={} retried={} exhausted={} abandoned={}",
                 metrics_.writes_succeeded.load(), metrics_.writes_failed.load(),
                 metrics_.writes_retried.load(), metrics_.writes_exhausted.load(),
                 metrics_.writes_abandoned.load());
}

void WriteCoordinator::abandon(size_t count, const char* where) {
    bump(metrics_.writes_abandoned, count);
    spdlog::error("[WriteCoordinator] Abandoned {} unwritten messages ({})", count, where);
}

// ============================================================================
// Workers
// ============================================================================

void WriteCoordinator::workerLoop(size_t workerId) {
    spdlog::debug("[WriteCoordinator] Worker {} started", workerId);
    const size_t batchSize = std::max<size_t>(1, config_.batchSize);

    while (!abandon_.load(std::memory_order_acquire)) {
        auto batch = queue_.popBatch(batchSize, POP_TIMEOUT);
        if (batch.empty()) {
            if (queue_.isClosed()) break;  // closed and drained
            continue;
        }
        metrics_.write_queue_depth.store(queue_.size(), std::memory_order_relaxed);

        try {
            processBatch(batch);
        } catch (const std::exception& e) {
            // processBatch counts every outcome itself; anything escaping is a bug
            bump(metrics_.writes_failed, batch.size());
            spdlog::error("[WriteCoordinator] Worker {} dropped {} writes: {}", workerId, batch.size(), e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(stateMtx_);
        --activeWorkers_;
    }
    stateCv_.notify_all();
    spdlog::debug("[WriteCoordinator] Worker {} stopped", workerId);
}

void WriteCoordinator::processBatch(std::vector<WriteTask>& batch) {
    if (batch.size() > 1 && commitBatch(batch)) {
        return;
    }
    for (auto& task : batch) {
        writeWithRetry(task);
    }
}

bool WriteCoordinator::commitBatch(std::vector<WriteTask>& batch) {
    try {
        auto conn = pool_.acquire(acquireTimeout_);
        conn->begin();
        try {
            for (const auto& task : batch) {
                conn->execute(sql_, task.params);
            }
            conn->commit();
        } catch (const StorageError&) {
            try {
                conn->rollback();
            } catch (const StorageError& re) {
                spdlog::warn("[WriteCoordinator] Rollback failed, discarding connection: {}", re.what());
                conn.invalidate();
            }
            throw;
        }
    } catch (const StorageError& e) {
        spdlog::warn("[WriteCoordinator] Batch of {} failed ({}), writing individually: {}",
                     batch.size(), e.transient() ? "transient" : "permanent", e.what());
        return false;
    }

    bump(metrics_.writes_succeeded, batch.size());
    return true;
}

WriteCoordinator::Outcome WriteCoordinator::attempt(WriteTask& task, std::string& error) {
    ++task.attempts;
    try {
        auto conn = pool_.acquire(acquireTimeout_);
        conn->execute(sql_, task.params);
        return Outcome::WRITTEN;
    } catch (const StorageError& e) {
        error = e.what();
        return e.transient() ? Outcome::TRANSIENT : Outcome::PERMANENT;
    } catch (const std::exception& e) {
        error = e.what();
        return Outcome::PERMANENT;
    }
}

void WriteCoordinator::writeWithRetry(WriteTask& task) {
    const uint32_t maxAttempts = std::max<uint32_t>(1, config_.maxAttempts);

    while (true) {
        std::string error;
        Outcome outcome = attempt(task, error);

        if (outcome == Outcome::WRITTEN) {
            bump(metrics_.writes_succeeded);
            if (task.attempts > 1) {
                spdlog::info("[WriteCoordinator] Write succeeded on attempt {}/{}", task.attempts, maxAttempts);
            }
            return;
        }

        if (outcome == Outcome::PERMANENT) {
            bump(metrics_.writes_failed);
            spdlog::error("[WriteCoordinator] Write failed permanently, dropping message: {}", error);
            return;
        }

        if (task.attempts >= maxAttempts) {
            bump(metrics_.writes_exhausted);
            spdlog::error("[WriteCoordinator] Write FAILED after {} attempts, dropping message: {}",
                          task.attempts, error);
            return;
        }

        auto backoff = backoffFor(task.attempts);
        bump(metrics_.writes_retried);
        spdlog::warn("[WriteCoordinator] Transient write failure (attempt {}/{}), retrying in {}ms: {}",
                     task.attempts, maxAttempts, backoff.count(), error);

        if (!sleepUnlessAbandoned(backoff)) {
            abandon(1, "retry pending at shutdown");
            return;
        }
    }
}

std::chrono::milliseconds WriteCoordinator::backoffFor(uint32_t attempts) const {
    uint64_t delay = config_.initialBackoffMs;
    for (uint32_t i = 1; i < attempts && delay < config_.maxBackoffMs; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min<uint64_t>(delay, config_.maxBackoffMs));
}

bool WriteCoordinator::sleepUnlessAbandoned(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(stateMtx_);
    stateCv_.wait_for(lock, duration, [this] { return abandon_.load(std::memory_order_acquire); });
    return !abandon_.load(std::memory_order_acquire);
}

} // namespace GelfBridge
