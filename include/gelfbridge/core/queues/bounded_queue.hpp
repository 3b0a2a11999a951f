#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace GelfBridge {

enum class OverflowPolicy : int { BLOCK_PRODUCER = 0, DROP_NEW = 1 };

enum class PushResult : int { OK = 0, DROPPED = 1, CLOSED = 2, TIMEOUT = 3 };

/**
 * @brief Mutex/condvar protected FIFO with a hard capacity.
 *
 * Connects pipeline stages. Producers either wait for space (BLOCK_PRODUCER)
 * or have the item rejected (DROP_NEW). close() wakes every waiter: blocked
 * producers return CLOSED, consumers keep draining until the queue is empty.
 */
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity, OverflowPolicy policy = OverflowPolicy::BLOCK_PRODUCER)
        : capacity_(capacity == 0 ? 1 : capacity), policy_(policy) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * @brief Push according to the configured overflow policy
     * @return OK, DROPPED (full under DROP_NEW) or CLOSED
     */
    PushResult push(T item) {
        std::unique_lock<std::mutex> lock(m_);
        if (closed_) return PushResult::CLOSED;

        if (dq_.size() >= capacity_) {
            if (policy_ == OverflowPolicy::DROP_NEW) {
                return PushResult::DROPPED;
            }
            not_full_.wait(lock, [this] { return closed_ || dq_.size() < capacity_; });
            if (closed_) return PushResult::CLOSED;
        }

        dq_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return PushResult::OK;
    }

    /**
     * @brief Like push(), but a blocking producer gives up after timeout.
     * On TIMEOUT, DROPPED or CLOSED the item is left untouched in the caller.
     */
    PushResult pushFor(T& item, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_);
        if (closed_) return PushResult::CLOSED;

        if (dq_.size() >= capacity_) {
            if (policy_ == OverflowPolicy::DROP_NEW) {
                return PushResult::DROPPED;
            }
            if (!not_full_.wait_for(lock, timeout, [this] { return closed_ || dq_.size() < capacity_; })) {
                return PushResult::TIMEOUT;
            }
            if (closed_) return PushResult::CLOSED;
        }

        dq_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return PushResult::OK;
    }

    std::optional<T> pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_);
        if (!not_empty_.wait_for(lock, timeout, [this] { return closed_ || !dq_.empty(); })) {
            return std::nullopt;
        }
        if (dq_.empty()) return std::nullopt;  // closed + empty

        T item = std::move(dq_.front());
        dq_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    /**
     * @brief Pop up to maxItems, waiting at most timeout for the first one
     * @return Empty vector on timeout or when closed and drained
     */
    std::vector<T> popBatch(size_t maxItems, std::chrono::milliseconds timeout) {
        std::vector<T> out;
        std::unique_lock<std::mutex> lock(m_);
        if (!not_empty_.wait_for(lock, timeout, [this] { return closed_ || !dq_.empty(); })) {
            return out;
        }

        const size_t n = std::min(dq_.size(), maxItems);
        out.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            out.push_back(std::move(dq_.front()));
            dq_.pop_front();
        }
        lock.unlock();
        if (n > 0) not_full_.notify_all();
        return out;
    }

    // Remove and return everything still queued
    std::vector<T> drain() {
        std::vector<T> out;
        {
            std::lock_guard<std::mutex> lock(m_);
            out.reserve(dq_.size());
            while (!dq_.empty()) {
                out.push_back(std::move(dq_.front()));
                dq_.pop_front();
            }
        }
        not_full_.notify_all();
        return out;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(m_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(m_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_);
        return dq_.size();
    }

    bool empty() const { return size() == 0; }

    size_t capacity() const { return capacity_; }
    OverflowPolicy policy() const { return policy_; }

private:
    const size_t capacity_;
    const OverflowPolicy policy_;

    mutable std::mutex m_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> dq_;
    bool closed_ = false;
};

} // namespace GelfBridge
