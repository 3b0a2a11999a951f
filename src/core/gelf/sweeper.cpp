#include <gelfbridge/core/gelf/sweeper.hpp>
#include <spdlog/spdlog.h>

namespace GelfBridge {

ReassemblySweeper::ReassemblySweeper(ChunkReassembler& reassembler, std::chrono::milliseconds interval)
    : reassembler_(reassembler), interval_(interval) {}

ReassemblySweeper::~ReassemblySweeper() noexcept {
    stop();
}

void ReassemblySweeper::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) return;
    worker_thread_ = std::thread(&ReassemblySweeper::loop, this);
    spdlog::info("[ReassemblySweeper] Started (interval: {}ms)", interval_.count());
}

void ReassemblySweeper::stop() {
    {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        running_.store(false, std::memory_order_release);
    }
    sleep_cv_.notify_all();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
        spdlog::info("[ReassemblySweeper] Stopped");
    }
}

void ReassemblySweeper::loop() {
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

        reassembler_.sweep(Clock::steady());
    }
}

} // namespace GelfBridge
