#pragma once

#include <gelfbridge/core/gelf/reassembler.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace GelfBridge {

/**
 * @class ReassemblySweeper
 * @brief Background timer that periodically evicts stale partial messages
 */
class ReassemblySweeper {
public:
    ReassemblySweeper(ChunkReassembler& reassembler, std::chrono::milliseconds interval);
    ~ReassemblySweeper() noexcept;

    void start();
    void stop();

private:
    void loop();

    ChunkReassembler& reassembler_;
    const std::chrono::milliseconds interval_;

    std::atomic<bool> running_{false};
    std::thread worker_thread_;

    // For interruptible sleep during shutdown
    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;
};

} // namespace GelfBridge
