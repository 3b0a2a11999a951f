#pragma once
#include <gelfbridge/core/config/app_config.hpp>
#include <gelfbridge/core/ingest/datagram.hpp>
#include <gelfbridge/core/metrics/pipeline_metrics.hpp>
#include <gelfbridge/core/queues/bounded_queue.hpp>

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace GelfBridge {

/**
 * @class UdpReceiver
 * @brief Owns the UDP socket and feeds RawDatagrams into the reassembly intake queue.
 *
 * Binding happens in the constructor so a bind failure aborts startup.
 * Oversized datagrams are dropped and counted. When the intake queue is full
 * the queue's overflow policy decides: BLOCK_PRODUCER stalls the receive loop
 * (the kernel buffer then absorbs or drops), DROP_NEW drops and counts.
 *
 * A socket error the loop cannot recover from ends the receive thread and
 * raises failed(); the owner is expected to shut the process down.
 */
class UdpReceiver {
public:
    UdpReceiver(const AppConfig::IngestConfig& config,
                BoundedQueue<RawDatagram>& intake,
                PipelineMetrics& metrics);
    ~UdpReceiver() noexcept;

    UdpReceiver(const UdpReceiver&) = delete;
    UdpReceiver& operator=(const UdpReceiver&) = delete;

    void start();
    void stop();

    // Actual bound port (useful when configured with port 0)
    uint16_t boundPort() const { return boundPort_; }

    // True once the receive loop has stopped on a fatal socket error
    bool failed() const { return failed_.load(std::memory_order_acquire); }

    int socketFd() const { return server_fd_; }

private:
    void receiveLoop();
    void fail(const std::string& reason);

    AppConfig::IngestConfig config_;
    BoundedQueue<RawDatagram>& intake_;
    PipelineMetrics& metrics_;

    int server_fd_ = -1;
    uint16_t boundPort_ = 0;
    std::atomic<bool> isRunning_{false};
    std::atomic<bool> failed_{false};
    std::thread receiveThread_;

    // Reused for every recvfrom(); one byte larger than the limit to detect truncation
    std::vector<uint8_t> recvBuffer_;

    static constexpr size_t MAX_UDP_DATAGRAM = 65507;
    static constexpr int POLL_INTERVAL_MS = 200;
};

} // namespace GelfBridge
