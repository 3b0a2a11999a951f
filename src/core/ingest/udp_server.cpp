#include <gelfbridge/core/ingest/udp_server.hpp>
#include <gelfbridge/core/errors.hpp>

#include <spdlog/spdlog.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace GelfBridge {

// Helper function to close socket
static void closeSocket(int fd) {
    if (fd == -1) return;
    close(fd);
}

UdpReceiver::UdpReceiver(const AppConfig::IngestConfig& config,
                         BoundedQueue<RawDatagram>& intake,
                         PipelineMetrics& metrics)
    : config_(config), intake_(intake), metrics_(metrics) {
    config_.maxDatagramBytes = std::min(config_.maxDatagramBytes, MAX_UDP_DATAGRAM);
    recvBuffer_.resize(config_.maxDatagramBytes + 1);

    server_fd_ = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (server_fd_ < 0) {
        throw TransportError(std::string("Failed to create UDP socket: ") + strerror(errno));
    }

    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (config_.socketBufferBytes > 0) {
        int rcvbuf = config_.socketBufferBytes;
        if (setsockopt(server_fd_, SOL_SOCKET, SO_RCVBUF, &rcvbuf, sizeof(rcvbuf)) < 0) {
            spdlog::warn("[UdpReceiver] Could not set SO_RCVBUF={}: {}", rcvbuf, strerror(errno));
        }
    }

    sockaddr_in server_addr{};
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(config_.port);
    if (inet_pton(AF_INET, config_.host.c_str(), &server_addr.sin_addr) != 1) {
        closeSocket(server_fd_);
        server_fd_ = -1;
        throw TransportError("Invalid UDP listen address '" + config_.host + "'");
    }

    if (bind(server_fd_, reinterpret_cast<sockaddr*>(&server_addr), sizeof(server_addr)) < 0) {
        int err = errno;
        closeSocket(server_fd_);
        server_fd_ = -1;
        throw TransportError("Failed to bind UDP socket on " + config_.host + ":" +
                             std::to_string(config_.port) + ": " + strerror(err));
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        boundPort_ = ntohs(bound.sin_port);
    } else {
        boundPort_ = config_.port;
    }
}

UdpReceiver::~UdpReceiver() noexcept {
    spdlog::info("[DESTRUCTOR] UdpReceiver being destroyed...");
    stop();
    closeSocket(server_fd_);
    server_fd_ = -1;
}

void UdpReceiver::start() {
    if (isRunning_.exchange(true, std::memory_order_acq_rel)) return;
    receiveThread_ = std::thread(&UdpReceiver::receiveLoop, this);
    spdlog::info("[UdpReceiver] Listening on udp://{}:{} (max datagram {} bytes, overflow policy {})",
                 config_.host, boundPort_, config_.maxDatagramBytes,
                 intake_.policy() == OverflowPolicy::DROP_NEW ? "drop" : "block");
}

void UdpReceiver::stop() {
    isRunning_.store(false, std::memory_order_release);

    // The loop polls with a short timeout, so it notices the flag on its own
    if (receiveThread_.joinable()) {
        receiveThread_.join();
        spdlog::info("[UdpReceiver] Stopped. datagrams={} oversized={} backpressure_drops={}",
                     metrics_.datagrams_received.load(),
                     metrics_.datagrams_oversized.load(),
                     metrics_.datagrams_dropped_backpressure.load());
    }
}

void UdpReceiver::fail(const std::string& reason) {
    spdlog::error("[UdpReceiver] Receive loop stopped: {}", reason);
    failed_.store(true, std::memory_order_release);
}

void UdpReceiver::receiveLoop() {
    pollfd pfd{};
    pfd.fd = server_fd_;
    pfd.events = POLLIN;

    while (isRunning_.load(std::memory_order_acquire)) {
        int rc = poll(&pfd, 1, POLL_INTERVAL_MS);
        if (rc < 0) {
            if (errno == EINTR) continue;
            fail(std::string("poll() failed: ") + strerror(errno));
            break;
        }
        if (pfd.revents & POLLNVAL) {
            fail("socket descriptor is no longer valid");
            break;
        }
        if (rc == 0 || !(pfd.revents & (POLLIN | POLLERR))) continue;

        sockaddr_in clientAddr{};
        socklen_t clientLen = sizeof(clientAddr);

        // MSG_TRUNC makes recvfrom report the full datagram length even when it did not fit
        ssize_t bytesReceived = recvfrom(
            server_fd_,
            recvBuffer_.data(),
            recvBuffer_.size(),
            MSG_TRUNC,
            reinterpret_cast<sockaddr*>(&clientAddr),
            &clientLen
        );

        if (bytesReceived < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            // ICMP port-unreachable feedback surfaces here on some stacks
            if (errno == ECONNREFUSED) {
                spdlog::warn("[UdpReceiver] recvfrom error: {}", strerror(errno));
                continue;
            }
            fail(std::string("recvfrom() failed: ") + strerror(errno));
            break;
        }

        bump(metrics_.datagrams_received);

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &clientAddr.sin_addr, ip, sizeof(ip));
        std::string source = std::string(ip) + ":" + std::to_string(ntohs(clientAddr.sin_port));

        if (static_cast<size_t>(bytesReceived) > config_.maxDatagramBytes) {
            bump(metrics_.datagrams_oversized);
            spdlog::warn("[UdpReceiver] Dropped oversized datagram ({} bytes > {}) from {}",
                         bytesReceived, config_.maxDatagramBytes, source);
            continue;
        }

        if (bytesReceived == 0) {
            continue;
        }

        RawDatagram dgram;
        dgram.bytes.assign(recvBuffer_.begin(), recvBuffer_.begin() + bytesReceived);
        dgram.source = std::move(source);
        dgram.receivedAt = Clock::steady();
        dgram.receivedEpoch = Clock::epochSeconds();

        // Blocking policy waits in short slices so shutdown is never stuck behind a full queue
        PushResult result;
        do {
            result = intake_.pushFor(dgram, std::chrono::milliseconds(POLL_INTERVAL_MS));
        } while (result == PushResult::TIMEOUT && isRunning_.load(std::memory_order_acquire));

        if (result != PushResult::OK) {
            bump(metrics_.datagrams_dropped_backpressure);
            spdlog::debug("[BACKPRESSURE] Intake queue full, dropped datagram from {}", dgram.source);
        }
        metrics_.intake_queue_depth.store(intake_.size(), std::memory_order_relaxed);
    }
}

} // namespace GelfBridge
