#pragma once

#include <gelfbridge/core/utils/clock.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace GelfBridge {

/**
 * @brief One UDP packet as read from the socket.
 *
 * The receiver never inspects the bytes; ownership moves to the reassembler.
 */
struct RawDatagram {
    std::vector<uint8_t> bytes;
    std::string source;                 // "ip:port"
    Clock::SteadyPoint receivedAt{};
    double receivedEpoch = 0.0;         // wall-clock, used for missing GELF timestamps

    static RawDatagram fromBytes(std::vector<uint8_t> data, std::string source = "local") {
        RawDatagram d;
        d.bytes = std::move(data);
        d.source = std::move(source);
        d.receivedAt = Clock::steady();
        d.receivedEpoch = Clock::epochSeconds();
        return d;
    }
};

} // namespace GelfBridge
