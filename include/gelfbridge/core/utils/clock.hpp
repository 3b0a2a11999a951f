#pragma once

#include <chrono>

namespace GelfBridge {

class Clock {
public:
    using SteadyPoint = std::chrono::steady_clock::time_point;

    static inline SteadyPoint steady() {
        return std::chrono::steady_clock::now();
    }

    // Wall-clock seconds since epoch with millisecond precision (GELF timestamp)
    static inline double epochSeconds() {
        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ).count();
        return static_cast<double>(ms) / 1000.0;
    }
};

} // namespace GelfBridge
