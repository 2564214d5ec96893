#pragma once
// steady_clock stopwatch used for fetch latency and measured poll intervals
#include <chrono>
#include <cstdint>

namespace plantop {

// Current time in milliseconds since epoch (report timestamps)
inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

class Timer {
public:
    void start() noexcept {
        start_ = std::chrono::steady_clock::now();
    }

    void stop() noexcept { end_ = std::chrono::steady_clock::now(); }

    // Seconds since start(); start() is re-armed to now. Used to measure the
    // wall-clock gap between two consecutive successful fetches.
    double lap_sec() noexcept {
        auto now = std::chrono::steady_clock::now();
        double sec = std::chrono::duration<double>(now - start_).count();
        start_ = now;
        return sec;
    }

    [[nodiscard]] int64_t elapsed_ms() const noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_ - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_{};
    std::chrono::steady_clock::time_point end_{};
};

} // namespace plantop
