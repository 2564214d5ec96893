#include "event_loop.hpp"
#include "../utils/logger.hpp"

#include <cmath>
#include <exception>
#include <stdexcept>
#include <string>
#include <thread>

namespace plantop {

// Upper bound for one sleep, so stop() is noticed quickly
static constexpr std::chrono::milliseconds kMaxSleep{100};

void EventLoop::set_alarm_in(double seconds, AlarmCallback cb) {
    if (!std::isfinite(seconds)) {
        throw std::invalid_argument("alarm delay must be finite, got " + std::to_string(seconds));
    }
    if (seconds < 0.0) seconds = 0.0;
    auto delay = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(seconds));
    alarms_.push({std::chrono::steady_clock::now() + delay, next_seq_++, std::move(cb)});
}

void EventLoop::run() {
    LOG_DBG("[event_loop] Running (%zu alarms pending)", alarms_.size());

    while (!stop_requested_.load() && !alarms_.empty()) {
        auto now = std::chrono::steady_clock::now();
        auto deadline = alarms_.top().deadline;
        if (now < deadline) {
            auto wait = deadline - now;
            if (wait > kMaxSleep) wait = kMaxSleep;
            std::this_thread::sleep_for(wait);
            continue;
        }

        // Pop before invoking: the callback may arm new alarms
        AlarmCallback cb = alarms_.top().cb;
        alarms_.pop();
        try {
            cb();
        } catch (const std::exception& e) {
            alarm_failures_++;
            LOG_ERR("[event_loop] Alarm callback failed: %s", e.what());
        }
    }

    LOG_DBG("[event_loop] Stopped (%zu alarms pending)", alarms_.size());
}

} // namespace plantop
