#pragma once
// =============================================================================
// Single-threaded alarm loop
//
// The poller re-arms itself through Scheduler::set_alarm_in(). EventLoop runs
// alarms one at a time on the calling thread, so a callback always finishes
// before the next one starts. stop() only sets an atomic flag and is safe to
// call from a signal handler.
// =============================================================================

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <queue>
#include <vector>

namespace plantop {

using AlarmCallback = std::function<void()>;

class Scheduler {
public:
    virtual ~Scheduler() = default;
    virtual void set_alarm_in(double seconds, AlarmCallback cb) = 0;
};

class EventLoop : public Scheduler {
public:
    // Throws std::invalid_argument for a non-finite delay
    void set_alarm_in(double seconds, AlarmCallback cb) override;

    // Fire alarms until stop() is called or none are left. A callback that
    // throws std::exception is logged and counted; the loop keeps going.
    void run();
    void stop() noexcept { stop_requested_.store(true); }

    [[nodiscard]] bool stop_requested() const noexcept { return stop_requested_.load(); }
    [[nodiscard]] size_t pending() const { return alarms_.size(); }
    [[nodiscard]] int64_t alarm_failures() const { return alarm_failures_; }

private:
    struct Alarm {
        std::chrono::steady_clock::time_point deadline;
        uint64_t seq;
        AlarmCallback cb;
    };
    // Earliest deadline on top; equal deadlines fire in arming order
    struct Later {
        bool operator()(const Alarm& a, const Alarm& b) const {
            if (a.deadline != b.deadline) return a.deadline > b.deadline;
            return a.seq > b.seq;
        }
    };

    std::priority_queue<Alarm, std::vector<Alarm>, Later> alarms_;
    uint64_t next_seq_ = 0;
    int64_t alarm_failures_ = 0;
    std::atomic<bool> stop_requested_{false};
};

} // namespace plantop
