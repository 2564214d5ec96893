#pragma once
// =============================================================================
// DatabasePoller -- periodic plan cache / memory sampling
//
// Holds the last good plan cache snapshot. Every poll() fetches a new one,
// diffs it against the retained snapshot and emits, in this order:
//
//   plancache_changed(diff)   per-plan interval rates
//   cpu_util_changed(total)   sum of CpuUtil over the diff
//   mem_usage_changed(value)  server memory, sampled independently
//
// A failed plan cache fetch emits nothing and keeps the old snapshot, so the
// next successful poll covers the whole gap. A failed memory lookup only
// skips mem_usage_changed.
// =============================================================================

#include <cstdint>

#include "../connectors/db_connector.hpp"
#include "../utils/timer.hpp"
#include "event_loop.hpp"
#include "plancache.hpp"
#include "signal.hpp"

namespace plantop {

class DatabasePoller {
public:
    enum class State { IDLE, POLLING };

    // Fetches the baseline snapshot; QueryError propagates.
    // Throws std::invalid_argument if update_interval_s is not finite and > 0.
    DatabasePoller(DbConnector& db, Scheduler& scheduler, double update_interval_s,
                   bool measure_interval = false);

    DatabasePoller(const DatabasePoller&) = delete;
    DatabasePoller& operator=(const DatabasePoller&) = delete;

    // Arm the first poll one interval from now
    void start();

    // One poll cycle. Re-arms the next one first.
    void poll();

    // Stop re-arming after this many polls (0 = never stop)
    void set_max_polls(int64_t n) { max_polls_ = n; }

    Signal<const PlanCacheDiff&> plancache_changed;
    Signal<double> cpu_util_changed;
    Signal<double> mem_usage_changed;

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] const PlanCounterSnapshot& snapshot() const { return plancache_; }
    [[nodiscard]] int64_t polls() const { return polls_; }
    [[nodiscard]] int64_t fetch_failures() const { return fetch_failures_; }
    [[nodiscard]] int64_t memory_failures() const { return memory_failures_; }

private:
    void arm_next();
    double interval_for_diff();

    DbConnector& db_;
    Scheduler& scheduler_;
    double update_interval_s_;
    bool measure_interval_;

    PlanCounterSnapshot plancache_;
    Timer since_snapshot_;
    State state_ = State::IDLE;

    int64_t max_polls_ = 0;
    int64_t polls_ = 0;
    int64_t fetch_failures_ = 0;
    int64_t memory_failures_ = 0;
};

inline const char* poller_state_str(DatabasePoller::State s) {
    switch (s) {
        case DatabasePoller::State::IDLE:    return "idle";
        case DatabasePoller::State::POLLING: return "polling";
    }
    return "??";
}

} // namespace plantop
