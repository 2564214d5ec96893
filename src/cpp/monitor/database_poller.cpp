#include "database_poller.hpp"
#include "server_memory.hpp"
#include "../utils/logger.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace plantop {

namespace {

// Returns the poller to IDLE however the cycle ends
struct PollingScope {
    explicit PollingScope(DatabasePoller::State& s) : state(s) {
        state = DatabasePoller::State::POLLING;
    }
    ~PollingScope() { state = DatabasePoller::State::IDLE; }

    PollingScope(const PollingScope&) = delete;
    PollingScope& operator=(const PollingScope&) = delete;

    DatabasePoller::State& state;
};

} // namespace

DatabasePoller::DatabasePoller(DbConnector& db, Scheduler& scheduler,
                               double update_interval_s, bool measure_interval)
    : db_(db),
      scheduler_(scheduler),
      update_interval_s_(update_interval_s),
      measure_interval_(measure_interval)
{
    if (!(update_interval_s_ > 0.0) || !std::isfinite(update_interval_s_)) {
        throw std::invalid_argument("update interval must be finite and > 0, got " +
            std::to_string(update_interval_s_));
    }

    plancache_ = fetch_plancache(db_);
    since_snapshot_.start();
    LOG_INF("[poller] Baseline snapshot: %zu plans, interval %.2f s%s",
        plancache_.size(), update_interval_s_,
        measure_interval_ ? " (measured)" : "");
}

void DatabasePoller::start() {
    arm_next();
}

void DatabasePoller::arm_next() {
    scheduler_.set_alarm_in(update_interval_s_, [this]() { poll(); });
}

double DatabasePoller::interval_for_diff() {
    double measured = since_snapshot_.lap_sec();
    if (measure_interval_ && measured > 0.0) return measured;
    return update_interval_s_;
}

void DatabasePoller::poll() {
    if (state_ == State::POLLING) {
        LOG_WRN("[poller] poll() while %s -- ignored", poller_state_str(state_));
        return;
    }

    polls_++;
    if (max_polls_ == 0 || polls_ < max_polls_) {
        arm_next();
    }

    PollingScope scope(state_);

    PlanCounterSnapshot new_plancache;
    try {
        new_plancache = fetch_plancache(db_);
    } catch (const QueryError& e) {
        fetch_failures_++;
        LOG_ERR("[poller] Plan cache fetch failed (keeping %zu-plan snapshot): %s",
            plancache_.size(), e.what());
        return;
    }

    PlanCacheDiff diff = diff_plancache(new_plancache, plancache_, interval_for_diff());
    plancache_changed.emit(diff);
    plancache_ = std::move(new_plancache);

    double cpu_util = total_cpu_util(diff);
    cpu_util_changed.emit(cpu_util);
    LOG_DBG("[poller] Poll %lld: %zu active plans, cpu_util %.3f",
        static_cast<long long>(polls_), diff.size(), cpu_util);

    double mem_usage = 0.0;
    try {
        mem_usage = fetch_server_memory(db_);
    } catch (const QueryError& e) {
        memory_failures_++;
        LOG_ERR("[poller] Memory status lookup failed: %s", e.what());
        return;
    } catch (const MalformedStatusRow& e) {
        memory_failures_++;
        LOG_ERR("[poller] Memory status unparsable: %s", e.what());
        return;
    }
    mem_usage_changed.emit(mem_usage);
}

} // namespace plantop
