#include "cycle_sink.hpp"
#include "../utils/timer.hpp"

namespace plantop {

void CycleSink::attach(DatabasePoller& poller) {
    poller.plancache_changed.connect([this](const PlanCacheDiff& d) { on_plancache(d); });
    poller.cpu_util_changed.connect([this](double v) { on_cpu_util(v); });
    poller.mem_usage_changed.connect([this](double v) { on_mem_usage(v); });
}

void CycleSink::finish() {
    flush();
}

void CycleSink::on_plancache(const PlanCacheDiff& diff) {
    flush();  // previous cycle never got its memory sample
    CycleReport report;
    report.timestamp_ms = now_ms();
    report.plans = diff;
    pending_ = std::move(report);
}

void CycleSink::on_cpu_util(double cpu_util) {
    if (pending_) pending_->cpu_util = cpu_util;
}

void CycleSink::on_mem_usage(double mem_usage) {
    if (!pending_) return;
    pending_->mem_usage = mem_usage;
    flush();
}

void CycleSink::flush() {
    if (!pending_) return;
    CycleReport report = std::move(*pending_);
    pending_.reset();
    write_cycle(report);
    cycles_written_++;
}

} // namespace plantop
