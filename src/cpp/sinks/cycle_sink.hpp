#pragma once
// Base for sinks that render one block per poll cycle.
//
// The poller emits a cycle as three separate events. CycleSink gathers them
// into a CycleReport and calls write_cycle() once the memory sample arrives.
// When the memory lookup failed, the report is written without it as soon as
// the next cycle starts (or on finish()).
#include <cstdint>
#include <optional>

#include "../monitor/database_poller.hpp"
#include "../monitor/plancache.hpp"

namespace plantop {

struct CycleReport {
    int64_t timestamp_ms = 0;
    PlanCacheDiff plans;
    double cpu_util = 0.0;
    std::optional<double> mem_usage;   // MB as reported by the server
};

class CycleSink {
public:
    virtual ~CycleSink() = default;

    // Register this sink's listeners on the poller's three events. The sink
    // must outlive the poller's use of them.
    void attach(DatabasePoller& poller);

    // Write out a cycle still waiting for its memory sample
    void finish();

    [[nodiscard]] int64_t cycles_written() const { return cycles_written_; }

protected:
    virtual void write_cycle(const CycleReport& report) = 0;

private:
    void on_plancache(const PlanCacheDiff& diff);
    void on_cpu_util(double cpu_util);
    void on_mem_usage(double mem_usage);
    void flush();

    std::optional<CycleReport> pending_;
    int64_t cycles_written_ = 0;
};

} // namespace plantop
