#pragma once
// Pushes cluster-level gauges to a Prometheus Pushgateway once per cycle so
// Grafana can chart them next to other cluster metrics:
//
//   plantop_cpu_util       summed CpuUtil of all active plans
//   plantop_active_plans   number of plans with commits in the interval
//   plantop_mem_usage_mb   server memory (omitted if the lookup failed)
#include <string>

#include "../config.hpp"
#include "cycle_sink.hpp"

namespace plantop {

class PushgatewaySink : public CycleSink {
public:
    // `instance` labels the pushed group, normally the monitored host:port
    PushgatewaySink(const PushgatewayConfig& config, std::string instance);

    // Target URL: <url>/metrics/job/<job>/instance/<instance>
    [[nodiscard]] std::string push_url() const;

    // Prometheus text exposition body for one cycle
    static std::string exposition(const CycleReport& report);

    [[nodiscard]] int64_t push_failures() const { return push_failures_; }

protected:
    void write_cycle(const CycleReport& report) override;

private:
    PushgatewayConfig config_;
    std::string instance_;
    int64_t push_failures_ = 0;
};

} // namespace plantop
