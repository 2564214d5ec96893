#pragma once
// JSON Lines output: one object per poll cycle
//
//   {"ts": 1700000000000, "cpu_util": 0.42, "mem_usage_mb": 2048.0,
//    "plans": [{"plan_hash": "...", "database": "...", "query": "...",
//               "executions_per_sec": 1.0, ...}, ...]}
//
// mem_usage_mb is null when the memory lookup failed for that cycle.
#include <ostream>
#include <nlohmann/json.hpp>

#include "../monitor/columns.hpp"
#include "cycle_sink.hpp"

namespace plantop {

class JsonSink : public CycleSink {
public:
    JsonSink(std::ostream& out, Column sort_column, bool descending)
        : out_(out), sort_column_(sort_column), descending_(descending) {}

    static nlohmann::json to_json(const CycleReport& report, Column sort_column,
                                  bool descending);

protected:
    void write_cycle(const CycleReport& report) override;

private:
    std::ostream& out_;
    Column sort_column_;
    bool descending_;
};

} // namespace plantop
