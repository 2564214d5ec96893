#pragma once
// =============================================================================
// Plan cache sampling and diffing
//
// The server keeps cumulative counters per cached query plan. A poll takes a
// full snapshot of those counters; two consecutive snapshots are diffed into
// per-interval rates:
//
//   per-second:  Executions/sec, RowCount/sec, CpuUtil
//   per-query:   ExecutionTime/query, Memory/query, QueuedTime/query
//
// Entries whose commit count did not grow during the interval are dropped.
// That covers unchanged plans, plans still running their first execution,
// and plans whose counters were reset by cache eviction/replacement.
// =============================================================================

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>

#include "../connectors/db_connector.hpp"

namespace plantop {

using PlanHash = std::string;

// Raw cumulative counters for one plan, as read from the server
struct PlanCounterRecord {
    std::string database_name;
    std::string query_text;
    int64_t commits = 0;
    int64_t rowcount = 0;
    int64_t execution_time = 0;   // microseconds
    int64_t queued_time = 0;      // microseconds
    int64_t cpu_time = 0;         // milliseconds
    int64_t memory_use = 0;       // bytes
};

using PlanCounterSnapshot = std::unordered_map<PlanHash, PlanCounterRecord>;

// Rates for one plan over one interval
struct IntervalMetricRecord {
    std::string database;
    std::string query;
    double executions_per_sec = 0.0;
    double rows_per_sec = 0.0;
    double cpu_util = 0.0;             // fraction of one core
    double execution_time_per_query = 0.0;
    double memory_per_query = 0.0;
    double queued_time_per_query = 0.0;
};

using PlanCacheDiff = std::map<PlanHash, IntervalMetricRecord>;

// The fetch query. Exposed so the fetcher can recognize (and skip) its own
// plan cache entry.
extern const char* const kPlanCacheQuery;

// Read the current plan cache summary. Rows with a NULL plan hash (leaf-only
// plans) and the row for kPlanCacheQuery itself are skipped.
// Throws QueryError.
PlanCounterSnapshot fetch_plancache(DbConnector& db);

// Convert one set of counter deltas into rates. delta.commits must be > 0.
IntervalMetricRecord normalize_plancache_entry(const PlanCounterRecord& delta,
                                               double interval_s);

// Diff two snapshots taken interval_s seconds apart.
// Throws std::invalid_argument if interval_s <= 0.
PlanCacheDiff diff_plancache(const PlanCounterSnapshot& new_plancache,
                             const PlanCounterSnapshot& old_plancache,
                             double interval_s);

// Sum of cpu_util over every entry of a diff
double total_cpu_util(const PlanCacheDiff& diff);

} // namespace plantop
