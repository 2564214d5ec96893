#include "plancache.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"

#include <stdexcept>

namespace plantop {

// Written without parameters so that the server's normalized query_text for
// this statement is identical to the string itself.
const char* const kPlanCacheQuery =
    "select database_name, query_text, plan_hash, "
    "IFNULL(commits, 0) as commits, "
    "IFNULL(rowcount, 0) as rowcount, "
    "IFNULL(execution_time, 0) as execution_time, "
    "IFNULL(queued_time, 0) as queued_time, "
    "IFNULL(cpu_time, 0) as cpu_time, "
    "IFNULL(memory_use, 0) as memory_use "
    "from distributed_plancache_summary "
    "where plan_hash is not null";

PlanCounterSnapshot fetch_plancache(DbConnector& db) {
    Timer timer;
    timer.start();
    std::vector<Row> rows = db.query(kPlanCacheQuery);
    timer.stop();

    PlanCounterSnapshot snapshot;
    snapshot.reserve(rows.size());
    size_t skipped = 0;

    for (const auto& r : rows) {
        if (r.is_null("plan_hash")) { skipped++; continue; }
        if (!r.is_null("query_text") && r.str("query_text") == kPlanCacheQuery) {
            skipped++;
            continue;
        }

        PlanCounterRecord rec;
        rec.database_name = r.is_null("database_name") ? "" : r.str("database_name");
        rec.query_text = r.is_null("query_text") ? "" : r.str("query_text");
        rec.commits = r.int64_or_zero("commits");
        rec.rowcount = r.int64_or_zero("rowcount");
        rec.execution_time = r.int64_or_zero("execution_time");
        rec.queued_time = r.int64_or_zero("queued_time");
        rec.cpu_time = r.int64_or_zero("cpu_time");
        rec.memory_use = r.int64_or_zero("memory_use");

        snapshot[r.str("plan_hash")] = std::move(rec);
    }

    LOG_DBG("[plancache] Fetched %zu plans (%zu skipped) in %lld ms",
        snapshot.size(), skipped, static_cast<long long>(timer.elapsed_ms()));
    return snapshot;
}

IntervalMetricRecord normalize_plancache_entry(const PlanCounterRecord& delta,
                                               double interval_s) {
    const double commits = static_cast<double>(delta.commits);

    IntervalMetricRecord m;
    m.database = delta.database_name;
    m.query = delta.query_text;
    m.executions_per_sec = commits / interval_s;
    m.rows_per_sec = static_cast<double>(delta.rowcount) / interval_s;
    m.cpu_util = static_cast<double>(delta.cpu_time) / 1000.0 / interval_s;
    m.execution_time_per_query = static_cast<double>(delta.execution_time) / commits;
    m.memory_per_query = static_cast<double>(delta.memory_use) / commits;
    m.queued_time_per_query = static_cast<double>(delta.queued_time) / commits;
    return m;
}

PlanCacheDiff diff_plancache(const PlanCounterSnapshot& new_plancache,
                             const PlanCounterSnapshot& old_plancache,
                             double interval_s) {
    if (!(interval_s > 0.0)) {
        throw std::invalid_argument("diff_plancache: interval must be > 0, got " +
            std::to_string(interval_s));
    }

    PlanCacheDiff diff;
    for (const auto& [key, n_ent] : new_plancache) {
        auto it = old_plancache.find(key);
        if (it == old_plancache.end()) {
            // A new entry can have zero commits: a slow query that has not
            // completed yet, or one that only ever errored.
            if (n_ent.commits > 0) {
                diff[key] = normalize_plancache_entry(n_ent, interval_s);
            }
            continue;
        }

        const PlanCounterRecord& o_ent = it->second;
        if (n_ent.commits - o_ent.commits <= 0) continue;  // unchanged or reset

        // Only commits are checked; other deltas may go negative after a
        // partial reset and are passed through as-is.
        PlanCounterRecord delta;
        delta.database_name = n_ent.database_name;
        delta.query_text = n_ent.query_text;
        delta.commits = n_ent.commits - o_ent.commits;
        delta.rowcount = n_ent.rowcount - o_ent.rowcount;
        delta.execution_time = n_ent.execution_time - o_ent.execution_time;
        delta.queued_time = n_ent.queued_time - o_ent.queued_time;
        delta.cpu_time = n_ent.cpu_time - o_ent.cpu_time;
        delta.memory_use = n_ent.memory_use - o_ent.memory_use;
        diff[key] = normalize_plancache_entry(delta, interval_s);
    }
    return diff;
}

double total_cpu_util(const PlanCacheDiff& diff) {
    double sum = 0.0;
    for (const auto& [key, rec] : diff) {
        (void)key;
        sum += rec.cpu_util;
    }
    return sum;
}

} // namespace plantop
