#include "columns.hpp"

#include <algorithm>
#include <cstdio>
#include <strings.h>

namespace plantop {

const char* column_str(Column c) {
    switch (c) {
        case Column::DATABASE:                 return "Database";
        case Column::QUERY:                    return "Query";
        case Column::EXECUTIONS_PER_SEC:       return "Executions/sec";
        case Column::ROWCOUNT_PER_SEC:         return "RowCount/sec";
        case Column::CPU_UTIL:                 return "CpuUtil";
        case Column::EXECUTION_TIME_PER_QUERY: return "ExecutionTime/query";
        case Column::MEMORY_PER_QUERY:         return "Memory/query";
        case Column::QUEUED_TIME_PER_QUERY:    return "QueuedTime/query";
    }
    return "??";
}

const char* column_key(Column c) {
    switch (c) {
        case Column::DATABASE:                 return "database";
        case Column::QUERY:                    return "query";
        case Column::EXECUTIONS_PER_SEC:       return "executions_per_sec";
        case Column::ROWCOUNT_PER_SEC:         return "rowcount_per_sec";
        case Column::CPU_UTIL:                 return "cpu_util";
        case Column::EXECUTION_TIME_PER_QUERY: return "execution_time_per_query";
        case Column::MEMORY_PER_QUERY:         return "memory_per_query";
        case Column::QUEUED_TIME_PER_QUERY:    return "queued_time_per_query";
    }
    return "??";
}

bool parse_column(const std::string& s, Column& out) {
    for (Column c : kAllColumns) {
        if (strcasecmp(s.c_str(), column_str(c)) == 0 ||
            strcasecmp(s.c_str(), column_key(c)) == 0) {
            out = c;
            return true;
        }
    }
    return false;
}

double column_value(const IntervalMetricRecord& rec, Column c) {
    switch (c) {
        case Column::EXECUTIONS_PER_SEC:       return rec.executions_per_sec;
        case Column::ROWCOUNT_PER_SEC:         return rec.rows_per_sec;
        case Column::CPU_UTIL:                 return rec.cpu_util;
        case Column::EXECUTION_TIME_PER_QUERY: return rec.execution_time_per_query;
        case Column::MEMORY_PER_QUERY:         return rec.memory_per_query;
        case Column::QUEUED_TIME_PER_QUERY:    return rec.queued_time_per_query;
        case Column::DATABASE:
        case Column::QUERY:                    break;
    }
    return 0.0;
}

std::string format_cell(const IntervalMetricRecord& rec, Column c) {
    switch (c) {
        case Column::DATABASE: return rec.database;
        case Column::QUERY:    return rec.query;
        case Column::CPU_UTIL: {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.3f", rec.cpu_util);
            return buf;
        }
        default: {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.1f", column_value(rec, c));
            return buf;
        }
    }
}

std::vector<RankedPlan> sort_records(const PlanCacheDiff& diff, Column c,
                                     bool descending) {
    std::vector<RankedPlan> out(diff.begin(), diff.end());

    const bool text = (c == Column::DATABASE || c == Column::QUERY);
    std::sort(out.begin(), out.end(), [&](const RankedPlan& a, const RankedPlan& b) {
        int cmp = 0;
        if (text) {
            const std::string& sa = (c == Column::DATABASE) ? a.second.database : a.second.query;
            const std::string& sb = (c == Column::DATABASE) ? b.second.database : b.second.query;
            cmp = sa.compare(sb);
        } else {
            double va = column_value(a.second, c);
            double vb = column_value(b.second, c);
            cmp = (va < vb) ? -1 : (va > vb ? 1 : 0);
        }
        if (cmp != 0) return descending ? cmp > 0 : cmp < 0;
        return a.first < b.first;
    });
    return out;
}

} // namespace plantop
