#pragma once
// Dashboard columns for per-plan interval metrics, and sorting by column
#include <array>
#include <string>
#include <utility>
#include <vector>

#include "plancache.hpp"

namespace plantop {

enum class Column {
    DATABASE,
    QUERY,
    EXECUTIONS_PER_SEC,
    ROWCOUNT_PER_SEC,
    CPU_UTIL,
    EXECUTION_TIME_PER_QUERY,
    MEMORY_PER_QUERY,
    QUEUED_TIME_PER_QUERY
};

inline constexpr std::array<Column, 8> kAllColumns = {
    Column::DATABASE, Column::QUERY, Column::EXECUTIONS_PER_SEC,
    Column::ROWCOUNT_PER_SEC, Column::CPU_UTIL, Column::EXECUTION_TIME_PER_QUERY,
    Column::MEMORY_PER_QUERY, Column::QUEUED_TIME_PER_QUERY
};

// Display name, e.g. "Executions/sec"
const char* column_str(Column c);

// snake_case alias, e.g. "executions_per_sec" (JSON keys use these)
const char* column_key(Column c);

// Accepts the display name or the alias, case-insensitive
bool parse_column(const std::string& s, Column& out);

// Numeric value of a rate column; 0 for DATABASE / QUERY
double column_value(const IntervalMetricRecord& rec, Column c);

// Cell text as shown in the console table
std::string format_cell(const IntervalMetricRecord& rec, Column c);

using RankedPlan = std::pair<PlanHash, IntervalMetricRecord>;

// Entries of `diff` ordered by column `c`. Text columns sort
// lexicographically. Ties are broken by plan hash (ascending) so the order
// is stable between refreshes.
std::vector<RankedPlan> sort_records(const PlanCacheDiff& diff, Column c,
                                     bool descending = true);

} // namespace plantop
