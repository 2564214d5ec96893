#include "console_sink.hpp"

#include <cctype>
#include <ctime>

namespace plantop {

static constexpr size_t kQueryWidth = 60;

std::string ConsoleSink::shorten_query(const std::string& query, size_t width) {
    std::string out;
    out.reserve(query.size());
    bool in_space = false;
    for (char ch : query) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            if (!in_space && !out.empty()) out.push_back(' ');
            in_space = true;
        } else {
            out.push_back(ch);
            in_space = false;
        }
    }
    if (!out.empty() && out.back() == ' ') out.pop_back();

    if (out.size() > width) {
        size_t cut = width <= 3 ? width : width - 3;
        // Never split a UTF-8 sequence: back up over continuation bytes
        while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80) cut--;
        if (width <= 3) return out.substr(0, cut);
        out = out.substr(0, cut) + "...";
    }
    return out;
}

void ConsoleSink::write_cycle(const CycleReport& report) {
    std::time_t t = static_cast<std::time_t>(report.timestamp_ms / 1000);
    struct tm tm_buf{};
    localtime_r(&t, &tm_buf);

    std::fprintf(out_, "\n[%02d:%02d:%02d] %zu active plans, sorted by %s%s\n",
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, report.plans.size(),
        column_str(sort_column_), descending_ ? " (desc)" : "");

    std::fprintf(out_, "%-16s %14s %13s %8s %20s %13s %17s  %s\n",
        "Database", "Executions/sec", "RowCount/sec", "CpuUtil",
        "ExecutionTime/query", "Memory/query", "QueuedTime/query", "Query");
    std::fprintf(out_, "%.170s\n",
        "------------------------------------------------------------------------------------------"
        "--------------------------------------------------------------------------------------------");

    auto ranked = sort_records(report.plans, sort_column_, descending_);
    int shown = 0;
    for (const auto& [hash, rec] : ranked) {
        (void)hash;
        if (max_rows_ > 0 && shown >= max_rows_) break;
        std::fprintf(out_, "%-16.16s %14s %13s %8s %20s %13s %17s  %s\n",
            rec.database.c_str(),
            format_cell(rec, Column::EXECUTIONS_PER_SEC).c_str(),
            format_cell(rec, Column::ROWCOUNT_PER_SEC).c_str(),
            format_cell(rec, Column::CPU_UTIL).c_str(),
            format_cell(rec, Column::EXECUTION_TIME_PER_QUERY).c_str(),
            format_cell(rec, Column::MEMORY_PER_QUERY).c_str(),
            format_cell(rec, Column::QUEUED_TIME_PER_QUERY).c_str(),
            shorten_query(rec.query, kQueryWidth).c_str());
        shown++;
    }
    if (ranked.size() > static_cast<size_t>(shown)) {
        std::fprintf(out_, "... %zu more\n", ranked.size() - static_cast<size_t>(shown));
    }

    std::fprintf(out_, "Total CpuUtil: %.3f", report.cpu_util);
    if (report.mem_usage) {
        std::fprintf(out_, "   Server memory: %.1f MB\n", *report.mem_usage);
    } else {
        std::fprintf(out_, "   Server memory: n/a\n");
    }
    std::fflush(out_);
}

} // namespace plantop
