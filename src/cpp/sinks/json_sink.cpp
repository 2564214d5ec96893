#include "json_sink.hpp"
#include "../utils/logger.hpp"

namespace plantop {

nlohmann::json JsonSink::to_json(const CycleReport& report, Column sort_column,
                                 bool descending) {
    nlohmann::json j;
    j["ts"] = report.timestamp_ms;
    j["cpu_util"] = report.cpu_util;
    if (report.mem_usage) {
        j["mem_usage_mb"] = *report.mem_usage;
    } else {
        j["mem_usage_mb"] = nullptr;
    }

    nlohmann::json plans = nlohmann::json::array();
    for (const auto& [hash, rec] : sort_records(report.plans, sort_column, descending)) {
        nlohmann::json p;
        p["plan_hash"] = hash;
        p[column_key(Column::DATABASE)] = rec.database;
        p[column_key(Column::QUERY)] = rec.query;
        for (Column c : kAllColumns) {
            if (c == Column::DATABASE || c == Column::QUERY) continue;
            p[column_key(c)] = column_value(rec, c);
        }
        plans.push_back(std::move(p));
    }
    j["plans"] = std::move(plans);
    return j;
}

void JsonSink::write_cycle(const CycleReport& report) {
    // Query text comes from the server as raw bytes; invalid UTF-8 becomes U+FFFD
    out_ << to_json(report, sort_column_, descending_)
                .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << '\n';
    out_.flush();
    if (!out_) {
        LOG_ERR("[json] Write failed after %lld cycles",
            static_cast<long long>(cycles_written()));
    }
}

} // namespace plantop
