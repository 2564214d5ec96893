#pragma once
// Scripted stand-ins for the connector and the scheduler
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "connectors/db_connector.hpp"
#include "monitor/event_loop.hpp"
#include "monitor/plancache.hpp"
#include "monitor/server_memory.hpp"

namespace plantop {
namespace testing {

// Answers query() from per-statement FIFO scripts. An unscripted statement
// fails with QueryError, like an unreachable server would.
class FakeConnector : public DbConnector {
public:
    bool connect(const DbConnection&) override { connected_ = true; return true; }
    void disconnect() override { connected_ = false; }
    bool is_connected() const override { return connected_; }
    const char* system_name() const override { return "fake"; }

    std::vector<Row> query(const std::string& sql) override {
        executed.push_back(sql);
        auto& q = script_[sql];
        if (q.empty()) throw QueryError("no scripted response for: " + sql);
        Response r = std::move(q.front());
        q.pop_front();
        if (r.error) throw QueryError(*r.error);
        return r.rows;
    }

    void push_rows(const std::string& sql, std::vector<Row> rows) {
        script_[sql].push_back({std::move(rows), std::nullopt});
    }

    void push_error(const std::string& sql, std::string message) {
        script_[sql].push_back({{}, std::move(message)});
    }

    void push_plancache(std::vector<Row> rows) { push_rows(kPlanCacheQuery, std::move(rows)); }
    void push_plancache_error(std::string message) { push_error(kPlanCacheQuery, std::move(message)); }

    void push_memory(const std::string& value) {
        Row r;
        r.set("Variable_name", std::string("Total_server_memory"));
        r.set("Value", value);
        push_rows(kServerMemoryQuery, {r});
    }

    std::vector<std::string> executed;

private:
    struct Response {
        std::vector<Row> rows;
        std::optional<std::string> error;
    };
    std::map<std::string, std::deque<Response>> script_;
    bool connected_ = true;
};

// Records alarms instead of waiting for them
class ManualScheduler : public Scheduler {
public:
    void set_alarm_in(double seconds, AlarmCallback cb) override {
        alarms.push_back({seconds, std::move(cb)});
    }

    // Fire the oldest pending alarm; false if none
    bool fire_next() {
        if (alarms.empty()) return false;
        AlarmCallback cb = std::move(alarms.front().second);
        alarms.pop_front();
        cb();
        return true;
    }

    std::deque<std::pair<double, AlarmCallback>> alarms;
};

struct PlanRowSpec {
    std::optional<std::string> plan_hash;
    std::string database = "db";
    std::string query = "select 1";
    int64_t commits = 0;
    int64_t rowcount = 0;
    int64_t execution_time = 0;
    int64_t queued_time = 0;
    int64_t cpu_time = 0;
    int64_t memory_use = 0;
};

inline Row plan_row(const PlanRowSpec& s) {
    Row r;
    r.set("database_name", s.database);
    r.set("query_text", s.query);
    r.set("plan_hash", s.plan_hash);
    r.set("commits", std::to_string(s.commits));
    r.set("rowcount", std::to_string(s.rowcount));
    r.set("execution_time", std::to_string(s.execution_time));
    r.set("queued_time", std::to_string(s.queued_time));
    r.set("cpu_time", std::to_string(s.cpu_time));
    r.set("memory_use", std::to_string(s.memory_use));
    return r;
}

inline PlanCounterRecord counters(int64_t commits, int64_t rowcount = 0,
                                  int64_t execution_time = 0, int64_t queued_time = 0,
                                  int64_t cpu_time = 0, int64_t memory_use = 0) {
    PlanCounterRecord rec;
    rec.database_name = "db";
    rec.query_text = "select * from t";
    rec.commits = commits;
    rec.rowcount = rowcount;
    rec.execution_time = execution_time;
    rec.queued_time = queued_time;
    rec.cpu_time = cpu_time;
    rec.memory_use = memory_use;
    return rec;
}

} // namespace testing
} // namespace plantop
