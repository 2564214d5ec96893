#include <catch2/catch.hpp>
#include <chrono>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "fake_data_source.hpp"
#include "monitor/database_poller.hpp"

using namespace plantop;           // NOLINT
using namespace plantop::testing;  // NOLINT

namespace {

// Records every event the poller emits, in order
struct EventRecorder {
    std::vector<std::string> events;
    std::vector<PlanCacheDiff> diffs;
    std::vector<double> cpu;
    std::vector<double> mem;

    void attach(DatabasePoller& p) {
        p.plancache_changed.connect([this](const PlanCacheDiff& d) {
            events.push_back("plancache_changed");
            diffs.push_back(d);
        });
        p.cpu_util_changed.connect([this](double v) {
            events.push_back("cpu_util_changed");
            cpu.push_back(v);
        });
        p.mem_usage_changed.connect([this](double v) {
            events.push_back("mem_usage_changed");
            mem.push_back(v);
        });
    }
};

Row plan(const std::string& hash, int64_t commits, int64_t rowcount = 0, int64_t cpu_time = 0) {
    PlanRowSpec s;
    s.plan_hash = hash;
    s.query = "select * from " + hash;
    s.commits = commits;
    s.rowcount = rowcount;
    s.cpu_time = cpu_time;
    return plan_row(s);
}

} // namespace

TEST_CASE("DatabasePoller: construction", "[poller]") {
    FakeConnector db;
    ManualScheduler sched;

    SECTION("Baseline snapshot is fetched up front") {
        db.push_plancache({plan("A", 10)});
        DatabasePoller poller(db, sched, 5.0);
        CHECK(poller.snapshot().size() == 1);
        CHECK(poller.state() == DatabasePoller::State::IDLE);
        CHECK(sched.alarms.empty());

        poller.start();
        REQUIRE(sched.alarms.size() == 1);
        CHECK(sched.alarms.front().first == Approx(5.0));
    }

    SECTION("Baseline fetch failure propagates") {
        db.push_plancache_error("connection refused");
        CHECK_THROWS_AS(DatabasePoller(db, sched, 5.0), QueryError);
    }

    SECTION("Non-positive interval is rejected") {
        db.push_plancache({});
        CHECK_THROWS_AS(DatabasePoller(db, sched, 0.0), std::invalid_argument);
        CHECK_THROWS_AS(DatabasePoller(db, sched, std::numeric_limits<double>::infinity()),
                        std::invalid_argument);
        CHECK(db.executed.empty());
    }
}

TEST_CASE("DatabasePoller: successful cycle", "[poller]") {
    FakeConnector db;
    ManualScheduler sched;
    db.push_plancache({plan("A", 10, 100), plan("gone", 3)});
    DatabasePoller poller(db, sched, 5.0);

    EventRecorder rec;
    rec.attach(poller);

    size_t alarms_at_emit = 0;
    poller.plancache_changed.connect([&](const PlanCacheDiff&) {
        alarms_at_emit = sched.alarms.size();
    });

    db.push_plancache({plan("A", 15, 150, 500), plan("fresh", 0)});
    db.push_memory("2048 MB");
    poller.poll();

    SECTION("Events fire once each, in order") {
        const std::vector<std::string> expected{
            "plancache_changed", "cpu_util_changed", "mem_usage_changed"};
        CHECK(rec.events == expected);
    }

    SECTION("Next poll is armed before emitting") {
        CHECK(alarms_at_emit == 1);
        CHECK(sched.alarms.size() == 1);
    }

    SECTION("Diff, aggregate and memory values") {
        REQUIRE(rec.diffs.size() == 1);
        const auto& diff = rec.diffs[0];
        REQUIRE(diff.size() == 1);
        CHECK(diff.at("A").executions_per_sec == Approx(1.0));
        CHECK(diff.at("A").rows_per_sec == Approx(10.0));
        REQUIRE(rec.cpu.size() == 1);
        CHECK(rec.cpu[0] == Approx(0.1));
        REQUIRE(rec.mem.size() == 1);
        CHECK(rec.mem[0] == Approx(2048.0));
    }

    SECTION("Retained snapshot is replaced") {
        CHECK(poller.snapshot().size() == 2);
        CHECK(poller.snapshot().count("fresh") == 1);
        CHECK(poller.snapshot().count("gone") == 0);
        CHECK(poller.state() == DatabasePoller::State::IDLE);
        CHECK(poller.polls() == 1);
    }
}

TEST_CASE("DatabasePoller: fetch failure keeps the old snapshot", "[poller]") {
    FakeConnector db;
    ManualScheduler sched;
    db.push_plancache({plan("A", 10)});
    DatabasePoller poller(db, sched, 5.0);

    EventRecorder rec;
    rec.attach(poller);

    db.push_plancache_error("Lost connection to MySQL server during query");
    poller.poll();

    CHECK(rec.events.empty());
    CHECK(poller.fetch_failures() == 1);
    CHECK(poller.snapshot().at("A").commits == 10);
    CHECK(poller.state() == DatabasePoller::State::IDLE);
    REQUIRE(sched.alarms.size() == 1);

    // Next tick diffs against the retained snapshot
    db.push_plancache({plan("A", 20)});
    db.push_memory("100 MB");
    REQUIRE(sched.fire_next());

    REQUIRE(rec.diffs.size() == 1);
    CHECK(rec.diffs[0].at("A").executions_per_sec == Approx(2.0));
    CHECK(rec.mem.size() == 1);
}

TEST_CASE("DatabasePoller: memory failure does not block plan cache", "[poller]") {
    FakeConnector db;
    ManualScheduler sched;
    db.push_plancache({plan("A", 1)});
    DatabasePoller poller(db, sched, 1.0);

    EventRecorder rec;
    rec.attach(poller);

    SECTION("Unparsable value") {
        db.push_plancache({plan("A", 2)});
        db.push_memory("n/a");
        poller.poll();
    }

    SECTION("Lookup error") {
        db.push_plancache({plan("A", 2)});
        db.push_error(kServerMemoryQuery, "timeout");
        poller.poll();
    }

    const std::vector<std::string> expected{"plancache_changed", "cpu_util_changed"};
    CHECK(rec.events == expected);
    CHECK(poller.memory_failures() == 1);
    CHECK(poller.fetch_failures() == 0);
    CHECK(poller.snapshot().at("A").commits == 2);
}

TEST_CASE("DatabasePoller: poll is not reentrant", "[poller]") {
    FakeConnector db;
    ManualScheduler sched;
    db.push_plancache({plan("A", 1)});
    DatabasePoller poller(db, sched, 1.0);

    int nested_calls = 0;
    poller.plancache_changed.connect([&](const PlanCacheDiff&) {
        nested_calls++;
        CHECK(poller.state() == DatabasePoller::State::POLLING);
        poller.poll();  // ignored
    });

    db.push_plancache({plan("A", 2)});
    db.push_memory("1 MB");
    poller.poll();

    CHECK(nested_calls == 1);
    CHECK(poller.polls() == 1);
    CHECK(sched.alarms.size() == 1);
    CHECK(poller.state() == DatabasePoller::State::IDLE);
}

TEST_CASE("DatabasePoller: max polls stops re-arming", "[poller]") {
    FakeConnector db;
    ManualScheduler sched;
    db.push_plancache({});
    DatabasePoller poller(db, sched, 1.0);
    poller.set_max_polls(2);
    poller.start();

    for (int i = 0; i < 2; i++) {
        db.push_plancache({});
        db.push_memory("1 MB");
    }

    CHECK(sched.fire_next());
    CHECK(sched.alarms.size() == 1);
    CHECK(sched.fire_next());
    CHECK(sched.alarms.empty());
    CHECK(poller.polls() == 2);
}

TEST_CASE("DatabasePoller: measured interval", "[poller]") {
    FakeConnector db;
    ManualScheduler sched;
    db.push_plancache({plan("A", 0)});
    DatabasePoller poller(db, sched, 100.0, true);

    EventRecorder rec;
    rec.attach(poller);

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    db.push_plancache({plan("A", 10)});
    db.push_memory("1 MB");
    poller.poll();

    // 10 commits over well under a second rather than over 100 s
    REQUIRE(rec.diffs.size() == 1);
    CHECK(rec.diffs[0].at("A").executions_per_sec > 10.0);
}
